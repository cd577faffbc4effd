// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "SweepParameters.h"

namespace mkc_dca
{
  constexpr std::size_t SweepParameters::DefaultTopN;

  SortKey parseSortKey(const std::string& name)
  {
    const std::string key = boost::algorithm::trim_copy(name);

    if (boost::algorithm::iequals(key, "totalReturn"))
      return SortKey::TotalReturn;
    else if (boost::algorithm::iequals(key, "sharpeRatio"))
      return SortKey::SharpeRatio;
    else if (boost::algorithm::iequals(key, "profitFactor"))
      return SortKey::ProfitFactor;
    else if (boost::algorithm::iequals(key, "returnPerInvestedDollar"))
      return SortKey::ReturnPerInvestedDollar;

    throw InvalidConfigError("parseSortKey - unknown sort key '" + name +
			     "', expected one of totalReturn, sharpeRatio, profitFactor, returnPerInvestedDollar");
  }

  std::string sortKeyToString(SortKey key)
  {
    switch (key)
      {
      case SortKey::TotalReturn:
	return "totalReturn";
      case SortKey::SharpeRatio:
	return "sharpeRatio";
      case SortKey::ProfitFactor:
	return "profitFactor";
      case SortKey::ReturnPerInvestedDollar:
	return "returnPerInvestedDollar";
      }

    throw InvalidConfigError("sortKeyToString - unknown sort key value");
  }

  std::ostream& operator<<(std::ostream& os, SortKey key)
  {
    return os << sortKeyToString(key);
  }

  SweepParameters::SweepParameters(double amountMin,
				   double amountMax,
				   double stepSize,
				   std::size_t topN,
				   SortKey sortKey,
				   bool descending,
				   std::optional<std::chrono::milliseconds> timeBudget)
    : mAmountMin(amountMin),
      mAmountMax(amountMax),
      mStepSize(stepSize),
      mTopN(topN),
      mSortKey(sortKey),
      mDescending(descending),
      mTimeBudget(timeBudget)
  {
    if (!std::isfinite(amountMin) || amountMin <= 0.0)
      throw InvalidConfigError("SweepParameters: amountMin must be positive, got " + std::to_string(amountMin));

    if (!std::isfinite(amountMax) || amountMax < amountMin)
      throw InvalidConfigError("SweepParameters: amountMax must be >= amountMin, got " + std::to_string(amountMax));

    if (!std::isfinite(stepSize) || stepSize <= 0.0)
      throw InvalidConfigError("SweepParameters: stepSize must be positive, got " + std::to_string(stepSize));

    if (topN < 1)
      throw InvalidConfigError("SweepParameters: topN must be at least 1");

    if (timeBudget && timeBudget->count() <= 0)
      throw InvalidConfigError("SweepParameters: time budget must be positive, got "
			       + std::to_string(timeBudget->count()) + " ms");
  }
} // namespace mkc_dca
