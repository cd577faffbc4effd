// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include "CandidateRanking.h"

namespace mkc_dca
{
  namespace
  {
    // true when a should come before b; NaN never precedes anything
    bool precedes(double a, double b, bool descending)
    {
      if (std::isnan(a))
	return false;
      if (std::isnan(b))
	return true;

      return descending ? (a > b) : (a < b);
    }

    // Sort pointers to the candidates and copy out only the first n
    template <class Before>
    std::vector<SweepCandidate> rankTopN(const std::vector<SweepCandidate>& candidates,
					 std::size_t n,
					 Before before)
    {
      std::vector<const SweepCandidate*> order;
      order.reserve(candidates.size());
      for (const auto& c : candidates)
	order.push_back(&c);

      std::stable_sort(order.begin(), order.end(),
		       [&before](const SweepCandidate* lhs, const SweepCandidate* rhs) {
			 return before(*lhs, *rhs);
		       });

      const std::size_t kept = std::min(n, order.size());
      std::vector<SweepCandidate> ranked;
      ranked.reserve(kept);
      for (std::size_t i = 0; i < kept; ++i)
	ranked.push_back(*order[i]);

      return ranked;
    }
  }

  double getSortValue(const SweepCandidate& candidate, SortKey key)
  {
    switch (key)
      {
      case SortKey::TotalReturn:
	return candidate.metrics.totalReturnPct;
      case SortKey::SharpeRatio:
	return candidate.metrics.sharpeRatio;
      case SortKey::ProfitFactor:
	return candidate.metrics.profitFactor;
      case SortKey::ReturnPerInvestedDollar:
	return candidate.returnPerInvestedDollar;
      }

    throw InvalidConfigError("getSortValue - unknown sort key value");
  }

  std::vector<SweepCandidate> rankByObjective(const std::vector<SweepCandidate>& candidates,
					      SortKey key,
					      bool descending,
					      std::size_t topN)
  {
    return rankTopN(candidates, topN,
		    [key, descending](const SweepCandidate& lhs, const SweepCandidate& rhs) {
		      return precedes(getSortValue(lhs, key), getSortValue(rhs, key), descending);
		    });
  }

  bool dollarProfitOrder(const SweepCandidate& lhs, const SweepCandidate& rhs)
  {
    if (lhs.dollarProfit != rhs.dollarProfit)
      return precedes(lhs.dollarProfit, rhs.dollarProfit, true);

    if (lhs.metrics.sharpeRatio != rhs.metrics.sharpeRatio)
      return precedes(lhs.metrics.sharpeRatio, rhs.metrics.sharpeRatio, true);

    if (lhs.metrics.volatilityAnnualized != rhs.metrics.volatilityAnnualized)
      return precedes(lhs.metrics.volatilityAnnualized, rhs.metrics.volatilityAnnualized, false);

    return lhs.weeklyAmount < rhs.weeklyAmount;
  }

  std::vector<SweepCandidate> rankByDollarProfit(const std::vector<SweepCandidate>& candidates,
						 std::size_t topN)
  {
    return rankTopN(candidates, topN, dollarProfitOrder);
  }
} // namespace mkc_dca
