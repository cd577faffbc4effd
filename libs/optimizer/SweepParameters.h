// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_SWEEP_PARAMETERS_H
#define __MKC_DCA_SWEEP_PARAMETERS_H 1

#include <chrono>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include "DcaExceptions.h"

namespace mkc_dca
{
  /**
   * @brief Metric used to order the objective ranking of a sweep.
   *
   *  - TotalReturn            : PerformanceMetrics::totalReturnPct
   *  - SharpeRatio            : PerformanceMetrics::sharpeRatio
   *  - ProfitFactor           : PerformanceMetrics::profitFactor
   *  - ReturnPerInvestedDollar: dollar profit divided by total invested
   */
  enum class SortKey
    {
      TotalReturn,
      SharpeRatio,
      ProfitFactor,
      ReturnPerInvestedDollar
    };

  /// @throws InvalidConfigError for a name other than the four sort keys
  SortKey parseSortKey(const std::string& name);

  std::string sortKeyToString(SortKey key);

  std::ostream& operator<<(std::ostream& os, SortKey key);

  /**
   * @brief Immutable, ctor-only parameters of one contribution-amount sweep.
   *
   * The constructor validates every field and throws InvalidConfigError on
   * the first violation:
   *  - 0 < amountMin <= amountMax
   *  - stepSize > 0
   *  - topN >= 1
   *  - a time budget, when given, is strictly positive
   *
   * When a time budget is present the sweep stops starting new candidates
   * once the budget has elapsed.
   */
  class SweepParameters
  {
  public:
    static constexpr std::size_t DefaultTopN = 10;

    SweepParameters(double amountMin,
		    double amountMax,
		    double stepSize,
		    std::size_t topN = DefaultTopN,
		    SortKey sortKey = SortKey::TotalReturn,
		    bool descending = true,
		    std::optional<std::chrono::milliseconds> timeBudget = std::nullopt);

    double getAmountMin() const
    {
      return mAmountMin;
    }

    double getAmountMax() const
    {
      return mAmountMax;
    }

    double getStepSize() const
    {
      return mStepSize;
    }

    std::size_t getTopN() const
    {
      return mTopN;
    }

    SortKey getSortKey() const
    {
      return mSortKey;
    }

    bool isDescending() const
    {
      return mDescending;
    }

    const std::optional<std::chrono::milliseconds>& getTimeBudget() const
    {
      return mTimeBudget;
    }

  private:
    double mAmountMin;
    double mAmountMax;
    double mStepSize;
    std::size_t mTopN;
    SortKey mSortKey;
    bool mDescending;
    std::optional<std::chrono::milliseconds> mTimeBudget;
  };
} // namespace mkc_dca

#endif // __MKC_DCA_SWEEP_PARAMETERS_H
