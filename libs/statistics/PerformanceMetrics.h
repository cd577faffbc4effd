// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_PERFORMANCE_METRICS_H
#define __MKC_DCA_PERFORMANCE_METRICS_H 1

#include "DisplayRounding.h"

namespace mkc_dca
{
  /**
   * @brief Return and risk statistics of one simulation.
   *
   * All percentages are expressed in percent (12.5 means 12.5%). Sharpe and
   * profit factor are plain ratios.
   */
  struct PerformanceMetrics
  {
    double totalReturnPct;
    double cagr;
    double volatilityAnnualized;
    double sharpeRatio;
    double maxDrawdownPct;
    double profitFactor;
    double winRatePct;

    PerformanceMetrics rounded(int places = 2) const
    {
      return PerformanceMetrics{ roundForDisplay(totalReturnPct, places),
				 roundForDisplay(cagr, places),
				 roundForDisplay(volatilityAnnualized, places),
				 roundForDisplay(sharpeRatio, places),
				 roundForDisplay(maxDrawdownPct, places),
				 roundForDisplay(profitFactor, places),
				 roundForDisplay(winRatePct, places) };
    }
  };

  inline bool operator==(const PerformanceMetrics& lhs, const PerformanceMetrics& rhs)
  {
    return lhs.totalReturnPct == rhs.totalReturnPct &&
      lhs.cagr == rhs.cagr &&
      lhs.volatilityAnnualized == rhs.volatilityAnnualized &&
      lhs.sharpeRatio == rhs.sharpeRatio &&
      lhs.maxDrawdownPct == rhs.maxDrawdownPct &&
      lhs.profitFactor == rhs.profitFactor &&
      lhs.winRatePct == rhs.winRatePct;
  }

  inline bool operator!=(const PerformanceMetrics& lhs, const PerformanceMetrics& rhs)
  {
    return !(lhs == rhs);
  }
} // namespace mkc_dca

#endif // __MKC_DCA_PERFORMANCE_METRICS_H
