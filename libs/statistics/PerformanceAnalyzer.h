// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_PERFORMANCE_ANALYZER_H
#define __MKC_DCA_PERFORMANCE_ANALYZER_H 1

#include <vector>
#include "PerformanceMetrics.h"
#include "SimulationResult.h"
#include "WeekRecord.h"

namespace mkc_dca
{
  /**
   * @brief Derives return and risk metrics from a weekly simulation ledger.
   *
   * Every metric is a function of the WeekRecord sequence alone:
   *
   *  - totalReturnPct  : (finalEquity / totalInvested - 1) * 100
   *  - returns r_t     : timeWeightedReturn of weeks 2..N (week 1 has no basis)
   *  - volatility      : stddev(r) * sqrt(52) * 100 (population stddev)
   *  - sharpeRatio     : mean(r) / stddev(r) * sqrt(52)
   *  - cagr            : (prod(1 + r)^(52 / len(r)) - 1) * 100
   *  - maxDrawdownPct  : largest peak-to-trough fall of the equity field
   *  - profitFactor    : sum of gains / sum of losses, where the dollar pnl of
   *                      week t is r_t * equity_{t-1}
   *  - winRatePct      : share of weeks with positive dollar pnl
   *
   * Volatility and Sharpe are 0 with fewer than two returns or zero
   * dispersion. Weeks whose time-weighted return was defined as 0 (no
   * positive equity before the contribution) are kept in the series as 0.
   *
   * Internal computation is at full precision; analyze() rounds to two
   * decimals on the way out, computeRawMetrics() does not.
   */
  class PerformanceAnalyzer
  {
  public:
    static constexpr double WeeksPerYear = 52.0;

    static PerformanceMetrics analyze(const SimulationResult& result);
    static PerformanceMetrics analyze(const std::vector<WeekRecord>& weeks);

    static PerformanceMetrics computeRawMetrics(const std::vector<WeekRecord>& weeks);

    /// timeWeightedReturn of weeks 2..N, skipping non-finite values
    static std::vector<double> extractReturnSeries(const std::vector<WeekRecord>& weeks);

    /// Largest peak-to-trough decline of the equity field, in percent
    static double computeMaxDrawdownPct(const std::vector<WeekRecord>& weeks);

    /// Compound annual growth of a weekly return series, in percent
    static double computeCagrPct(const std::vector<double>& weeklyReturns);
  };
} // namespace mkc_dca

#endif // __MKC_DCA_PERFORMANCE_ANALYZER_H
