// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_SWEEP_CANDIDATE_H
#define __MKC_DCA_SWEEP_CANDIDATE_H 1

#include "PerformanceMetrics.h"
#include "SimulationResult.h"

namespace mkc_dca
{
  /**
   * @brief One evaluated grid point of a contribution-amount sweep.
   *
   * Every figure is kept at full precision (metrics come from
   * PerformanceAnalyzer::computeRawMetrics). Rounding happens when a report
   * is printed or serialized.
   */
  struct SweepCandidate
  {
    double weeklyAmount;
    SimulationResult result;
    PerformanceMetrics metrics;
    double dollarProfit;              // finalEquity - totalInvested
    double returnPerInvestedDollar;   // dollarProfit / totalInvested
  };
} // namespace mkc_dca

#endif // __MKC_DCA_SWEEP_CANDIDATE_H
