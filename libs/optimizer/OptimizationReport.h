// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_OPTIMIZATION_REPORT_H
#define __MKC_DCA_OPTIMIZATION_REPORT_H 1

#include <cstddef>
#include <utility>
#include <vector>
#include "SweepCandidate.h"
#include "SweepParameters.h"

namespace mkc_dca
{
  /**
   * @brief Bookkeeping of one sweep.
   *
   * candidatesTested = candidatesSucceeded + candidatesFailed, and
   * candidatesTested + candidatesSkipped equals the grid size. Skipped
   * candidates were never started because the sweep was cancelled.
   */
  struct OptimizationSummary
  {
    std::size_t candidatesTested;
    std::size_t candidatesSucceeded;
    std::size_t candidatesFailed;
    std::size_t candidatesSkipped;
    double effectiveStepSize;
    SortKey sortKey;
    bool descending;
    bool cancelled;
    std::size_t weeksSimulated;
  };

  class OptimizationReport
  {
  public:
    OptimizationReport(std::vector<double> testedGrid,
		       std::vector<SweepCandidate> candidates,
		       std::vector<SweepCandidate> topByObjective,
		       std::vector<SweepCandidate> topByDollarProfit,
		       const OptimizationSummary& summary)
      : mTestedGrid(std::move(testedGrid)),
	mCandidates(std::move(candidates)),
	mTopByObjective(std::move(topByObjective)),
	mTopByDollarProfit(std::move(topByDollarProfit)),
	mSummary(summary)
    {}

    /// Every amount of the grid, ascending, including skipped ones
    const std::vector<double>& getTestedGrid() const
    {
      return mTestedGrid;
    }

    /// Successful candidates in grid order
    const std::vector<SweepCandidate>& getCandidates() const
    {
      return mCandidates;
    }

    const std::vector<SweepCandidate>& getTopByObjective() const
    {
      return mTopByObjective;
    }

    const std::vector<SweepCandidate>& getTopByDollarProfit() const
    {
      return mTopByDollarProfit;
    }

    const OptimizationSummary& getSummary() const
    {
      return mSummary;
    }

  private:
    std::vector<double> mTestedGrid;
    std::vector<SweepCandidate> mCandidates;
    std::vector<SweepCandidate> mTopByObjective;
    std::vector<SweepCandidate> mTopByDollarProfit;
    OptimizationSummary mSummary;
  };
} // namespace mkc_dca

#endif // __MKC_DCA_OPTIMIZATION_REPORT_H
