// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_CANDIDATE_RANKING_H
#define __MKC_DCA_CANDIDATE_RANKING_H 1

#include <cstddef>
#include <vector>
#include "SweepCandidate.h"
#include "SweepParameters.h"

namespace mkc_dca
{
  constexpr std::size_t DollarProfitRankingSize = 5;

  /// Value of @p key for one candidate
  double getSortValue(const SweepCandidate& candidate, SortKey key);

  /**
   * @brief Order candidates by a single metric and keep the first @p topN.
   *
   * The sort is stable, so candidates with equal values keep their grid
   * order. NaN values rank after every number in either direction.
   */
  std::vector<SweepCandidate> rankByObjective(const std::vector<SweepCandidate>& candidates,
					      SortKey key,
					      bool descending,
					      std::size_t topN);

  /**
   * @brief Strict ordering used by the dollar-profit ranking:
   *        dollarProfit desc, sharpeRatio desc, volatilityAnnualized asc,
   *        weeklyAmount asc.
   */
  bool dollarProfitOrder(const SweepCandidate& lhs, const SweepCandidate& rhs);

  /// Candidates ordered by dollarProfitOrder, first @p topN kept
  std::vector<SweepCandidate> rankByDollarProfit(const std::vector<SweepCandidate>& candidates,
						 std::size_t topN = DollarProfitRankingSize);
} // namespace mkc_dca

#endif // __MKC_DCA_CANDIDATE_RANKING_H
