// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_AMOUNT_GRID_H
#define __MKC_DCA_AMOUNT_GRID_H 1

#include <cstddef>
#include <vector>

namespace mkc_dca
{
  constexpr std::size_t MaxAmountGridPoints = 1000;

  struct AmountGrid
  {
    std::vector<double> amounts;
    double effectiveStepSize;
  };

  /**
   * @brief Build the ascending list of candidate weekly amounts.
   *
   * Points are amountMin + i * stepSize up to amountMax; amountMax itself is
   * always the last point, even when it is not a whole number of steps away.
   * When that grid would hold more than @p maxPoints amounts the step is
   * widened to (amountMax - amountMin) / (maxPoints - 1) so the grid holds
   * exactly @p maxPoints.
   *
   * Arguments are assumed validated (see SweepParameters).
   */
  AmountGrid buildAmountGrid(double amountMin,
			     double amountMax,
			     double stepSize,
			     std::size_t maxPoints = MaxAmountGridPoints);
} // namespace mkc_dca

#endif // __MKC_DCA_AMOUNT_GRID_H
