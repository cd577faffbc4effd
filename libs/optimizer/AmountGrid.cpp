// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include "AmountGrid.h"

namespace mkc_dca
{
  namespace
  {
    // Relative slack so 0.1-style steps still land on amountMax
    constexpr double StepTolerance = 1e-9;

    std::vector<double> evenlySpaced(double amountMin, double amountMax, double step, std::size_t count)
    {
      std::vector<double> amounts;
      amounts.reserve(count);
      for (std::size_t i = 0; i < count; ++i)
	amounts.push_back(std::min(amountMax, amountMin + static_cast<double>(i) * step));

      amounts.back() = amountMax;
      return amounts;
    }
  }

  AmountGrid buildAmountGrid(double amountMin, double amountMax, double stepSize, std::size_t maxPoints)
  {
    if (amountMax <= amountMin)
      return AmountGrid{ std::vector<double>{ amountMin }, stepSize };

    if (maxPoints < 2)
      maxPoints = 2;

    const double span = amountMax - amountMin;
    const double wholeSteps = std::floor(span / stepSize + StepTolerance);
    const double remainder = span - wholeSteps * stepSize;
    const bool needsEndPoint = remainder > stepSize * StepTolerance;

    // wholeSteps + 1 regular points, plus amountMax when it is off-grid
    const double pointCount = wholeSteps + 1.0 + (needsEndPoint ? 1.0 : 0.0);

    if (pointCount > static_cast<double>(maxPoints))
      {
	const double widened = span / static_cast<double>(maxPoints - 1);
	return AmountGrid{ evenlySpaced(amountMin, amountMax, widened, maxPoints), widened };
      }

    const std::size_t regular = static_cast<std::size_t>(wholeSteps) + 1;
    std::vector<double> amounts;
    amounts.reserve(regular + 1);
    for (std::size_t i = 0; i < regular; ++i)
      amounts.push_back(std::min(amountMax, amountMin + static_cast<double>(i) * stepSize));

    if (needsEndPoint)
      amounts.push_back(amountMax);
    else
      amounts.back() = amountMax;

    return AmountGrid{ amounts, stepSize };
  }
} // namespace mkc_dca
