// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "EquityCurve.h"

namespace mkc_dca
{
  std::vector<EquityCurvePoint> buildEquityCurve(const SimulationResult& result)
  {
    std::vector<EquityCurvePoint> curve;
    curve.reserve(result.getNumWeeks());

    double previousEquity = 0.0;
    for (auto it = result.beginWeeks(); it != result.endWeeks(); ++it)
      {
	curve.push_back(EquityCurvePoint{ it->date,
					  it->equity,
					  it->positionNotional,
					  it->cashBalance,
					  it->totalInvested,
					  it->pnl,
					  it->timeWeightedReturn,
					  previousEquity });
	previousEquity = it->equity;
      }

    return curve;
  }
} // namespace mkc_dca
