// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_EQUITY_CURVE_H
#define __MKC_DCA_EQUITY_CURVE_H 1

#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "SimulationResult.h"

namespace mkc_dca
{
  struct EquityCurvePoint
  {
    boost::gregorian::date date;
    double equity;
    double positionNotional;
    double cashBalance;
    double invested;
    double pnl;
    double timeWeightedReturn;
    double previousEquity;   // equity at the end of the prior week, 0 for week 1
  };

  /**
   * @brief Projects a simulation ledger onto one point per week for charting.
   */
  std::vector<EquityCurvePoint> buildEquityCurve(const SimulationResult& result);
} // namespace mkc_dca

#endif // __MKC_DCA_EQUITY_CURVE_H
