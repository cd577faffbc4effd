// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_WEEK_RECORD_H
#define __MKC_DCA_WEEK_RECORD_H 1

#include <boost/date_time/gregorian/gregorian.hpp>

namespace mkc_dca
{
  /**
   * @brief One row of the weekly simulation ledger, captured at week end.
   *
   * Money fields are in account currency at full precision. returnPct is a
   * percentage; timeWeightedReturn is a fraction.
   */
  struct WeekRecord
  {
    unsigned int weekIndex;              // 1-based
    boost::gregorian::date date;
    double price;
    double contributionAmount;
    int contractsAdded;
    int contractsLiquidated;
    int totalContracts;
    double totalInvested;
    double equity;
    double positionNotional;             // totalContracts * price * multiplier
    double cashBalance;
    double requiredMaintenanceMargin;
    double feesPaid;                     // fees charged during this week
    double pnl;                          // equity - totalInvested
    double returnPct;
    double timeWeightedReturn;
  };

  inline bool operator==(const WeekRecord& lhs, const WeekRecord& rhs)
  {
    return lhs.weekIndex == rhs.weekIndex &&
      lhs.date == rhs.date &&
      lhs.price == rhs.price &&
      lhs.contributionAmount == rhs.contributionAmount &&
      lhs.contractsAdded == rhs.contractsAdded &&
      lhs.contractsLiquidated == rhs.contractsLiquidated &&
      lhs.totalContracts == rhs.totalContracts &&
      lhs.totalInvested == rhs.totalInvested &&
      lhs.equity == rhs.equity &&
      lhs.positionNotional == rhs.positionNotional &&
      lhs.cashBalance == rhs.cashBalance &&
      lhs.requiredMaintenanceMargin == rhs.requiredMaintenanceMargin &&
      lhs.feesPaid == rhs.feesPaid &&
      lhs.pnl == rhs.pnl &&
      lhs.returnPct == rhs.returnPct &&
      lhs.timeWeightedReturn == rhs.timeWeightedReturn;
  }

  inline bool operator!=(const WeekRecord& lhs, const WeekRecord& rhs)
  {
    return !(lhs == rhs);
  }
} // namespace mkc_dca

#endif // __MKC_DCA_WEEK_RECORD_H
