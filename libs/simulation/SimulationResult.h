// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_SIMULATION_RESULT_H
#define __MKC_DCA_SIMULATION_RESULT_H 1

#include <vector>
#include <utility>
#include "WeekRecord.h"

namespace mkc_dca
{
  /**
   * @brief Immutable outcome of one weekly DCA simulation.
   *
   * The summary fields mirror the last WeekRecord; an empty ledger reports
   * zero for all of them.
   */
  class SimulationResult
  {
  public:
    typedef std::vector<WeekRecord>::const_iterator ConstWeekIterator;

    SimulationResult(double weeklyAmount, std::vector<WeekRecord> weeklyRecords, double cumulativeFees)
      : mWeeklyAmount(weeklyAmount),
	mWeeklyRecords(std::move(weeklyRecords)),
	mCumulativeFees(cumulativeFees)
    {}

    SimulationResult(const SimulationResult&) = default;
    SimulationResult& operator=(const SimulationResult&) = default;
    SimulationResult(SimulationResult&&) = default;
    SimulationResult& operator=(SimulationResult&&) = default;
    ~SimulationResult() = default;

    double getWeeklyAmount() const
    {
      return mWeeklyAmount;
    }

    const std::vector<WeekRecord>& getWeeklyRecords() const
    {
      return mWeeklyRecords;
    }

    std::size_t getNumWeeks() const
    {
      return mWeeklyRecords.size();
    }

    ConstWeekIterator beginWeeks() const
    {
      return mWeeklyRecords.begin();
    }

    ConstWeekIterator endWeeks() const
    {
      return mWeeklyRecords.end();
    }

    double getTotalInvested() const
    {
      return mWeeklyRecords.empty() ? 0.0 : mWeeklyRecords.back().totalInvested;
    }

    double getFinalEquity() const
    {
      return mWeeklyRecords.empty() ? 0.0 : mWeeklyRecords.back().equity;
    }

    int getTotalContracts() const
    {
      return mWeeklyRecords.empty() ? 0 : mWeeklyRecords.back().totalContracts;
    }

    double getCumulativeFees() const
    {
      return mCumulativeFees;
    }

  private:
    double mWeeklyAmount;
    std::vector<WeekRecord> mWeeklyRecords;
    double mCumulativeFees;
  };
} // namespace mkc_dca

#endif // __MKC_DCA_SIMULATION_RESULT_H
