// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_DIAGNOSTIC_SELECTOR_H
#define __MKC_DCA_DIAGNOSTIC_SELECTOR_H 1

#include <optional>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "SimulationResult.h"
#include "WeekRecord.h"

namespace mkc_dca
{
  /// The only facts about a week handed to the narrative generator
  struct WorstWeekDiagnostic
  {
    boost::gregorian::date date;
    double returnPct;
  };

  class DiagnosticSelector
  {
  public:
    /**
     * @brief Week with the lowest returnPct; the earliest one wins ties.
     *
     * Records whose returnPct is not finite are ignored. If no record has a
     * finite returnPct the first record is returned. An empty ledger yields
     * std::nullopt.
     */
    static std::optional<WeekRecord> findWorstWeek(const SimulationResult& result);
    static std::optional<WeekRecord> findWorstWeek(const std::vector<WeekRecord>& weeks);

    static WorstWeekDiagnostic makeNarrativeRequest(const WeekRecord& week);
  };
} // namespace mkc_dca

#endif // __MKC_DCA_DIAGNOSTIC_SELECTOR_H
