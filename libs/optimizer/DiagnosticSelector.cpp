// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include "DiagnosticSelector.h"

namespace mkc_dca
{
  std::optional<WeekRecord> DiagnosticSelector::findWorstWeek(const SimulationResult& result)
  {
    return findWorstWeek(result.getWeeklyRecords());
  }

  std::optional<WeekRecord> DiagnosticSelector::findWorstWeek(const std::vector<WeekRecord>& weeks)
  {
    if (weeks.empty())
      return std::nullopt;

    const WeekRecord* worst = nullptr;
    for (const auto& w : weeks)
      {
	if (!std::isfinite(w.returnPct))
	  continue;

	if (worst == nullptr || w.returnPct < worst->returnPct)
	  worst = &w;
      }

    return (worst != nullptr) ? *worst : weeks.front();
  }

  WorstWeekDiagnostic DiagnosticSelector::makeNarrativeRequest(const WeekRecord& week)
  {
    return WorstWeekDiagnostic{ week.date, week.returnPct };
  }
} // namespace mkc_dca
