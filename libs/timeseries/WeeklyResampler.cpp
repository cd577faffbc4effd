// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <vector>
#include "WeeklyResampler.h"

namespace mkc_dca
{
  using boost::gregorian::date;
  using boost::gregorian::days;

  date getWeekEndingDate(const date& d, boost::date_time::weekdays weekEnd)
  {
    const int dayOfWeek = d.day_of_week().as_number();  // 0 = Sunday
    const int daysUntilWeekEnd = (static_cast<int>(weekEnd) - dayOfWeek + 7) % 7;

    return d + days(daysUntilWeekEnd);
  }

  PriceSeries resampleToWeeklyClose(const PriceSeries& series, boost::date_time::weekdays weekEnd)
  {
    std::vector<PricePoint> weekly;
    if (series.empty())
      return PriceSeries();

    date currentLabel = getWeekEndingDate(series[0].getDate(), weekEnd);
    double lastClose = series[0].getClosePrice();

    for (std::size_t i = 1; i < series.getNumEntries(); ++i)
      {
	const date label = getWeekEndingDate(series[i].getDate(), weekEnd);
	if (label != currentLabel)
	  {
	    weekly.emplace_back(currentLabel, lastClose);
	    currentLabel = label;
	  }

	lastClose = series[i].getClosePrice();
      }

    weekly.emplace_back(currentLabel, lastClose);
    return PriceSeries(std::move(weekly));
  }
} // namespace mkc_dca
