// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_WEEKLY_RESAMPLER_H
#define __MKC_DCA_WEEKLY_RESAMPLER_H 1

#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeries.h"

namespace mkc_dca
{
  /**
   * @brief Returns the week-ending date that @p d belongs to.
   *
   * The week ending on @p weekEnd contains the six days before it plus the
   * week-end day itself, so a Saturday maps to the following Friday.
   */
  boost::gregorian::date
  getWeekEndingDate(const boost::gregorian::date& d,
		    boost::date_time::weekdays weekEnd = boost::date_time::Friday);

  /**
   * @brief Resample a (typically daily) series to one close per week.
   *
   * Every observation is assigned to the week ending on @p weekEnd on or after
   * its date. The weekly close is the last observation inside that week and is
   * dated with the week-end label. Weeks without observations are dropped.
   *
   * Applying the resampler to a series that is already dated on week-end days
   * returns an identical series.
   */
  PriceSeries resampleToWeeklyClose(const PriceSeries& series,
				    boost::date_time::weekdays weekEnd = boost::date_time::Friday);
} // namespace mkc_dca

#endif // __MKC_DCA_WEEKLY_RESAMPLER_H
