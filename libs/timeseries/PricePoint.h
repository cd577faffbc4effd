// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_PRICE_POINT_H
#define __MKC_DCA_PRICE_POINT_H 1

#include <cmath>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeriesException.h"

namespace mkc_dca
{
  /**
   * @brief A single dated close price.
   *
   * The close must be strictly positive and finite; anything else is rejected
   * at construction so downstream margin arithmetic never sees a zero price.
   */
  class PricePoint
  {
  public:
    PricePoint(const boost::gregorian::date& date, double closePrice)
      : mDate(date),
	mClosePrice(closePrice)
    {
      if (date.is_special())
	throw PriceSeriesException("PricePoint: date must be a valid calendar date");

      if (!std::isfinite(closePrice) || closePrice <= 0.0)
	throw PriceSeriesException("PricePoint: close price must be positive, got "
				   + std::to_string(closePrice)
				   + " on " + boost::gregorian::to_iso_extended_string(date));
    }

    PricePoint(const PricePoint&) = default;
    PricePoint& operator=(const PricePoint&) = default;
    ~PricePoint() noexcept = default;

    const boost::gregorian::date& getDate() const
    {
      return mDate;
    }

    double getClosePrice() const
    {
      return mClosePrice;
    }

  private:
    boost::gregorian::date mDate;
    double mClosePrice;
  };

  inline bool operator==(const PricePoint& lhs, const PricePoint& rhs)
  {
    return (lhs.getDate() == rhs.getDate()) && (lhs.getClosePrice() == rhs.getClosePrice());
  }

  inline bool operator!=(const PricePoint& lhs, const PricePoint& rhs)
  {
    return !(lhs == rhs);
  }
} // namespace mkc_dca

#endif // __MKC_DCA_PRICE_POINT_H
