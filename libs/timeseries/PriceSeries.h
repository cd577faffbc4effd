// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_PRICE_SERIES_H
#define __MKC_DCA_PRICE_SERIES_H 1

#include <vector>
#include <string>
#include <utility>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PricePoint.h"
#include "DateRange.h"
#include "PriceSeriesException.h"

namespace mkc_dca
{
  /**
   * @brief Immutable close-price series ordered strictly ascending by date.
   *
   * A PriceSeries is the unit of data shared between a simulation and the
   * analysis built on top of it. Once constructed it is never modified, which
   * allows one instance to be read concurrently by any number of simulations.
   */
  class PriceSeries
  {
  public:
    typedef std::vector<PricePoint>::const_iterator ConstIterator;

    PriceSeries()
      : mPoints()
    {}

    explicit PriceSeries(std::vector<PricePoint> points)
      : mPoints(std::move(points))
    {
      for (std::size_t i = 1; i < mPoints.size(); ++i)
	{
	  if (!(mPoints[i - 1].getDate() < mPoints[i].getDate()))
	    throw PriceSeriesException("PriceSeries: dates must be strictly ascending, found "
				       + boost::gregorian::to_iso_extended_string(mPoints[i - 1].getDate())
				       + " followed by "
				       + boost::gregorian::to_iso_extended_string(mPoints[i].getDate()));
	}
    }

    PriceSeries(const PriceSeries&) = default;
    PriceSeries& operator=(const PriceSeries&) = default;
    PriceSeries(PriceSeries&&) = default;
    PriceSeries& operator=(PriceSeries&&) = default;
    ~PriceSeries() noexcept = default;

    std::size_t getNumEntries() const
    {
      return mPoints.size();
    }

    bool empty() const
    {
      return mPoints.empty();
    }

    const PricePoint& operator[](std::size_t i) const
    {
      return mPoints[i];
    }

    const PricePoint& getEntry(std::size_t i) const
    {
      if (i >= mPoints.size())
	throw PriceSeriesException("PriceSeries::getEntry - offset " + std::to_string(i)
				   + " out of range for series with "
				   + std::to_string(mPoints.size()) + " entries");
      return mPoints[i];
    }

    ConstIterator begin() const
    {
      return mPoints.begin();
    }

    ConstIterator end() const
    {
      return mPoints.end();
    }

    const boost::gregorian::date& getFirstDate() const
    {
      return getEntry(0).getDate();
    }

    const boost::gregorian::date& getLastDate() const
    {
      if (mPoints.empty())
	throw PriceSeriesException("PriceSeries::getLastDate - series is empty");
      return mPoints.back().getDate();
    }

    const std::vector<PricePoint>& getPoints() const
    {
      return mPoints;
    }

    // Points whose date falls inside the inclusive range
    PriceSeries subSeries(const DateRange& range) const
    {
      std::vector<PricePoint> selected;
      for (const auto& p : mPoints)
	{
	  if (range.contains(p.getDate()))
	    selected.push_back(p);
	}
      return PriceSeries(std::move(selected));
    }

  private:
    std::vector<PricePoint> mPoints;
  };
} // namespace mkc_dca

#endif // __MKC_DCA_PRICE_SERIES_H
