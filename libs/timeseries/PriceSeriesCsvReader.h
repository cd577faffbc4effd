// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_PRICE_SERIES_CSV_READER_H
#define __MKC_DCA_PRICE_SERIES_CSV_READER_H 1

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeries.h"

namespace mkc_dca
{
  /**
   * @brief Parse a bar date in either ISO extended (2024-01-05) or
   *        undelimited (20240105) form.
   *
   * Anything after the first ten characters of an ISO date (a time or a UTC
   * offset appended by some vendors) is ignored.
   */
  boost::gregorian::date parseBarDate(const std::string& dateStamp);

  //
  // Reads daily bar files with a header row. The file must contain "Date" and
  // "Close" columns; when an "Adj Close" column is present it is used instead
  // of "Close". Any other columns (Open, High, Low, Volume...) are ignored.
  //
  // Rows with an empty close are skipped.
  //
  class PriceSeriesCsvReader
  {
  public:
    explicit PriceSeriesCsvReader(const std::string& fileName);

    PriceSeriesCsvReader(const PriceSeriesCsvReader&) = default;
    PriceSeriesCsvReader& operator=(const PriceSeriesCsvReader&) = default;
    ~PriceSeriesCsvReader() = default;

    void readFile();

    const PriceSeries& getPriceSeries() const
    {
      return mSeries;
    }

    const std::string& getFileName() const
    {
      return mFileName;
    }

    bool usedAdjustedClose() const
    {
      return mUsedAdjustedClose;
    }

  private:
    std::string mFileName;
    PriceSeries mSeries;
    bool mUsedAdjustedClose;
  };
} // namespace mkc_dca

#endif // __MKC_DCA_PRICE_SERIES_CSV_READER_H
