// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_PRICE_SERIES_EXCEPTION_H
#define __MKC_DCA_PRICE_SERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_dca
{
  class PriceSeriesException : public std::runtime_error
  {
  public:
    PriceSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~PriceSeriesException() = default;
  };

  // Raised when a price file cannot be opened or a row cannot be parsed
  class PriceDataFormatException : public PriceSeriesException
  {
  public:
    explicit PriceDataFormatException(const std::string& msg)
      : PriceSeriesException(msg) {}
  };

  class PriceDataNotFoundException : public PriceSeriesException
  {
  public:
    explicit PriceDataNotFoundException(const std::string& msg)
      : PriceSeriesException(msg) {}
  };
} // namespace mkc_dca

#endif // __MKC_DCA_PRICE_SERIES_EXCEPTION_H
