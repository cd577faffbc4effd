// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <boost/algorithm/string.hpp>
#include "PriceSeriesProvider.h"
#include "PriceSeriesCsvReader.h"

namespace mkc_dca
{
  StaticPriceSeriesProvider::StaticPriceSeriesProvider()
    : mSeriesBySymbol()
  {}

  void StaticPriceSeriesProvider::addSeries(const std::string& symbol,
					    std::shared_ptr<const PriceSeries> series)
  {
    if (!series)
      throw PriceSeriesException("StaticPriceSeriesProvider::addSeries - null series for " + symbol);

    auto key = boost::algorithm::to_upper_copy(symbol);
    auto [it, ok] = mSeriesBySymbol.emplace(key, std::move(series));
    if (!ok)
      throw PriceSeriesException("StaticPriceSeriesProvider::addSeries - symbol " + symbol + " already exists");
  }

  const PriceSeries& StaticPriceSeriesProvider::lookup(const std::string& symbol) const
  {
    auto it = mSeriesBySymbol.find(boost::algorithm::to_upper_copy(symbol));
    if (it == mSeriesBySymbol.end())
      throw PriceDataNotFoundException("No price data available for symbol " + symbol);

    return *(it->second);
  }

  PriceSeries StaticPriceSeriesProvider::getPriceSeries(const std::string& symbol,
							const DateRange& range) const
  {
    return lookup(symbol).subSeries(range);
  }

  DateRange StaticPriceSeriesProvider::getAvailableDateRange(const std::string& symbol) const
  {
    const PriceSeries& series = lookup(symbol);
    if (series.empty())
      throw PriceDataNotFoundException("No price data available for symbol " + symbol);

    return DateRange(series.getFirstDate(), series.getLastDate());
  }

  CsvPriceSeriesProvider::CsvPriceSeriesProvider(const std::string& symbol, const std::string& fileName)
    : StaticPriceSeriesProvider()
  {
    PriceSeriesCsvReader reader(fileName);
    reader.readFile();
    addSeries(symbol, std::make_shared<const PriceSeries>(reader.getPriceSeries()));
  }
} // namespace mkc_dca
