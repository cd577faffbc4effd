// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_PRICE_SERIES_PROVIDER_H
#define __MKC_DCA_PRICE_SERIES_PROVIDER_H 1

#include <map>
#include <memory>
#include <string>
#include "PriceSeries.h"
#include "DateRange.h"

namespace mkc_dca
{
  /**
   * @brief Read-only source of close-price series.
   *
   * Implementations are injected into the services that need market data.
   * They are queried, never mutated, by the simulation code, so a provider
   * instance may be shared between threads once constructed.
   */
  class IPriceSeriesProvider
  {
  public:
    virtual ~IPriceSeriesProvider() = default;

    /// Points for @p symbol whose date falls inside @p range (inclusive)
    virtual PriceSeries getPriceSeries(const std::string& symbol, const DateRange& range) const = 0;

    /// First and last date for which @p symbol has data
    virtual DateRange getAvailableDateRange(const std::string& symbol) const = 0;
  };

  /**
   * @brief Provider backed by series held in memory, keyed by symbol.
   *
   * Symbol lookup is case-insensitive.
   */
  class StaticPriceSeriesProvider : public IPriceSeriesProvider
  {
  public:
    StaticPriceSeriesProvider();

    void addSeries(const std::string& symbol, std::shared_ptr<const PriceSeries> series);

    PriceSeries getPriceSeries(const std::string& symbol, const DateRange& range) const override;
    DateRange getAvailableDateRange(const std::string& symbol) const override;

  private:
    const PriceSeries& lookup(const std::string& symbol) const;

  private:
    std::map<std::string, std::shared_ptr<const PriceSeries>> mSeriesBySymbol;
  };

  /**
   * @brief Provider that loads one symbol's daily bars from a CSV file at
   *        construction time.
   * @see PriceSeriesCsvReader for the accepted file layout.
   */
  class CsvPriceSeriesProvider : public StaticPriceSeriesProvider
  {
  public:
    CsvPriceSeriesProvider(const std::string& symbol, const std::string& fileName);
  };
} // namespace mkc_dca

#endif // __MKC_DCA_PRICE_SERIES_PROVIDER_H
