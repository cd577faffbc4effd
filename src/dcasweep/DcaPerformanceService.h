// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"
#include "EquityCurve.h"
#include "OptimizationReport.h"
#include "PerformanceMetrics.h"
#include "PriceSeriesProvider.h"
#include "SimulationConfig.h"
#include "SimulationResult.h"
#include "SweepParameters.h"

namespace dcasweep
{
  // Everything produced by one weekly DCA calculation
  struct DcaPerformanceReport
  {
    std::string symbol;
    double weeklyAmount;
    boost::gregorian::date startDate;
    boost::gregorian::date endDate;
    std::size_t totalWeeks;
    double totalInvested;
    double currentValue;
    double totalReturnPct;
    int totalContracts;
    mkc_dca::SimulationResult result;
    mkc_dca::PerformanceMetrics metrics;
    std::vector<mkc_dca::EquityCurvePoint> equityCurve;
  };

  /**
   * @brief Runs DCA calculations and sweeps for one symbol against an
   *        injected price provider.
   *
   * When a start or end date is not given, the end defaults to today and the
   * start to 365 days before the end. The provider's daily bars are resampled
   * to weekly Friday closes before simulation.
   */
  class DcaPerformanceService
  {
  public:
    static constexpr long DefaultLookbackDays = 365;

    DcaPerformanceService(std::shared_ptr<const mkc_dca::IPriceSeriesProvider> provider,
			  const std::string& symbol,
			  const mkc_dca::SimulationConfig& config,
			  std::ostream& log = std::cout);

    /**
     * @throws mkc_dca::PriceDataNotFoundException if the window holds no bars
     * @throws mkc_dca::InsufficientDataError if it holds fewer than two weeks
     * @throws mkc_dca::InvalidConfigError if @p weeklyAmount is not positive
     */
    DcaPerformanceReport
    calculateWeeklyDcaPerformance(double weeklyAmount,
				  std::optional<boost::gregorian::date> startDate = std::nullopt,
				  std::optional<boost::gregorian::date> endDate = std::nullopt) const;

    /// Same as calculateWeeklyDcaPerformance with @p today as the default end date
    DcaPerformanceReport
    calculateWeeklyDcaPerformanceAsOf(const boost::gregorian::date& today,
				      double weeklyAmount,
				      std::optional<boost::gregorian::date> startDate,
				      std::optional<boost::gregorian::date> endDate) const;

    /// Sweep weekly amounts over the same date window rules
    mkc_dca::OptimizationReport
    optimizeWeeklyAmount(const mkc_dca::SweepParameters& params,
			 std::optional<boost::gregorian::date> startDate = std::nullopt,
			 std::optional<boost::gregorian::date> endDate = std::nullopt) const;

    mkc_dca::DateRange getAvailableDateRange() const;

    mkc_dca::DateRange resolveDateRange(const boost::gregorian::date& today,
					std::optional<boost::gregorian::date> startDate,
					std::optional<boost::gregorian::date> endDate) const;

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const mkc_dca::SimulationConfig& getConfig() const
    {
      return mConfig;
    }

  private:
    mkc_dca::PriceSeries fetchDailySeries(const mkc_dca::DateRange& range) const;

    std::shared_ptr<const mkc_dca::IPriceSeriesProvider> mProvider;
    std::string mSymbol;
    mkc_dca::SimulationConfig mConfig;
    std::ostream& mLog;
  };
}
