// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "DcaPerformanceService.h"
#include "ParameterSweepOptimizer.h"
#include "PerformanceAnalyzer.h"
#include "PriceSeriesException.h"
#include "SimulationEngine.h"
#include "WeeklyResampler.h"
#include "utils/TimeUtils.h"

using namespace mkc_dca;

namespace dcasweep
{
  constexpr long DcaPerformanceService::DefaultLookbackDays;

  DcaPerformanceService::DcaPerformanceService(std::shared_ptr<const IPriceSeriesProvider> provider,
					       const std::string& symbol,
					       const SimulationConfig& config,
					       std::ostream& log)
    : mProvider(provider),
      mSymbol(symbol),
      mConfig(config),
      mLog(log)
  {
    if (!mProvider)
      throw PriceSeriesException("DcaPerformanceService - price series provider is null");

    mConfig.validate();
  }

  DateRange DcaPerformanceService::resolveDateRange(const boost::gregorian::date& today,
						    std::optional<boost::gregorian::date> startDate,
						    std::optional<boost::gregorian::date> endDate) const
  {
    const boost::gregorian::date last = endDate ? *endDate : today;
    const boost::gregorian::date first = startDate ? *startDate
      : last - boost::gregorian::days(DefaultLookbackDays);

    return DateRange(first, last);
  }

  PriceSeries DcaPerformanceService::fetchDailySeries(const DateRange& range) const
  {
    PriceSeries daily = mProvider->getPriceSeries(mSymbol, range);
    if (daily.empty())
      throw PriceDataNotFoundException("No " + mSymbol + " price data available between "
				       + utils::toIsoDateString(range.getFirstDate()) + " and "
				       + utils::toIsoDateString(range.getLastDate()));
    return daily;
  }

  DcaPerformanceReport
  DcaPerformanceService::calculateWeeklyDcaPerformance(double weeklyAmount,
						       std::optional<boost::gregorian::date> startDate,
						       std::optional<boost::gregorian::date> endDate) const
  {
    return calculateWeeklyDcaPerformanceAsOf(utils::getToday(), weeklyAmount, startDate, endDate);
  }

  DcaPerformanceReport
  DcaPerformanceService::calculateWeeklyDcaPerformanceAsOf(const boost::gregorian::date& today,
							   double weeklyAmount,
							   std::optional<boost::gregorian::date> startDate,
							   std::optional<boost::gregorian::date> endDate) const
  {
    const DateRange range = resolveDateRange(today, startDate, endDate);

    mLog << "Starting " << mSymbol << " DCA calculation: $" << weeklyAmount << "/week from "
	 << utils::toIsoDateString(range.getFirstDate()) << " to "
	 << utils::toIsoDateString(range.getLastDate()) << std::endl;

    PriceSeries weekly = resampleToWeeklyClose(fetchDailySeries(range));

    SimulationEngine engine(mConfig);
    SimulationResult result = engine.simulate(weekly, weeklyAmount);
    PerformanceMetrics metrics = PerformanceAnalyzer::analyze(result);
    std::vector<EquityCurvePoint> curve = buildEquityCurve(result);

    mLog << mSymbol << " DCA calculation completed: " << result.getNumWeeks() << " weeks, "
	 << result.getTotalContracts() << " contracts held" << std::endl;

    return DcaPerformanceReport{ mSymbol,
				 weeklyAmount,
				 range.getFirstDate(),
				 range.getLastDate(),
				 weekly.getNumEntries(),
				 result.getTotalInvested(),
				 result.getFinalEquity(),
				 metrics.totalReturnPct,
				 result.getTotalContracts(),
				 result,
				 metrics,
				 curve };
  }

  OptimizationReport
  DcaPerformanceService::optimizeWeeklyAmount(const SweepParameters& params,
					      std::optional<boost::gregorian::date> startDate,
					      std::optional<boost::gregorian::date> endDate) const
  {
    const DateRange range = resolveDateRange(utils::getToday(), startDate, endDate);

    mLog << "Starting " << mSymbol << " weekly amount sweep: " << params.getAmountMin()
	 << " to " << params.getAmountMax() << " step " << params.getStepSize()
	 << ", ranked by " << params.getSortKey() << std::endl;

    ParameterSweepOptimizer<> optimizer(mConfig, mLog);
    OptimizationReport report = optimizer.optimize(fetchDailySeries(range), params);

    mLog << mSymbol << " sweep completed: " << report.getSummary().candidatesSucceeded << " of "
	 << report.getTestedGrid().size() << " amounts evaluated successfully" << std::endl;

    return report;
  }

  DateRange DcaPerformanceService::getAvailableDateRange() const
  {
    return mProvider->getAvailableDateRange(mSymbol);
  }
}
