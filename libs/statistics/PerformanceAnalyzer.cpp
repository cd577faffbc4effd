// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "PerformanceAnalyzer.h"

namespace mkc_dca
{
  using boost::accumulators::accumulator_set;
  using boost::accumulators::stats;

  typedef boost::accumulators::tag::mean mean_tag;
  typedef boost::accumulators::tag::variance variance_tag;

  constexpr double PerformanceAnalyzer::WeeksPerYear;

  PerformanceMetrics PerformanceAnalyzer::analyze(const SimulationResult& result)
  {
    return analyze(result.getWeeklyRecords());
  }

  PerformanceMetrics PerformanceAnalyzer::analyze(const std::vector<WeekRecord>& weeks)
  {
    return computeRawMetrics(weeks).rounded(2);
  }

  std::vector<double> PerformanceAnalyzer::extractReturnSeries(const std::vector<WeekRecord>& weeks)
  {
    std::vector<double> returns;
    if (weeks.size() < 2)
      return returns;

    returns.reserve(weeks.size() - 1);
    for (std::size_t i = 1; i < weeks.size(); ++i)
      {
	if (std::isfinite(weeks[i].timeWeightedReturn))
	  returns.push_back(weeks[i].timeWeightedReturn);
      }

    return returns;
  }

  double PerformanceAnalyzer::computeMaxDrawdownPct(const std::vector<WeekRecord>& weeks)
  {
    if (weeks.empty())
      return 0.0;

    double peak = weeks.front().equity;
    double maxDrawdown = 0.0;

    for (const auto& w : weeks)
      {
	if (w.equity > peak)
	  peak = w.equity;

	if (peak > 0.0)
	  {
	    const double drawdown = (peak - w.equity) / peak;
	    if (drawdown > maxDrawdown)
	      maxDrawdown = drawdown;
	  }
      }

    return maxDrawdown * 100.0;
  }

  double PerformanceAnalyzer::computeCagrPct(const std::vector<double>& weeklyReturns)
  {
    const double years = static_cast<double>(weeklyReturns.size()) / WeeksPerYear;
    if (years <= 0.0)
      return 0.0;

    double compoundFactor = 1.0;
    for (double r : weeklyReturns)
      compoundFactor *= (1.0 + r);

    // A return of -100% or worse leaves nothing to compound
    if (compoundFactor <= 0.0)
      return -100.0;

    return (std::pow(compoundFactor, 1.0 / years) - 1.0) * 100.0;
  }

  PerformanceMetrics PerformanceAnalyzer::computeRawMetrics(const std::vector<WeekRecord>& weeks)
  {
    PerformanceMetrics metrics{0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    if (weeks.empty())
      return metrics;

    const double totalInvested = weeks.back().totalInvested;
    const double finalEquity = weeks.back().equity;
    metrics.totalReturnPct = (totalInvested > 0.0) ? (finalEquity / totalInvested - 1.0) * 100.0 : 0.0;

    const std::vector<double> returns = extractReturnSeries(weeks);

    if (returns.size() > 1)
      {
	accumulator_set<double, stats<mean_tag, variance_tag>> acc;
	for (double r : returns)
	  acc(r);

	const double meanReturn = boost::accumulators::mean(acc);
	const double variance = boost::accumulators::variance(acc);
	const double stdDev = (variance > 0.0) ? std::sqrt(variance) : 0.0;

	if (stdDev > 0.0)
	  {
	    const double annualizer = std::sqrt(WeeksPerYear);
	    metrics.volatilityAnnualized = stdDev * annualizer * 100.0;
	    metrics.sharpeRatio = (meanReturn / stdDev) * annualizer;
	  }
      }

    metrics.cagr = computeCagrPct(returns);
    metrics.maxDrawdownPct = computeMaxDrawdownPct(weeks);

    double gains = 0.0;
    double losses = 0.0;
    unsigned int positiveWeeks = 0;
    unsigned int countedWeeks = 0;
    double previousEquity = weeks.front().equity;

    for (std::size_t i = 1; i < weeks.size(); ++i)
      {
	const double r = weeks[i].timeWeightedReturn;
	if (!std::isfinite(r))
	  continue;

	const double weekPnl = r * previousEquity;
	if (weekPnl > 0.0)
	  {
	    gains += weekPnl;
	    ++positiveWeeks;
	  }
	else
	  losses += -weekPnl;

	++countedWeeks;
	previousEquity = weeks[i].equity;
      }

    metrics.profitFactor = (losses > 0.0) ? gains / losses : 0.0;
    metrics.winRatePct = (countedWeeks > 0)
      ? (static_cast<double>(positiveWeeks) / countedWeeks) * 100.0
      : 0.0;

    return metrics;
  }
} // namespace mkc_dca
