// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_PARAMETER_SWEEP_OPTIMIZER_H
#define __MKC_DCA_PARAMETER_SWEEP_OPTIMIZER_H 1

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "AmountGrid.h"
#include "CandidateRanking.h"
#include "OptimizationReport.h"
#include "SweepParameters.h"
#include "PerformanceAnalyzer.h"
#include "SimulationEngine.h"
#include "WeeklyResampler.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "CancellationToken.h"

namespace mkc_dca
{
  /**
   * @brief Searches a grid of weekly contribution amounts for the best DCA plan.
   *
   * optimize() performs these steps:
   *  1. build the amount grid (see buildAmountGrid)
   *  2. resample the input prices to weekly closes once; every candidate
   *     reads that single immutable series
   *  3. simulate and analyze each amount on the executor, one result slot
   *     per grid point
   *  4. rank the successful candidates twice: by the requested sort key
   *     (top-N) and by dollar profit (top-5)
   *
   * A candidate that throws is logged with its amount and left out of both
   * rankings. Cancellation, explicit or through the time budget, is checked
   * before each candidate starts; candidates finished by then stay in the
   * report.
   *
   * @tparam Executor executor policy used to evaluate grid points.
   *         SingleThreadExecutor gives a fully deterministic evaluation order.
   */
  template <class Executor = concurrency::ThreadPoolExecutor<>>
  class ParameterSweepOptimizer
  {
  public:
    /// @throws InvalidConfigError if @p config fails validation
    explicit ParameterSweepOptimizer(const SimulationConfig& config, std::ostream& log = std::cerr)
      : mEngine(config),
	mLog(log)
    {}

    ParameterSweepOptimizer(const ParameterSweepOptimizer&) = delete;
    ParameterSweepOptimizer& operator=(const ParameterSweepOptimizer&) = delete;

    OptimizationReport optimize(const PriceSeries& prices, const SweepParameters& params) const
    {
      if (params.getTimeBudget())
	{
	  concurrency::CancellationToken token(concurrency::CancellationToken::deadlineAfter(*params.getTimeBudget()));
	  return optimize(prices, params, token);
	}

      concurrency::CancellationToken token;
      return optimize(prices, params, token);
    }

    /**
     * @throws NoValidCandidatesError if no candidate succeeded
     */
    OptimizationReport optimize(const PriceSeries& prices,
				const SweepParameters& params,
				const concurrency::CancellationToken& token) const
    {
      AmountGrid grid = buildAmountGrid(params.getAmountMin(), params.getAmountMax(), params.getStepSize());

      std::shared_ptr<const PriceSeries> weekly =
	std::make_shared<const PriceSeries>(resampleToWeeklyClose(prices));

      std::vector<CandidateSlot> slots(grid.amounts.size());
      const SimulationEngine& engine = mEngine;
      const std::vector<double>& amounts = grid.amounts;

      Executor executor;
      concurrency::parallel_for_cancellable(static_cast<uint32_t>(slots.size()), executor, token,
					    [&slots, &amounts, &engine, weekly](uint32_t i) {
					      evaluateCandidate(engine, *weekly, amounts[i], slots[i]);
					    },
					    executor.getNumThreads());

      std::vector<SweepCandidate> succeeded;
      succeeded.reserve(slots.size());

      OptimizationSummary summary{0, 0, 0, 0,
				  grid.effectiveStepSize,
				  params.getSortKey(),
				  params.isDescending(),
				  false,
				  weekly->getNumEntries()};

      for (std::size_t i = 0; i < slots.size(); ++i)
	{
	  CandidateSlot& slot = slots[i];
	  if (!slot.attempted)
	    {
	      ++summary.candidatesSkipped;
	      continue;
	    }

	  ++summary.candidatesTested;
	  if (slot.candidate)
	    {
	      ++summary.candidatesSucceeded;
	      succeeded.push_back(std::move(*slot.candidate));
	    }
	  else
	    {
	      ++summary.candidatesFailed;
	      mLog << "ParameterSweepOptimizer: weekly amount " << amounts[i]
		   << " skipped: " << slot.failure << std::endl;
	    }
	}

      summary.cancelled = summary.candidatesSkipped > 0;
      if (summary.cancelled)
	mLog << "ParameterSweepOptimizer: sweep cancelled after " << summary.candidatesTested
	     << " of " << amounts.size() << " candidates" << std::endl;

      if (succeeded.empty())
	throw NoValidCandidatesError("ParameterSweepOptimizer::optimize - none of the "
				     + std::to_string(summary.candidatesTested)
				     + " evaluated candidates produced a result");

      std::vector<SweepCandidate> topByObjective =
	rankByObjective(succeeded, params.getSortKey(), params.isDescending(), params.getTopN());
      std::vector<SweepCandidate> topByDollarProfit = rankByDollarProfit(succeeded);

      return OptimizationReport(std::move(grid.amounts),
				std::move(succeeded),
				std::move(topByObjective),
				std::move(topByDollarProfit),
				summary);
    }

    const SimulationConfig& getConfig() const
    {
      return mEngine.getConfig();
    }

    /**
     * @brief Simulate and analyze one weekly amount.
     *
     * The candidate keeps unrounded metrics; rankings compare full-precision values.
     * @throws whatever SimulationEngine::simulate throws
     */
    static SweepCandidate makeCandidate(const SimulationEngine& engine,
					const PriceSeries& weeklyPrices,
					double weeklyAmount)
    {
      SimulationResult result = engine.simulate(weeklyPrices, weeklyAmount);
      PerformanceMetrics metrics = PerformanceAnalyzer::computeRawMetrics(result.getWeeklyRecords());

      const double invested = result.getTotalInvested();
      const double dollarProfit = result.getFinalEquity() - invested;
      const double perDollar = (invested > 0.0) ? dollarProfit / invested : 0.0;

      return SweepCandidate{ weeklyAmount, std::move(result), metrics, dollarProfit, perDollar };
    }

  private:
    // Written by exactly one worker; read only after all workers finish
    struct CandidateSlot
    {
      bool attempted = false;
      std::optional<SweepCandidate> candidate;
      std::string failure;
    };

    static void evaluateCandidate(const SimulationEngine& engine,
				  const PriceSeries& weeklyPrices,
				  double weeklyAmount,
				  CandidateSlot& slot)
    {
      slot.attempted = true;
      try
	{
	  slot.candidate = makeCandidate(engine, weeklyPrices, weeklyAmount);
	}
      catch (const std::exception& e)
	{
	  slot.failure = e.what();
	}
    }

    SimulationEngine mEngine;
    std::ostream& mLog;
  };

  /// Sweep with the default thread pool; validates @p config first.
  inline OptimizationReport optimize(const PriceSeries& prices,
				     const SweepParameters& params,
				     const SimulationConfig& config,
				     std::ostream& log = std::cerr)
  {
    ParameterSweepOptimizer<> optimizer(config, log);
    return optimizer.optimize(prices, params);
  }
} // namespace mkc_dca

#endif // __MKC_DCA_PARAMETER_SWEEP_OPTIMIZER_H
