// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_SIMULATION_ENGINE_H
#define __MKC_DCA_SIMULATION_ENGINE_H 1

#include "PriceSeries.h"
#include "SimulationConfig.h"
#include "SimulationResult.h"
#include "DcaExceptions.h"

namespace mkc_dca
{
  /**
   * @brief Outcome of evaluating a single one-contract add.
   */
  enum class ContractAddDecision
    {
      Accepted,
      RejectedMaxContracts,     // already holding maxContracts
      RejectedInitialMargin,    // equity does not cover initial margin after the add
      RejectedNotionalRatio     // equity after fees below the equity-to-notional floor
    };

  /**
   * @brief Weekly dollar-cost-averaging simulator for a margined futures contract.
   *
   * Each week, in order:
   *  1. mark the open position to market against the previous week's price
   *  2. add the weekly contribution to cash and equity
   *  3. attempt up to maxContractAddsPerWeek single-contract adds, stopping
   *     at the first rejection (see evaluateContractAdd)
   *  4. force-close one contract at a time while equity is below maintenance
   *  5. floor a flat account's fee-driven negative equity at zero
   *  6. record the week
   *
   * simulate() is a pure function of its arguments: it holds no mutable state
   * and reads no clock or random source, so one engine may be shared across
   * threads and identical inputs produce identical ledgers.
   */
  class SimulationEngine
  {
  public:
    /// @throws InvalidConfigError if @p config fails validation
    explicit SimulationEngine(const SimulationConfig& config);

    SimulationEngine(const SimulationEngine&) = default;
    SimulationEngine& operator=(const SimulationEngine&) = default;
    ~SimulationEngine() = default;

    /**
     * @brief Run one simulation over a weekly close series.
     * @throws InsufficientDataError if @p prices has fewer than two points
     * @throws InvalidConfigError if @p weeklyAmount is not strictly positive
     */
    SimulationResult simulate(const PriceSeries& prices, double weeklyAmount) const;

    /**
     * @brief Decide whether one more contract may be opened.
     *
     * The initial-margin test compares the equity available when the add is
     * considered against (totalContracts+1) * initialMargin. The
     * equity-to-notional test compares equity net of the add's fees against
     * (totalContracts+1) * price * multiplier * minEquityToNotionalRatio.
     */
    ContractAddDecision evaluateContractAdd(double equity, int totalContracts, double price) const;

    const SimulationConfig& getConfig() const
    {
      return mConfig;
    }

  private:
    SimulationConfig mConfig;
  };

  /// Convenience wrapper: validates @p config and runs one simulation.
  SimulationResult simulate(const PriceSeries& prices, double weeklyAmount, const SimulationConfig& config);
} // namespace mkc_dca

#endif // __MKC_DCA_SIMULATION_ENGINE_H
