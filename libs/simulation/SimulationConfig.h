// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_SIMULATION_CONFIG_H
#define __MKC_DCA_SIMULATION_CONFIG_H 1

#include <ostream>
#include "DcaExceptions.h"

namespace mkc_dca
{
  /**
   * @brief Contract and risk parameters of a leveraged weekly DCA simulation.
   *
   * Design:
   *  - One constructor taking every field; getters only.
   *  - Construction does not validate. validate() is called once by
   *    SimulationEngine (and therefore once per sweep) and throws
   *    InvalidConfigError naming the first offending field.
   *
   * Constraints enforced by validate():
   *  - every field strictly positive (and finite)
   *  - maintenanceMarginPerContract < initialMarginPerContract
   *  - maxContracts >= 1, maxContractAddsPerWeek >= 1
   */
  class SimulationConfig
  {
  public:
    SimulationConfig(double contractMultiplier,
		     double initialMarginPerContract,
		     double maintenanceMarginPerContract,
		     double commissionPerContract,
		     double slippagePerContract,
		     int maxContracts,
		     double minEquityToNotionalRatio,
		     int maxContractAddsPerWeek);

    SimulationConfig(const SimulationConfig&) = default;
    SimulationConfig& operator=(const SimulationConfig&) = default;
    ~SimulationConfig() = default;

    /**
     * @brief Micro E-mini NASDAQ-100 defaults: $2 per point, $1000 initial /
     *        $800 maintenance margin, $2.50 commission, $1.00 slippage,
     *        at most 100 contracts, 10% equity-to-notional floor, one add per week.
     */
    static SimulationConfig microNasdaqDefaults();

    void validate() const;

    double getContractMultiplier() const
    {
      return mContractMultiplier;
    }

    double getInitialMarginPerContract() const
    {
      return mInitialMarginPerContract;
    }

    double getMaintenanceMarginPerContract() const
    {
      return mMaintenanceMarginPerContract;
    }

    double getCommissionPerContract() const
    {
      return mCommissionPerContract;
    }

    double getSlippagePerContract() const
    {
      return mSlippagePerContract;
    }

    /** @return commission + slippage charged for every contract opened or closed */
    double getFeePerContract() const
    {
      return mCommissionPerContract + mSlippagePerContract;
    }

    int getMaxContracts() const
    {
      return mMaxContracts;
    }

    double getMinEquityToNotionalRatio() const
    {
      return mMinEquityToNotionalRatio;
    }

    int getMaxContractAddsPerWeek() const
    {
      return mMaxContractAddsPerWeek;
    }

  private:
    double mContractMultiplier;
    double mInitialMarginPerContract;
    double mMaintenanceMarginPerContract;
    double mCommissionPerContract;
    double mSlippagePerContract;
    int mMaxContracts;
    double mMinEquityToNotionalRatio;
    int mMaxContractAddsPerWeek;
  };

  bool operator==(const SimulationConfig& lhs, const SimulationConfig& rhs);
  bool operator!=(const SimulationConfig& lhs, const SimulationConfig& rhs);

  std::ostream& operator<<(std::ostream& os, const SimulationConfig& config);
} // namespace mkc_dca

#endif // __MKC_DCA_SIMULATION_CONFIG_H
