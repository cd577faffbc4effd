// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <string>
#include "SimulationConfig.h"

namespace mkc_dca
{
  namespace
  {
    void requirePositive(double value, const char* fieldName)
    {
      if (!std::isfinite(value) || value <= 0.0)
	throw InvalidConfigError(std::string("SimulationConfig: ") + fieldName
				 + " must be positive, got " + std::to_string(value));
    }

    void requireAtLeastOne(int value, const char* fieldName)
    {
      if (value < 1)
	throw InvalidConfigError(std::string("SimulationConfig: ") + fieldName
				 + " must be at least 1, got " + std::to_string(value));
    }
  }

  SimulationConfig::SimulationConfig(double contractMultiplier,
				     double initialMarginPerContract,
				     double maintenanceMarginPerContract,
				     double commissionPerContract,
				     double slippagePerContract,
				     int maxContracts,
				     double minEquityToNotionalRatio,
				     int maxContractAddsPerWeek)
    : mContractMultiplier(contractMultiplier),
      mInitialMarginPerContract(initialMarginPerContract),
      mMaintenanceMarginPerContract(maintenanceMarginPerContract),
      mCommissionPerContract(commissionPerContract),
      mSlippagePerContract(slippagePerContract),
      mMaxContracts(maxContracts),
      mMinEquityToNotionalRatio(minEquityToNotionalRatio),
      mMaxContractAddsPerWeek(maxContractAddsPerWeek)
  {}

  SimulationConfig SimulationConfig::microNasdaqDefaults()
  {
    return SimulationConfig(2.0, 1000.0, 800.0, 2.50, 1.00, 100, 0.10, 1);
  }

  void SimulationConfig::validate() const
  {
    requirePositive(mContractMultiplier, "contractMultiplier");
    requirePositive(mInitialMarginPerContract, "initialMarginPerContract");
    requirePositive(mMaintenanceMarginPerContract, "maintenanceMarginPerContract");
    requirePositive(mCommissionPerContract, "commissionPerContract");
    requirePositive(mSlippagePerContract, "slippagePerContract");
    requireAtLeastOne(mMaxContracts, "maxContracts");
    requirePositive(mMinEquityToNotionalRatio, "minEquityToNotionalRatio");
    requireAtLeastOne(mMaxContractAddsPerWeek, "maxContractAddsPerWeek");

    if (!(mMaintenanceMarginPerContract < mInitialMarginPerContract))
      throw InvalidConfigError("SimulationConfig: maintenanceMarginPerContract ("
			       + std::to_string(mMaintenanceMarginPerContract)
			       + ") must be less than initialMarginPerContract ("
			       + std::to_string(mInitialMarginPerContract) + ")");
  }

  bool operator==(const SimulationConfig& lhs, const SimulationConfig& rhs)
  {
    return (lhs.getContractMultiplier() == rhs.getContractMultiplier()) &&
      (lhs.getInitialMarginPerContract() == rhs.getInitialMarginPerContract()) &&
      (lhs.getMaintenanceMarginPerContract() == rhs.getMaintenanceMarginPerContract()) &&
      (lhs.getCommissionPerContract() == rhs.getCommissionPerContract()) &&
      (lhs.getSlippagePerContract() == rhs.getSlippagePerContract()) &&
      (lhs.getMaxContracts() == rhs.getMaxContracts()) &&
      (lhs.getMinEquityToNotionalRatio() == rhs.getMinEquityToNotionalRatio()) &&
      (lhs.getMaxContractAddsPerWeek() == rhs.getMaxContractAddsPerWeek());
  }

  bool operator!=(const SimulationConfig& lhs, const SimulationConfig& rhs)
  {
    return !(lhs == rhs);
  }

  std::ostream& operator<<(std::ostream& os, const SimulationConfig& config)
  {
    os << "Contract multiplier: " << config.getContractMultiplier() << std::endl;
    os << "Initial margin per contract: " << config.getInitialMarginPerContract() << std::endl;
    os << "Maintenance margin per contract: " << config.getMaintenanceMarginPerContract() << std::endl;
    os << "Commission per contract: " << config.getCommissionPerContract() << std::endl;
    os << "Slippage per contract: " << config.getSlippagePerContract() << std::endl;
    os << "Max contracts: " << config.getMaxContracts() << std::endl;
    os << "Min equity to notional ratio: " << config.getMinEquityToNotionalRatio() << std::endl;
    os << "Max contract adds per week: " << config.getMaxContractAddsPerWeek() << std::endl;
    return os;
  }
} // namespace mkc_dca
