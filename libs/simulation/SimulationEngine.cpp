// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <string>
#include <vector>
#include "SimulationEngine.h"

namespace mkc_dca
{
  SimulationEngine::SimulationEngine(const SimulationConfig& config)
    : mConfig(config)
  {
    mConfig.validate();
  }

  ContractAddDecision SimulationEngine::evaluateContractAdd(double equity, int totalContracts, double price) const
  {
    if (totalContracts >= mConfig.getMaxContracts())
      return ContractAddDecision::RejectedMaxContracts;

    const int contractsAfterAdd = totalContracts + 1;
    const double requiredInitialMargin = contractsAfterAdd * mConfig.getInitialMarginPerContract();
    if (equity < requiredInitialMargin)
      return ContractAddDecision::RejectedInitialMargin;

    const double equityAfterFees = equity - mConfig.getFeePerContract();
    const double notionalAfterAdd = contractsAfterAdd * price * mConfig.getContractMultiplier();
    if (equityAfterFees < notionalAfterAdd * mConfig.getMinEquityToNotionalRatio())
      return ContractAddDecision::RejectedNotionalRatio;

    return ContractAddDecision::Accepted;
  }

  SimulationResult SimulationEngine::simulate(const PriceSeries& prices, double weeklyAmount) const
  {
    if (prices.getNumEntries() < 2)
      throw InsufficientDataError("SimulationEngine::simulate - at least 2 weekly prices are required, got "
				  + std::to_string(prices.getNumEntries()));

    if (!std::isfinite(weeklyAmount) || weeklyAmount <= 0.0)
      throw InvalidConfigError("SimulationEngine::simulate - weekly amount must be positive, got "
			       + std::to_string(weeklyAmount));

    const double multiplier = mConfig.getContractMultiplier();
    const double feePerContract = mConfig.getFeePerContract();

    std::vector<WeekRecord> records;
    records.reserve(prices.getNumEntries());

    double cashBalance = 0.0;
    double equity = 0.0;
    double cumulativeFees = 0.0;
    int totalContracts = 0;

    for (std::size_t i = 0; i < prices.getNumEntries(); ++i)
      {
	const PricePoint& point = prices[i];
	const double price = point.getClosePrice();
	const unsigned int weekIndex = static_cast<unsigned int>(i + 1);

	// Mark-to-market against last week's close
	if (i > 0 && totalContracts != 0)
	  {
	    const double markToMarket = (price - prices[i - 1].getClosePrice()) * multiplier * totalContracts;
	    cashBalance += markToMarket;
	    equity += markToMarket;
	  }

	double equityBeforeContribution = equity;

	cashBalance += weeklyAmount;
	equity += weeklyAmount;
	// Computed rather than accumulated so it is exactly weekIndex * weeklyAmount
	const double totalInvested = weekIndex * weeklyAmount;

	double weekFees = 0.0;

	int contractsAdded = 0;
	while (contractsAdded < mConfig.getMaxContractAddsPerWeek())
	  {
	    if (evaluateContractAdd(equity, totalContracts, price) != ContractAddDecision::Accepted)
	      break;

	    cashBalance -= feePerContract;
	    equity -= feePerContract;
	    weekFees += feePerContract;
	    ++totalContracts;
	    ++contractsAdded;
	  }

	double requiredMaintenance = totalContracts * mConfig.getMaintenanceMarginPerContract();
	int contractsLiquidated = 0;
	while (totalContracts > 0 && equity < requiredMaintenance)
	  {
	    cashBalance -= feePerContract;
	    equity -= feePerContract;
	    weekFees += feePerContract;
	    --totalContracts;
	    ++contractsLiquidated;
	    requiredMaintenance = totalContracts * mConfig.getMaintenanceMarginPerContract();
	  }

	if (totalContracts == 0 && equity < 0.0)
	  {
	    equity = 0.0;
	    cashBalance = 0.0;
	    equityBeforeContribution = 0.0;
	  }

	cumulativeFees += weekFees;

	const double pnl = equity - totalInvested;
	const double timeWeightedReturn = (equityBeforeContribution > 0.0)
	  ? (equity - equityBeforeContribution - weeklyAmount) / equityBeforeContribution
	  : 0.0;

	WeekRecord record;
	record.weekIndex = weekIndex;
	record.date = point.getDate();
	record.price = price;
	record.contributionAmount = weeklyAmount;
	record.contractsAdded = contractsAdded;
	record.contractsLiquidated = contractsLiquidated;
	record.totalContracts = totalContracts;
	record.totalInvested = totalInvested;
	record.equity = equity;
	record.positionNotional = totalContracts * price * multiplier;
	record.cashBalance = cashBalance;
	record.requiredMaintenanceMargin = requiredMaintenance;
	record.feesPaid = weekFees;
	record.pnl = pnl;
	record.returnPct = pnl / totalInvested * 100.0;
	record.timeWeightedReturn = timeWeightedReturn;

	records.push_back(record);
      }

    return SimulationResult(weeklyAmount, std::move(records), cumulativeFees);
  }

  SimulationResult simulate(const PriceSeries& prices, double weeklyAmount, const SimulationConfig& config)
  {
    SimulationEngine engine(config);
    return engine.simulate(prices, weeklyAmount);
  }
} // namespace mkc_dca
