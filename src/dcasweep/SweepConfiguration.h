// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "SimulationConfig.h"

namespace dcasweep
{
  class SweepConfigurationException : public std::runtime_error
  {
  public:
  SweepConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~SweepConfigurationException()
      {}
  };

  /**
   * @brief Instrument, data file, default date window and contract
   *        economics of one dcasweep run.
   */
  class SweepConfiguration
  {
  public:
    SweepConfiguration(const std::string& symbol,
		       const std::string& dataPath,
		       std::optional<boost::gregorian::date> startDate,
		       std::optional<boost::gregorian::date> endDate,
		       const mkc_dca::SimulationConfig& simulationConfig)
      : mSymbol(symbol),
        mDataPath(dataPath),
        mStartDate(startDate),
        mEndDate(endDate),
        mSimulationConfig(simulationConfig)
    {}

    SweepConfiguration(const SweepConfiguration&) = default;
    SweepConfiguration& operator=(const SweepConfiguration&) = default;
    ~SweepConfiguration() = default;

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const std::string& getDataPath() const
    {
      return mDataPath;
    }

    const std::optional<boost::gregorian::date>& getStartDate() const
    {
      return mStartDate;
    }

    const std::optional<boost::gregorian::date>& getEndDate() const
    {
      return mEndDate;
    }

    const mkc_dca::SimulationConfig& getSimulationConfig() const
    {
      return mSimulationConfig;
    }

  private:
    std::string mSymbol;
    std::string mDataPath;
    std::optional<boost::gregorian::date> mStartDate;
    std::optional<boost::gregorian::date> mEndDate;
    mkc_dca::SimulationConfig mSimulationConfig;
  };

  //
  // Reads a one-row CSV configuration file. The header row is optional; when
  // present it must name the columns
  //
  //   Symbol,DataPath,StartDate,EndDate,ContractMultiplier,InitialMargin,
  //   MaintenanceMargin,Commission,Slippage,MaxContracts,MinEquityToNotional,
  //   MaxAddsPerWeek
  //
  // StartDate/EndDate may be left empty. An empty numeric cell takes the
  // Micro E-mini NASDAQ-100 default. A relative DataPath is resolved against
  // the directory of the configuration file.
  //
  class SweepConfigurationFileReader
  {
  public:
    SweepConfigurationFileReader (const std::string& configurationFileName);
    ~SweepConfigurationFileReader()
      {}

    std::shared_ptr<SweepConfiguration> readConfigurationFile();

  private:
    std::string mConfigurationFileName;
  };
}
