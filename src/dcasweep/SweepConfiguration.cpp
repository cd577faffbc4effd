// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "csv.h"
#include "SweepConfiguration.h"
#include "PriceSeriesCsvReader.h"
#include "DcaExceptions.h"

using namespace boost::filesystem;
using mkc_dca::SimulationConfig;

namespace dcasweep
{
  static double parseNumericField(const std::string& fieldName,
				  const std::string& cell,
				  double defaultValue);

  static int parseIntegerField(const std::string& fieldName,
			       const std::string& cell,
			       int defaultValue);

  static std::optional<boost::gregorian::date> parseOptionalDate(const std::string& fieldName,
								 const std::string& cell);

  SweepConfigurationFileReader::SweepConfigurationFileReader (const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<SweepConfiguration> SweepConfigurationFileReader::readConfigurationFile()
  {
    if (!exists (path (mConfigurationFileName)))
      throw SweepConfigurationException("SweepConfigurationFileReader::readConfigurationFile - configuration file "
					+ mConfigurationFileName + " does not exist");

    std::string tickerSymbol, dataPathStr, startDateStr, endDateStr;
    std::string multiplierStr, initialMarginStr, maintenanceMarginStr;
    std::string commissionStr, slippageStr, maxContractsStr, minEquityToNotionalStr, maxAddsStr;

    try
      {
	// Check if the file has a header row by reading the first line
	io::CSVReader<12> csvConfigFileCheck(mConfigurationFileName.c_str());
	char* firstLine = csvConfigFileCheck.next_line();
	bool hasHeader = false;
	if (firstLine)
	  {
	    std::string firstLineStr(firstLine);
	    hasHeader = (firstLineStr.find("Symbol") != std::string::npos &&
			 firstLineStr.find("DataPath") != std::string::npos);
	  }

	io::CSVReader<12> csvConfigFile(mConfigurationFileName.c_str());

	if (hasHeader)
	  csvConfigFile.read_header(io::ignore_no_column, "Symbol", "DataPath", "StartDate", "EndDate",
				    "ContractMultiplier", "InitialMargin", "MaintenanceMargin",
				    "Commission", "Slippage", "MaxContracts", "MinEquityToNotional",
				    "MaxAddsPerWeek");
	else
	  csvConfigFile.set_header("Symbol", "DataPath", "StartDate", "EndDate",
				   "ContractMultiplier", "InitialMargin", "MaintenanceMargin",
				   "Commission", "Slippage", "MaxContracts", "MinEquityToNotional",
				   "MaxAddsPerWeek");

	if (!csvConfigFile.read_row (tickerSymbol, dataPathStr, startDateStr, endDateStr,
				     multiplierStr, initialMarginStr, maintenanceMarginStr,
				     commissionStr, slippageStr, maxContractsStr,
				     minEquityToNotionalStr, maxAddsStr))
	  throw SweepConfigurationException("SweepConfigurationFileReader::readConfigurationFile - "
					    + mConfigurationFileName + " contains no configuration row");
      }
    catch (const io::error::base& e)
      {
	throw SweepConfigurationException("SweepConfigurationFileReader::readConfigurationFile - "
					  + std::string(e.what()));
      }

    boost::algorithm::trim(tickerSymbol);
    boost::algorithm::trim(dataPathStr);

    if (tickerSymbol.empty())
      throw SweepConfigurationException("SweepConfigurationFileReader::readConfigurationFile - Symbol is empty");

    if (dataPathStr.empty())
      throw SweepConfigurationException("SweepConfigurationFileReader::readConfigurationFile - DataPath is empty");

    path historicDataFilePath (dataPathStr);
    if (historicDataFilePath.is_relative())
      historicDataFilePath = path (mConfigurationFileName).parent_path() / historicDataFilePath;

    if (!exists (historicDataFilePath))
      throw SweepConfigurationException("Historic data file path " + historicDataFilePath.string()
					+ " does not exist");

    std::optional<boost::gregorian::date> startDate = parseOptionalDate("StartDate", startDateStr);
    std::optional<boost::gregorian::date> endDate = parseOptionalDate("EndDate", endDateStr);

    if (startDate && endDate && (*endDate < *startDate))
      throw SweepConfigurationException("SweepConfigurationFileReader::readConfigurationFile - EndDate "
					+ endDateStr + " is before StartDate " + startDateStr);

    const SimulationConfig defaults = SimulationConfig::microNasdaqDefaults();

    SimulationConfig simConfig(parseNumericField("ContractMultiplier", multiplierStr,
						 defaults.getContractMultiplier()),
			       parseNumericField("InitialMargin", initialMarginStr,
						 defaults.getInitialMarginPerContract()),
			       parseNumericField("MaintenanceMargin", maintenanceMarginStr,
						 defaults.getMaintenanceMarginPerContract()),
			       parseNumericField("Commission", commissionStr,
						 defaults.getCommissionPerContract()),
			       parseNumericField("Slippage", slippageStr,
						 defaults.getSlippagePerContract()),
			       parseIntegerField("MaxContracts", maxContractsStr,
						 defaults.getMaxContracts()),
			       parseNumericField("MinEquityToNotional", minEquityToNotionalStr,
						 defaults.getMinEquityToNotionalRatio()),
			       parseIntegerField("MaxAddsPerWeek", maxAddsStr,
						 defaults.getMaxContractAddsPerWeek()));

    try
      {
	simConfig.validate();
      }
    catch (const mkc_dca::InvalidConfigError& e)
      {
	throw SweepConfigurationException("SweepConfigurationFileReader::readConfigurationFile - "
					  + std::string(e.what()));
      }

    return std::make_shared<SweepConfiguration>(tickerSymbol, historicDataFilePath.string(),
						startDate, endDate, simConfig);
  }

  static double parseNumericField(const std::string& fieldName,
				  const std::string& cell,
				  double defaultValue)
  {
    const std::string text = boost::algorithm::trim_copy(cell);
    if (text.empty())
      return defaultValue;

    try
      {
	std::size_t consumed = 0;
	double value = std::stod(text, &consumed);
	if (consumed != text.size())
	  throw SweepConfigurationException(fieldName + " value '" + text + "' is not a number");
	return value;
      }
    catch (const std::invalid_argument&)
      {
	throw SweepConfigurationException(fieldName + " value '" + text + "' is not a number");
      }
    catch (const std::out_of_range&)
      {
	throw SweepConfigurationException(fieldName + " value '" + text + "' is out of range");
      }
  }

  static int parseIntegerField(const std::string& fieldName,
			       const std::string& cell,
			       int defaultValue)
  {
    const std::string text = boost::algorithm::trim_copy(cell);
    if (text.empty())
      return defaultValue;

    try
      {
	std::size_t consumed = 0;
	int value = std::stoi(text, &consumed);
	if (consumed != text.size())
	  throw SweepConfigurationException(fieldName + " value '" + text + "' is not an integer");
	return value;
      }
    catch (const std::invalid_argument&)
      {
	throw SweepConfigurationException(fieldName + " value '" + text + "' is not an integer");
      }
    catch (const std::out_of_range&)
      {
	throw SweepConfigurationException(fieldName + " value '" + text + "' is out of range");
      }
  }

  static std::optional<boost::gregorian::date> parseOptionalDate(const std::string& fieldName,
								 const std::string& cell)
  {
    const std::string text = boost::algorithm::trim_copy(cell);
    if (text.empty())
      return std::nullopt;

    try
      {
	return mkc_dca::parseBarDate(text);
      }
    catch (const std::exception& e)
      {
	throw SweepConfigurationException(fieldName + " value '" + text + "' is not a valid date: " + e.what());
      }
  }
}
