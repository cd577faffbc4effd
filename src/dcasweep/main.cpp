#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>
#include "DcaPerformanceService.h"
#include "InstrumentInfo.h"
#include "SweepConfiguration.h"
#include "DiagnosticSelector.h"
#include "PriceSeriesCsvReader.h"
#include "PriceSeriesProvider.h"
#include "SimulationConfig.h"
#include "SweepParameters.h"
#include "reporting/ResultSerializer.h"
#include "reporting/SweepReporter.h"
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"

namespace po = boost::program_options;

using namespace dcasweep;
using namespace mkc_dca;

namespace
{
  void printUsage(const po::options_description& desc)
  {
    std::cout << "dcasweep - Leveraged futures weekly DCA simulator and amount optimizer\n\n";
    std::cout << "Usage: dcasweep <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  simulate     Run one weekly DCA simulation\n";
    std::cout << "  optimize     Sweep a grid of weekly amounts and rank the results\n";
    std::cout << "  date-range   Show the first and last date available in the data file\n";
    std::cout << "  info         Describe the traded contract\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  dcasweep simulate --config mnq.csv --amount 1000 --start 2024-01-01\n";
    std::cout << "  dcasweep optimize --data MNQ_daily.csv --min 100 --max 5000 --step 100 --sort-key sharpeRatio\n";
    std::cout << "  dcasweep date-range --data MNQ_daily.csv\n";
  }

  std::optional<boost::gregorian::date> optionalDate(const po::variables_map& vm, const char* name)
  {
    if (!vm.count(name))
      return std::nullopt;

    return parseBarDate(vm[name].as<std::string>());
  }

  std::shared_ptr<SweepConfiguration> loadConfiguration(const po::variables_map& vm)
  {
    if (vm.count("config"))
      {
	SweepConfigurationFileReader reader(vm["config"].as<std::string>());
	return reader.readConfigurationFile();
      }

    if (!vm.count("data"))
      throw SweepConfigurationException("either --config or --data must be given");

    return std::make_shared<SweepConfiguration>(vm["symbol"].as<std::string>(),
						vm["data"].as<std::string>(),
						std::nullopt,
						std::nullopt,
						SimulationConfig::microNasdaqDefaults());
  }

  void writeJson(const po::variables_map& vm, const std::string& symbol,
		 const std::string& kind, const std::string& json, std::ostream& out)
  {
    std::string filePath;
    if (vm.count("json"))
      filePath = vm["json"].as<std::string>();
    else if (vm.count("output-dir"))
      filePath = utils::createOutputFileName(vm["output-dir"].as<std::string>(), symbol, kind, "json");
    else
      return;

    reporting::ResultSerializer::saveToFile(json, filePath);
    out << "Results written to " << filePath << std::endl;
  }

  int runCommand(const std::string& command, const po::variables_map& vm, std::ostream& out)
  {
    if (command == "info")
      {
	printInstrumentInfo(out, getMicroNasdaqInstrumentInfo());
	return 0;
      }

    std::shared_ptr<SweepConfiguration> config = loadConfiguration(vm);

    auto provider = std::make_shared<const CsvPriceSeriesProvider>(config->getSymbol(), config->getDataPath());
    DcaPerformanceService service(provider, config->getSymbol(), config->getSimulationConfig(), out);

    std::optional<boost::gregorian::date> startDate = optionalDate(vm, "start");
    std::optional<boost::gregorian::date> endDate = optionalDate(vm, "end");
    if (!startDate)
      startDate = config->getStartDate();
    if (!endDate)
      endDate = config->getEndDate();

    if (command == "date-range")
      {
	DateRange available = service.getAvailableDateRange();
	out << config->getSymbol() << " data available from "
	    << utils::toIsoDateString(available.getFirstDate()) << " to "
	    << utils::toIsoDateString(available.getLastDate()) << std::endl;
	return 0;
      }

    if (command == "simulate")
      {
	out << config->getSimulationConfig() << std::endl;

	DcaPerformanceReport report =
	  service.calculateWeeklyDcaPerformance(vm["amount"].as<double>(), startDate, endDate);

	reporting::SweepReporter::writeSimulationSummary(out, report);
	if (vm.count("breakdown"))
	  reporting::SweepReporter::writeWeeklyBreakdown(out, report.result);

	auto worst = DiagnosticSelector::findWorstWeek(report.result);
	if (worst)
	  reporting::SweepReporter::writeWorstWeek(out, DiagnosticSelector::makeNarrativeRequest(*worst));

	writeJson(vm, config->getSymbol(), "Simulation", reporting::ResultSerializer::toJson(report), out);
	return 0;
      }

    if (command == "optimize")
      {
	std::optional<std::chrono::milliseconds> timeBudget;
	if (vm.count("time-budget-ms"))
	  timeBudget = std::chrono::milliseconds(vm["time-budget-ms"].as<long>());

	SweepParameters params(vm["min"].as<double>(),
			       vm["max"].as<double>(),
			       vm["step"].as<double>(),
			       vm["top"].as<std::size_t>(),
			       parseSortKey(vm["sort-key"].as<std::string>()),
			       vm.count("ascending") == 0,
			       timeBudget);

	out << config->getSimulationConfig() << std::endl;

	OptimizationReport report = service.optimizeWeeklyAmount(params, startDate, endDate);
	reporting::SweepReporter::writeOptimizationReport(out, report);

	writeJson(vm, config->getSymbol(), "Sweep", reporting::ResultSerializer::toJson(report), out);
	return 0;
      }

    std::cerr << "Error: unknown command '" << command << "'" << std::endl;
    return 1;
  }
}

int main(int argc, char* argv[])
{
  po::options_description desc("Options");
  desc.add_options()
    ("help,h", "Show help message")
    ("command", po::value<std::string>(), "simulate | optimize | date-range | info")
    ("config,c", po::value<std::string>(), "CSV configuration file")
    ("data,d", po::value<std::string>(), "Daily bar CSV file (Date,Close[,Adj Close]) when no configuration file is given")
    ("symbol", po::value<std::string>()->default_value("MNQ=F"), "Symbol used with --data")
    ("start", po::value<std::string>(), "Start date (YYYY-MM-DD), default one year before the end date")
    ("end", po::value<std::string>(), "End date (YYYY-MM-DD), default today")
    ("amount,a", po::value<double>()->default_value(1000.0), "Weekly contribution for simulate")
    ("min", po::value<double>()->default_value(100.0), "Smallest weekly amount for optimize")
    ("max", po::value<double>()->default_value(5000.0), "Largest weekly amount for optimize")
    ("step", po::value<double>()->default_value(100.0), "Grid step for optimize")
    ("top", po::value<std::size_t>()->default_value(10), "Size of the objective ranking")
    ("sort-key", po::value<std::string>()->default_value("totalReturn"),
     "totalReturn | sharpeRatio | profitFactor | returnPerInvestedDollar")
    ("ascending", "Rank the objective in ascending order")
    ("time-budget-ms", po::value<long>(), "Stop starting new sweep candidates after this many milliseconds")
    ("breakdown", "Print the weekly breakdown table")
    ("json", po::value<std::string>(), "Write JSON results to this file")
    ("output-dir,o", po::value<std::string>(), "Write timestamped JSON results into this directory")
    ("log", "Mirror console output to a timestamped log file");

  po::positional_options_description positional;
  positional.add("command", 1);

  try
    {
      po::variables_map vm;
      po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
      po::notify(vm);

      if (vm.count("help") || !vm.count("command"))
	{
	  printUsage(desc);
	  return vm.count("help") ? 0 : 1;
	}

      const std::string command = boost::algorithm::to_lower_copy(vm["command"].as<std::string>());

      if (!vm.count("log"))
	return runCommand(command, vm, std::cout);

      const std::string logDir = vm.count("output-dir") ? vm["output-dir"].as<std::string>() : std::string();
      const std::string symbol = vm.count("symbol") ? vm["symbol"].as<std::string>() : std::string("dcasweep");
      const std::string logFileName = utils::createOutputFileName(logDir, symbol, "Log", "txt");

      std::ofstream logFile(logFileName);
      if (!logFile.is_open())
	throw std::runtime_error("Cannot open log file for writing: " + logFileName);

      utils::TeeStream tee(std::cout, logFile);
      int status = runCommand(command, vm, tee);
      tee.flush();
      return status;
    }
  catch (const po::error& e)
    {
      std::cerr << "Error: " << e.what() << "\n\n";
      printUsage(desc);
      return 1;
    }
  catch (const std::exception& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
}
