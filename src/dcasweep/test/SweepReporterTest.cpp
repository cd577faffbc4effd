#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <sstream>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "reporting/SweepReporter.h"
#include "DcaTestUtils.h"

using namespace dcasweep;
using namespace dcasweep::reporting;
using namespace mkc_dca;
using boost::gregorian::date;

namespace
{
    std::shared_ptr<const IPriceSeriesProvider> makeProvider()
    {
        auto provider = std::make_shared<StaticPriceSeriesProvider>();
        provider->addSeries("MNQ=F", std::make_shared<const PriceSeries>(
            makeWeeklySeries({ 100.0, 104.0, 99.0, 108.0, 111.0 })));
        return provider;
    }
}

TEST_CASE("SweepReporter prints a simulation summary", "[SweepReporter]") {
    std::ostringstream log;
    DcaPerformanceService service(makeProvider(), "MNQ=F", makeScenarioConfig(), log);
    DcaPerformanceReport report =
        service.calculateWeeklyDcaPerformance(1000.0, date(2024, 1, 1), date(2024, 2, 29));

    std::ostringstream os;
    os.precision(6);
    SweepReporter::writeSimulationSummary(os, report);
    SweepReporter::writeWeeklyBreakdown(os, report.result);

    const std::string text = os.str();
    REQUIRE(text.find("=== MNQ=F Weekly DCA Performance ===") != std::string::npos);
    REQUIRE(text.find("Total Weeks: 5") != std::string::npos);
    REQUIRE(text.find("=== Weekly Breakdown ===") != std::string::npos);
    REQUIRE(text.find("2024-02-02") != std::string::npos);

    // Stream formatting is restored after the tables
    REQUIRE(os.precision() == 6);
    REQUIRE((os.flags() & std::ios_base::fixed) == 0);
}

TEST_CASE("SweepReporter prints a sweep report", "[SweepReporter]") {
    std::ostringstream log;
    DcaPerformanceService service(makeProvider(), "MNQ=F", makeScenarioConfig(), log);
    OptimizationReport report = service.optimizeWeeklyAmount(SweepParameters(500.0, 2000.0, 500.0),
                                                             date(2024, 1, 1), date(2024, 2, 29));

    std::ostringstream os;
    SweepReporter::writeOptimizationReport(os, report);

    const std::string text = os.str();
    REQUIRE(text.find("=== Weekly Amount Sweep ===") != std::string::npos);
    REQUIRE(text.find("Grid Size: 4") != std::string::npos);
    REQUIRE(text.find("=== Top by totalReturn (descending) ===") != std::string::npos);
    REQUIRE(text.find("=== Top by Dollar Profit ===") != std::string::npos);
    REQUIRE(text.find("Sweep cancelled") == std::string::npos);
}

TEST_CASE("SweepReporter prints the worst week", "[SweepReporter]") {
    std::ostringstream os;
    SweepReporter::writeWorstWeek(os, WorstWeekDiagnostic{ date(2024, 1, 12), -4.256 });

    REQUIRE(os.str().find("Worst Week: 2024-01-12 (-4.26%)") != std::string::npos);
}
