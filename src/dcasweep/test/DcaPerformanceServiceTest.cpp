#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <sstream>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DcaPerformanceService.h"
#include "DcaExceptions.h"
#include "PriceSeriesException.h"
#include "DcaTestUtils.h"

using namespace dcasweep;
using namespace mkc_dca;
using boost::gregorian::date;
using Catch::Approx;

namespace
{
    // Three flat weekly closes on 2024-01-05, 2024-01-12 and 2024-01-19
    std::shared_ptr<const IPriceSeriesProvider> makeFlatProvider()
    {
        auto provider = std::make_shared<StaticPriceSeriesProvider>();
        provider->addSeries("MNQ=F", std::make_shared<const PriceSeries>(makeWeeklySeries({ 100.0, 100.0, 100.0 })));
        return provider;
    }
}

TEST_CASE("DcaPerformanceService calculates a weekly DCA report", "[DcaPerformanceService]") {
    std::ostringstream log;
    DcaPerformanceService service(makeFlatProvider(), "MNQ=F", makeScenarioConfig(), log);

    DcaPerformanceReport report =
        service.calculateWeeklyDcaPerformance(1000.0, date(2024, 1, 1), date(2024, 1, 31));

    REQUIRE(report.symbol == "MNQ=F");
    REQUIRE(report.startDate == date(2024, 1, 1));
    REQUIRE(report.endDate == date(2024, 1, 31));
    REQUIRE(report.totalWeeks == 3);
    REQUIRE(report.totalInvested == Approx(3000.0));
    REQUIRE(report.currentValue == Approx(2993.0));
    REQUIRE(report.totalReturnPct == Approx(-0.23));
    REQUIRE(report.totalContracts == 2);
    REQUIRE(report.result.getNumWeeks() == 3);
    REQUIRE(report.equityCurve.size() == 3);
    REQUIRE(report.metrics.winRatePct == Approx(0.0));

    REQUIRE(log.str().find("Starting MNQ=F DCA calculation") != std::string::npos);
}

TEST_CASE("DcaPerformanceService resamples daily bars to weekly closes", "[DcaPerformanceService]") {
    auto provider = std::make_shared<StaticPriceSeriesProvider>();
    provider->addSeries("MNQ=F", std::make_shared<const PriceSeries>(
        makeWeekdaySeries({ 100, 101, 102, 103, 104, 110, 111, 112, 113, 114 })));

    std::ostringstream log;
    DcaPerformanceService service(provider, "MNQ=F", makeScenarioConfig(), log);
    DcaPerformanceReport report =
        service.calculateWeeklyDcaPerformance(1000.0, date(2024, 1, 1), date(2024, 1, 31));

    REQUIRE(report.totalWeeks == 2);
    REQUIRE(report.result.getWeeklyRecords()[0].date == date(2024, 1, 5));
    REQUIRE(report.result.getWeeklyRecords()[0].price == Approx(104.0));
    REQUIRE(report.result.getWeeklyRecords()[1].price == Approx(114.0));
}

TEST_CASE("DcaPerformanceService default date window", "[DcaPerformanceService]") {
    std::ostringstream log;
    DcaPerformanceService service(makeFlatProvider(), "MNQ=F", makeScenarioConfig(), log);
    const date today(2024, 1, 20);

    SECTION("both dates missing") {
        DateRange range = service.resolveDateRange(today, std::nullopt, std::nullopt);
        REQUIRE(range.getLastDate() == today);
        REQUIRE(range.getFirstDate() == date(2023, 1, 20));
    }

    SECTION("start derived from an explicit end") {
        DateRange range = service.resolveDateRange(today, std::nullopt, date(2024, 1, 12));
        REQUIRE(range.getFirstDate() == date(2023, 1, 12));
        REQUIRE(range.getLastDate() == date(2024, 1, 12));
    }

    SECTION("explicit start with default end") {
        DateRange range = service.resolveDateRange(today, date(2024, 1, 10), std::nullopt);
        REQUIRE(range.getFirstDate() == date(2024, 1, 10));
        REQUIRE(range.getLastDate() == today);
    }

    SECTION("calculation as of a fixed day") {
        DcaPerformanceReport report =
            service.calculateWeeklyDcaPerformanceAsOf(today, 1000.0, std::nullopt, std::nullopt);
        REQUIRE(report.startDate == date(2023, 1, 20));
        REQUIRE(report.endDate == today);
        REQUIRE(report.totalWeeks == 3);
    }
}

TEST_CASE("DcaPerformanceService error handling", "[DcaPerformanceService]") {
    std::ostringstream log;

    SECTION("null provider") {
        REQUIRE_THROWS_AS(DcaPerformanceService(nullptr, "MNQ=F", makeScenarioConfig(), log),
                          PriceSeriesException);
    }

    SECTION("invalid configuration") {
        SimulationConfig bad(2.0, 1000.0, 1000.0, 2.5, 1.0, 100, 0.1, 1);
        REQUIRE_THROWS_AS(DcaPerformanceService(makeFlatProvider(), "MNQ=F", bad, log),
                          InvalidConfigError);
    }

    DcaPerformanceService service(makeFlatProvider(), "MNQ=F", makeScenarioConfig(), log);

    SECTION("window without data") {
        REQUIRE_THROWS_AS(service.calculateWeeklyDcaPerformance(1000.0, date(2025, 1, 1), date(2025, 2, 1)),
                          PriceDataNotFoundException);
    }

    SECTION("window with a single week") {
        REQUIRE_THROWS_AS(service.calculateWeeklyDcaPerformance(1000.0, date(2024, 1, 1), date(2024, 1, 8)),
                          InsufficientDataError);
    }

    SECTION("non positive amount") {
        REQUIRE_THROWS_AS(service.calculateWeeklyDcaPerformance(0.0, date(2024, 1, 1), date(2024, 1, 31)),
                          InvalidConfigError);
    }

    SECTION("unknown symbol") {
        DcaPerformanceService other(makeFlatProvider(), "ES=F", makeScenarioConfig(), log);
        REQUIRE_THROWS_AS(other.getAvailableDateRange(), PriceDataNotFoundException);
    }
}

TEST_CASE("DcaPerformanceService reports the available date range", "[DcaPerformanceService]") {
    std::ostringstream log;
    DcaPerformanceService service(makeFlatProvider(), "MNQ=F", makeScenarioConfig(), log);

    DateRange range = service.getAvailableDateRange();
    REQUIRE(range.getFirstDate() == date(2024, 1, 5));
    REQUIRE(range.getLastDate() == date(2024, 1, 19));
}

TEST_CASE("DcaPerformanceService sweeps weekly amounts", "[DcaPerformanceService]") {
    std::ostringstream log;
    DcaPerformanceService service(makeFlatProvider(), "MNQ=F", makeScenarioConfig(), log);

    OptimizationReport report =
        service.optimizeWeeklyAmount(SweepParameters(500.0, 1500.0, 500.0), date(2024, 1, 1), date(2024, 1, 31));

    REQUIRE(report.getTestedGrid().size() == 3);
    REQUIRE(report.getSummary().candidatesSucceeded == 3);
    REQUIRE(report.getSummary().weeksSimulated == 3);
    REQUIRE_FALSE(report.getSummary().cancelled);
    REQUIRE(report.getTopByObjective().size() == 3);
    REQUIRE(report.getTopByDollarProfit().size() == 3);
    REQUIRE(log.str().find("sweep completed") != std::string::npos);
}
