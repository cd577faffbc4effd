#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <rapidjson/document.h>
#include "reporting/ResultSerializer.h"
#include "DcaTestUtils.h"

using namespace dcasweep;
using namespace dcasweep::reporting;
using namespace mkc_dca;
using boost::gregorian::date;
using Catch::Approx;

namespace
{
    DcaPerformanceService makeFlatService(std::ostream& log)
    {
        auto provider = std::make_shared<StaticPriceSeriesProvider>();
        provider->addSeries("MNQ=F", std::make_shared<const PriceSeries>(makeWeeklySeries({ 100.0, 100.0, 100.0 })));
        return DcaPerformanceService(provider, "MNQ=F", makeScenarioConfig(), log);
    }

    rapidjson::Document parse(const std::string& json)
    {
        rapidjson::Document doc;
        doc.Parse(json.c_str());
        REQUIRE_FALSE(doc.HasParseError());
        return doc;
    }
}

TEST_CASE("ResultSerializer writes a simulation report", "[ResultSerializer]") {
    std::ostringstream log;
    DcaPerformanceService service = makeFlatService(log);
    DcaPerformanceReport report =
        service.calculateWeeklyDcaPerformance(1000.0, date(2024, 1, 1), date(2024, 1, 31));

    rapidjson::Document doc = parse(ResultSerializer::toJson(report));

    REQUIRE(doc["success"].GetBool());
    REQUIRE(std::string(doc["symbol"].GetString()) == "MNQ=F");
    REQUIRE(std::string(doc["startDate"].GetString()) == "2024-01-01");
    REQUIRE(std::string(doc["endDate"].GetString()) == "2024-01-31");
    REQUIRE(doc["totalWeeks"].GetUint64() == 3);
    REQUIRE(doc["totalInvested"].GetDouble() == Approx(3000.0));
    REQUIRE(doc["currentValue"].GetDouble() == Approx(2993.0));
    REQUIRE(doc["totalReturn"].GetDouble() == Approx(-0.23));
    REQUIRE(doc["totalContracts"].GetInt() == 2);
    REQUIRE(doc["cumulativeFees"].GetDouble() == Approx(7.0));

    const rapidjson::Value& metrics = doc["performanceMetrics"];
    REQUIRE(metrics.IsObject());
    for (const char* key : { "totalReturn", "cagr", "volatility", "sharpeRatio",
                             "maxDrawdown", "profitFactor", "winRate" })
        REQUIRE(metrics.HasMember(key));

    const rapidjson::Value& weeks = doc["weeklyBreakdown"];
    REQUIRE(weeks.IsArray());
    REQUIRE(weeks.Size() == 3);
    REQUIRE(weeks[0]["week"].GetInt() == 1);
    REQUIRE(std::string(weeks[0]["date"].GetString()) == "2024-01-05");
    REQUIRE(weeks[0]["contractsBought"].GetInt() == 1);
    REQUIRE(weeks[0]["feesPaid"].GetDouble() == Approx(3.5));
    REQUIRE(weeks[0]["returnPct"].GetDouble() == Approx(-0.35));
    REQUIRE(weeks[2]["totalContracts"].GetInt() == 2);

    const rapidjson::Value& curve = doc["equityCurve"];
    REQUIRE(curve.Size() == 3);
    REQUIRE(curve[0]["prevEquity"].GetDouble() == Approx(0.0));
    REQUIRE(curve[1]["prevEquity"].GetDouble() == Approx(996.5));

    REQUIRE(std::string(doc["worstWeek"]["date"].GetString()) == "2024-01-05");
    REQUIRE(doc["worstWeek"]["returnPct"].GetDouble() == Approx(-0.35));
}

TEST_CASE("ResultSerializer writes non-finite values as null", "[ResultSerializer]") {
    std::ostringstream log;
    DcaPerformanceService service = makeFlatService(log);
    DcaPerformanceReport report =
        service.calculateWeeklyDcaPerformance(1000.0, date(2024, 1, 1), date(2024, 1, 31));
    report.metrics.sharpeRatio = std::numeric_limits<double>::quiet_NaN();
    report.metrics.profitFactor = std::numeric_limits<double>::infinity();

    rapidjson::Document doc = parse(ResultSerializer::toJson(report));

    REQUIRE(doc["performanceMetrics"]["sharpeRatio"].IsNull());
    REQUIRE(doc["performanceMetrics"]["profitFactor"].IsNull());
    REQUIRE(doc["performanceMetrics"]["winRate"].IsNumber());
}

TEST_CASE("ResultSerializer writes a sweep report", "[ResultSerializer]") {
    std::ostringstream log;
    DcaPerformanceService service = makeFlatService(log);
    OptimizationReport report = service.optimizeWeeklyAmount(
        SweepParameters(500.0, 1500.0, 500.0, 2, SortKey::SharpeRatio, false),
        date(2024, 1, 1), date(2024, 1, 31));

    rapidjson::Document doc = parse(ResultSerializer::toJson(report));

    REQUIRE(doc["success"].GetBool());

    const rapidjson::Value& summary = doc["summary"];
    REQUIRE(summary["candidatesTested"].GetUint64() == 3);
    REQUIRE(summary["candidatesSucceeded"].GetUint64() == 3);
    REQUIRE(summary["candidatesFailed"].GetUint64() == 0);
    REQUIRE(summary["effectiveStepSize"].GetDouble() == Approx(500.0));
    REQUIRE(std::string(summary["sortKey"].GetString()) == "sharpeRatio");
    REQUIRE_FALSE(summary["descending"].GetBool());
    REQUIRE_FALSE(summary["cancelled"].GetBool());

    REQUIRE(doc["testedGrid"].Size() == 3);
    REQUIRE(doc["testedGrid"][0].GetDouble() == Approx(500.0));
    REQUIRE(doc["topByPercentage"].Size() == 2);
    REQUIRE(doc["topByDollarProfit"].Size() == 3);

    const rapidjson::Value& first = doc["topByDollarProfit"][0];
    for (const char* key : { "weeklyAmount", "totalInvested", "finalEquity", "totalContracts",
                             "dollarProfit", "returnPerInvestedDollar", "metrics" })
        REQUIRE(first.HasMember(key));
}

TEST_CASE("ResultSerializer saves JSON to disk", "[ResultSerializer]") {
    TempFile file("");
    ResultSerializer::saveToFile("{\"success\": true}", file.getFileName());

    std::ifstream in(file.getFileName());
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(contents.find("\"success\": true") != std::string::npos);

    REQUIRE_THROWS_AS(ResultSerializer::saveToFile("{}", "/nonexistent/dcasweep/out.json"),
                      std::runtime_error);
}
