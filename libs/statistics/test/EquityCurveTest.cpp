#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "EquityCurve.h"
#include "SimulationEngine.h"
#include "DcaTestUtils.h"

using namespace mkc_dca;
using Catch::Approx;

TEST_CASE("EquityCurve: one point per simulated week", "[EquityCurve]")
{
  SimulationEngine engine(makeScenarioConfig());
  auto result = engine.simulate(makeWeeklySeries({100.0, 150.0, 120.0, 130.0}), 1000.0);
  auto curve = buildEquityCurve(result);

  REQUIRE(curve.size() == result.getNumWeeks());

  for (std::size_t i = 0; i < curve.size(); ++i)
    {
      const WeekRecord& w = result.getWeeklyRecords()[i];
      REQUIRE(curve[i].date == w.date);
      REQUIRE(curve[i].equity == w.equity);
      REQUIRE(curve[i].positionNotional == w.positionNotional);
      REQUIRE(curve[i].cashBalance == w.cashBalance);
      REQUIRE(curve[i].invested == w.totalInvested);
      REQUIRE(curve[i].pnl == w.pnl);
      REQUIRE(curve[i].timeWeightedReturn == w.timeWeightedReturn);
    }

  SECTION("previousEquity chains week to week")
  {
    REQUIRE(curve[0].previousEquity == 0.0);
    for (std::size_t i = 1; i < curve.size(); ++i)
      REQUIRE(curve[i].previousEquity == curve[i - 1].equity);
  }
}

TEST_CASE("EquityCurve: empty result", "[EquityCurve]")
{
  SimulationResult empty(100.0, {}, 0.0);
  REQUIRE(buildEquityCurve(empty).empty());
}
