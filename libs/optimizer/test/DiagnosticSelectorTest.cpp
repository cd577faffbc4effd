#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <vector>
#include "DiagnosticSelector.h"
#include "SimulationEngine.h"
#include "DcaTestUtils.h"

using namespace mkc_dca;
using Catch::Approx;

namespace
{
  WeekRecord makeRecord(unsigned int weekIndex, double returnPct)
  {
    WeekRecord r{};
    r.weekIndex = weekIndex;
    r.date = firstTestFriday() + boost::gregorian::weeks(weekIndex - 1);
    r.returnPct = returnPct;
    return r;
  }
}

TEST_CASE("DiagnosticSelector: lowest returnPct wins", "[DiagnosticSelector]")
{
  std::vector<WeekRecord> weeks{ makeRecord(1, -0.35), makeRecord(2, -4.0),
				 makeRecord(3, 1.5), makeRecord(4, -2.0) };

  auto worst = DiagnosticSelector::findWorstWeek(weeks);
  REQUIRE(worst.has_value());
  REQUIRE(worst->weekIndex == 2);
}

TEST_CASE("DiagnosticSelector: earliest week wins ties", "[DiagnosticSelector]")
{
  std::vector<WeekRecord> weeks{ makeRecord(1, 0.5), makeRecord(2, -3.0), makeRecord(3, -3.0) };

  REQUIRE(DiagnosticSelector::findWorstWeek(weeks)->weekIndex == 2);
}

TEST_CASE("DiagnosticSelector: non-finite returns", "[DiagnosticSelector]")
{
  const double nan = std::numeric_limits<double>::quiet_NaN();

  SECTION("are ignored when a finite value exists")
  {
    std::vector<WeekRecord> weeks{ makeRecord(1, nan), makeRecord(2, 2.0), makeRecord(3, 1.0) };
    REQUIRE(DiagnosticSelector::findWorstWeek(weeks)->weekIndex == 3);
  }

  SECTION("fall back to the first record")
  {
    std::vector<WeekRecord> weeks{ makeRecord(1, nan), makeRecord(2, nan) };
    REQUIRE(DiagnosticSelector::findWorstWeek(weeks)->weekIndex == 1);
  }
}

TEST_CASE("DiagnosticSelector: empty ledger", "[DiagnosticSelector]")
{
  std::vector<WeekRecord> empty;
  REQUIRE_FALSE(DiagnosticSelector::findWorstWeek(empty).has_value());

  SimulationResult result(100.0, {}, 0.0);
  REQUIRE_FALSE(DiagnosticSelector::findWorstWeek(result).has_value());
}

TEST_CASE("DiagnosticSelector: narrative request from a simulation", "[DiagnosticSelector]")
{
  SimulationEngine engine(makeScenarioConfig());
  auto result = engine.simulate(makeWeeklySeries({100.0, 100.0, 100.0}), 1000.0);

  // Week 1 carries the fees on the smallest invested base
  auto worst = DiagnosticSelector::findWorstWeek(result);
  REQUIRE(worst.has_value());
  REQUIRE(worst->weekIndex == 1);

  auto request = DiagnosticSelector::makeNarrativeRequest(*worst);
  REQUIRE(request.date == firstTestFriday());
  REQUIRE(request.returnPct == Approx(-0.35));
}
