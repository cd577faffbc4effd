#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <vector>
#include "CandidateRanking.h"

using namespace mkc_dca;

namespace
{
  const double NaN = std::numeric_limits<double>::quiet_NaN();

  SweepCandidate makeCandidate(double weeklyAmount,
			       double dollarProfit,
			       double sharpe = 0.0,
			       double volatility = 0.0,
			       double totalReturnPct = 0.0)
  {
    PerformanceMetrics metrics{ totalReturnPct, 0.0, volatility, sharpe, 0.0, 0.0, 0.0 };
    return SweepCandidate{ weeklyAmount,
			   SimulationResult(weeklyAmount, std::vector<WeekRecord>(), 0.0),
			   metrics,
			   dollarProfit,
			   0.0 };
  }

  std::vector<double> amountsOf(const std::vector<SweepCandidate>& candidates)
  {
    std::vector<double> amounts;
    for (const auto& c : candidates)
      amounts.push_back(c.weeklyAmount);
    return amounts;
  }
}

TEST_CASE("rankByDollarProfit: tie-break chain", "[CandidateRanking]")
{
  SECTION("equal profit falls back to higher Sharpe")
  {
    std::vector<SweepCandidate> candidates{ makeCandidate(100.0, 10.0, 0.5),
					    makeCandidate(200.0, 10.0, 1.5),
					    makeCandidate(300.0, 10.0, 1.0) };

    REQUIRE(amountsOf(rankByDollarProfit(candidates)) == std::vector<double>{200.0, 300.0, 100.0});
  }

  SECTION("equal profit and Sharpe fall back to lower volatility")
  {
    std::vector<SweepCandidate> candidates{ makeCandidate(100.0, 10.0, 1.0, 12.0),
					    makeCandidate(200.0, 10.0, 1.0, 8.0),
					    makeCandidate(300.0, 10.0, 1.0, 10.0) };

    REQUIRE(amountsOf(rankByDollarProfit(candidates)) == std::vector<double>{200.0, 300.0, 100.0});
  }

  SECTION("full tie resolves by the smaller amount")
  {
    std::vector<SweepCandidate> candidates{ makeCandidate(300.0, 10.0, 1.0, 4.0),
					    makeCandidate(100.0, 10.0, 1.0, 4.0),
					    makeCandidate(200.0, 10.0, 1.0, 4.0) };

    REQUIRE(amountsOf(rankByDollarProfit(candidates)) == std::vector<double>{100.0, 200.0, 300.0});
  }

  SECTION("every level of the chain at once")
  {
    std::vector<SweepCandidate> candidates{ makeCandidate(500.0, 10.0, 1.0, 5.0),
					    makeCandidate(400.0, 10.0, 2.0, 9.0),
					    makeCandidate(300.0, 10.0, 2.0, 4.0),
					    makeCandidate(200.0, 10.0, 2.0, 4.0),
					    makeCandidate(100.0, 20.0, 0.0, 0.0) };

    REQUIRE(amountsOf(rankByDollarProfit(candidates)) ==
	    std::vector<double>{100.0, 200.0, 300.0, 400.0, 500.0});
  }

  SECTION("only the first five are kept")
  {
    std::vector<SweepCandidate> candidates;
    for (int i = 1; i <= 8; ++i)
      candidates.push_back(makeCandidate(100.0 * i, 10.0 * i));

    REQUIRE(amountsOf(rankByDollarProfit(candidates)) ==
	    std::vector<double>{800.0, 700.0, 600.0, 500.0, 400.0});
    REQUIRE(rankByDollarProfit(candidates, 2).size() == 2);
  }
}

TEST_CASE("rankByObjective: NaN values rank last", "[CandidateRanking]")
{
  std::vector<SweepCandidate> candidates{ makeCandidate(100.0, 0.0, 0.0, 0.0, NaN),
					  makeCandidate(200.0, 0.0, 0.0, 0.0, 3.0),
					  makeCandidate(300.0, 0.0, 0.0, 0.0, NaN),
					  makeCandidate(400.0, 0.0, 0.0, 0.0, -1.0),
					  makeCandidate(500.0, 0.0, 0.0, 0.0, 7.0) };

  SECTION("descending")
  {
    REQUIRE(amountsOf(rankByObjective(candidates, SortKey::TotalReturn, true, 10)) ==
	    std::vector<double>{500.0, 200.0, 400.0, 100.0, 300.0});
  }

  SECTION("ascending")
  {
    REQUIRE(amountsOf(rankByObjective(candidates, SortKey::TotalReturn, false, 10)) ==
	    std::vector<double>{400.0, 200.0, 500.0, 100.0, 300.0});
  }

  SECTION("topN cuts after the sort")
  {
    REQUIRE(amountsOf(rankByObjective(candidates, SortKey::TotalReturn, false, 2)) ==
	    std::vector<double>{400.0, 200.0});
  }
}

TEST_CASE("rankByObjective: equal values keep grid order", "[CandidateRanking]")
{
  std::vector<SweepCandidate> candidates{ makeCandidate(100.0, 0.0, 1.0),
					  makeCandidate(200.0, 0.0, 2.0),
					  makeCandidate(300.0, 0.0, 1.0),
					  makeCandidate(400.0, 0.0, 2.0) };

  REQUIRE(amountsOf(rankByObjective(candidates, SortKey::SharpeRatio, true, 10)) ==
	  std::vector<double>{200.0, 400.0, 100.0, 300.0});
  REQUIRE(amountsOf(rankByObjective(candidates, SortKey::SharpeRatio, false, 10)) ==
	  std::vector<double>{100.0, 300.0, 200.0, 400.0});
}

TEST_CASE("rankByObjective: values closer than a display cent stay distinct", "[CandidateRanking]")
{
  // All four print as 449.54 or 449.56; the full-precision order must win
  std::vector<SweepCandidate> candidates{ makeCandidate(1009.95, 0.0, 0.0, 0.0, 449.561),
					  makeCandidate(1009.96, 0.0, 0.0, 0.0, 449.557),
					  makeCandidate(1009.99, 0.0, 0.0, 0.0, 449.542),
					  makeCandidate(1010.00, 0.0, 0.0, 0.0, 449.538) };

  REQUIRE(amountsOf(rankByObjective(candidates, SortKey::TotalReturn, false, 3)) ==
	  std::vector<double>{1010.00, 1009.99, 1009.96});
}
