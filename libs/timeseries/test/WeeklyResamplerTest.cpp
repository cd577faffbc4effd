#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "WeeklyResampler.h"
#include "DcaTestUtils.h"

using namespace mkc_dca;
using boost::gregorian::date;
using Catch::Approx;

TEST_CASE("getWeekEndingDate maps every weekday to its Friday", "[WeeklyResampler]") {
    // Monday 2024-01-01 through Friday 2024-01-05
    for (int day = 1; day <= 5; ++day)
        REQUIRE(getWeekEndingDate(date(2024, 1, day)) == date(2024, 1, 5));

    // Saturday and Sunday belong to the following week
    REQUIRE(getWeekEndingDate(date(2024, 1, 6)) == date(2024, 1, 12));
    REQUIRE(getWeekEndingDate(date(2024, 1, 7)) == date(2024, 1, 12));
}

TEST_CASE("getWeekEndingDate honours a different week end", "[WeeklyResampler]") {
    REQUIRE(getWeekEndingDate(date(2024, 1, 3), boost::date_time::Sunday) == date(2024, 1, 7));
    REQUIRE(getWeekEndingDate(date(2024, 1, 7), boost::date_time::Sunday) == date(2024, 1, 7));
}

TEST_CASE("resampleToWeeklyClose keeps the last close of each week", "[WeeklyResampler]") {
    // Two full weeks of weekday bars
    PriceSeries daily = makeWeekdaySeries({ 100, 101, 102, 103, 104,
                                            110, 111, 112, 113, 114 });
    PriceSeries weekly = resampleToWeeklyClose(daily);

    REQUIRE(weekly.getNumEntries() == 2);
    REQUIRE(weekly[0].getDate() == date(2024, 1, 5));
    REQUIRE(weekly[0].getClosePrice() == Approx(104.0));
    REQUIRE(weekly[1].getDate() == date(2024, 1, 12));
    REQUIRE(weekly[1].getClosePrice() == Approx(114.0));
}

TEST_CASE("resampleToWeeklyClose labels partial weeks with the week end", "[WeeklyResampler]") {
    // Wednesday 2024-01-03 and Tuesday 2024-01-09
    PriceSeries daily(std::vector<PricePoint>{ PricePoint(date(2024, 1, 3), 50.0),
                                               PricePoint(date(2024, 1, 9), 55.0) });
    PriceSeries weekly = resampleToWeeklyClose(daily);

    REQUIRE(weekly.getNumEntries() == 2);
    REQUIRE(weekly[0].getDate() == date(2024, 1, 5));
    REQUIRE(weekly[0].getClosePrice() == Approx(50.0));
    REQUIRE(weekly[1].getDate() == date(2024, 1, 12));
    REQUIRE(weekly[1].getClosePrice() == Approx(55.0));
}

TEST_CASE("resampleToWeeklyClose drops weeks without data", "[WeeklyResampler]") {
    PriceSeries daily(std::vector<PricePoint>{ PricePoint(date(2024, 1, 2), 10.0),
                                               PricePoint(date(2024, 1, 23), 20.0) });
    PriceSeries weekly = resampleToWeeklyClose(daily);

    REQUIRE(weekly.getNumEntries() == 2);
    REQUIRE(weekly[1].getDate() == date(2024, 1, 26));
}

TEST_CASE("resampleToWeeklyClose is idempotent on weekly data", "[WeeklyResampler]") {
    PriceSeries weekly = makeWeeklySeries({ 100.0, 90.0, 95.0, 120.0 });
    PriceSeries again = resampleToWeeklyClose(weekly);

    REQUIRE(again.getPoints() == weekly.getPoints());
}

TEST_CASE("resampleToWeeklyClose of an empty series is empty", "[WeeklyResampler]") {
    REQUIRE(resampleToWeeklyClose(PriceSeries()).empty());
}
