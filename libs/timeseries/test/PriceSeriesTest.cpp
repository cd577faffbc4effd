#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PricePoint.h"
#include "PriceSeries.h"
#include "DcaTestUtils.h"

using namespace mkc_dca;
using boost::gregorian::date;
using Catch::Approx;

TEST_CASE("PricePoint: rejects non-positive and non-finite closes", "[PricePoint]") {
    date d(2024, 1, 5);
    REQUIRE_NOTHROW(PricePoint(d, 17000.25));
    REQUIRE_THROWS_AS(PricePoint(d, 0.0), PriceSeriesException);
    REQUIRE_THROWS_AS(PricePoint(d, -1.0), PriceSeriesException);
    REQUIRE_THROWS_AS(PricePoint(d, std::numeric_limits<double>::quiet_NaN()), PriceSeriesException);
    REQUIRE_THROWS_AS(PricePoint(d, std::numeric_limits<double>::infinity()), PriceSeriesException);
}

TEST_CASE("PricePoint: rejects special dates", "[PricePoint]") {
    REQUIRE_THROWS_AS(PricePoint(date(boost::gregorian::not_a_date_time), 100.0), PriceSeriesException);
}

TEST_CASE("PricePoint: equality compares date and price", "[PricePoint]") {
    PricePoint a(date(2024, 1, 5), 100.0);
    PricePoint b(date(2024, 1, 5), 100.0);
    PricePoint c(date(2024, 1, 5), 101.0);
    REQUIRE(a == b);
    REQUIRE(a != c);
}

TEST_CASE("PriceSeries: requires strictly ascending dates", "[PriceSeries]") {
    std::vector<PricePoint> duplicate{ PricePoint(date(2024, 1, 5), 100.0),
                                       PricePoint(date(2024, 1, 5), 101.0) };
    REQUIRE_THROWS_AS(PriceSeries(duplicate), PriceSeriesException);

    std::vector<PricePoint> descending{ PricePoint(date(2024, 1, 12), 100.0),
                                        PricePoint(date(2024, 1, 5), 101.0) };
    REQUIRE_THROWS_AS(PriceSeries(descending), PriceSeriesException);
}

TEST_CASE("PriceSeries: accessors", "[PriceSeries]") {
    PriceSeries series = makeWeeklySeries({ 100.0, 110.0, 90.0 });

    REQUIRE(series.getNumEntries() == 3);
    REQUIRE_FALSE(series.empty());
    REQUIRE(series.getFirstDate() == firstTestFriday());
    REQUIRE(series.getLastDate() == date(2024, 1, 19));
    REQUIRE(series[1].getClosePrice() == Approx(110.0));
    REQUIRE(series.getEntry(2).getClosePrice() == Approx(90.0));
    REQUIRE_THROWS_AS(series.getEntry(3), PriceSeriesException);

    double sum = 0.0;
    for (const auto& p : series)
        sum += p.getClosePrice();
    REQUIRE(sum == Approx(300.0));
}

TEST_CASE("PriceSeries: empty series", "[PriceSeries]") {
    PriceSeries series;
    REQUIRE(series.empty());
    REQUIRE(series.getNumEntries() == 0);
    REQUIRE_THROWS_AS(series.getFirstDate(), PriceSeriesException);
    REQUIRE_THROWS_AS(series.getLastDate(), PriceSeriesException);
}

TEST_CASE("PriceSeries: subSeries selects an inclusive window", "[PriceSeries]") {
    PriceSeries series = makeWeeklySeries({ 100.0, 110.0, 90.0, 95.0 });

    PriceSeries middle = series.subSeries(DateRange(date(2024, 1, 12), date(2024, 1, 19)));
    REQUIRE(middle.getNumEntries() == 2);
    REQUIRE(middle.getFirstDate() == date(2024, 1, 12));
    REQUIRE(middle.getLastDate() == date(2024, 1, 19));

    PriceSeries none = series.subSeries(DateRange(date(2023, 1, 1), date(2023, 12, 31)));
    REQUIRE(none.empty());
}
