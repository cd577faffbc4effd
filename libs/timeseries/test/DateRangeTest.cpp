#include <catch2/catch_test_macros.hpp>
#include "DateRange.h"
#include <boost/date_time/gregorian/gregorian.hpp>

using namespace mkc_dca;
using boost::gregorian::date;

TEST_CASE("DateRange: valid construction and getters", "[DateRange]") {
    date d1(2024, 1, 1);
    date d2(2024, 12, 31);
    DateRange range(d1, d2);
    REQUIRE(range.getFirstDate() == d1);
    REQUIRE(range.getLastDate() == d2);
}

TEST_CASE("DateRange: single day range is allowed", "[DateRange]") {
    date d(2024, 3, 15);
    DateRange range(d, d);
    REQUIRE(range.contains(d));
    REQUIRE_FALSE(range.contains(d + boost::gregorian::days(1)));
}

TEST_CASE("DateRange: invalid construction throws", "[DateRange]") {
    REQUIRE_THROWS_AS(DateRange(date(2024, 12, 31), date(2024, 1, 1)), DateRangeException);
    REQUIRE_THROWS_AS(DateRange(date(boost::gregorian::not_a_date_time), date(2024, 1, 1)),
                      DateRangeException);
}

TEST_CASE("DateRange: contains is inclusive at both ends", "[DateRange]") {
    DateRange range(date(2024, 1, 5), date(2024, 1, 26));
    REQUIRE(range.contains(date(2024, 1, 5)));
    REQUIRE(range.contains(date(2024, 1, 12)));
    REQUIRE(range.contains(date(2024, 1, 26)));
    REQUIRE_FALSE(range.contains(date(2024, 1, 4)));
    REQUIRE_FALSE(range.contains(date(2024, 1, 27)));
}

TEST_CASE("DateRange: equality and inequality", "[DateRange]") {
    DateRange a(date(2021, 7, 1), date(2021, 7, 31));
    DateRange b(date(2021, 7, 1), date(2021, 7, 31));
    DateRange c(date(2021, 7, 1), date(2021, 8, 31));
    REQUIRE(a == b);
    REQUIRE(a != c);

    DateRange assigned = c;
    assigned = a;
    REQUIRE(assigned == a);
}
