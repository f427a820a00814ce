#include <catch2/catch.hpp>

#include "date.hpp"

TEST_CASE("Date arithmetic", "[Date]") {
  SECTION("Leap years") {
    REQUIRE(is_leap(2024));
    REQUIRE(is_leap(2000));
    REQUIRE_FALSE(is_leap(1900));
    REQUIRE_FALSE(is_leap(2025));
  }

  SECTION("Days in month") {
    REQUIRE(days_in_month(2024, 2) == 29);
    REQUIRE(days_in_month(2025, 2) == 28);
    REQUIRE(days_in_month(2025, 4) == 30);
    REQUIRE(days_in_month(2025, 12) == 31);
  }

  SECTION("Weekdays are Sunday based") {
    REQUIRE(weekday_index(2025, 1, 1) == 3);
    REQUIRE(weekday_index(2026, 2, 1) == 0);
    REQUIRE(weekday_index(2025, 2, 1) == 6);
  }

  SECTION("Ordering is by day") {
    REQUIRE(Date{2024, 12, 31} < Date{2025, 1, 1});
    REQUIRE(Date{2025, 1, 9} < Date{2025, 1, 10});
    REQUIRE(Date{2025, 2, 1} > Date{2025, 1, 31});
    REQUIRE(Date{2025, 3, 3} == Date{2025, 3, 3});
  }

  SECTION("Adding days crosses months and years") {
    REQUIRE(add_days(Date{2025, 1, 31}, 1) == Date{2025, 2, 1});
    REQUIRE(add_days(Date{2025, 1, 1}, -1) == Date{2024, 12, 31});
    REQUIRE(add_days(Date{2024, 2, 28}, 1) == Date{2024, 2, 29});
    REQUIRE(days_from_epoch(Date{1970, 1, 1}) == 0);
  }
}

TEST_CASE("Date parsing and formatting", "[Date]") {
  Date date;

  SECTION("Valid dates") {
    REQUIRE(parse_date("2025-01-05", date));
    REQUIRE(date == Date{2025, 1, 5});
    REQUIRE(parse_date("2024-02-29", date));
    REQUIRE(date == Date{2024, 2, 29});
  }

  SECTION("Invalid dates leave the output untouched") {
    date = Date{2000, 1, 1};
    REQUIRE_FALSE(parse_date("2025-02-29", date));
    REQUIRE_FALSE(parse_date("2025-13-01", date));
    REQUIRE_FALSE(parse_date("2025-1-05", date));
    REQUIRE_FALSE(parse_date("2025/01/05", date));
    REQUIRE_FALSE(parse_date("2025-01-xx", date));
    REQUIRE_FALSE(parse_date("", date));
    REQUIRE(date == Date{2000, 1, 1});
  }

  SECTION("Formatting") {
    REQUIRE(format_date(Date{2025, 1, 5}) == "2025-01-05");
    REQUIRE(format_date_short(Date{2025, 1, 5}) == "Jan 5");
    REQUIRE(format_date_short(Date{2025, 12, 20}) == "Dec 20");
    REQUIRE(month_name(1) == "January");
    REQUIRE(month_name(12) == "December");
    REQUIRE(month_name(0).empty());
  }
}
