#pragma once

#include <compare>
#include <string>
#include <string_view>

// A calendar day. month is 1..12, day is 1..31. There is no time of day.
struct Date {
  int year{};
  int month{};
  int day{};

  auto operator<=>(const Date &) const = default;
};

[[nodiscard]] bool is_leap(int y);

// m is 1..12
[[nodiscard]] int days_in_month(int y, int m);

// 0=Sun .. 6=Sat
[[nodiscard]] int weekday_index(int y, int m, int d);

// Days since 1970-01-01, usable for ordering and day differences
[[nodiscard]] int days_from_epoch(const Date &date);

[[nodiscard]] Date add_days(const Date &date, int delta);

// Today's date in the system clock's calendar
[[nodiscard]] Date today();

// Parse "YYYY-MM-DD". Rejects days past the end of the month.
[[nodiscard]] bool parse_date(std::string_view s, Date &out);

// "YYYY-MM-DD"
[[nodiscard]] std::string format_date(const Date &date);

// "Jan 5"
[[nodiscard]] std::string format_date_short(const Date &date);

// "January"; empty for m outside 1..12
[[nodiscard]] std::string month_name(int m);
