#include "date.hpp"

#include <charconv>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace {
std::chrono::sys_days to_sys_days(int y, int m, int d) {
  using namespace std::chrono;
  return sys_days{year{y} / month{static_cast<unsigned>(m)} /
                  day{static_cast<unsigned>(d)}};
}

Date from_sys_days(std::chrono::sys_days days) {
  using namespace std::chrono;
  year_month_day ymd{days};
  return Date{int(ymd.year()), int(unsigned(ymd.month())),
              int(unsigned(ymd.day()))};
}
} // namespace

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0); }

int days_in_month(int y, int m) {
  static const int dm[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12) {
    return 0;
  }
  if (m == 2 && is_leap(y)) {
    return 29;
  }
  return dm[m];
}

int weekday_index(int y, int m, int d) {
  using namespace std::chrono;
  return int(weekday{to_sys_days(y, m, d)}.c_encoding()); // 0=Sun
}

int days_from_epoch(const Date &date) {
  return int(
      to_sys_days(date.year, date.month, date.day).time_since_epoch().count());
}

Date add_days(const Date &date, int delta) {
  return from_sys_days(to_sys_days(date.year, date.month, date.day) +
                       std::chrono::days{delta});
}

Date today() {
  using namespace std::chrono;
  return from_sys_days(floor<days>(system_clock::now()));
}

bool parse_date(std::string_view s, Date &out) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-')
    return false;

  auto parse_part = [](std::string_view part, int &value) {
    auto res = std::from_chars(part.data(), part.data() + part.size(), value);
    return res.ec == std::errc{} && res.ptr == part.data() + part.size();
  };

  Date parsed;
  if (!parse_part(s.substr(0, 4), parsed.year))
    return false;
  if (!parse_part(s.substr(5, 2), parsed.month))
    return false;
  if (!parse_part(s.substr(8, 2), parsed.day))
    return false;

  if (parsed.month < 1 || parsed.month > 12 || parsed.day < 1 ||
      parsed.day > days_in_month(parsed.year, parsed.month))
    return false;

  out = parsed;
  return true;
}

std::string format_date(const Date &date) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << date.year << "-" << std::setw(2)
      << date.month << "-" << std::setw(2) << date.day;
  return oss.str();
}

std::string format_date_short(const Date &date) {
  static const char *names[] = {"",    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  if (date.month < 1 || date.month > 12) {
    return "";
  }
  return std::string(names[date.month]) + " " + std::to_string(date.day);
}

std::string month_name(int m) {
  static const char *names[] = {"",          "January", "February", "March",
                                "April",     "May",     "June",     "July",
                                "August",    "September", "October",
                                "November",  "December"};
  if (m < 1 || m > 12) {
    return "";
  }
  return names[m];
}
