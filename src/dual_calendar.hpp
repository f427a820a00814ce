#pragma once

#include "date.hpp"
#include "range_selection.hpp"

#include <optional>

// month is 0..11
struct DisplayedMonth {
  int year{};
  int month{};

  bool operator==(const DisplayedMonth &) const = default;
};

[[nodiscard]] DisplayedMonth next_month(const DisplayedMonth &m);
[[nodiscard]] DisplayedMonth prev_month(const DisplayedMonth &m);
[[nodiscard]] DisplayedMonth month_of(const Date &date);

// Two adjacent month views. Only the left month is stored; the right one is
// always derived from it, so the views cannot drift apart.
class DualCalendarController {
public:
  // Opens on the month of the range's start, or on `fallback`'s month.
  DualCalendarController(const DateRange &range, const Date &fallback);

  void NavigatePrev();
  void NavigateNext();

  // Jump to the start month when the range's start differs from the one seen
  // last. Navigation never writes back to the range.
  void SyncToRange(const DateRange &range);

  DisplayedMonth Left() const { return left_; }
  DisplayedMonth Right() const { return next_month(left_); }

  // True when `date` falls in the left or right month.
  bool Shows(const Date &date) const;

private:
  DisplayedMonth left_;
  std::optional<Date> synced_start_;
};
