#include "dual_calendar.hpp"

DisplayedMonth next_month(const DisplayedMonth &m) {
  if (m.month == 11) {
    return DisplayedMonth{m.year + 1, 0};
  }
  return DisplayedMonth{m.year, m.month + 1};
}

DisplayedMonth prev_month(const DisplayedMonth &m) {
  if (m.month == 0) {
    return DisplayedMonth{m.year - 1, 11};
  }
  return DisplayedMonth{m.year, m.month - 1};
}

DisplayedMonth month_of(const Date &date) {
  return DisplayedMonth{date.year, date.month - 1};
}

DualCalendarController::DualCalendarController(const DateRange &range,
                                               const Date &fallback)
    : left_(month_of(range.start ? *range.start : fallback)),
      synced_start_(range.start) {}

void DualCalendarController::NavigatePrev() { left_ = prev_month(left_); }

void DualCalendarController::NavigateNext() { left_ = next_month(left_); }

void DualCalendarController::SyncToRange(const DateRange &range) {
  if (range.start == synced_start_) {
    return;
  }
  synced_start_ = range.start;
  if (range.start) {
    left_ = month_of(*range.start);
  }
}

bool DualCalendarController::Shows(const Date &date) const {
  const DisplayedMonth m = month_of(date);
  return m == Left() || m == Right();
}
