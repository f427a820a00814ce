#pragma once

#include "calendar_grid.hpp"
#include "date.hpp"
#include "dual_calendar.hpp"
#include "range_highlight.hpp"
#include "range_selection.hpp"

#include <array>
#include <functional>
#include <optional>
#include <string>

enum class CalendarSide { Left, Right };

struct DayCell {
  CalendarCell cell;
  CellHighlight highlight;
};

using DecoratedGrid = std::array<DayCell, kGridCells>;

struct RangePickerOptions {
  // Controlled when set: commits are only reported through on_change and the
  // owner feeds the new value back with SetValue.
  std::optional<DateRange> value;
  // Initial value when uncontrolled.
  DateRange default_value;
  std::function<void(const DateRange &)> on_change;
  Constraints constraints;
  // Rejects clicks, hovers and opening.
  bool disabled = false;
  std::string placeholder = "Select dates";
  std::string label;
};

// Selection engine behind a dual-calendar range picker. All input is applied
// synchronously; the presentation layer reads grids and flags back after each
// call.
class RangePicker {
public:
  explicit RangePicker(RangePickerOptions options);
  RangePicker(RangePickerOptions options, const Date &today);

  // Returns false when the click was ignored (picker or cell disabled).
  bool Click(const CalendarCell &cell);
  // Pointer entered `cell`, or left the grid when empty.
  void Hover(const std::optional<CalendarCell> &cell);

  void NavigatePrev();
  void NavigateNext();

  // Outside dismissal or cancel key: forget the pending start, close.
  void Abort();
  void Open();
  void Toggle();

  // Caller-side value update; moves the calendars when the start changed.
  void SetValue(const DateRange &range);
  void SetToday(const Date &today) { today_ = today; }

  bool IsControlled() const { return controlled_; }
  bool IsOpen() const { return open_; }
  bool Disabled() const { return options_.disabled; }
  const DateRange &Value() const { return value_; }
  SelectionPhase Phase() const { return selection_.phase; }
  const std::optional<Date> &PendingStart() const {
    return selection_.pending_start;
  }
  const std::optional<Date> &HoveredDate() const { return hovered_; }
  const Constraints &GetConstraints() const { return options_.constraints; }
  const std::string &Label() const { return options_.label; }
  const Date &Today() const { return today_; }

  DisplayedMonth LeftMonth() const { return calendar_.Left(); }
  DisplayedMonth RightMonth() const { return calendar_.Right(); }
  DisplayedMonth Month(CalendarSide side) const;
  bool Shows(const Date &date) const { return calendar_.Shows(date); }

  DecoratedGrid Grid(CalendarSide side) const;

  // "Jan 5 – Jan 20" for a complete range, the placeholder otherwise.
  std::string TriggerText() const;

private:
  void Commit(const DateRange &range);
  void ApplyValue(const DateRange &range);

  RangePickerOptions options_;
  bool controlled_ = false;
  DateRange value_;
  SelectionState selection_;
  std::optional<Date> hovered_;
  bool open_ = false;
  Date today_;
  DualCalendarController calendar_;
};
