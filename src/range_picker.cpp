#include "range_picker.hpp"

#include <utility>

namespace {
DateRange initial_value(const RangePickerOptions &options) {
  return options.value ? *options.value : options.default_value;
}
} // namespace

RangePicker::RangePicker(RangePickerOptions options)
    : RangePicker(std::move(options), today()) {}

RangePicker::RangePicker(RangePickerOptions options, const Date &today)
    : options_(std::move(options)), controlled_(options_.value.has_value()),
      value_(initial_value(options_)), today_(today),
      calendar_(value_, today) {}

bool RangePicker::Click(const CalendarCell &cell) {
  if (options_.disabled || is_cell_disabled(cell, options_.constraints)) {
    return false;
  }
  SelectionStep step = on_date_click(selection_, cell.date);
  selection_ = step.state;
  if (step.committed) {
    Commit(*step.committed);
  }
  return true;
}

void RangePicker::Hover(const std::optional<CalendarCell> &cell) {
  if (options_.disabled) {
    return;
  }
  if (!cell) {
    hovered_.reset();
    return;
  }
  if (is_cell_disabled(*cell, options_.constraints)) {
    return;
  }
  hovered_ = cell->date;
}

void RangePicker::NavigatePrev() { calendar_.NavigatePrev(); }

void RangePicker::NavigateNext() { calendar_.NavigateNext(); }

void RangePicker::Abort() {
  selection_ = on_abort(selection_);
  open_ = false;
}

void RangePicker::Open() {
  if (options_.disabled) {
    return;
  }
  open_ = true;
}

void RangePicker::Toggle() {
  if (open_) {
    Abort();
  } else {
    Open();
  }
}

void RangePicker::SetValue(const DateRange &range) { ApplyValue(range); }

DisplayedMonth RangePicker::Month(CalendarSide side) const {
  return side == CalendarSide::Left ? calendar_.Left() : calendar_.Right();
}

DecoratedGrid RangePicker::Grid(CalendarSide side) const {
  const DisplayedMonth month = Month(side);
  const CalendarGrid cells = build_month_grid(month.year, month.month);

  HighlightContext ctx;
  ctx.committed = value_;
  ctx.selection = selection_;
  ctx.hovered = hovered_;
  ctx.constraints = options_.constraints;
  ctx.today = today_;

  DecoratedGrid grid{};
  for (int i = 0; i < kGridCells; ++i) {
    grid[i] = DayCell{cells[i], resolve_highlight(cells[i], ctx)};
  }
  return grid;
}

std::string RangePicker::TriggerText() const {
  if (!value_.complete()) {
    return options_.placeholder;
  }
  return format_date_short(*value_.start) + " – " +
         format_date_short(*value_.end);
}

void RangePicker::Commit(const DateRange &range) {
  open_ = false;
  if (!controlled_) {
    ApplyValue(range);
  }
  if (options_.on_change) {
    options_.on_change(range);
  }
}

void RangePicker::ApplyValue(const DateRange &range) {
  value_ = range;
  calendar_.SyncToRange(value_);
}
