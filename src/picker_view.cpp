#include "picker_view.hpp"
#include "range_picker.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/mouse.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/box.hpp>
#include <ftxui/screen/color.hpp>

#include <algorithm>
#include <array>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

using namespace ftxui;

namespace {
int side_index(CalendarSide side) {
  return side == CalendarSide::Left ? 0 : 1;
}

// Months since year 0, for ordering DisplayedMonth values
int month_index(const DisplayedMonth &m) { return m.year * 12 + m.month; }

std::string day_label(int day) {
  std::ostringstream oss;
  oss << std::setw(2) << day << " ";
  return oss.str();
}

std::string month_title(const DisplayedMonth &m) {
  return month_name(m.month + 1) + " " + std::to_string(m.year);
}

Element style_day(Element elem, const DayCell &day) {
  const CellHighlight &h = day.highlight;
  if (day.cell.is_outside_month) {
    return elem | color(Color::GrayDark) | dim;
  }
  if (h.is_disabled) {
    return elem | color(Color::GrayDark);
  }
  if (h.is_today) {
    elem = elem | color(Color::Yellow) | bold;
  }
  if (h.is_in_range) {
    elem = elem | bgcolor(Color::RGB(40, 60, 110));
  }
  if (h.is_start || h.is_end) {
    elem = elem | inverted | bold;
  }
  if (h.is_hovered) {
    elem = elem | underlined;
  }
  return elem;
}
} // namespace

class RangePickerBase : public ComponentBase {
public:
  explicit RangePickerBase(RangePicker &picker)
      : picker_(picker), cursor_(picker.Today()) {
    if (picker_.Value().start) {
      cursor_ = *picker_.Value().start;
    }
  }

  Element OnRender() override {
    Elements rows;
    if (!picker_.Label().empty()) {
      rows.push_back(text(picker_.Label()) | bold);
    }
    rows.push_back(RenderTrigger());
    if (picker_.IsOpen()) {
      rows.push_back(hbox({
                         RenderMonth(CalendarSide::Left),
                         RenderMonth(CalendarSide::Right),
                     }) |
                     reflect(overlay_box_));
    }
    rows.push_back(RenderStatus());
    return vbox(std::move(rows));
  }

  bool OnEvent(Event event) override {
    if (event == Event::Custom) {
      picker_.SetToday(today());
      return true;
    }

    if (event.is_mouse()) {
      HandleMouse(event.mouse());
      return true;
    }

    if (!picker_.IsOpen()) {
      if (event == Event::Return || event == Event::Character(' ')) {
        OpenOverlay();
        return true;
      }
      return false;
    }
    return HandleOverlayKeys(event);
  }

  bool Focusable() const override { return true; }

private:
  void OpenOverlay() {
    picker_.Open();
    if (picker_.IsOpen()) {
      status_message_.clear();
      KeepCursorVisible();
    }
  }

  bool HandleOverlayKeys(const Event &event) {
    if (event == Event::Escape) {
      picker_.Abort();
      status_message_.clear();
      return true;
    }
    if (event == Event::ArrowLeft || event == Event::Character('h')) {
      MoveCursor(-1);
      return true;
    }
    if (event == Event::ArrowRight || event == Event::Character('l')) {
      MoveCursor(1);
      return true;
    }
    if (event == Event::ArrowUp || event == Event::Character('k')) {
      MoveCursor(-7);
      return true;
    }
    if (event == Event::ArrowDown || event == Event::Character('j')) {
      MoveCursor(7);
      return true;
    }
    if (event == Event::PageUp || event == Event::Character('[')) {
      picker_.NavigatePrev();
      KeepCursorVisible();
      return true;
    }
    if (event == Event::PageDown || event == Event::Character(']')) {
      picker_.NavigateNext();
      KeepCursorVisible();
      return true;
    }
    if (event == Event::Return) {
      Activate(CalendarCell{cursor_, false});
      return true;
    }
    return false;
  }

  void HandleMouse(const Mouse &mouse) {
    const int x = mouse.x;
    const int y = mouse.y;

    if (mouse.button == Mouse::Left && mouse.motion == Mouse::Pressed) {
      if (trigger_box_.Contain(x, y)) {
        if (picker_.IsOpen()) {
          picker_.Abort();
        } else {
          OpenOverlay();
        }
        return;
      }
      if (!picker_.IsOpen()) {
        return;
      }
      if (prev_box_.Contain(x, y)) {
        picker_.NavigatePrev();
        KeepCursorVisible();
        return;
      }
      if (next_box_.Contain(x, y)) {
        picker_.NavigateNext();
        KeepCursorVisible();
        return;
      }
      if (auto cell = CellAt(x, y)) {
        if (!cell->is_outside_month) {
          cursor_ = cell->date;
        }
        Activate(*cell);
        return;
      }
      // Pointer-down outside the overlay dismisses it.
      if (!overlay_box_.Contain(x, y)) {
        picker_.Abort();
      }
      return;
    }

    if (mouse.motion == Mouse::Moved && picker_.IsOpen()) {
      auto cell = CellAt(x, y);
      if (cell && is_cell_disabled(*cell, picker_.GetConstraints())) {
        cell.reset();
      }
      picker_.Hover(cell);
    }
  }

  void Activate(const CalendarCell &cell) {
    if (!picker_.Click(cell)) {
      status_message_ = "That day cannot be selected.";
      return;
    }
    status_message_.clear();
  }

  void MoveCursor(int delta) {
    cursor_ = add_days(cursor_, delta);
    const int target = month_index(month_of(cursor_));
    if (target < month_index(picker_.LeftMonth())) {
      picker_.NavigatePrev();
    } else if (target > month_index(picker_.RightMonth())) {
      picker_.NavigateNext();
    }
    HoverCursor();
  }

  // Keep the cursor on a day of one of the two visible months.
  void KeepCursorVisible() {
    if (!picker_.Shows(cursor_)) {
      const DisplayedMonth left = picker_.LeftMonth();
      const int m = left.month + 1;
      cursor_ = Date{left.year, m,
                     std::clamp(cursor_.day, 1, days_in_month(left.year, m))};
    }
    HoverCursor();
  }

  void HoverCursor() {
    const CalendarCell cell{cursor_, false};
    if (is_cell_disabled(cell, picker_.GetConstraints())) {
      picker_.Hover(std::nullopt);
      return;
    }
    picker_.Hover(cell);
  }

  std::optional<CalendarCell> CellAt(int x, int y) const {
    for (CalendarSide side : {CalendarSide::Left, CalendarSide::Right}) {
      const auto &boxes = cell_boxes_[side_index(side)];
      for (int i = 0; i < kGridCells; ++i) {
        if (boxes[i].Contain(x, y)) {
          const DisplayedMonth m = picker_.Month(side);
          return build_month_grid(m.year, m.month)[i];
        }
      }
    }
    return std::nullopt;
  }

  Element RenderTrigger() {
    const bool has_value = picker_.Value().complete();
    auto label = text(picker_.TriggerText()) |
                 color(has_value ? Color::White : Color::GrayDark);
    auto trigger = hbox({text(" [#] "), label, text(" ")}) | border;
    if (picker_.Disabled()) {
      trigger = trigger | dim;
    } else if (picker_.IsOpen()) {
      trigger = trigger | color(Color::YellowLight);
    }
    return trigger | reflect(trigger_box_);
  }

  Element RenderMonth(CalendarSide side) {
    const DecoratedGrid grid = picker_.Grid(side);
    auto &boxes = cell_boxes_[side_index(side)];

    Elements lines;
    lines.push_back(hbox({
        text("Su ") | color(Color::GrayLight),
        text("Mo ") | color(Color::GrayLight),
        text("Tu ") | color(Color::GrayLight),
        text("We ") | color(Color::GrayLight),
        text("Th ") | color(Color::GrayLight),
        text("Fr ") | color(Color::GrayLight),
        text("Sa ") | color(Color::GrayLight),
    }));

    for (int row = 0; row < kGridWeeks; ++row) {
      Elements cols;
      for (int col = 0; col < 7; ++col) {
        const int cell = row * 7 + col;
        cols.push_back(
            style_day(text(day_label(grid[cell].cell.date.day)), grid[cell]) |
            reflect(boxes[cell]));
      }
      lines.push_back(hbox(std::move(cols)));
    }

    auto name = text(month_title(picker_.Month(side))) | bold |
                color(Color::Cyan);
    Element title;
    if (side == CalendarSide::Left) {
      title = hbox({text(" < ") | bold | reflect(prev_box_), name});
    } else {
      title = hbox({name, text(" > ") | bold | reflect(next_box_)});
    }
    return window(title, vbox(std::move(lines)));
  }

  Element RenderStatus() {
    std::string phase;
    if (picker_.Disabled()) {
      phase = "Picker disabled";
    } else if (!picker_.IsOpen()) {
      phase = "Enter: open  q: quit";
    } else if (picker_.Phase() == SelectionPhase::AwaitingStart) {
      phase = "Pick a start date";
    } else {
      phase = "Pick an end date (from " + format_date(*picker_.PendingStart()) +
              ")";
    }

    Elements lines;
    lines.push_back(text(phase) | color(Color::White));
    if (!status_message_.empty()) {
      lines.push_back(text(status_message_) | color(Color::RedLight));
    }
    if (picker_.IsOpen()) {
      lines.push_back(
          text("Arrows: move  Enter: pick  [ ]: month  Esc: cancel") |
          color(Color::GrayDark));
    }
    return vbox(std::move(lines));
  }

  RangePicker &picker_;
  Date cursor_;
  std::string status_message_;

  Box trigger_box_;
  Box overlay_box_;
  Box prev_box_;
  Box next_box_;
  std::array<std::array<Box, kGridCells>, 2> cell_boxes_{};
};

Component MakeRangePickerApp(RangePicker &picker) {
  return std::make_shared<RangePickerBase>(picker);
}
