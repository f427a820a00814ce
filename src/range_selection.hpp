#pragma once

#include "date.hpp"

#include <optional>

// start <= end whenever both are set. A commit always sets both.
struct DateRange {
  std::optional<Date> start;
  std::optional<Date> end;

  bool operator==(const DateRange &) const = default;

  [[nodiscard]] bool complete() const { return start && end; }
};

enum class SelectionPhase { AwaitingStart, AwaitingEnd };

// pending_start is set exactly while phase is AwaitingEnd.
struct SelectionState {
  SelectionPhase phase = SelectionPhase::AwaitingStart;
  std::optional<Date> pending_start;

  bool operator==(const SelectionState &) const = default;
};

struct SelectionStep {
  SelectionState state;
  std::optional<DateRange> committed;
};

// Advance the two-click protocol with a click on `date`:
//  - AwaitingStart: `date` becomes the pending start.
//  - AwaitingEnd, `date` before the pending start: `date` replaces the pending
//    start, nothing is committed.
//  - AwaitingEnd otherwise: commits {pending start, date} and returns to
//    AwaitingStart.
// Whether the clicked cell may be clicked at all is decided by the caller.
[[nodiscard]] SelectionStep on_date_click(const SelectionState &state,
                                          const Date &date);

// Drop any half-made selection without committing.
[[nodiscard]] SelectionState on_abort(const SelectionState &state);
