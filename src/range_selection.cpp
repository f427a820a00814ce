#include "range_selection.hpp"

SelectionStep on_date_click(const SelectionState &state, const Date &date) {
  SelectionStep step;

  if (state.phase == SelectionPhase::AwaitingStart || !state.pending_start) {
    step.state.phase = SelectionPhase::AwaitingEnd;
    step.state.pending_start = date;
    return step;
  }

  const Date start = *state.pending_start;
  if (date < start) {
    step.state.phase = SelectionPhase::AwaitingEnd;
    step.state.pending_start = date;
    return step;
  }

  step.state = SelectionState{};
  step.committed = DateRange{start, date};
  return step;
}

SelectionState on_abort(const SelectionState &) { return SelectionState{}; }
