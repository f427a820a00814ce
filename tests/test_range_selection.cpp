#include <catch2/catch.hpp>

#include "range_selection.hpp"

TEST_CASE("Two-click range selection", "[RangeSelection]") {
  SelectionState state;
  REQUIRE(state.phase == SelectionPhase::AwaitingStart);
  REQUIRE_FALSE(state.pending_start);

  SECTION("First click sets the pending start") {
    SelectionStep step = on_date_click(state, Date{2025, 1, 10});
    REQUIRE(step.state.phase == SelectionPhase::AwaitingEnd);
    REQUIRE(step.state.pending_start == Date{2025, 1, 10});
    REQUIRE_FALSE(step.committed);
  }

  SECTION("Earlier second click resets the start, later click commits") {
    SelectionStep step = on_date_click(state, Date{2025, 1, 10});

    step = on_date_click(step.state, Date{2025, 1, 5});
    REQUIRE(step.state.phase == SelectionPhase::AwaitingEnd);
    REQUIRE(step.state.pending_start == Date{2025, 1, 5});
    REQUIRE_FALSE(step.committed);

    step = on_date_click(step.state, Date{2025, 1, 20});
    REQUIRE(step.state.phase == SelectionPhase::AwaitingStart);
    REQUIRE_FALSE(step.state.pending_start);
    REQUIRE(step.committed);
    REQUIRE(step.committed->start == Date{2025, 1, 5});
    REQUIRE(step.committed->end == Date{2025, 1, 20});
  }

  SECTION("Clicking the pending start again commits a one-day range") {
    SelectionStep step = on_date_click(state, Date{2025, 3, 3});
    step = on_date_click(step.state, Date{2025, 3, 3});
    REQUIRE(step.committed);
    REQUIRE(step.committed->start == Date{2025, 3, 3});
    REQUIRE(step.committed->end == Date{2025, 3, 3});
  }

  SECTION("A range may span months and years") {
    SelectionStep step = on_date_click(state, Date{2025, 12, 30});
    step = on_date_click(step.state, Date{2026, 1, 2});
    REQUIRE(step.committed);
    REQUIRE(*step.committed == DateRange{Date{2025, 12, 30}, Date{2026, 1, 2}});
  }

  SECTION("Abort discards the pending start") {
    SelectionStep step = on_date_click(state, Date{2025, 1, 10});
    SelectionState aborted = on_abort(step.state);
    REQUIRE(aborted == SelectionState{});

    // The next click starts a fresh selection rather than committing.
    step = on_date_click(aborted, Date{2025, 1, 12});
    REQUIRE_FALSE(step.committed);
    REQUIRE(step.state.pending_start == Date{2025, 1, 12});
  }

  SECTION("Abort while awaiting a start is harmless") {
    REQUIRE(on_abort(state) == SelectionState{});
  }
}
