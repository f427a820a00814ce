#pragma once

#include "calendar_grid.hpp"
#include "date.hpp"
#include "range_selection.hpp"

#include <optional>

// Caller-supplied bounds. min_date > max_date is a caller error: every cell
// then resolves as disabled.
struct Constraints {
  std::optional<Date> min_date;
  std::optional<Date> max_date;
};

[[nodiscard]] bool constraints_consistent(const Constraints &constraints);

// Outside cells and cells beyond min_date/max_date cannot be clicked.
[[nodiscard]] bool is_cell_disabled(const CalendarCell &cell,
                                    const Constraints &constraints);

struct CellHighlight {
  bool is_start = false;
  bool is_end = false;
  bool is_in_range = false;
  bool is_today = false;
  bool is_hovered = false;
  bool is_disabled = false;

  bool operator==(const CellHighlight &) const = default;
};

// Everything besides the cell that decides its highlight.
struct HighlightContext {
  DateRange committed;
  SelectionState selection;
  std::optional<Date> hovered;
  Constraints constraints;
  Date today;
};

// While a selection is in progress the pending start and the hovered date
// (only when it is not before the pending start) form the previewed range;
// otherwise the committed range is shown. Disabled cells carry no highlight.
[[nodiscard]] CellHighlight resolve_highlight(const CalendarCell &cell,
                                              const HighlightContext &ctx);
