#include "range_highlight.hpp"

namespace {
struct ActiveRange {
  std::optional<Date> start;
  std::optional<Date> end;
};

ActiveRange active_range(const HighlightContext &ctx) {
  if (ctx.selection.phase == SelectionPhase::AwaitingEnd) {
    ActiveRange range{ctx.selection.pending_start, std::nullopt};
    if (range.start && ctx.hovered && !(*ctx.hovered < *range.start)) {
      range.end = ctx.hovered;
    }
    return range;
  }
  return ActiveRange{ctx.committed.start, ctx.committed.end};
}
} // namespace

bool constraints_consistent(const Constraints &constraints) {
  return !constraints.min_date || !constraints.max_date ||
         *constraints.min_date <= *constraints.max_date;
}

bool is_cell_disabled(const CalendarCell &cell,
                      const Constraints &constraints) {
  if (cell.is_outside_month) {
    return true;
  }
  if (constraints.min_date && cell.date < *constraints.min_date) {
    return true;
  }
  if (constraints.max_date && cell.date > *constraints.max_date) {
    return true;
  }
  return false;
}

CellHighlight resolve_highlight(const CalendarCell &cell,
                                const HighlightContext &ctx) {
  CellHighlight out;
  out.is_disabled = is_cell_disabled(cell, ctx.constraints);
  if (out.is_disabled) {
    return out;
  }

  const Date &date = cell.date;
  const ActiveRange range = active_range(ctx);

  out.is_start = range.start && date == *range.start;
  out.is_end = range.end && date == *range.end;
  out.is_in_range =
      range.start && range.end && *range.start < date && date < *range.end;
  out.is_today = date == ctx.today;
  out.is_hovered = ctx.hovered && date == *ctx.hovered;
  return out;
}
