#pragma once

#include "date.hpp"

#include <array>

struct CalendarCell {
  Date date;
  bool is_outside_month = false;
};

// Six Sunday-first weeks, so every month renders at the same height.
inline constexpr int kGridWeeks = 6;
inline constexpr int kGridCells = kGridWeeks * 7;

using CalendarGrid = std::array<CalendarCell, kGridCells>;

// Build the grid for `month` (0 = January) of `year`. The cells before day 1
// are the last days of the previous month, the cells after the last day start
// at day 1 of the next month; both are flagged is_outside_month.
[[nodiscard]] CalendarGrid build_month_grid(int year, int month);
