#include "calendar_grid.hpp"

CalendarGrid build_month_grid(int year, int month) {
  // Fold out-of-range months into the year so callers may pass month +/- 1.
  year += (month >= 0 ? month : month - 11) / 12;
  month = ((month % 12) + 12) % 12;

  const int m = month + 1;
  const int num_days = days_in_month(year, m);
  const int first_wd = weekday_index(year, m, 1);

  const int prev_y = (m == 1) ? year - 1 : year;
  const int prev_m = (m == 1) ? 12 : m - 1;
  const int prev_days = days_in_month(prev_y, prev_m);

  const int next_y = (m == 12) ? year + 1 : year;
  const int next_m = (m == 12) ? 1 : m + 1;

  CalendarGrid grid{};
  int cell = 0;
  for (int i = first_wd - 1; i >= 0; --i) {
    grid[cell++] = CalendarCell{Date{prev_y, prev_m, prev_days - i}, true};
  }
  for (int d = 1; d <= num_days; ++d) {
    grid[cell++] = CalendarCell{Date{year, m, d}, false};
  }
  for (int d = 1; cell < kGridCells; ++d) {
    grid[cell++] = CalendarCell{Date{next_y, next_m, d}, true};
  }
  return grid;
}
