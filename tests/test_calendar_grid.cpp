#include <catch2/catch.hpp>

#include "calendar_grid.hpp"

namespace {
int count_inside(const CalendarGrid &grid) {
  int inside = 0;
  for (const auto &cell : grid) {
    if (!cell.is_outside_month) {
      ++inside;
    }
  }
  return inside;
}
} // namespace

TEST_CASE("Month grid layout", "[CalendarGrid]") {
  SECTION("January 2025 starts on a Wednesday") {
    const CalendarGrid grid = build_month_grid(2025, 0);

    REQUIRE(grid.size() == 42);
    REQUIRE(grid[0].date == Date{2024, 12, 29});
    REQUIRE(grid[1].date == Date{2024, 12, 30});
    REQUIRE(grid[2].date == Date{2024, 12, 31});
    for (int i = 0; i < 3; ++i) {
      REQUIRE(grid[i].is_outside_month);
    }
    for (int d = 1; d <= 31; ++d) {
      REQUIRE(grid[2 + d].date == Date{2025, 1, d});
      REQUIRE_FALSE(grid[2 + d].is_outside_month);
    }
    for (int d = 1; d <= 8; ++d) {
      REQUIRE(grid[33 + d].date == Date{2025, 2, d});
      REQUIRE(grid[33 + d].is_outside_month);
    }
  }

  SECTION("Leap February") {
    const CalendarGrid grid = build_month_grid(2024, 1);
    REQUIRE(count_inside(grid) == 29);
    REQUIRE(grid[4].date == Date{2024, 2, 1});
    REQUIRE(grid[32].date == Date{2024, 2, 29});
    REQUIRE(grid[33].date == Date{2024, 3, 1});
  }

  SECTION("Common-year February") {
    const CalendarGrid grid = build_month_grid(2025, 1);
    REQUIRE(count_inside(grid) == 28);
    REQUIRE(grid[0].date == Date{2025, 1, 26});
    REQUIRE(grid[6].date == Date{2025, 2, 1});
  }

  SECTION("Month starting on Sunday has no leading cells") {
    const CalendarGrid grid = build_month_grid(2026, 1);
    REQUIRE(grid[0].date == Date{2026, 2, 1});
    REQUIRE_FALSE(grid[0].is_outside_month);
    REQUIRE(grid[27].date == Date{2026, 2, 28});
    REQUIRE(grid[28].date == Date{2026, 3, 1});
    REQUIRE(grid[41].date == Date{2026, 3, 14});
  }

  SECTION("December rolls the trailing cells into the next year") {
    const CalendarGrid grid = build_month_grid(2025, 11);
    REQUIRE(grid[0].date == Date{2025, 11, 30});
    REQUIRE(grid[1].date == Date{2025, 12, 1});
    REQUIRE(grid[32].date == Date{2026, 1, 1});
    REQUIRE(grid[41].date == Date{2026, 1, 10});
  }

  SECTION("Out-of-range months fold into the neighbouring year") {
    REQUIRE(build_month_grid(2025, -1)[1].date ==
            build_month_grid(2024, 11)[1].date);
    REQUIRE(build_month_grid(2024, 12)[10].date ==
            build_month_grid(2025, 0)[10].date);
  }
}

TEST_CASE("Every month grid has 42 cells bounded by day 1 and the last day",
          "[CalendarGrid]") {
  for (int year = 1999; year <= 2030; ++year) {
    for (int month = 0; month < 12; ++month) {
      const CalendarGrid grid = build_month_grid(year, month);
      REQUIRE(grid.size() == 42);

      int first = -1;
      int last = -1;
      for (int i = 0; i < kGridCells; ++i) {
        if (!grid[i].is_outside_month) {
          if (first < 0) {
            first = i;
          }
          last = i;
        }
      }
      REQUIRE(grid[first].date == Date{year, month + 1, 1});
      REQUIRE(grid[last].date ==
              Date{year, month + 1, days_in_month(year, month + 1)});
      REQUIRE(last - first + 1 == days_in_month(year, month + 1));

      // Consecutive days across the whole grid
      for (int i = 1; i < kGridCells; ++i) {
        REQUIRE(days_from_epoch(grid[i].date) ==
                days_from_epoch(grid[i - 1].date) + 1);
      }
    }
  }
}
