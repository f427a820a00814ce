#include "config.hpp"
#include "picker_view.hpp"
#include "range_picker.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace ftxui;

// Print the 42-cell grid of a "YYYY-MM" month; outside days in brackets.
static bool print_month(const std::string &arg) {
  Date first;
  if (!parse_date(arg + "-01", first)) {
    return false;
  }
  const CalendarGrid grid = build_month_grid(first.year, first.month - 1);

  std::cout << month_name(first.month) << " " << first.year << "\n";
  std::cout << "  Su  Mo  Tu  We  Th  Fr  Sa\n";
  for (int row = 0; row < kGridWeeks; ++row) {
    for (int col = 0; col < 7; ++col) {
      const CalendarCell &cell = grid[row * 7 + col];
      if (cell.is_outside_month) {
        std::cout << "[" << std::setw(2) << cell.date.day << "]";
      } else {
        std::cout << " " << std::setw(2) << cell.date.day << " ";
      }
    }
    std::cout << "\n";
  }
  return true;
}

int main(int argc, char *argv[]) {
  bool controlled = false;
  std::string month_to_print;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: range-picker [options]\n"
                << "Options:\n"
                << "  -h, --help               Show this help message\n"
                << "  --controlled             Own the selected range in the "
                   "caller and feed commits back\n"
                << "  --print-month YYYY-MM    Print the calendar grid of a "
                   "month and exit\n"
                << "Environment:\n"
                << "  RANGE_PICKER_START, RANGE_PICKER_END, "
                   "RANGE_PICKER_MIN_DATE, RANGE_PICKER_MAX_DATE,\n"
                << "  RANGE_PICKER_LABEL, RANGE_PICKER_PLACEHOLDER, "
                   "RANGE_PICKER_DISABLED\n";
      return 0;
    } else if (arg == "--controlled") {
      controlled = true;
    } else if (arg == "--print-month") {
      if (i + 1 >= argc) {
        std::cerr << "--print-month needs a YYYY-MM argument\n";
        return 1;
      }
      month_to_print = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    }
  }

  if (!month_to_print.empty()) {
    if (!print_month(month_to_print)) {
      std::cerr << "Invalid month: " << month_to_print << "\n";
      return 1;
    }
    return 0;
  }

  // Load config
  Config config;
  try {
    config = load_config();
  } catch (const std::exception &e) {
    std::cerr << "Error loading configuration: " << e.what() << "\n";
    return 1;
  }

  std::optional<DateRange> last_commit;
  RangePicker *picker_ref = nullptr;

  RangePickerOptions options;
  if (controlled) {
    options.value = config.default_value;
  } else {
    options.default_value = config.default_value;
  }
  options.constraints = config.constraints;
  options.disabled = config.disabled;
  options.label = config.label;
  options.placeholder = config.placeholder;
  options.on_change = [&](const DateRange &range) {
    last_commit = range;
    // As the owner of a controlled value, accept every commit as-is.
    if (controlled && picker_ref) {
      picker_ref->SetValue(range);
    }
  };

  RangePicker picker(std::move(options));
  picker_ref = &picker;

  auto screen = ScreenInteractive::TerminalOutput();

  auto main_component =
      CatchEvent(MakeRangePickerApp(picker), [&](Event event) {
        if (event == Event::Character('q') ||
            (event == Event::Escape && !picker.IsOpen())) {
          screen.Exit();
          return true;
        }
        return false;
      });

  // Periodic redraw so "today" follows the clock.
  std::atomic<bool> running{true};
  std::thread ticker([&] {
    using namespace std::chrono_literals;
    while (running.load()) {
      std::this_thread::sleep_for(1s);
      screen.PostEvent(Event::Custom);
    }
  });

  screen.Loop(main_component);

  running.store(false);
  if (ticker.joinable()) {
    ticker.join();
  }

  if (last_commit && last_commit->complete()) {
    std::cout << format_date(*last_commit->start) << " "
              << format_date(*last_commit->end) << std::endl;
  }

  return 0;
}
