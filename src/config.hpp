#pragma once

#include "range_highlight.hpp"
#include "range_selection.hpp"

#include <string>

struct Config {
  std::string start_date_str;
  std::string end_date_str;
  std::string min_date_str;
  std::string max_date_str;
  std::string label;
  std::string placeholder;
  bool disabled = false;

  // Parsed from the strings above
  DateRange default_value;
  Constraints constraints;
};

// Load settings from the environment:
//   RANGE_PICKER_START, RANGE_PICKER_END       initial range (YYYY-MM-DD)
//   RANGE_PICKER_MIN_DATE, RANGE_PICKER_MAX_DATE
//   RANGE_PICKER_LABEL, RANGE_PICKER_PLACEHOLDER
//   RANGE_PICKER_DISABLED                      "1" or "true"
// Throws std::runtime_error on malformed dates or an inverted range.
[[nodiscard]] Config load_config();
