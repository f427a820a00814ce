#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace {
std::string get_env(const char *name, const std::string &def) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : def;
}

std::optional<Date> parse_optional_date(const std::string &str,
                                        const char *what) {
  if (str.empty()) {
    return std::nullopt;
  }
  Date date;
  if (!parse_date(str, date)) {
    throw std::runtime_error(std::string("Invalid ") + what +
                             " format: " + str);
  }
  return date;
}
} // namespace

Config load_config() {
  Config cfg;

  cfg.start_date_str = get_env("RANGE_PICKER_START", "");
  cfg.end_date_str = get_env("RANGE_PICKER_END", "");
  cfg.min_date_str = get_env("RANGE_PICKER_MIN_DATE", "");
  cfg.max_date_str = get_env("RANGE_PICKER_MAX_DATE", "");
  cfg.label = get_env("RANGE_PICKER_LABEL", "");
  cfg.placeholder = get_env("RANGE_PICKER_PLACEHOLDER", "Select dates");

  std::string disabled = get_env("RANGE_PICKER_DISABLED", "");
  cfg.disabled = disabled == "1" || disabled == "true";

  // Parse dates
  cfg.default_value.start = parse_optional_date(cfg.start_date_str, "start");
  cfg.default_value.end = parse_optional_date(cfg.end_date_str, "end");
  cfg.constraints.min_date = parse_optional_date(cfg.min_date_str, "min_date");
  cfg.constraints.max_date = parse_optional_date(cfg.max_date_str, "max_date");

  if (cfg.default_value.start.has_value() !=
      cfg.default_value.end.has_value()) {
    throw std::runtime_error(
        "RANGE_PICKER_START and RANGE_PICKER_END must be set together");
  }
  if (cfg.default_value.complete() &&
      *cfg.default_value.end < *cfg.default_value.start) {
    throw std::runtime_error("Range start " + cfg.start_date_str +
                             " is after its end " + cfg.end_date_str);
  }

  // Not fatal: the picker shows every day disabled until this is fixed.
  if (!constraints_consistent(cfg.constraints)) {
    std::cerr << "Warning: min_date " << cfg.min_date_str
              << " is after max_date " << cfg.max_date_str
              << "; every day will be disabled\n";
  }

  return cfg;
}
