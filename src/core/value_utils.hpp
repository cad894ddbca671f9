#pragma once

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "core/context.hpp"

namespace auto_core {

// ---- YAML value helpers shared by triggers, conditions, actions ----

// Scalar text of a node ("" for null/undefined, flow YAML for collections)
std::string node_to_string(const YAML::Node &node);

// Numeric cast of a scalar node; nullopt on null or parse failure
std::optional<double> node_to_double(const YAML::Node &node);

// Deep structural equality (scalars compared as text)
bool nodes_equal(const YAML::Node &a, const YAML::Node &b);

// Deep copy so that callers never share mutable YAML storage
YAML::Node clone_node(const YAML::Node &node);

YAML::Node map_to_node(const std::map<std::string, YAML::Node> &values);
std::map<std::string, YAML::Node> node_to_map(const YAML::Node &node);

// Optional field readers for raw configuration maps.
// Throw std::runtime_error("<key>: ...") when present but of the wrong kind.
std::optional<std::string> get_string(const YAML::Node &config,
                                      const std::string &key);
std::optional<double> get_double(const YAML::Node &config,
                                 const std::string &key);
std::optional<int64_t> get_int(const YAML::Node &config,
                               const std::string &key);
bool get_bool(const YAML::Node &config, const std::string &key, bool fallback);
std::vector<std::string> get_string_list(const YAML::Node &config,
                                         const std::string &key);
std::string require_string(const YAML::Node &config, const std::string &key,
                           const std::string &what);

// Value of an entity field: attribute when `attribute` is set, else state.
// nullopt when the entity or attribute is missing.
std::optional<std::string>
entity_value(const EntityState *entity,
             const std::optional<std::string> &attribute);

// ---- Time helpers ----

// ISO-8601 local time "YYYY-MM-DDTHH:MM:SS"
std::string format_time(TimePoint tp);

// Seconds since local midnight
int seconds_of_day(TimePoint tp);

// Lower-case English weekday name ("monday" ...)
std::string weekday_name(TimePoint tp);

// Local midnight of the day containing tp
TimePoint start_of_day(TimePoint tp);

// Parse "HH:MM" or "HH:MM:SS" into seconds since midnight
std::optional<int> parse_time_of_day(const std::string &text);

// Parse a duration: plain seconds ("90", "1.5"), "HH:MM:SS", or unit form
// ("1h30m", "45s", "2 minutes", "1 hour 5 secs").
// Throws std::invalid_argument on malformed, non-finite or out-of-range
// (above kMaxDurationSeconds) text.
double parse_duration(const std::string &text);

// Duration field of a raw configuration map: number of seconds, duration
// text, or a {hours, minutes, seconds} map. Throws std::runtime_error
// "<key>: ..." on malformed values.
std::optional<double> get_duration(const YAML::Node &config,
                                   const std::string &key);

// Longest accepted duration (100 years). Time points offset by this much
// stay representable in Clock::duration.
constexpr double kMaxDurationSeconds = 100.0 * 365.0 * 86400.0;

// Seconds as a chrono duration, clamped to +/-kMaxDurationSeconds
// (NaN maps to zero)
inline Clock::duration to_duration(double seconds) {
  if (std::isnan(seconds)) {
    return Clock::duration::zero();
  }
  seconds = std::min(std::max(seconds, -kMaxDurationSeconds),
                     kMaxDurationSeconds);
  return std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(seconds));
}

inline double seconds_between(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

std::string lower(std::string text);

} // namespace auto_core
