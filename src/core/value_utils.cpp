#include "core/value_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace auto_core {

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

static std::string trim(const std::string &text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string node_to_string(const YAML::Node &node) {
  if (!node.IsDefined() || node.IsNull()) {
    return "";
  }
  if (node.IsScalar()) {
    return node.Scalar();
  }
  YAML::Emitter out;
  out << YAML::Flow << node;
  return out.c_str();
}

std::optional<double> node_to_double(const YAML::Node &node) {
  if (!node.IsDefined() || !node.IsScalar()) {
    return std::nullopt;
  }
  try {
    return node.as<double>();
  } catch (const YAML::Exception &) {
    return std::nullopt;
  }
}

bool nodes_equal(const YAML::Node &a, const YAML::Node &b) {
  const bool a_null = !a.IsDefined() || a.IsNull();
  const bool b_null = !b.IsDefined() || b.IsNull();
  if (a_null || b_null) {
    return a_null == b_null;
  }
  if (a.Type() != b.Type()) {
    return false;
  }
  if (a.IsScalar()) {
    return a.Scalar() == b.Scalar();
  }
  if (a.size() != b.size()) {
    return false;
  }
  if (a.IsSequence()) {
    for (std::size_t i = 0; i < a.size(); ++i) {
      if (!nodes_equal(a[i], b[i])) {
        return false;
      }
    }
    return true;
  }
  for (const auto &kv : a) {
    const std::string key = kv.first.as<std::string>();
    if (!b[key] || !nodes_equal(kv.second, b[key])) {
      return false;
    }
  }
  return true;
}

YAML::Node clone_node(const YAML::Node &node) {
  if (!node.IsDefined()) {
    return YAML::Node();
  }
  return YAML::Clone(node);
}

YAML::Node map_to_node(const std::map<std::string, YAML::Node> &values) {
  YAML::Node out(YAML::NodeType::Map);
  for (const auto &[key, value] : values) {
    out[key] = clone_node(value);
  }
  return out;
}

std::map<std::string, YAML::Node> node_to_map(const YAML::Node &node) {
  std::map<std::string, YAML::Node> out;
  if (!node.IsDefined() || !node.IsMap()) {
    return out;
  }
  for (const auto &kv : node) {
    out[kv.first.as<std::string>()] = clone_node(kv.second);
  }
  return out;
}

std::optional<std::string> get_string(const YAML::Node &config,
                                      const std::string &key) {
  const YAML::Node node = config[key];
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    throw std::runtime_error(key + ": expected a string");
  }
  return node.Scalar();
}

std::optional<double> get_double(const YAML::Node &config,
                                 const std::string &key) {
  const YAML::Node node = config[key];
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  auto value = node_to_double(node);
  if (!value) {
    throw std::runtime_error(key + ": expected a number, got '" +
                             node_to_string(node) + "'");
  }
  return value;
}

std::optional<int64_t> get_int(const YAML::Node &config,
                               const std::string &key) {
  const YAML::Node node = config[key];
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  try {
    return node.as<int64_t>();
  } catch (const YAML::Exception &) {
    throw std::runtime_error(key + ": expected an integer, got '" +
                             node_to_string(node) + "'");
  }
}

bool get_bool(const YAML::Node &config, const std::string &key,
              bool fallback) {
  const YAML::Node node = config[key];
  if (!node || node.IsNull()) {
    return fallback;
  }
  try {
    return node.as<bool>();
  } catch (const YAML::Exception &) {
    throw std::runtime_error(key + ": expected a boolean, got '" +
                             node_to_string(node) + "'");
  }
}

std::vector<std::string> get_string_list(const YAML::Node &config,
                                         const std::string &key) {
  std::vector<std::string> out;
  const YAML::Node node = config[key];
  if (!node || node.IsNull()) {
    return out;
  }
  if (node.IsScalar()) {
    out.push_back(node.Scalar());
    return out;
  }
  if (!node.IsSequence()) {
    throw std::runtime_error(key + ": expected a string or a sequence");
  }
  for (const auto &item : node) {
    out.push_back(node_to_string(item));
  }
  return out;
}

std::string require_string(const YAML::Node &config, const std::string &key,
                           const std::string &what) {
  auto value = get_string(config, key);
  if (!value || value->empty()) {
    throw std::runtime_error(what + ": missing required field '" + key + "'");
  }
  return *value;
}

std::optional<std::string>
entity_value(const EntityState *entity,
             const std::optional<std::string> &attribute) {
  if (!entity) {
    return std::nullopt;
  }
  if (!attribute) {
    return entity->state;
  }
  auto it = entity->attributes.find(*attribute);
  if (it == entity->attributes.end() || !it->second.IsDefined() ||
      it->second.IsNull()) {
    return std::nullopt;
  }
  return node_to_string(it->second);
}

// -----------------------------
// Time helpers
// -----------------------------

static std::tm to_local_tm(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm out{};
#ifdef _WIN32
  localtime_s(&out, &t);
#else
  localtime_r(&t, &out);
#endif
  return out;
}

std::string format_time(TimePoint tp) {
  const std::tm tm = to_local_tm(tp);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return os.str();
}

int seconds_of_day(TimePoint tp) {
  const std::tm tm = to_local_tm(tp);
  return tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
}

std::string weekday_name(TimePoint tp) {
  static const char *kNames[] = {"sunday",   "monday", "tuesday", "wednesday",
                                 "thursday", "friday", "saturday"};
  const std::tm tm = to_local_tm(tp);
  return kNames[tm.tm_wday];
}

TimePoint start_of_day(TimePoint tp) {
  std::tm tm = to_local_tm(tp);
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  return Clock::from_time_t(std::mktime(&tm));
}

std::optional<int> parse_time_of_day(const std::string &text) {
  static const std::regex pattern(R"(^\s*(\d{1,2}):(\d{2})(?::(\d{2}))?\s*$)");
  std::smatch match;
  if (!std::regex_match(text, match, pattern)) {
    return std::nullopt;
  }
  const int h = std::stoi(match[1]);
  const int m = std::stoi(match[2]);
  const int s = match[3].matched ? std::stoi(match[3]) : 0;
  if (h > 23 || m > 59 || s > 59) {
    return std::nullopt;
  }
  return h * 3600 + m * 60 + s;
}

namespace {

double checked_duration(double seconds, const std::string &text) {
  if (!std::isfinite(seconds) || seconds > kMaxDurationSeconds) {
    throw std::invalid_argument("duration out of range: '" + text + "'");
  }
  return seconds;
}

} // namespace

double parse_duration(const std::string &text) {
  const std::string input = lower(trim(text));
  if (input.empty()) {
    throw std::invalid_argument("empty duration");
  }

  // Plain number of seconds
  std::optional<double> plain;
  try {
    std::size_t consumed = 0;
    const double seconds = std::stod(input, &consumed);
    if (consumed == input.size()) {
      plain = seconds;
    }
  } catch (const std::logic_error &) {
    // not a bare number
  }
  if (plain) {
    if (*plain < 0.0) {
      throw std::invalid_argument("negative duration: '" + text + "'");
    }
    return checked_duration(*plain, text);
  }

  // Clock form
  static const std::regex clock(R"(^(\d+):(\d{1,2})(?::(\d{1,2}))?$)");
  std::smatch match;
  if (std::regex_match(input, match, clock)) {
    const double h = std::stod(match[1]);
    const double m = std::stod(match[2]);
    const double s = match[3].matched ? std::stod(match[3]) : 0.0;
    return checked_duration(h * 3600.0 + m * 60.0 + s, text);
  }

  // Unit form: every token must be "<number> <unit>"
  static const std::regex unit(
      R"(\s*(\d+(?:\.\d+)?)\s*(hours|hour|hrs|hr|h|minutes|minute|mins|min|m|seconds|second|secs|sec|s)\s*)");
  double total = 0.0;
  bool any = false;
  auto begin = input.cbegin();
  while (begin != input.cend()) {
    if (!std::regex_search(begin, input.cend(), match, unit,
                           std::regex_constants::match_continuous)) {
      throw std::invalid_argument("invalid duration: '" + text + "'");
    }
    const double amount = std::stod(match[1]);
    const char u = match[2].str()[0];
    if (u == 'h') {
      total += amount * 3600.0;
    } else if (u == 'm') {
      total += amount * 60.0;
    } else {
      total += amount;
    }
    any = true;
    begin = match[0].second;
  }
  if (!any) {
    throw std::invalid_argument("invalid duration: '" + text + "'");
  }
  return checked_duration(total, text);
}

std::optional<double> get_duration(const YAML::Node &config,
                                   const std::string &key) {
  const YAML::Node node = config[key];
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  if (node.IsMap()) {
    double total = 0.0;
    for (const auto &kv : node) {
      const std::string unit = kv.first.as<std::string>();
      auto amount = node_to_double(kv.second);
      if (!amount) {
        throw std::runtime_error(key + "." + unit + ": expected a number");
      }
      if (unit == "hours") {
        total += *amount * 3600.0;
      } else if (unit == "minutes") {
        total += *amount * 60.0;
      } else if (unit == "seconds") {
        total += *amount;
      } else if (unit == "milliseconds") {
        total += *amount / 1000.0;
      } else {
        throw std::runtime_error(key + ": unknown duration unit '" + unit +
                                 "'");
      }
    }
    if (!std::isfinite(total) || total < 0.0 || total > kMaxDurationSeconds) {
      throw std::runtime_error(key + ": duration out of range");
    }
    return total;
  }
  if (!node.IsScalar()) {
    throw std::runtime_error(key + ": expected a duration");
  }
  try {
    return parse_duration(node.Scalar());
  } catch (const std::invalid_argument &e) {
    throw std::runtime_error(key + ": " + e.what());
  }
}

} // namespace auto_core
