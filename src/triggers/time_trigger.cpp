#include "triggers/time_trigger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include "core/value_utils.hpp"

namespace auto_triggers {

using auto_core::seconds_between;

namespace {

// A one-second match window is hit by up to two ticks; only the first counts
constexpr double kMatchWindow = 1.0;

std::optional<int> parse_clock_field(const std::optional<std::string> &text,
                                     const char *field) {
  if (!text) {
    return std::nullopt;
  }
  auto seconds = auto_core::parse_time_of_day(*text);
  if (!seconds) {
    throw std::runtime_error(std::string(field) + ": invalid time '" + *text +
                             "' (expected HH:MM or HH:MM:SS)");
  }
  return seconds;
}

} // namespace

// -----------------------------
// TimeTrigger
// -----------------------------

TimeTrigger::TimeTrigger(TriggerConfig config, std::optional<std::string> at,
                         std::optional<std::string> after,
                         std::optional<std::string> before,
                         std::vector<std::string> weekdays,
                         std::optional<std::string> interval)
    : Trigger(std::move(config)), at_(std::move(at)), after_(std::move(after)),
      before_(std::move(before)), weekdays_(std::move(weekdays)),
      interval_(std::move(interval)) {
  at_seconds_ = parse_clock_field(at_, "at");
  after_seconds_ = parse_clock_field(after_, "after");
  before_seconds_ = parse_clock_field(before_, "before");
  if (interval_) {
    try {
      interval_seconds_ = auto_core::parse_duration(*interval_);
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(std::string("interval: ") + e.what());
    }
    if (*interval_seconds_ <= 0.0) {
      throw std::runtime_error("interval: must be positive");
    }
  }
  for (auto &day : weekdays_) {
    day = auto_core::lower(day);
  }
}

bool TimeTrigger::at_matches(TimePoint now) {
  if (!at_seconds_) {
    return false;
  }
  const TimePoint target =
      auto_core::start_of_day(now) + std::chrono::seconds(*at_seconds_);
  if (std::fabs(seconds_between(target, now)) > kMatchWindow) {
    return false;
  }
  if (last_at_match_ &&
      std::fabs(seconds_between(*last_at_match_, now)) <= 2 * kMatchWindow) {
    return false;
  }
  last_at_match_ = now;
  return true;
}

bool TimeTrigger::window_matches(TimePoint now) const {
  if (!after_seconds_ && !before_seconds_) {
    return false;
  }
  const int current = auto_core::seconds_of_day(now);
  if (after_seconds_ && before_seconds_) {
    if (*after_seconds_ <= *before_seconds_) {
      return current >= *after_seconds_ && current <= *before_seconds_;
    }
    return current >= *after_seconds_ || current <= *before_seconds_;
  }
  if (after_seconds_) {
    return current >= *after_seconds_;
  }
  return current <= *before_seconds_;
}

bool TimeTrigger::interval_matches(TimePoint now) {
  if (!interval_seconds_) {
    return false;
  }
  if (last_interval_fire_ &&
      seconds_between(*last_interval_fire_, now) < *interval_seconds_) {
    return false;
  }
  last_interval_fire_ = now;
  return true;
}

bool TimeTrigger::check(const Context &ctx) {
  const TimePoint now = ctx.now();
  if (!weekdays_.empty() &&
      std::find(weekdays_.begin(), weekdays_.end(),
                auto_core::weekday_name(now)) == weekdays_.end()) {
    return false;
  }
  if (at_matches(now) || window_matches(now)) {
    return true;
  }
  return interval_matches(now);
}

void TimeTrigger::describe(YAML::Node &out) const {
  if (at_) {
    out["at"] = *at_;
  }
  if (after_) {
    out["after"] = *after_;
  }
  if (before_) {
    out["before"] = *before_;
  }
  if (!weekdays_.empty()) {
    for (const auto &day : weekdays_) {
      out["weekday"].push_back(day);
    }
  }
  if (interval_) {
    out["interval"] = *interval_;
  }
}

// -----------------------------
// SunTrigger
// -----------------------------

SunTrigger::SunTrigger(TriggerConfig config, std::string event, double offset)
    : Trigger(std::move(config)), event_(std::move(event)), offset_(offset) {
  if (event_ != "sunrise" && event_ != "sunset") {
    throw std::runtime_error("event: expected 'sunrise' or 'sunset', got '" +
                             event_ + "'");
  }
}

bool SunTrigger::check(const Context &ctx) {
  if (!ctx.state) {
    return false;
  }
  auto it = ctx.state->sun_events.find(event_);
  if (it == ctx.state->sun_events.end()) {
    return false;
  }
  const TimePoint now = ctx.now();
  const TimePoint target = it->second + auto_core::to_duration(offset_);
  if (std::fabs(seconds_between(target, now)) > kMatchWindow) {
    return false;
  }
  if (last_match_ &&
      std::fabs(seconds_between(*last_match_, now)) <= 2 * kMatchWindow) {
    return false;
  }
  last_match_ = now;
  return true;
}

void SunTrigger::describe(YAML::Node &out) const {
  out["event"] = event_;
  if (offset_ != 0.0) {
    out["offset"] = offset_;
  }
}

void SunTrigger::annotate(const Context &, YAML::Node &details) const {
  details["event"] = event_;
  details["offset"] = offset_;
}

} // namespace auto_triggers
