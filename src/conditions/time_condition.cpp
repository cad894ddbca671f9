#include "conditions/time_condition.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "core/template_renderer.hpp"
#include "core/value_utils.hpp"

namespace auto_conditions {

static std::optional<int> parse_bound(const std::optional<std::string> &text,
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

// -----------------------------
// TimeCondition
// -----------------------------

TimeCondition::TimeCondition(ConditionConfig config,
                             std::optional<std::string> after,
                             std::optional<std::string> before,
                             std::vector<std::string> weekdays)
    : Condition(std::move(config)), after_(std::move(after)),
      before_(std::move(before)), weekdays_(std::move(weekdays)) {
  after_seconds_ = parse_bound(after_, "after");
  before_seconds_ = parse_bound(before_, "before");
  for (auto &day : weekdays_) {
    day = auto_core::lower(day);
  }
}

bool TimeCondition::test(const Context &ctx) const {
  const auto now = ctx.now();
  if (!weekdays_.empty() &&
      std::find(weekdays_.begin(), weekdays_.end(),
                auto_core::weekday_name(now)) == weekdays_.end()) {
    return false;
  }
  const int current = auto_core::seconds_of_day(now);
  if (after_seconds_ && before_seconds_ && *after_seconds_ > *before_seconds_) {
    return current >= *after_seconds_ || current <= *before_seconds_;
  }
  if (after_seconds_ && current < *after_seconds_) {
    return false;
  }
  return !(before_seconds_ && current > *before_seconds_);
}

void TimeCondition::describe(YAML::Node &out) const {
  if (after_) {
    out["after"] = *after_;
  }
  if (before_) {
    out["before"] = *before_;
  }
  for (const auto &day : weekdays_) {
    out["weekday"].push_back(day);
  }
}

// -----------------------------
// SunCondition
// -----------------------------

SunCondition::SunCondition(ConditionConfig config,
                           std::optional<std::string> before,
                           std::optional<std::string> after,
                           double before_offset, double after_offset)
    : Condition(std::move(config)), before_(std::move(before)),
      after_(std::move(after)), before_offset_(before_offset),
      after_offset_(after_offset) {
  for (const auto *event : {&before_, &after_}) {
    if (*event && **event != "sunrise" && **event != "sunset") {
      throw std::runtime_error("sun: expected 'sunrise' or 'sunset', got '" +
                               **event + "'");
    }
  }
}

bool SunCondition::test(const Context &ctx) const {
  if (!ctx.state) {
    return false;
  }
  const auto &events = ctx.state->sun_events;
  const auto now = ctx.now();
  if (before_) {
    auto it = events.find(*before_);
    if (it != events.end() &&
        now > it->second + auto_core::to_duration(before_offset_)) {
      return false;
    }
  }
  if (after_) {
    auto it = events.find(*after_);
    if (it != events.end() &&
        now < it->second + auto_core::to_duration(after_offset_)) {
      return false;
    }
  }
  return true;
}

void SunCondition::describe(YAML::Node &out) const {
  if (before_) {
    out["before"] = *before_;
    out["before_offset"] = before_offset_;
  }
  if (after_) {
    out["after"] = *after_;
    out["after_offset"] = after_offset_;
  }
}

// -----------------------------
// TemplateCondition
// -----------------------------

TemplateCondition::TemplateCondition(ConditionConfig config,
                                     std::string value_template)
    : Condition(std::move(config)), value_template_(std::move(value_template)) {
}

bool TemplateCondition::test(const Context &ctx) const {
  try {
    return auto_core::is_truthy_text(ctx.render(value_template_));
  } catch (const auto_core::TemplateError &e) {
    std::cerr << "[Condition] WARNING: template of '" << id()
              << "' failed: " << e.what() << std::endl;
    return false;
  }
}

void TemplateCondition::describe(YAML::Node &out) const {
  out["value_template"] = value_template_;
}

} // namespace auto_conditions
