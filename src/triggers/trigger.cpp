#include "triggers/trigger.hpp"

#include <iostream>
#include <stdexcept>

#include "core/value_utils.hpp"

namespace auto_triggers {

const char *trigger_type_name(TriggerType type) {
  switch (type) {
  case TriggerType::State:
    return "state";
  case TriggerType::Time:
    return "time";
  case TriggerType::Event:
    return "event";
  case TriggerType::NumericState:
    return "numeric_state";
  case TriggerType::Template:
    return "template";
  case TriggerType::Sun:
    return "sun";
  case TriggerType::Mqtt:
    return "mqtt";
  }
  return "state";
}

TriggerType parse_trigger_type(const std::string &name) {
  static const TriggerType kAll[] = {
      TriggerType::State,    TriggerType::Time, TriggerType::Event,
      TriggerType::NumericState, TriggerType::Template, TriggerType::Sun,
      TriggerType::Mqtt};
  for (TriggerType type : kAll) {
    if (name == trigger_type_name(type)) {
      return type;
    }
  }
  throw std::runtime_error(
      "Invalid trigger platform: '" + name +
      "'. Valid values: state, time, event, numeric_state, template, sun, "
      "mqtt");
}

YAML::Node TriggerData::to_yaml() const {
  YAML::Node out;
  out["trigger_id"] = trigger_id;
  out["trigger_type"] = trigger_type_name(trigger_type);
  out["timestamp"] = auto_core::format_time(timestamp);
  out["trigger_count"] = trigger_count;
  out["details"] = details;
  return out;
}

Trigger::Trigger(TriggerConfig config) : config_(std::move(config)) {}

bool Trigger::enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.enabled;
}

void Trigger::set_enabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.enabled = enabled;
}

std::optional<TimePoint> Trigger::last_triggered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_triggered_;
}

int64_t Trigger::trigger_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trigger_count_;
}

int Trigger::add_callback(TriggerCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int id = next_subscription_++;
  callbacks_.emplace_back(id, std::move(callback));
  return id;
}

bool Trigger::remove_callback(int subscription_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
    if (it->first == subscription_id) {
      callbacks_.erase(it);
      return true;
    }
  }
  return false;
}

double Trigger::required_duration() const {
  return config_.for_duration && *config_.for_duration > 0.0
             ? *config_.for_duration
             : 0.0;
}

void Trigger::annotate(const Context &, YAML::Node &) const {}

bool Trigger::fire(const Context &ctx) {
  const TimePoint now = ctx.now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.enabled) {
      return false;
    }
    if (config_.cooldown && last_triggered_ &&
        auto_core::seconds_between(*last_triggered_, now) < *config_.cooldown) {
      return false;
    }
  }

  if (!check(ctx)) {
    return false;
  }

  TriggerData data;
  std::vector<std::pair<int, TriggerCallback>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_triggered_ = now;
    ++trigger_count_;
    data.trigger_count = trigger_count_;
    callbacks = callbacks_;
  }

  data.trigger_id = config_.trigger_id;
  data.trigger_type = config_.type;
  data.timestamp = now;
  data.context = ctx;
  data.details = YAML::Node(YAML::NodeType::Map);
  data.details["id"] = config_.trigger_id;
  data.details["platform"] = trigger_type_name(config_.type);
  for (const auto &[key, value] : config_.variables) {
    data.details[key] = auto_core::clone_node(value);
  }
  annotate(ctx, data.details);

  for (const auto &[id, callback] : callbacks) {
    try {
      callback(data);
    } catch (const std::exception &e) {
      std::cerr << "[Trigger] WARNING: callback " << id << " of '"
                << config_.trigger_id << "' failed: " << e.what()
                << std::endl;
    }
  }
  return true;
}

YAML::Node Trigger::to_yaml() const {
  YAML::Node out;
  out["platform"] = trigger_type_name(config_.type);
  out["id"] = config_.trigger_id;
  out["enabled"] = enabled();
  if (config_.cooldown) {
    out["cooldown"] = *config_.cooldown;
  }
  if (config_.for_duration) {
    out["for"] = *config_.for_duration;
  }
  if (!config_.variables.empty()) {
    out["variables"] = auto_core::map_to_node(config_.variables);
  }
  describe(out);
  return out;
}

bool DurationGate::pass(bool active, TimePoint now, double duration) {
  if (!active) {
    since_.reset();
    return false;
  }
  if (duration <= 0.0) {
    return true;
  }
  if (!since_) {
    since_ = now;
    return false;
  }
  if (auto_core::seconds_between(*since_, now) < duration) {
    return false;
  }
  since_.reset();
  return true;
}

} // namespace auto_triggers
