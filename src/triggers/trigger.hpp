#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "core/context.hpp"

namespace auto_triggers {

using auto_core::Context;
using auto_core::TimePoint;

enum class TriggerType { State, Time, Event, NumericState, Template, Sun, Mqtt };

// Platform name as used in configuration ("state", "numeric_state", ...)
const char *trigger_type_name(TriggerType type);

// Throws std::runtime_error listing the valid platforms
TriggerType parse_trigger_type(const std::string &name);

struct TriggerConfig {
  std::string trigger_id;
  TriggerType type = TriggerType::State;
  bool enabled = true;
  std::optional<double> cooldown;     // seconds
  std::optional<double> for_duration; // seconds
  std::map<std::string, YAML::Node> variables;
};

// Record handed to subscribers when a trigger fires
struct TriggerData {
  std::string trigger_id;
  TriggerType trigger_type = TriggerType::State;
  TimePoint timestamp;
  int64_t trigger_count = 0;
  // Variant-specific details (entity_id, from_state, to_state, ...) plus the
  // configured trigger variables; exposed to runs as the `trigger` variable
  YAML::Node details;
  Context context;

  YAML::Node to_yaml() const;
};

using TriggerCallback = std::function<void(const TriggerData &)>;

/**
 * @brief Base of every trigger platform.
 *
 * check() is the variant predicate and may keep internal timers (for
 * `for_duration` gates and intervals). fire() wraps it with the common
 * gating: a disabled trigger never fires, a trigger inside its cooldown
 * window never fires. Successful fires update the statistics and notify the
 * subscribers; a throwing subscriber is logged and skipped.
 *
 * fire()/check() are driven from a single scheduler thread. Statistics and
 * subscriptions may be read or changed from other threads.
 */
class Trigger {
public:
  explicit Trigger(TriggerConfig config);
  virtual ~Trigger() = default;

  Trigger(const Trigger &) = delete;
  Trigger &operator=(const Trigger &) = delete;

  virtual bool check(const Context &ctx) = 0;

  bool fire(const Context &ctx);

  // Returns a subscription id for remove_callback()
  int add_callback(TriggerCallback callback);
  bool remove_callback(int subscription_id);

  // Configuration map accepted by create_trigger()
  YAML::Node to_yaml() const;

  const TriggerConfig &config() const { return config_; }
  const std::string &id() const { return config_.trigger_id; }
  TriggerType type() const { return config_.type; }

  bool enabled() const;
  void set_enabled(bool enabled);

  std::optional<TimePoint> last_triggered() const;
  int64_t trigger_count() const;

protected:
  // Variant fields for to_yaml()
  virtual void describe(YAML::Node &out) const = 0;

  // Variant details for TriggerData::details
  virtual void annotate(const Context &ctx, YAML::Node &details) const;

  // Effective persistence requirement in seconds (0 when none)
  double required_duration() const;

private:
  TriggerConfig config_;

  mutable std::mutex mutex_;
  std::optional<TimePoint> last_triggered_;
  int64_t trigger_count_ = 0;
  int next_subscription_ = 1;
  std::vector<std::pair<int, TriggerCallback>> callbacks_;
};

/**
 * @brief Persistence gate for `for_duration`.
 *
 * The first active observation starts the timer and does not pass. Once the
 * condition has stayed active for the full duration the gate passes and
 * rearms. Any inactive observation resets the timer.
 */
class DurationGate {
public:
  bool pass(bool active, TimePoint now, double duration);
  void reset() { since_.reset(); }
  bool pending() const { return since_.has_value(); }

private:
  std::optional<TimePoint> since_;
};

} // namespace auto_triggers
