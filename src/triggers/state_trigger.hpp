#pragma once

#include <optional>
#include <string>

#include "triggers/trigger.hpp"

namespace auto_triggers {

/**
 * @brief Fires when an entity's state (or one attribute) changes.
 *
 * With `from`/`to` set, the old/new values must match them. With neither,
 * any change of the watched value fires. An entity missing from the previous
 * tick counts as a change.
 *
 * With `for_duration`, a matching transition only arms a pending fire; the
 * trigger fires once the new value has been held for the full duration and
 * drops the pending fire as soon as the value moves away.
 */
class StateTrigger : public Trigger {
public:
  StateTrigger(TriggerConfig config, std::string entity_id,
               std::optional<std::string> from_state,
               std::optional<std::string> to_state,
               std::optional<std::string> attribute);

  bool check(const Context &ctx) override;

  const std::string &entity_id() const { return entity_id_; }

protected:
  void describe(YAML::Node &out) const override;
  void annotate(const Context &ctx, YAML::Node &details) const override;

private:
  bool transition_matches(const std::optional<std::string> &old_value,
                          const std::optional<std::string> &new_value) const;

  std::string entity_id_;
  std::optional<std::string> from_state_;
  std::optional<std::string> to_state_;
  std::optional<std::string> attribute_;

  // Pending for_duration fire
  std::optional<std::string> pending_value_;
  std::optional<TimePoint> pending_since_;
};

// Fires when a numeric value enters the open range (above, below), once per
// entry. With `for_duration` the value must stay in range that long first.
class NumericStateTrigger : public Trigger {
public:
  NumericStateTrigger(TriggerConfig config, std::string entity_id,
                      std::optional<double> above, std::optional<double> below,
                      std::optional<std::string> attribute);

  bool check(const Context &ctx) override;

protected:
  void describe(YAML::Node &out) const override;
  void annotate(const Context &ctx, YAML::Node &details) const override;

private:
  std::string entity_id_;
  std::optional<double> above_;
  std::optional<double> below_;
  std::optional<std::string> attribute_;
  DurationGate gate_;
  bool armed_ = true; // cleared by a fire, set when the value leaves range
};

} // namespace auto_triggers
