#pragma once

#include <optional>
#include <string>

#include "triggers/trigger.hpp"

namespace auto_triggers {

// Matches the snapshot's event by type and an exact sub-map of its data
class EventTrigger : public Trigger {
public:
  EventTrigger(TriggerConfig config, std::string event_type,
               YAML::Node event_data);

  bool check(const Context &ctx) override;

protected:
  void describe(YAML::Node &out) const override;
  void annotate(const Context &ctx, YAML::Node &details) const override;

private:
  std::string event_type_;
  YAML::Node event_data_; // map or null
};

// Matches the snapshot's bus message by exact topic and optional payload
class MqttTrigger : public Trigger {
public:
  MqttTrigger(TriggerConfig config, std::string topic,
              std::optional<std::string> payload, std::string encoding);

  bool check(const Context &ctx) override;

protected:
  void describe(YAML::Node &out) const override;
  void annotate(const Context &ctx, YAML::Node &details) const override;

private:
  std::string topic_;
  std::optional<std::string> payload_;
  std::string encoding_;
};

/**
 * @brief Fires when a rendered template is truthy.
 *
 * Rendering errors count as false and are logged. With `for_duration` the
 * template must stay truthy that long; a false render resets the timer.
 */
class TemplateTrigger : public Trigger {
public:
  TemplateTrigger(TriggerConfig config, std::string value_template);

  bool check(const Context &ctx) override;

protected:
  void describe(YAML::Node &out) const override;

private:
  std::string value_template_;
  DurationGate gate_;
};

} // namespace auto_triggers
