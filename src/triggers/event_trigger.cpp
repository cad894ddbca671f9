#include "triggers/event_trigger.hpp"

#include <iostream>

#include "core/template_renderer.hpp"
#include "core/value_utils.hpp"

namespace auto_triggers {

// -----------------------------
// EventTrigger
// -----------------------------

EventTrigger::EventTrigger(TriggerConfig config, std::string event_type,
                           YAML::Node event_data)
    : Trigger(std::move(config)), event_type_(std::move(event_type)),
      event_data_(auto_core::clone_node(event_data)) {}

bool EventTrigger::check(const Context &ctx) {
  if (!ctx.state || !ctx.state->event) {
    return false;
  }
  const auto &event = *ctx.state->event;
  if (event.event_type != event_type_) {
    return false;
  }
  if (!event_data_.IsDefined() || !event_data_.IsMap()) {
    return true;
  }
  for (const auto &kv : event_data_) {
    const std::string key = kv.first.as<std::string>();
    if (!event.data.IsDefined() || !event.data.IsMap() || !event.data[key] ||
        !auto_core::nodes_equal(kv.second, event.data[key])) {
      return false;
    }
  }
  return true;
}

void EventTrigger::describe(YAML::Node &out) const {
  out["event_type"] = event_type_;
  if (event_data_.IsDefined() && event_data_.IsMap() &&
      event_data_.size() > 0) {
    out["event_data"] = auto_core::clone_node(event_data_);
  }
}

void EventTrigger::annotate(const Context &ctx, YAML::Node &details) const {
  details["event_type"] = event_type_;
  if (ctx.state && ctx.state->event && ctx.state->event->data.IsDefined()) {
    details["event_data"] = auto_core::clone_node(ctx.state->event->data);
  }
}

// -----------------------------
// MqttTrigger
// -----------------------------

MqttTrigger::MqttTrigger(TriggerConfig config, std::string topic,
                         std::optional<std::string> payload,
                         std::string encoding)
    : Trigger(std::move(config)), topic_(std::move(topic)),
      payload_(std::move(payload)), encoding_(std::move(encoding)) {}

bool MqttTrigger::check(const Context &ctx) {
  if (!ctx.state || !ctx.state->mqtt_message) {
    return false;
  }
  const auto &message = *ctx.state->mqtt_message;
  if (message.topic != topic_) {
    return false;
  }
  return !payload_ || message.payload == *payload_;
}

void MqttTrigger::describe(YAML::Node &out) const {
  out["topic"] = topic_;
  if (payload_) {
    out["payload"] = *payload_;
  }
  out["encoding"] = encoding_;
}

void MqttTrigger::annotate(const Context &ctx, YAML::Node &details) const {
  details["topic"] = topic_;
  if (ctx.state && ctx.state->mqtt_message) {
    details["payload"] = ctx.state->mqtt_message->payload;
  }
}

// -----------------------------
// TemplateTrigger
// -----------------------------

TemplateTrigger::TemplateTrigger(TriggerConfig config,
                                 std::string value_template)
    : Trigger(std::move(config)), value_template_(std::move(value_template)) {}

bool TemplateTrigger::check(const Context &ctx) {
  bool truthy = false;
  try {
    truthy = auto_core::is_truthy_text(ctx.render(value_template_));
  } catch (const auto_core::TemplateError &e) {
    std::cerr << "[Trigger] WARNING: template of '" << id()
              << "' failed: " << e.what() << std::endl;
  }
  return gate_.pass(truthy, ctx.now(), required_duration());
}

void TemplateTrigger::describe(YAML::Node &out) const {
  out["value_template"] = value_template_;
}

} // namespace auto_triggers
