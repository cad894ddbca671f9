#include "triggers/state_trigger.hpp"

#include <stdexcept>

#include "core/value_utils.hpp"

namespace auto_triggers {

using auto_core::entity_value;

// -----------------------------
// StateTrigger
// -----------------------------

StateTrigger::StateTrigger(TriggerConfig config, std::string entity_id,
                           std::optional<std::string> from_state,
                           std::optional<std::string> to_state,
                           std::optional<std::string> attribute)
    : Trigger(std::move(config)), entity_id_(std::move(entity_id)),
      from_state_(std::move(from_state)), to_state_(std::move(to_state)),
      attribute_(std::move(attribute)) {}

bool StateTrigger::transition_matches(
    const std::optional<std::string> &old_value,
    const std::optional<std::string> &new_value) const {
  if (old_value == new_value) {
    return false;
  }
  if (from_state_ && old_value != from_state_) {
    return false;
  }
  if (to_state_ && new_value != to_state_) {
    return false;
  }
  return true;
}

bool StateTrigger::check(const Context &ctx) {
  const auto new_value = entity_value(ctx.entity(entity_id_), attribute_);
  if (!new_value) {
    pending_value_.reset();
    pending_since_.reset();
    return false;
  }
  const auto old_value = entity_value(ctx.old_entity(entity_id_), attribute_);

  const double duration = required_duration();
  if (duration <= 0.0) {
    return transition_matches(old_value, new_value);
  }

  if (pending_value_) {
    if (*new_value == *pending_value_) {
      if (auto_core::seconds_between(*pending_since_, ctx.now()) < duration) {
        return false;
      }
      pending_value_.reset();
      pending_since_.reset();
      return true;
    }
    // Value moved away before the duration elapsed
    pending_value_.reset();
    pending_since_.reset();
  }

  if (transition_matches(old_value, new_value)) {
    pending_value_ = new_value;
    pending_since_ = ctx.now();
  }
  return false;
}

void StateTrigger::describe(YAML::Node &out) const {
  out["entity_id"] = entity_id_;
  if (from_state_) {
    out["from"] = *from_state_;
  }
  if (to_state_) {
    out["to"] = *to_state_;
  }
  if (attribute_) {
    out["attribute"] = *attribute_;
  }
}

void StateTrigger::annotate(const Context &ctx, YAML::Node &details) const {
  details["entity_id"] = entity_id_;
  const auto *old_entity = ctx.old_entity(entity_id_);
  const auto *new_entity = ctx.entity(entity_id_);
  if (old_entity) {
    details["from_state"] = old_entity->state;
  }
  if (new_entity) {
    details["to_state"] = new_entity->state;
  }
  if (attribute_) {
    details["attribute"] = *attribute_;
  }
}

// -----------------------------
// NumericStateTrigger
// -----------------------------

NumericStateTrigger::NumericStateTrigger(TriggerConfig config,
                                         std::string entity_id,
                                         std::optional<double> above,
                                         std::optional<double> below,
                                         std::optional<std::string> attribute)
    : Trigger(std::move(config)), entity_id_(std::move(entity_id)),
      above_(above), below_(below), attribute_(std::move(attribute)) {}

bool NumericStateTrigger::check(const Context &ctx) {
  bool in_range = false;
  const auto text = entity_value(ctx.entity(entity_id_), attribute_);
  if (text) {
    try {
      std::size_t consumed = 0;
      const double value = std::stod(*text, &consumed);
      in_range = consumed == text->size() && (!above_ || value > *above_) &&
                 (!below_ || value < *below_);
    } catch (const std::logic_error &) {
      in_range = false;
    }
  }
  if (!in_range) {
    armed_ = true;
    gate_.reset();
    return false;
  }
  if (!armed_ || !gate_.pass(true, ctx.now(), required_duration())) {
    return false;
  }
  armed_ = false;
  return true;
}

void NumericStateTrigger::describe(YAML::Node &out) const {
  out["entity_id"] = entity_id_;
  if (above_) {
    out["above"] = *above_;
  }
  if (below_) {
    out["below"] = *below_;
  }
  if (attribute_) {
    out["attribute"] = *attribute_;
  }
}

void NumericStateTrigger::annotate(const Context &ctx,
                                   YAML::Node &details) const {
  details["entity_id"] = entity_id_;
  if (auto value = entity_value(ctx.entity(entity_id_), attribute_)) {
    details["value"] = *value;
  }
  if (above_) {
    details["above"] = *above_;
  }
  if (below_) {
    details["below"] = *below_;
  }
}

} // namespace auto_triggers
