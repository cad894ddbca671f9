#include "conditions/condition.hpp"

#include <stdexcept>

#include "core/value_utils.hpp"

namespace auto_conditions {

const char *condition_type_name(ConditionType type) {
  switch (type) {
  case ConditionType::State:
    return "state";
  case ConditionType::NumericState:
    return "numeric_state";
  case ConditionType::Time:
    return "time";
  case ConditionType::Template:
    return "template";
  case ConditionType::Device:
    return "device";
  case ConditionType::Zone:
    return "zone";
  case ConditionType::Sun:
    return "sun";
  case ConditionType::And:
    return "and";
  case ConditionType::Or:
    return "or";
  case ConditionType::Not:
    return "not";
  }
  return "state";
}

ConditionType parse_condition_type(const std::string &name) {
  static const ConditionType kAll[] = {
      ConditionType::State,  ConditionType::NumericState, ConditionType::Time,
      ConditionType::Template, ConditionType::Device,     ConditionType::Zone,
      ConditionType::Sun,    ConditionType::And,          ConditionType::Or,
      ConditionType::Not};
  for (ConditionType type : kAll) {
    if (name == condition_type_name(type)) {
      return type;
    }
  }
  throw std::runtime_error("Invalid condition: '" + name +
                           "'. Valid values: state, numeric_state, time, "
                           "template, device, zone, sun, and, or, not");
}

bool Condition::evaluate(const Context &ctx) const {
  if (!config_.enabled) {
    return true;
  }
  return test(ctx);
}

YAML::Node Condition::to_yaml() const {
  YAML::Node out;
  out["condition"] = condition_type_name(config_.type);
  out["id"] = config_.condition_id;
  out["enabled"] = config_.enabled;
  if (!config_.variables.empty()) {
    out["variables"] = auto_core::map_to_node(config_.variables);
  }
  describe(out);
  return out;
}

bool all_of(const std::vector<ConditionPtr> &conditions, const Context &ctx) {
  for (const auto &condition : conditions) {
    if (!condition->evaluate(ctx)) {
      return false;
    }
  }
  return true;
}

static void describe_children(const std::vector<ConditionPtr> &conditions,
                              YAML::Node &out) {
  YAML::Node list(YAML::NodeType::Sequence);
  for (const auto &condition : conditions) {
    list.push_back(condition->to_yaml());
  }
  out["conditions"] = list;
}

// ---- And ----

AndCondition::AndCondition(ConditionConfig config,
                           std::vector<ConditionPtr> conditions)
    : Condition(std::move(config)), conditions_(std::move(conditions)) {}

bool AndCondition::test(const Context &ctx) const {
  return all_of(conditions_, ctx);
}

void AndCondition::describe(YAML::Node &out) const {
  describe_children(conditions_, out);
}

// ---- Or ----

OrCondition::OrCondition(ConditionConfig config,
                         std::vector<ConditionPtr> conditions)
    : Condition(std::move(config)), conditions_(std::move(conditions)) {}

bool OrCondition::test(const Context &ctx) const {
  for (const auto &condition : conditions_) {
    if (condition->evaluate(ctx)) {
      return true;
    }
  }
  return false;
}

void OrCondition::describe(YAML::Node &out) const {
  describe_children(conditions_, out);
}

// ---- Not ----

NotCondition::NotCondition(ConditionConfig config, ConditionPtr condition)
    : Condition(std::move(config)), condition_(std::move(condition)) {
  if (!condition_) {
    throw std::invalid_argument("not: missing inner condition");
  }
}

bool NotCondition::test(const Context &ctx) const {
  return !condition_->evaluate(ctx);
}

void NotCondition::describe(YAML::Node &out) const {
  out["conditions"].push_back(condition_->to_yaml());
}

} // namespace auto_conditions
