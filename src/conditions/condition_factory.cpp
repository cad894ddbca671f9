#include "conditions/condition_factory.hpp"

#include <stdexcept>

#include "conditions/state_condition.hpp"
#include "conditions/time_condition.hpp"
#include "core/value_utils.hpp"

namespace auto_conditions {

using auto_core::get_double;
using auto_core::get_string;
using auto_core::require_string;

static std::vector<ConditionPtr> create_children(const YAML::Node &config,
                                                 const std::string &parent_id) {
  const YAML::Node list = config["conditions"];
  if (!list || !list.IsSequence()) {
    throw std::runtime_error("condition '" + parent_id +
                             "': 'conditions' must be a sequence");
  }
  std::vector<ConditionPtr> children;
  for (std::size_t i = 0; i < list.size(); ++i) {
    children.push_back(
        create_condition(list[i], parent_id + "_" + std::to_string(i)));
  }
  return children;
}

ConditionPtr create_condition(const YAML::Node &config,
                              const std::string &default_id) {
  if (!config.IsDefined() || !config.IsMap()) {
    throw std::runtime_error("condition '" + default_id +
                             "': expected a mapping");
  }

  ConditionConfig base;
  base.condition_id = get_string(config, "id").value_or(default_id);
  base.type =
      parse_condition_type(get_string(config, "condition").value_or("state"));
  base.enabled = auto_core::get_bool(config, "enabled", true);
  base.variables = auto_core::node_to_map(config["variables"]);

  const std::string what = "condition '" + base.condition_id + "'";

  switch (base.type) {
  case ConditionType::And:
    return std::make_unique<AndCondition>(
        base, create_children(config, base.condition_id));

  case ConditionType::Or:
    return std::make_unique<OrCondition>(
        base, create_children(config, base.condition_id));

  case ConditionType::Not: {
    auto children = create_children(config, base.condition_id);
    if (children.size() != 1) {
      throw std::runtime_error(what + ": 'not' takes exactly one condition");
    }
    return std::make_unique<NotCondition>(base, std::move(children.front()));
  }

  case ConditionType::State:
    return std::make_unique<StateCondition>(
        base, require_string(config, "entity_id", what),
        get_string(config, "state"), get_string(config, "state_not"),
        get_string(config, "attribute"),
        auto_core::get_bool(config, "match", false));

  case ConditionType::NumericState: {
    auto above = get_double(config, "above");
    auto below = get_double(config, "below");
    if (!above && !below) {
      throw std::runtime_error(what +
                               ": numeric_state needs 'above' or 'below'");
    }
    return std::make_unique<NumericStateCondition>(
        base, require_string(config, "entity_id", what), above, below,
        get_string(config, "attribute"));
  }

  case ConditionType::Time:
    return std::make_unique<TimeCondition>(
        base, get_string(config, "after"), get_string(config, "before"),
        auto_core::get_string_list(config, "weekday"));

  case ConditionType::Template:
    return std::make_unique<TemplateCondition>(
        base, require_string(config, "value_template", what));

  case ConditionType::Device:
    return std::make_unique<DeviceCondition>(
        base, require_string(config, "device_id", what),
        get_string(config, "entity_id"), get_string(config, "domain"),
        get_string(config, "type"), get_string(config, "state"));

  case ConditionType::Zone:
    return std::make_unique<ZoneCondition>(
        base, require_string(config, "entity_id", what),
        require_string(config, "zone", what));

  case ConditionType::Sun: {
    auto before = get_string(config, "before");
    auto after = get_string(config, "after");
    if (!before && !after) {
      throw std::runtime_error(what + ": sun needs 'before' or 'after'");
    }
    return std::make_unique<SunCondition>(
        base, before, after, get_double(config, "before_offset").value_or(0.0),
        get_double(config, "after_offset").value_or(0.0));
  }
  }
  throw std::runtime_error(what + ": unsupported condition");
}

} // namespace auto_conditions
