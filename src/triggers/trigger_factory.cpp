#include "triggers/trigger_factory.hpp"

#include <stdexcept>

#include "core/value_utils.hpp"
#include "triggers/event_trigger.hpp"
#include "triggers/state_trigger.hpp"
#include "triggers/time_trigger.hpp"

namespace auto_triggers {

using auto_core::get_bool;
using auto_core::get_double;
using auto_core::get_string;
using auto_core::require_string;

std::unique_ptr<Trigger> create_trigger(const YAML::Node &config,
                                        const std::string &default_id) {
  if (!config.IsDefined() || !config.IsMap()) {
    throw std::runtime_error("trigger '" + default_id +
                             "': expected a mapping");
  }

  TriggerConfig base;
  base.trigger_id = get_string(config, "id").value_or(default_id);
  base.type = parse_trigger_type(get_string(config, "platform").value_or("state"));
  base.enabled = get_bool(config, "enabled", true);
  base.cooldown = auto_core::get_duration(config, "cooldown");
  base.for_duration = auto_core::get_duration(config, "for");
  base.variables = auto_core::node_to_map(config["variables"]);

  const std::string what = "trigger '" + base.trigger_id + "'";

  switch (base.type) {
  case TriggerType::State:
    return std::make_unique<StateTrigger>(
        base, require_string(config, "entity_id", what),
        get_string(config, "from"), get_string(config, "to"),
        get_string(config, "attribute"));

  case TriggerType::NumericState: {
    auto above = get_double(config, "above");
    auto below = get_double(config, "below");
    if (!above && !below) {
      throw std::runtime_error(what + ": numeric_state needs 'above' or "
                                      "'below'");
    }
    return std::make_unique<NumericStateTrigger>(
        base, require_string(config, "entity_id", what), above, below,
        get_string(config, "attribute"));
  }

  case TriggerType::Time: {
    auto at = get_string(config, "at");
    auto after = get_string(config, "after");
    auto before = get_string(config, "before");
    auto interval = get_string(config, "interval");
    if (!at && !after && !before && !interval) {
      throw std::runtime_error(
          what + ": time needs one of 'at', 'after', 'before', 'interval'");
    }
    return std::make_unique<TimeTrigger>(base, at, after, before,
                                         auto_core::get_string_list(config,
                                                                    "weekday"),
                                         interval);
  }

  case TriggerType::Event:
    return std::make_unique<EventTrigger>(
        base, require_string(config, "event_type", what), config["event_data"]);

  case TriggerType::Template:
    return std::make_unique<TemplateTrigger>(
        base, require_string(config, "value_template", what));

  case TriggerType::Sun:
    return std::make_unique<SunTrigger>(
        base, require_string(config, "event", what),
        get_double(config, "offset").value_or(0.0));

  case TriggerType::Mqtt:
    return std::make_unique<MqttTrigger>(
        base, require_string(config, "topic", what),
        get_string(config, "payload"),
        get_string(config, "encoding").value_or("utf-8"));
  }
  throw std::runtime_error(what + ": unsupported platform");
}

} // namespace auto_triggers
