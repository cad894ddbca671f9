#include "actions/action_factory.hpp"

#include <stdexcept>

#include "actions/flow_actions.hpp"
#include "actions/leaf_actions.hpp"
#include "conditions/condition_factory.hpp"
#include "core/value_utils.hpp"

namespace auto_actions {

using auto_core::get_string;
using auto_core::node_to_string;
using auto_core::require_string;

std::vector<ActionPtr> create_actions(const YAML::Node &list,
                                      const std::string &prefix) {
  std::vector<ActionPtr> actions;
  if (!list || list.IsNull()) {
    return actions;
  }
  if (!list.IsSequence()) {
    throw std::runtime_error(prefix + ": expected a sequence of actions");
  }
  for (std::size_t i = 0; i < list.size(); ++i) {
    actions.push_back(create_action(list[i], prefix + "_" + std::to_string(i)));
  }
  return actions;
}

static std::vector<Choice> create_choices(const YAML::Node &list,
                                          const std::string &parent_id) {
  std::vector<Choice> choices;
  if (!list || list.IsNull()) {
    return choices;
  }
  if (!list.IsSequence()) {
    throw std::runtime_error("action '" + parent_id +
                             "': 'choices' must be a sequence");
  }
  for (std::size_t i = 0; i < list.size(); ++i) {
    const YAML::Node entry = list[i];
    const std::string prefix = parent_id + "_choice" + std::to_string(i);
    Choice choice;
    const YAML::Node conditions = entry["conditions"];
    if (conditions && conditions.IsSequence()) {
      for (std::size_t c = 0; c < conditions.size(); ++c) {
        choice.conditions.push_back(auto_conditions::create_condition(
            conditions[c], prefix + "_condition" + std::to_string(c)));
      }
    } else if (conditions && !conditions.IsNull()) {
      throw std::runtime_error("action '" + parent_id +
                               "': choice conditions must be a sequence");
    }
    const YAML::Node actions =
        entry["actions"] ? entry["actions"] : entry["sequence"];
    choice.actions = create_actions(actions, prefix);
    choices.push_back(std::move(choice));
  }
  return choices;
}

// Scalar text of a count/duration field that may be a number or a string
static std::optional<std::string> get_text(const YAML::Node &config,
                                           const std::string &key) {
  const YAML::Node node = config[key];
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  if (node.IsMap()) {
    // {hours, minutes, seconds} form of a duration
    return node_to_string(YAML::Node(*auto_core::get_duration(config, key)));
  }
  if (!node.IsScalar()) {
    throw std::runtime_error(key + ": expected a scalar");
  }
  return node.Scalar();
}

static ActionPtr build(const YAML::Node &config, const std::string &tag,
                       const std::string &id) {
  const std::string what = "action '" + id + "'";

  if (tag == "service") {
    return std::make_unique<ServiceAction>(
        id, require_string(config, "service", what),
        get_string(config, "entity_id"), config["data"],
        config["data_template"]);
  }
  if (tag == "script") {
    return std::make_unique<ScriptAction>(
        id, require_string(config, "script_id", what),
        auto_core::node_to_map(config["variables"]));
  }
  if (tag == "delay") {
    auto delay = get_text(config, "delay");
    auto delay_template = get_string(config, "delay_template");
    if (!delay && !delay_template) {
      throw std::runtime_error(what +
                               ": delay needs 'delay' or 'delay_template'");
    }
    return std::make_unique<DelayAction>(id, delay.value_or("0"),
                                         delay_template);
  }
  if (tag == "notify") {
    auto message = get_string(config, "message");
    auto message_template = get_string(config, "message_template");
    if (!message && !message_template) {
      throw std::runtime_error(
          what + ": notify needs 'message' or 'message_template'");
    }
    return std::make_unique<NotifyAction>(
        id, message.value_or(""), get_string(config, "title"),
        get_string(config, "target"), message_template);
  }
  if (tag == "scene" || tag == "activate_scene" || tag == "deactivate_scene") {
    auto scene_id = get_string(config, "scene_id");
    if (!scene_id) {
      scene_id = get_string(config, "scene");
    }
    if (!scene_id || scene_id->empty()) {
      throw std::runtime_error(what + ": missing required field 'scene_id'");
    }
    bool activate = auto_core::get_bool(config, "activate", true);
    if (tag != "scene") {
      activate = tag == "activate_scene";
    }
    return std::make_unique<SceneAction>(id, *scene_id, activate);
  }
  if (tag == "choose") {
    return std::make_unique<ChooseAction>(
        id, create_choices(config["choices"], id),
        create_actions(config["default"], id + "_default"));
  }
  if (tag == "parallel") {
    return std::make_unique<ParallelAction>(
        id, create_actions(config["actions"], id),
        static_cast<int>(auto_core::get_int(config, "max_parallel").value_or(0)));
  }
  if (tag == "repeat") {
    auto repeat = get_text(config, "repeat");
    auto repeat_template = get_string(config, "repeat_template");
    if (!repeat && !repeat_template) {
      throw std::runtime_error(what +
                               ": repeat needs 'repeat' or 'repeat_template'");
    }
    return std::make_unique<RepeatAction>(
        id, repeat.value_or("0"), create_actions(config["sequence"], id),
        repeat_template);
  }
  if (tag == "template") {
    return std::make_unique<TemplateAction>(
        id, require_string(config, "value_template", what));
  }
  if (tag == "log") {
    auto_core::LogLevel level = auto_core::LogLevel::Info;
    if (auto name = get_string(config, "level")) {
      try {
        level = auto_core::parse_log_level(*name);
      } catch (const std::invalid_argument &e) {
        throw std::runtime_error(what + ": " + e.what());
      }
    }
    return std::make_unique<LogAction>(
        id, require_string(config, "message", what), level);
  }
  throw std::runtime_error(
      "Invalid action: '" + tag +
      "'. Valid values: service, script, delay, notify, scene, "
      "activate_scene, deactivate_scene, choose, parallel, repeat, template, "
      "log");
}

ActionPtr create_action(const YAML::Node &config,
                        const std::string &default_id) {
  if (!config.IsDefined() || !config.IsMap()) {
    throw std::runtime_error("action '" + default_id + "': expected a mapping");
  }
  const std::string id = get_string(config, "id").value_or(default_id);
  ActionPtr action =
      build(config, get_string(config, "action").value_or("service"), id);

  if (!auto_core::get_bool(config, "enabled", true)) {
    action->disable();
  }
  const YAML::Node metadata = config["metadata"];
  if (metadata && metadata.IsMap()) {
    for (const auto &kv : metadata) {
      action->set_metadata(kv.first.as<std::string>(), kv.second);
    }
  }
  return action;
}

} // namespace auto_actions
