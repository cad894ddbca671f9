#include "config.hpp"

#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>

#include "actions/action_factory.hpp"
#include "conditions/condition_factory.hpp"
#include "core/value_utils.hpp"
#include "triggers/trigger_factory.hpp"

namespace butler_automation {

namespace fs = std::filesystem;

using auto_core::get_bool;
using auto_core::get_string;

[[noreturn]] static void fail(const std::string &where,
                              const std::string &message) {
  throw std::runtime_error("[CONFIG] " + where + ": " + message);
}

static std::string at(const std::string &section, std::size_t index) {
  return section + "[" + std::to_string(index) + "]";
}

// Optional numeric field, validated against [min, max]
static std::optional<double> read_number(const YAML::Node &node,
                                         const std::string &key,
                                         const std::string &where, double min,
                                         double max) {
  std::optional<double> value;
  try {
    value = auto_core::get_double(node, key);
  } catch (const std::runtime_error &e) {
    fail(where + "." + key, e.what());
  }
  if (value && (*value < min || *value > max)) {
    fail(where + "." + key, "must be in range [" + auto_core::node_to_string(
                                                       YAML::Node(min)) +
                                ", " +
                                auto_core::node_to_string(YAML::Node(max)) +
                                "]");
  }
  return value;
}

static YAML::Node read_sequence(const YAML::Node &node, const std::string &key,
                                const std::string &where) {
  const YAML::Node list = node[key];
  if (!list || list.IsNull()) {
    return YAML::Node(YAML::NodeType::Sequence);
  }
  if (!list.IsSequence()) {
    fail(where + "." + key, "must be a sequence");
  }
  return auto_core::clone_node(list);
}

static std::string read_text(const YAML::Node &node, const std::string &key,
                             const std::string &where,
                             const std::string &fallback) {
  try {
    return get_string(node, key).value_or(fallback);
  } catch (const std::runtime_error &e) {
    fail(where + "." + key, e.what());
  }
}

static void read_policies(const YAML::Node &node, const std::string &where,
                          auto_engine::ExecutionMode &mode,
                          auto_engine::MaxExceeded &max_exceeded) {
  try {
    mode = auto_engine::parse_execution_mode(
        read_text(node, "mode", where, "single"));
  } catch (const std::runtime_error &e) {
    fail(where + ".mode", e.what());
  }
  try {
    max_exceeded = auto_engine::parse_max_exceeded(
        read_text(node, "max_exceeded", where, "warn"));
  } catch (const std::runtime_error &e) {
    fail(where + ".max_exceeded", e.what());
  }
}

static auto_engine::EngineOptions parse_engine(const YAML::Node &yaml) {
  if (!yaml["engine"]) {
    throw std::runtime_error("[CONFIG] Missing required 'engine' section");
  }
  const YAML::Node engine = yaml["engine"];
  if (!engine.IsMap()) {
    throw std::runtime_error("[CONFIG] 'engine' section must be a map");
  }

  auto_engine::EngineOptions options;
  auto tick_rate = read_number(engine, "tick_rate_hz", "engine", 0.1, 1000.0);
  if (!tick_rate) {
    throw std::runtime_error("[CONFIG] Missing required 'engine.tick_rate_hz'");
  }
  options.tick_rate_hz = *tick_rate;

  if (auto limit =
          read_number(engine, "history_limit", "engine", 1.0, 10000.0)) {
    options.history_limit = static_cast<std::size_t>(*limit);
  }
  if (auto runs =
          read_number(engine, "max_parallel_runs", "engine", 1.0, 1e6)) {
    options.max_parallel_runs = static_cast<int>(*runs);
  }
  return options;
}

static std::vector<AutomationSpec> parse_automations(const YAML::Node &yaml) {
  std::vector<AutomationSpec> specs;
  const YAML::Node list = yaml["automations"];
  if (!list || list.IsNull()) {
    return specs;
  }
  if (!list.IsSequence()) {
    throw std::runtime_error("[CONFIG] 'automations' must be a sequence");
  }

  std::set<std::string> ids;
  for (std::size_t i = 0; i < list.size(); ++i) {
    const YAML::Node node = list[i];
    const std::string where = at("automations", i);
    if (!node.IsMap()) {
      fail(where, "entry must be a map");
    }

    AutomationSpec spec;
    spec.id = read_text(node, "id", where, "");
    if (spec.id.empty()) {
      fail(where, "missing required field 'id'");
    }
    if (!ids.insert(spec.id).second) {
      fail(where + ".id", "duplicate automation id '" + spec.id + "'");
    }
    spec.name = read_text(node, "name", where, spec.id);
    spec.description = read_text(node, "description", where, "");
    try {
      spec.enabled = get_bool(node, "enabled", true);
    } catch (const std::runtime_error &e) {
      fail(where + ".enabled", e.what());
    }
    read_policies(node, where, spec.mode, spec.max_exceeded);
    spec.triggers = read_sequence(node, "triggers", where);
    spec.conditions = read_sequence(node, "conditions", where);
    spec.actions = read_sequence(node, "actions", where);
    specs.push_back(std::move(spec));
  }
  return specs;
}

static std::vector<std::shared_ptr<auto_blueprint::Blueprint>>
parse_blueprints(const YAML::Node &yaml) {
  std::vector<std::shared_ptr<auto_blueprint::Blueprint>> blueprints;
  const YAML::Node list = yaml["blueprints"];
  if (!list || list.IsNull()) {
    return blueprints;
  }
  if (!list.IsSequence()) {
    throw std::runtime_error("[CONFIG] 'blueprints' must be a sequence");
  }

  std::set<std::string> ids;
  for (std::size_t i = 0; i < list.size(); ++i) {
    const std::string where = at("blueprints", i);
    std::shared_ptr<auto_blueprint::Blueprint> blueprint;
    try {
      blueprint = auto_blueprint::Blueprint::from_yaml(list[i]);
    } catch (const std::exception &e) {
      fail(where, e.what());
    }
    if (!ids.insert(blueprint->id()).second) {
      fail(where + ".id", "duplicate blueprint id '" + blueprint->id() + "'");
    }
    blueprints.push_back(std::move(blueprint));
  }
  return blueprints;
}

static std::vector<InstanceSpec>
parse_instances(const YAML::Node &yaml, const std::set<std::string> &known) {
  std::vector<InstanceSpec> specs;
  const YAML::Node list = yaml["instances"];
  if (!list || list.IsNull()) {
    return specs;
  }
  if (!list.IsSequence()) {
    throw std::runtime_error("[CONFIG] 'instances' must be a sequence");
  }

  for (std::size_t i = 0; i < list.size(); ++i) {
    const YAML::Node node = list[i];
    const std::string where = at("instances", i);
    if (!node.IsMap()) {
      fail(where, "entry must be a map");
    }

    InstanceSpec spec;
    spec.blueprint_id = read_text(node, "blueprint", where, "");
    if (spec.blueprint_id.empty()) {
      fail(where, "missing required field 'blueprint'");
    }
    if (known.count(spec.blueprint_id) == 0) {
      fail(where + ".blueprint",
           "unknown blueprint '" + spec.blueprint_id + "'");
    }
    const std::string automation_id = read_text(node, "automation_id", where, "");
    if (!automation_id.empty()) {
      spec.automation_id = automation_id;
    }
    spec.name = read_text(node, "name", where,
                          automation_id.empty() ? spec.blueprint_id
                                                : automation_id);
    read_policies(node, where, spec.mode, spec.max_exceeded);

    const YAML::Node parameters = node["parameters"];
    if (parameters && !parameters.IsNull() && !parameters.IsMap()) {
      fail(where + ".parameters", "must be a map");
    }
    spec.parameters = auto_core::node_to_map(parameters);
    specs.push_back(std::move(spec));
  }
  return specs;
}

static std::map<std::string, int> parse_sun(const YAML::Node &yaml) {
  std::map<std::string, int> sun;
  const YAML::Node node = yaml["sun"];
  if (!node || node.IsNull()) {
    return sun;
  }
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'sun' section must be a map");
  }
  for (const auto &kv : node) {
    const std::string key = kv.first.as<std::string>();
    if (key != "sunrise" && key != "sunset") {
      fail("sun." + key, "unknown key (expected sunrise or sunset)");
    }
    auto seconds = kv.second.IsScalar()
                       ? auto_core::parse_time_of_day(kv.second.Scalar())
                       : std::nullopt;
    if (!seconds) {
      fail("sun." + key, "expected HH:MM or HH:MM:SS, got '" +
                             auto_core::node_to_string(kv.second) + "'");
    }
    sun[key] = *seconds;
  }
  return sun;
}

EngineConfig parse_config(const YAML::Node &yaml) {
  if (!yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] Top level must be a map");
  }

  EngineConfig config;
  config.engine = parse_engine(yaml);
  config.automations = parse_automations(yaml);
  config.blueprints = parse_blueprints(yaml);

  std::set<std::string> blueprint_ids;
  for (const auto &blueprint : config.blueprints) {
    blueprint_ids.insert(blueprint->id());
  }
  config.instances = parse_instances(yaml, blueprint_ids);
  config.sun = parse_sun(yaml);

  // Instance ids share the automation namespace
  std::set<std::string> ids;
  for (const auto &spec : config.automations) {
    ids.insert(spec.id);
  }
  for (std::size_t i = 0; i < config.instances.size(); ++i) {
    const auto &spec = config.instances[i];
    if (spec.automation_id && !ids.insert(*spec.automation_id).second) {
      fail(at("instances", i) + ".automation_id",
           "duplicate automation id '" + *spec.automation_id + "'");
    }
  }
  return config;
}

EngineConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Failed to load config file '" + path +
                             "': " + e.what());
  }

  EngineConfig config = parse_config(yaml);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

static std::shared_ptr<auto_engine::Automation>
build_inline(const AutomationSpec &spec, const std::string &where,
             std::size_t history_limit) {
  std::vector<std::unique_ptr<auto_triggers::Trigger>> triggers;
  for (std::size_t j = 0; j < spec.triggers.size(); ++j) {
    try {
      triggers.push_back(auto_triggers::create_trigger(
          spec.triggers[j], "trigger_" + std::to_string(j)));
    } catch (const std::exception &e) {
      fail(where + "." + at("triggers", j), e.what());
    }
  }

  std::vector<auto_conditions::ConditionPtr> conditions;
  for (std::size_t j = 0; j < spec.conditions.size(); ++j) {
    try {
      conditions.push_back(auto_conditions::create_condition(
          spec.conditions[j], "condition_" + std::to_string(j)));
    } catch (const std::exception &e) {
      fail(where + "." + at("conditions", j), e.what());
    }
  }

  std::vector<auto_actions::ActionPtr> actions;
  for (std::size_t j = 0; j < spec.actions.size(); ++j) {
    try {
      actions.push_back(auto_actions::create_action(
          spec.actions[j], "action_" + std::to_string(j)));
    } catch (const std::exception &e) {
      fail(where + "." + at("actions", j), e.what());
    }
  }

  auto_engine::AutomationConfig config;
  config.automation_id = spec.id;
  config.name = spec.name;
  config.description = spec.description;
  config.enabled = spec.enabled;
  config.mode = spec.mode;
  config.max_exceeded = spec.max_exceeded;
  return std::make_shared<auto_engine::Automation>(
      std::move(config), std::move(triggers), std::move(conditions),
      std::move(actions), history_limit);
}

std::vector<std::shared_ptr<auto_engine::Automation>>
build_automations(const EngineConfig &config,
                  auto_blueprint::BlueprintRegistry &blueprints) {
  for (std::size_t i = 0; i < config.blueprints.size(); ++i) {
    if (!blueprints.register_blueprint(config.blueprints[i])) {
      fail(at("blueprints", i), "blueprint '" + config.blueprints[i]->id() +
                                    "' is already registered");
    }
  }

  std::vector<std::shared_ptr<auto_engine::Automation>> automations;
  for (std::size_t i = 0; i < config.automations.size(); ++i) {
    automations.push_back(build_inline(config.automations[i],
                                       at("automations", i),
                                       config.engine.history_limit));
  }

  for (std::size_t i = 0; i < config.instances.size(); ++i) {
    const InstanceSpec &spec = config.instances[i];
    const std::string where = at("instances", i);
    auto blueprint = blueprints.get(spec.blueprint_id);
    if (!blueprint) {
      fail(where + ".blueprint",
           "unknown blueprint '" + spec.blueprint_id + "'");
    }
    try {
      auto instance =
          blueprint->create_instance(spec.name, spec.parameters,
                                     spec.automation_id);
      automations.push_back(blueprint->create_automation(
          instance, spec.mode, spec.max_exceeded,
          config.engine.history_limit));
    } catch (const std::exception &e) {
      fail(where, e.what());
    }
  }

  std::cerr << "[CONFIG] Built " << automations.size() << " automations ("
            << config.instances.size() << " from blueprints)" << std::endl;
  return automations;
}

std::map<std::string, auto_core::TimePoint>
sun_events_for(const EngineConfig &config, auto_core::TimePoint now) {
  std::map<std::string, auto_core::TimePoint> events;
  const auto midnight = auto_core::start_of_day(now);
  for (const auto &[name, seconds] : config.sun) {
    events[name] = midnight + std::chrono::seconds(seconds);
  }
  return events;
}

} // namespace butler_automation
