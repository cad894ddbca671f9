#include "blueprint/blueprint.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#include "actions/action_factory.hpp"
#include "conditions/condition_factory.hpp"
#include "core/value_utils.hpp"
#include "triggers/trigger_factory.hpp"

namespace auto_blueprint {

using auto_core::get_string;
using auto_core::node_to_string;

namespace {

const char *kInputTag = "!input";
const char *kInputPrefix = "!input ";

YAML::Node text_or_null(const std::optional<std::string> &text) {
  return text ? YAML::Node(*text) : YAML::Node(YAML::NodeType::Null);
}

YAML::Node value_or_null(const YAML::Node &node) {
  return node.IsDefined() ? auto_core::clone_node(node)
                          : YAML::Node(YAML::NodeType::Null);
}

bool is_missing(const YAML::Node &node) {
  return !node.IsDefined() || node.IsNull();
}

// YYYY-MM-DD with plausible month and day
bool is_date(const std::string &text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  const int month = std::stoi(text.substr(5, 2));
  const int day = std::stoi(text.substr(8, 2));
  return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

std::string random_suffix() {
  static std::mt19937 rng{std::random_device{}()};
  static std::mutex rng_mutex;
  std::lock_guard<std::mutex> lock(rng_mutex);
  std::ostringstream out;
  out << std::hex << std::setw(8) << std::setfill('0') << rng();
  return out.str();
}

// Placeholder name of a node, if it is one
std::optional<std::string> placeholder_name(const YAML::Node &node) {
  if (!node.IsScalar()) {
    return std::nullopt;
  }
  if (node.Tag() == kInputTag) {
    return node.Scalar();
  }
  const std::string &text = node.Scalar();
  if (text.rfind(kInputPrefix, 0) == 0) {
    return text.substr(std::string(kInputPrefix).size());
  }
  return std::nullopt;
}

} // namespace

const char *parameter_type_name(ParameterType type) {
  switch (type) {
  case ParameterType::String:
    return "string";
  case ParameterType::Number:
    return "number";
  case ParameterType::Boolean:
    return "boolean";
  case ParameterType::Entity:
    return "entity";
  case ParameterType::Device:
    return "device";
  case ParameterType::Select:
    return "select";
  case ParameterType::Time:
    return "time";
  case ParameterType::Date:
    return "date";
  }
  return "string";
}

ParameterType parse_parameter_type(const std::string &name) {
  if (name == "string") {
    return ParameterType::String;
  } else if (name == "number") {
    return ParameterType::Number;
  } else if (name == "boolean") {
    return ParameterType::Boolean;
  } else if (name == "entity") {
    return ParameterType::Entity;
  } else if (name == "device") {
    return ParameterType::Device;
  } else if (name == "select") {
    return ParameterType::Select;
  } else if (name == "time") {
    return ParameterType::Time;
  } else if (name == "date") {
    return ParameterType::Date;
  }
  throw std::runtime_error("Invalid parameter type: '" + name +
                           "'. Valid values: string, number, boolean, "
                           "entity, device, select, time, date");
}

// -----------------------------
// BlueprintParameter
// -----------------------------

bool BlueprintParameter::validate(const YAML::Node &value) const {
  if (is_missing(value)) {
    return !required;
  }
  if (!value.IsScalar()) {
    return false;
  }
  const std::string &text = value.Scalar();

  switch (type) {
  case ParameterType::String:
    return true;
  case ParameterType::Number: {
    auto number = auto_core::node_to_double(value);
    if (!number || !std::isfinite(*number)) {
      return false;
    }
    if (min && *number < *min) {
      return false;
    }
    if (max && *number > *max) {
      return false;
    }
    return true;
  }
  case ParameterType::Boolean: {
    bool flag = false;
    return YAML::convert<bool>::decode(value, flag);
  }
  case ParameterType::Entity:
    return text.find('.') != std::string::npos;
  case ParameterType::Device:
    return !text.empty();
  case ParameterType::Select:
    if (options.empty()) {
      return true;
    }
    for (const auto &option : options) {
      if (option == text) {
        return true;
      }
    }
    return false;
  case ParameterType::Time:
    return auto_core::parse_time_of_day(text).has_value();
  case ParameterType::Date:
    return is_date(text);
  }
  return false;
}

YAML::Node BlueprintParameter::to_yaml() const {
  YAML::Node out;
  out["name"] = name;
  out["type"] = parameter_type_name(type);
  out["default"] = value_or_null(default_value);
  out["required"] = required;
  out["description"] = text_or_null(description);
  if (options.empty()) {
    out["options"] = YAML::Node(YAML::NodeType::Null);
  } else {
    for (const auto &option : options) {
      out["options"].push_back(option);
    }
  }
  out["min"] = min ? YAML::Node(*min) : YAML::Node(YAML::NodeType::Null);
  out["max"] = max ? YAML::Node(*max) : YAML::Node(YAML::NodeType::Null);
  out["selector"] = value_or_null(selector);
  return out;
}

YAML::Node BlueprintInstance::to_yaml() const {
  YAML::Node out;
  out["automation_id"] = automation_id;
  out["name"] = name;
  out["blueprint_id"] = blueprint_id;
  out["parameter_values"] = auto_core::map_to_node(parameter_values);
  out["created_at"] = auto_core::format_time(created_at);
  if (updated_at) {
    out["updated_at"] = auto_core::format_time(*updated_at);
  }
  return out;
}

// -----------------------------
// Blueprint
// -----------------------------

Blueprint::Blueprint(std::string blueprint_id, std::string name,
                     std::string description,
                     std::optional<std::string> domain,
                     std::optional<std::string> author, std::string version)
    : blueprint_id_(std::move(blueprint_id)), name_(std::move(name)),
      description_(std::move(description)), domain_(std::move(domain)),
      author_(std::move(author)), version_(std::move(version)),
      created_at_(auto_core::Clock::now()), updated_at_(created_at_) {
  if (blueprint_id_.empty()) {
    throw std::invalid_argument("blueprint id must not be empty");
  }
}

void Blueprint::touch() { updated_at_ = auto_core::Clock::now(); }

Blueprint &Blueprint::add_parameter(BlueprintParameter parameter) {
  if (parameter.name.empty()) {
    throw std::invalid_argument("blueprint parameter name must not be empty");
  }
  const std::string name = parameter.name;
  parameters_[name] = std::move(parameter);
  touch();
  return *this;
}

Blueprint &Blueprint::add_trigger(const YAML::Node &config) {
  triggers_.push_back(auto_core::clone_node(config));
  touch();
  return *this;
}

Blueprint &Blueprint::add_condition(const YAML::Node &config) {
  conditions_.push_back(auto_core::clone_node(config));
  touch();
  return *this;
}

Blueprint &Blueprint::add_action(const YAML::Node &config) {
  actions_.push_back(auto_core::clone_node(config));
  touch();
  return *this;
}

void Blueprint::validate_values(const ParameterValues &values) const {
  for (const auto &[name, parameter] : parameters_) {
    auto it = values.find(name);
    const YAML::Node value = it != values.end() && !is_missing(it->second)
                                 ? it->second
                                 : parameter.default_value;
    if (!parameter.validate(value)) {
      throw BlueprintValidationError(
          "Invalid value for parameter '" + name + "': " +
          (is_missing(value) ? std::string("null") : node_to_string(value)));
    }
  }
}

BlueprintInstance
Blueprint::create_instance(const std::string &name,
                           const ParameterValues &values,
                           std::optional<std::string> automation_id) {
  validate_values(values);

  BlueprintInstance instance;
  instance.automation_id =
      automation_id ? *automation_id : blueprint_id_ + "_" + random_suffix();
  instance.name = name;
  instance.blueprint_id = blueprint_id_;
  for (const auto &[key, value] : values) {
    instance.parameter_values[key] = auto_core::clone_node(value);
  }
  instance.created_at = auto_core::Clock::now();

  std::lock_guard<std::mutex> lock(mutex_);
  if (instances_.count(instance.automation_id) > 0) {
    throw std::invalid_argument("Blueprint instance already exists: " +
                                instance.automation_id);
  }
  instances_[instance.automation_id] = instance;
  std::cerr << "[Blueprint] Created instance '" << instance.automation_id
            << "' of '" << blueprint_id_ << "'" << std::endl;
  return instance;
}

std::optional<BlueprintInstance>
Blueprint::get_instance(const std::string &automation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(automation_id);
  if (it == instances_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<BlueprintInstance> Blueprint::get_all_instances() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<BlueprintInstance> out;
  out.reserve(instances_.size());
  for (const auto &entry : instances_) {
    out.push_back(entry.second);
  }
  return out;
}

std::size_t Blueprint::instance_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return instances_.size();
}

std::optional<BlueprintInstance>
Blueprint::update_instance(const std::string &automation_id,
                           const ParameterValues &values) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (instances_.count(automation_id) == 0) {
      return std::nullopt;
    }
  }
  validate_values(values);

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(automation_id);
  if (it == instances_.end()) {
    return std::nullopt;
  }
  it->second.parameter_values.clear();
  for (const auto &[key, value] : values) {
    it->second.parameter_values[key] = auto_core::clone_node(value);
  }
  it->second.updated_at = auto_core::Clock::now();
  return it->second;
}

bool Blueprint::delete_instance(const std::string &automation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return instances_.erase(automation_id) > 0;
}

ParameterValues
Blueprint::resolve_parameters(const ParameterValues &values) const {
  ParameterValues resolved;
  for (const auto &[name, parameter] : parameters_) {
    auto it = values.find(name);
    if (it != values.end() && !is_missing(it->second)) {
      resolved[name] = auto_core::clone_node(it->second);
    } else {
      resolved[name] = value_or_null(parameter.default_value);
    }
  }
  // Undeclared values still resolve placeholders that name them
  for (const auto &[name, value] : values) {
    if (resolved.count(name) == 0) {
      resolved[name] = auto_core::clone_node(value);
    }
  }
  return resolved;
}

YAML::Node Blueprint::resolve_config(const YAML::Node &config,
                                     const ParameterValues &parameters) const {
  if (!config.IsDefined() || config.IsNull()) {
    return YAML::Node(YAML::NodeType::Null);
  }
  if (config.IsScalar()) {
    auto name = placeholder_name(config);
    if (!name) {
      return YAML::Node(config.Scalar());
    }
    auto it = parameters.find(*name);
    if (it == parameters.end()) {
      throw BlueprintValidationError("Unknown blueprint input '" + *name +
                                     "' in blueprint '" + blueprint_id_ + "'");
    }
    return auto_core::clone_node(it->second);
  }
  if (config.IsSequence()) {
    YAML::Node out(YAML::NodeType::Sequence);
    for (const auto &item : config) {
      out.push_back(resolve_config(item, parameters));
    }
    return out;
  }
  YAML::Node out(YAML::NodeType::Map);
  for (const auto &kv : config) {
    out[kv.first.as<std::string>()] = resolve_config(kv.second, parameters);
  }
  return out;
}

std::vector<std::unique_ptr<auto_triggers::Trigger>>
Blueprint::instantiate_triggers(const ParameterValues &values) const {
  const ParameterValues parameters = resolve_parameters(values);
  std::vector<std::unique_ptr<auto_triggers::Trigger>> triggers;
  for (std::size_t i = 0; i < triggers_.size(); ++i) {
    triggers.push_back(auto_triggers::create_trigger(
        resolve_config(triggers_[i], parameters),
        "trigger_" + std::to_string(i)));
  }
  return triggers;
}

std::vector<auto_conditions::ConditionPtr>
Blueprint::instantiate_conditions(const ParameterValues &values) const {
  const ParameterValues parameters = resolve_parameters(values);
  std::vector<auto_conditions::ConditionPtr> conditions;
  for (std::size_t i = 0; i < conditions_.size(); ++i) {
    conditions.push_back(auto_conditions::create_condition(
        resolve_config(conditions_[i], parameters),
        "condition_" + std::to_string(i)));
  }
  return conditions;
}

std::vector<auto_actions::ActionPtr>
Blueprint::instantiate_actions(const ParameterValues &values) const {
  const ParameterValues parameters = resolve_parameters(values);
  std::vector<auto_actions::ActionPtr> actions;
  for (std::size_t i = 0; i < actions_.size(); ++i) {
    actions.push_back(auto_actions::create_action(
        resolve_config(actions_[i], parameters),
        "action_" + std::to_string(i)));
  }
  return actions;
}

std::shared_ptr<auto_engine::Automation>
Blueprint::create_automation(const BlueprintInstance &instance,
                             auto_engine::ExecutionMode mode,
                             auto_engine::MaxExceeded max_exceeded,
                             std::size_t history_limit) const {
  auto_engine::AutomationConfig config;
  config.automation_id = instance.automation_id;
  config.name = instance.name.empty() ? instance.automation_id : instance.name;
  config.description = description_;
  config.mode = mode;
  config.max_exceeded = max_exceeded;
  config.blueprint_id = blueprint_id_;

  return std::make_shared<auto_engine::Automation>(
      std::move(config), instantiate_triggers(instance.parameter_values),
      instantiate_conditions(instance.parameter_values),
      instantiate_actions(instance.parameter_values), history_limit);
}

YAML::Node Blueprint::to_yaml(bool include_instances) const {
  YAML::Node out;
  out["blueprint_id"] = blueprint_id_;
  out["name"] = name_;
  out["description"] = description_;
  out["domain"] = text_or_null(domain_);
  out["author"] = text_or_null(author_);
  out["version"] = version_;
  out["created_at"] = auto_core::format_time(created_at_);
  out["updated_at"] = auto_core::format_time(updated_at_);

  YAML::Node input;
  input["parameters"] = YAML::Node(YAML::NodeType::Map);
  for (const auto &[name, parameter] : parameters_) {
    input["parameters"][name] = parameter.to_yaml();
  }
  input["triggers"] = YAML::Node(YAML::NodeType::Sequence);
  for (const auto &config : triggers_) {
    input["triggers"].push_back(auto_core::clone_node(config));
  }
  input["conditions"] = YAML::Node(YAML::NodeType::Sequence);
  for (const auto &config : conditions_) {
    input["conditions"].push_back(auto_core::clone_node(config));
  }
  input["actions"] = YAML::Node(YAML::NodeType::Sequence);
  for (const auto &config : actions_) {
    input["actions"].push_back(auto_core::clone_node(config));
  }
  out["input"] = input;

  std::lock_guard<std::mutex> lock(mutex_);
  out["instance_count"] = instances_.size();
  if (include_instances) {
    out["instances"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto &entry : instances_) {
      out["instances"].push_back(entry.second.to_yaml());
    }
  }
  return out;
}

static BlueprintParameter parse_parameter(const std::string &name,
                                          const YAML::Node &data) {
  if (!data.IsMap()) {
    throw std::runtime_error("parameters." + name + ": expected a mapping");
  }
  const std::string where = "parameters." + name + ".";
  BlueprintParameter parameter;
  parameter.name = name;
  try {
    parameter.type = parse_parameter_type(
        auto_core::require_string(data, "type", "parameter '" + name + "'"));
    if (data["default"]) {
      parameter.default_value = auto_core::clone_node(data["default"]);
    }
    parameter.required = auto_core::get_bool(data, "required", false);
    parameter.description = get_string(data, "description");
    parameter.options = auto_core::get_string_list(data, "options");
    parameter.min = auto_core::get_double(data, "min");
    parameter.max = auto_core::get_double(data, "max");
    if (data["selector"]) {
      parameter.selector = auto_core::clone_node(data["selector"]);
    }
  } catch (const std::runtime_error &e) {
    throw std::runtime_error(where + e.what());
  }
  if (parameter.min && parameter.max && *parameter.min > *parameter.max) {
    throw std::runtime_error(where + "min: must not exceed max");
  }
  return parameter;
}

static void append_configs(const YAML::Node &list, const std::string &key,
                           Blueprint &blueprint,
                           Blueprint &(Blueprint::*add)(const YAML::Node &)) {
  if (!list || list.IsNull()) {
    return;
  }
  if (!list.IsSequence()) {
    throw std::runtime_error("input." + key + ": expected a sequence");
  }
  for (std::size_t i = 0; i < list.size(); ++i) {
    if (!list[i].IsMap()) {
      throw std::runtime_error("input." + key + "[" + std::to_string(i) +
                               "]: expected a mapping");
    }
    (blueprint.*add)(list[i]);
  }
}

std::unique_ptr<Blueprint> Blueprint::from_yaml(const YAML::Node &data) {
  if (!data.IsMap()) {
    throw std::runtime_error("blueprint: expected a mapping");
  }
  auto id = get_string(data, "blueprint_id");
  if (!id) {
    id = get_string(data, "id");
  }
  if (!id || id->empty()) {
    throw std::runtime_error("id: missing required field");
  }

  auto blueprint = std::make_unique<Blueprint>(
      *id, get_string(data, "name").value_or(*id),
      get_string(data, "description").value_or(""),
      get_string(data, "domain"), get_string(data, "author"),
      get_string(data, "version").value_or("1.0.0"));

  const YAML::Node input = data["input"];
  if (!input || input.IsNull()) {
    return blueprint;
  }
  if (!input.IsMap()) {
    throw std::runtime_error("input: expected a mapping");
  }

  const YAML::Node parameters = input["parameters"];
  if (parameters && parameters.IsMap()) {
    for (const auto &kv : parameters) {
      const std::string name = kv.first.as<std::string>();
      blueprint->add_parameter(parse_parameter(name, kv.second));
    }
  } else if (parameters && !parameters.IsNull()) {
    throw std::runtime_error("input.parameters: expected a mapping");
  }

  append_configs(input["triggers"], "triggers", *blueprint,
                 &Blueprint::add_trigger);
  append_configs(input["conditions"], "conditions", *blueprint,
                 &Blueprint::add_condition);
  append_configs(input["actions"], "actions", *blueprint,
                 &Blueprint::add_action);
  return blueprint;
}

} // namespace auto_blueprint
