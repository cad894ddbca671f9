#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "actions/action.hpp"
#include "conditions/condition.hpp"
#include "core/context.hpp"
#include "engine/automation.hpp"
#include "triggers/trigger.hpp"

namespace auto_blueprint {

using auto_core::TimePoint;

enum class ParameterType {
  String,
  Number,
  Boolean,
  Entity,
  Device,
  Select,
  Time,
  Date
};

const char *parameter_type_name(ParameterType type);

// Throws std::runtime_error listing the valid values
ParameterType parse_parameter_type(const std::string &name);

// Raised synchronously when a parameter value is rejected
class BlueprintValidationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

using ParameterValues = std::map<std::string, YAML::Node>;

struct BlueprintParameter {
  std::string name;
  ParameterType type = ParameterType::String;
  YAML::Node default_value; // null when no default
  bool required = false;
  std::optional<std::string> description;
  std::vector<std::string> options; // select choices
  std::optional<double> min;
  std::optional<double> max;
  YAML::Node selector; // opaque UI hint

  // A null value means "not supplied": accepted unless required
  bool validate(const YAML::Node &value) const;

  YAML::Node to_yaml() const;
};

struct BlueprintInstance {
  std::string automation_id;
  std::string name;
  std::string blueprint_id;
  ParameterValues parameter_values;
  TimePoint created_at;
  std::optional<TimePoint> updated_at;

  YAML::Node to_yaml() const;
};

/**
 * @brief Parameterized automation template.
 *
 * Raw trigger/condition/action configurations may contain placeholders
 * that name a declared parameter, either as the string "!input <name>" or
 * as a scalar tagged `!input`. Instantiation replaces every placeholder
 * (recursively through maps and sequences) with the instance's value, or
 * the parameter default, and hands the result to the regular factories.
 *
 * Thread Safety:
 *   Instance bookkeeping is mutex-protected. The template itself (builder
 *   methods) is expected to be completed before the blueprint is shared.
 */
class Blueprint {
public:
  Blueprint(std::string blueprint_id, std::string name,
            std::string description,
            std::optional<std::string> domain = std::nullopt,
            std::optional<std::string> author = std::nullopt,
            std::string version = "1.0.0");

  Blueprint(const Blueprint &) = delete;
  Blueprint &operator=(const Blueprint &) = delete;

  // ---- Builders ----

  Blueprint &add_parameter(BlueprintParameter parameter);
  Blueprint &add_trigger(const YAML::Node &config);
  Blueprint &add_condition(const YAML::Node &config);
  Blueprint &add_action(const YAML::Node &config);

  // ---- Instances ----

  /**
   * @brief Validate values against every declared parameter and record an
   * instance.
   *
   * automation_id defaults to "<blueprint_id>_<8 hex digits>". Throws
   * BlueprintValidationError naming the first rejected parameter, and
   * std::invalid_argument when the automation id is already taken.
   */
  BlueprintInstance
  create_instance(const std::string &name, const ParameterValues &values,
                  std::optional<std::string> automation_id = std::nullopt);

  std::optional<BlueprintInstance>
  get_instance(const std::string &automation_id) const;
  std::vector<BlueprintInstance> get_all_instances() const;
  std::size_t instance_count() const;

  // Re-validates; nullopt when the instance does not exist
  std::optional<BlueprintInstance>
  update_instance(const std::string &automation_id,
                  const ParameterValues &values);
  bool delete_instance(const std::string &automation_id);

  // ---- Instantiation ----

  // Supplied values plus defaults for every declared parameter
  ParameterValues resolve_parameters(const ParameterValues &values) const;

  // Deep copy of config with placeholders replaced. Throws
  // BlueprintValidationError for a placeholder naming no parameter.
  YAML::Node resolve_config(const YAML::Node &config,
                            const ParameterValues &parameters) const;

  std::vector<std::unique_ptr<auto_triggers::Trigger>>
  instantiate_triggers(const ParameterValues &values) const;
  std::vector<auto_conditions::ConditionPtr>
  instantiate_conditions(const ParameterValues &values) const;
  std::vector<auto_actions::ActionPtr>
  instantiate_actions(const ParameterValues &values) const;

  // Runnable automation for a recorded instance
  std::shared_ptr<auto_engine::Automation> create_automation(
      const BlueprintInstance &instance,
      auto_engine::ExecutionMode mode = auto_engine::ExecutionMode::Single,
      auto_engine::MaxExceeded max_exceeded = auto_engine::MaxExceeded::Warn,
      std::size_t history_limit = 100) const;

  // ---- Serialization ----

  YAML::Node to_yaml(bool include_instances = false) const;

  // Accepts `blueprint_id` or `id`. Throws std::runtime_error naming the
  // offending field.
  static std::unique_ptr<Blueprint> from_yaml(const YAML::Node &data);

  const std::string &id() const { return blueprint_id_; }
  const std::string &name() const { return name_; }
  const std::string &description() const { return description_; }
  const std::optional<std::string> &domain() const { return domain_; }
  const std::optional<std::string> &author() const { return author_; }
  const std::string &version() const { return version_; }
  const std::map<std::string, BlueprintParameter> &parameters() const {
    return parameters_;
  }

private:
  void validate_values(const ParameterValues &values) const;
  void touch();

  std::string blueprint_id_;
  std::string name_;
  std::string description_;
  std::optional<std::string> domain_;
  std::optional<std::string> author_;
  std::string version_;
  TimePoint created_at_;
  TimePoint updated_at_;

  std::map<std::string, BlueprintParameter> parameters_;
  std::vector<YAML::Node> triggers_;
  std::vector<YAML::Node> conditions_;
  std::vector<YAML::Node> actions_;

  mutable std::mutex mutex_;
  std::map<std::string, BlueprintInstance> instances_;
};

} // namespace auto_blueprint
