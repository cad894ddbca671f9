#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "blueprint/blueprint.hpp"
#include "blueprint/blueprint_registry.hpp"
#include "core/context.hpp"
#include "engine/automation.hpp"
#include "engine/automation_engine.hpp"

namespace butler_automation {

// Automation defined inline in the config file
struct AutomationSpec {
  std::string id;
  std::string name;
  std::string description;
  bool enabled = true;
  auto_engine::ExecutionMode mode = auto_engine::ExecutionMode::Single;
  auto_engine::MaxExceeded max_exceeded = auto_engine::MaxExceeded::Warn;
  YAML::Node triggers;   // raw sequences, same shape the factories consume
  YAML::Node conditions;
  YAML::Node actions;
};

// Automation created from a blueprint
struct InstanceSpec {
  std::string blueprint_id;
  std::string name;
  std::optional<std::string> automation_id;
  auto_engine::ExecutionMode mode = auto_engine::ExecutionMode::Single;
  auto_engine::MaxExceeded max_exceeded = auto_engine::MaxExceeded::Warn;
  std::map<std::string, YAML::Node> parameters;
};

// Complete engine configuration
struct EngineConfig {
  std::string config_file_path; // absolute
  auto_engine::EngineOptions engine;
  std::vector<AutomationSpec> automations;
  std::vector<std::shared_ptr<auto_blueprint::Blueprint>> blueprints;
  std::vector<InstanceSpec> instances;
  std::map<std::string, int> sun; // "sunrise"/"sunset" -> seconds of day
};

// Load engine configuration from YAML file
// Throws std::runtime_error ("[CONFIG] <path>: ...") if the file cannot be
// read, parsed, or validated
EngineConfig load_config(const std::string &path);

// Same validation for an already parsed document
EngineConfig parse_config(const YAML::Node &yaml);

/**
 * @brief Build every automation the configuration declares.
 *
 * Blueprints are registered into `blueprints`, inline automations are
 * built through the trigger/condition/action factories and blueprint
 * instances are validated and instantiated. Throws std::runtime_error
 * ("[CONFIG] <path>: ...") on the first invalid definition.
 */
std::vector<std::shared_ptr<auto_engine::Automation>>
build_automations(const EngineConfig &config,
                  auto_blueprint::BlueprintRegistry &blueprints);

// Sun almanac of the config anchored to the day containing `now`
std::map<std::string, auto_core::TimePoint>
sun_events_for(const EngineConfig &config, auto_core::TimePoint now);

} // namespace butler_automation
