#pragma once

#include <map>
#include <optional>
#include <string>

#include "actions/action.hpp"

namespace auto_actions {

// Calls `service` through the service_caller capability with `data` merged
// with the rendered `data_template`, and `entity_id` injected when set
class ServiceAction : public Action {
public:
  ServiceAction(std::string action_id, std::string service,
                std::optional<std::string> entity_id, YAML::Node data,
                YAML::Node data_template);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string service_;
  std::optional<std::string> entity_id_;
  YAML::Node data_;
  YAML::Node data_template_;
};

// Runs a script with the context variables overlaid by `variables`
class ScriptAction : public Action {
public:
  ScriptAction(std::string action_id, std::string script_id,
               std::map<std::string, YAML::Node> variables);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string script_id_;
  std::map<std::string, YAML::Node> variables_;
};

class NotifyAction : public Action {
public:
  NotifyAction(std::string action_id, std::string message,
               std::optional<std::string> title,
               std::optional<std::string> target,
               std::optional<std::string> message_template);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string message_;
  std::optional<std::string> title_;
  std::optional<std::string> target_;
  std::optional<std::string> message_template_;
};

class SceneAction : public Action {
public:
  SceneAction(std::string action_id, std::string scene_id, bool activate);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;
  std::string config_tag() const override;

private:
  std::string scene_id_;
  bool activate_;
};

// Renders a template and reports the text
class TemplateAction : public Action {
public:
  TemplateAction(std::string action_id, std::string value_template);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string value_template_;
};

// Writes a rendered message to the logger capability (stderr by default)
class LogAction : public Action {
public:
  LogAction(std::string action_id, std::string message,
            auto_core::LogLevel level);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string message_;
  auto_core::LogLevel level_;
};

} // namespace auto_actions
