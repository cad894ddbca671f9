#include "actions/leaf_actions.hpp"

#include "core/value_utils.hpp"

namespace auto_actions {

static YAML::Node optional_text(const std::optional<std::string> &text) {
  return text ? YAML::Node(*text) : YAML::Node(YAML::NodeType::Null);
}

// -----------------------------
// ServiceAction
// -----------------------------

ServiceAction::ServiceAction(std::string action_id, std::string service,
                             std::optional<std::string> entity_id,
                             YAML::Node data, YAML::Node data_template)
    : Action(std::move(action_id), ActionType::Service),
      service_(std::move(service)), entity_id_(std::move(entity_id)),
      data_(auto_core::clone_node(data)),
      data_template_(auto_core::clone_node(data_template)) {}

ActionOutcome ServiceAction::run(const Context &ctx) const {
  if (!ctx.capabilities || !ctx.capabilities->service_caller) {
    return ActionOutcome::failure("No service caller available in context");
  }

  YAML::Node data(YAML::NodeType::Map);
  for (const YAML::Node *source : {&data_, &data_template_}) {
    if (!source->IsDefined() || !source->IsMap()) {
      continue;
    }
    YAML::Node rendered = render_tree(*source, ctx);
    for (const auto &kv : rendered) {
      data[kv.first.as<std::string>()] = kv.second;
    }
  }
  if (entity_id_) {
    data["entity_id"] = ctx.render_or_raw(*entity_id_);
  }

  YAML::Node result = ctx.capabilities->service_caller(service_, data);

  YAML::Node out;
  out["service"] = service_;
  out["data"] = data;
  out["result"] = result;
  return ActionOutcome::success(out);
}

void ServiceAction::describe(YAML::Node &out) const {
  out["service"] = service_;
  if (entity_id_) {
    out["entity_id"] = *entity_id_;
  }
  if (data_.IsDefined() && data_.IsMap() && data_.size() > 0) {
    out["data"] = auto_core::clone_node(data_);
  }
  if (data_template_.IsDefined() && data_template_.IsMap() &&
      data_template_.size() > 0) {
    out["data_template"] = auto_core::clone_node(data_template_);
  }
}

// -----------------------------
// ScriptAction
// -----------------------------

ScriptAction::ScriptAction(std::string action_id, std::string script_id,
                           std::map<std::string, YAML::Node> variables)
    : Action(std::move(action_id), ActionType::Script),
      script_id_(std::move(script_id)), variables_(std::move(variables)) {}

ActionOutcome ScriptAction::run(const Context &ctx) const {
  if (!ctx.capabilities || !ctx.capabilities->script_executor) {
    return ActionOutcome::failure("No script executor available in context");
  }

  std::map<std::string, YAML::Node> variables = ctx.variables;
  for (const auto &[key, value] : variables_) {
    variables.erase(key);
    variables.emplace(key, render_tree(value, ctx));
  }

  YAML::Node result = ctx.capabilities->script_executor(script_id_, variables);

  YAML::Node out;
  out["script_id"] = script_id_;
  out["result"] = result;
  return ActionOutcome::success(out);
}

void ScriptAction::describe(YAML::Node &out) const {
  out["script_id"] = script_id_;
  if (!variables_.empty()) {
    out["variables"] = auto_core::map_to_node(variables_);
  }
}

// -----------------------------
// NotifyAction
// -----------------------------

NotifyAction::NotifyAction(std::string action_id, std::string message,
                           std::optional<std::string> title,
                           std::optional<std::string> target,
                           std::optional<std::string> message_template)
    : Action(std::move(action_id), ActionType::Notify),
      message_(std::move(message)), title_(std::move(title)),
      target_(std::move(target)),
      message_template_(std::move(message_template)) {}

ActionOutcome NotifyAction::run(const Context &ctx) const {
  if (!ctx.capabilities || !ctx.capabilities->notifier) {
    return ActionOutcome::failure("No notifier available in context");
  }

  const std::string message = ctx.render_or_raw(
      message_template_ ? *message_template_ : message_);
  std::optional<std::string> title;
  if (title_) {
    title = ctx.render_or_raw(*title_);
  }

  ctx.capabilities->notifier(message, title, target_);

  YAML::Node out;
  out["message"] = message;
  out["title"] = optional_text(title);
  out["target"] = optional_text(target_);
  return ActionOutcome::success(out);
}

void NotifyAction::describe(YAML::Node &out) const {
  out["message"] = message_;
  if (title_) {
    out["title"] = *title_;
  }
  if (target_) {
    out["target"] = *target_;
  }
  if (message_template_) {
    out["message_template"] = *message_template_;
  }
}

// -----------------------------
// SceneAction
// -----------------------------

SceneAction::SceneAction(std::string action_id, std::string scene_id,
                         bool activate)
    : Action(std::move(action_id), ActionType::Scene),
      scene_id_(std::move(scene_id)), activate_(activate) {}

ActionOutcome SceneAction::run(const Context &ctx) const {
  if (!ctx.capabilities || !ctx.capabilities->scene_executor) {
    return ActionOutcome::failure("No scene executor available in context");
  }

  if (activate_) {
    ctx.capabilities->scene_executor->activate_scene(scene_id_);
  } else {
    ctx.capabilities->scene_executor->deactivate_scene(scene_id_);
  }

  YAML::Node out;
  out["scene_id"] = scene_id_;
  out["activated"] = activate_;
  return ActionOutcome::success(out);
}

void SceneAction::describe(YAML::Node &out) const {
  out["scene_id"] = scene_id_;
}

std::string SceneAction::config_tag() const {
  return activate_ ? "activate_scene" : "deactivate_scene";
}

// -----------------------------
// TemplateAction
// -----------------------------

TemplateAction::TemplateAction(std::string action_id,
                               std::string value_template)
    : Action(std::move(action_id), ActionType::Template),
      value_template_(std::move(value_template)) {}

ActionOutcome TemplateAction::run(const Context &ctx) const {
  YAML::Node out;
  out["result"] = ctx.render_or_raw(value_template_);
  return ActionOutcome::success(out);
}

void TemplateAction::describe(YAML::Node &out) const {
  out["value_template"] = value_template_;
}

// -----------------------------
// LogAction
// -----------------------------

LogAction::LogAction(std::string action_id, std::string message,
                     auto_core::LogLevel level)
    : Action(std::move(action_id), ActionType::Log),
      message_(std::move(message)), level_(level) {}

ActionOutcome LogAction::run(const Context &ctx) const {
  const std::string message = ctx.render_or_raw(message_);
  if (ctx.capabilities && ctx.capabilities->logger) {
    ctx.capabilities->logger(level_, message);
  } else {
    auto_core::stderr_log_sink()(level_, message);
  }

  YAML::Node out;
  out["message"] = message;
  out["level"] = auto_core::log_level_name(level_);
  return ActionOutcome::success(out);
}

void LogAction::describe(YAML::Node &out) const {
  out["message"] = message_;
  out["level"] = auto_core::log_level_name(level_);
}

} // namespace auto_actions
