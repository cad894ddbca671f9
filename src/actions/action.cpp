#include "actions/action.hpp"

#include "core/value_utils.hpp"

namespace auto_actions {

const char *action_type_name(ActionType type) {
  switch (type) {
  case ActionType::Service:
    return "service";
  case ActionType::Script:
    return "script";
  case ActionType::Delay:
    return "delay";
  case ActionType::Notify:
    return "notify";
  case ActionType::Scene:
    return "scene";
  case ActionType::Choose:
    return "choose";
  case ActionType::Parallel:
    return "parallel";
  case ActionType::Repeat:
    return "repeat";
  case ActionType::Template:
    return "template";
  case ActionType::Log:
    return "log";
  }
  return "service";
}

YAML::Node ActionResult::to_yaml() const {
  YAML::Node out;
  out["success"] = success;
  out["action_id"] = action_id;
  out["action_type"] = action_type;
  out["timestamp"] = auto_core::format_time(timestamp);
  out["data"] = data.IsDefined() ? data : YAML::Node(YAML::NodeType::Null);
  if (error) {
    out["error"] = *error;
  } else {
    out["error"] = YAML::Node(YAML::NodeType::Null);
  }
  return out;
}

Action::Action(std::string action_id, ActionType type)
    : action_id_(std::move(action_id)), type_(type) {}

ActionResult Action::execute(const Context &ctx) const {
  ActionResult result;
  result.action_id = action_id_;
  result.action_type = action_type_name(type_);
  result.timestamp = auto_core::Clock::now();

  if (!enabled()) {
    result.error = "Action is disabled";
    return result;
  }
  if (ctx.cancel && ctx.cancel->is_cancelled()) {
    result.error = "Cancelled";
    return result;
  }

  try {
    ActionOutcome outcome = run(ctx);
    result.success = outcome.ok();
    result.data = outcome.data();
    result.error = outcome.error();
  } catch (const std::exception &e) {
    result.success = false;
    result.error = e.what();
  }
  return result;
}

YAML::Node Action::to_yaml() const {
  YAML::Node out;
  out["action"] = config_tag();
  out["id"] = action_id_;
  out["enabled"] = enabled();
  {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    if (!metadata_.empty()) {
      out["metadata"] = auto_core::map_to_node(metadata_);
    }
  }
  describe(out);
  return out;
}

void Action::set_metadata(const std::string &key, const YAML::Node &value) {
  std::lock_guard<std::mutex> lock(metadata_mutex_);
  metadata_[key] = auto_core::clone_node(value);
}

YAML::Node Action::get_metadata(const std::string &key) const {
  std::lock_guard<std::mutex> lock(metadata_mutex_);
  auto it = metadata_.find(key);
  return it == metadata_.end() ? YAML::Node() : auto_core::clone_node(it->second);
}

std::vector<ActionResult> run_sequence(const std::vector<ActionPtr> &actions,
                                       const Context &ctx) {
  std::vector<ActionResult> results;
  results.reserve(actions.size());
  for (const auto &action : actions) {
    results.push_back(action->execute(ctx));
  }
  return results;
}

YAML::Node results_to_yaml(const std::vector<ActionResult> &results) {
  YAML::Node list(YAML::NodeType::Sequence);
  for (const auto &result : results) {
    list.push_back(result.to_yaml());
  }
  return list;
}

YAML::Node render_tree(const YAML::Node &node, const Context &ctx) {
  if (!node.IsDefined() || node.IsNull()) {
    return YAML::Node();
  }
  if (node.IsScalar()) {
    const std::string &text = node.Scalar();
    if (text.find("{{") == std::string::npos) {
      return auto_core::clone_node(node);
    }
    return YAML::Node(ctx.render_or_raw(text));
  }
  if (node.IsSequence()) {
    YAML::Node out(YAML::NodeType::Sequence);
    for (const auto &item : node) {
      out.push_back(render_tree(item, ctx));
    }
    return out;
  }
  YAML::Node out(YAML::NodeType::Map);
  for (const auto &kv : node) {
    out[kv.first.as<std::string>()] = render_tree(kv.second, ctx);
  }
  return out;
}

YAML::Node actions_to_yaml(const std::vector<ActionPtr> &actions) {
  YAML::Node list(YAML::NodeType::Sequence);
  for (const auto &action : actions) {
    list.push_back(action->to_yaml());
  }
  return list;
}

} // namespace auto_actions
