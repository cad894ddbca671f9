#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "core/context.hpp"

namespace auto_actions {

using auto_core::Context;
using auto_core::TimePoint;

enum class ActionType {
  Service,
  Script,
  Delay,
  Notify,
  Scene,
  Choose,
  Parallel,
  Repeat,
  Template,
  Log
};

const char *action_type_name(ActionType type);

// Audit record of one action execution
struct ActionResult {
  bool success = false;
  std::string action_id;
  std::string action_type;
  TimePoint timestamp;
  YAML::Node data; // null when the action produced none
  std::optional<std::string> error;

  YAML::Node to_yaml() const;
};

/**
 * @brief Outcome of an action body: payload data, or an error.
 *
 * Composite actions fail while still reporting their child results, so a
 * failed outcome may carry data as well.
 */
class ActionOutcome {
public:
  static ActionOutcome success(YAML::Node data) {
    ActionOutcome out;
    out.data_ = std::move(data);
    return out;
  }
  static ActionOutcome failure(std::string error,
                               YAML::Node data = YAML::Node()) {
    ActionOutcome out;
    out.error_ = std::move(error);
    out.data_ = std::move(data);
    return out;
  }

  bool ok() const { return !error_.has_value(); }
  const YAML::Node &data() const { return data_; }
  const std::optional<std::string> &error() const { return error_; }

private:
  ActionOutcome() = default;

  YAML::Node data_;
  std::optional<std::string> error_;
};

/**
 * @brief Base of every action.
 *
 * execute() never throws: a disabled action, a cancelled run, a missing
 * capability and any std::exception raised by the body or an injected
 * callback all end up in ActionResult::error. Actions are immutable while
 * executing and may run on several threads at once.
 */
class Action {
public:
  Action(std::string action_id, ActionType type);
  virtual ~Action() = default;

  Action(const Action &) = delete;
  Action &operator=(const Action &) = delete;

  ActionResult execute(const Context &ctx) const;

  // Configuration map accepted by create_action()
  YAML::Node to_yaml() const;

  const std::string &id() const { return action_id_; }
  ActionType type() const { return type_; }

  bool enabled() const { return enabled_.load(); }
  void enable() { enabled_.store(true); }
  void disable() { enabled_.store(false); }

  void set_metadata(const std::string &key, const YAML::Node &value);
  YAML::Node get_metadata(const std::string &key) const;

protected:
  virtual ActionOutcome run(const Context &ctx) const = 0;
  virtual void describe(YAML::Node &out) const = 0;

  // Type tag written by to_yaml() (scene deactivation differs)
  virtual std::string config_tag() const { return action_type_name(type_); }

private:
  std::string action_id_;
  ActionType type_;
  std::atomic<bool> enabled_{true};

  mutable std::mutex metadata_mutex_;
  std::map<std::string, YAML::Node> metadata_;
};

using ActionPtr = std::unique_ptr<Action>;

// Run a list of actions in order; every action runs even after a failure
std::vector<ActionResult> run_sequence(const std::vector<ActionPtr> &actions,
                                       const Context &ctx);

// Sequence of result maps for ActionResult::data
YAML::Node results_to_yaml(const std::vector<ActionResult> &results);

// Render every string leaf of a tree, falling back to raw text on error
YAML::Node render_tree(const YAML::Node &node, const Context &ctx);

YAML::Node actions_to_yaml(const std::vector<ActionPtr> &actions);

} // namespace auto_actions
