#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "actions/action.hpp"
#include "conditions/condition.hpp"
#include "core/context.hpp"
#include "triggers/trigger.hpp"

namespace auto_engine {

using auto_core::Context;
using auto_core::TimePoint;

enum class ExecutionMode { Single, Restart, Queued, Parallel };
enum class MaxExceeded { Silent, Warn, Error };

const char *execution_mode_name(ExecutionMode mode);
const char *max_exceeded_name(MaxExceeded policy);

// Throw std::runtime_error listing the valid values
ExecutionMode parse_execution_mode(const std::string &name);
MaxExceeded parse_max_exceeded(const std::string &name);

struct AutomationConfig {
  std::string automation_id;
  std::string name;
  std::string description;
  bool enabled = true;
  ExecutionMode mode = ExecutionMode::Single;
  MaxExceeded max_exceeded = MaxExceeded::Warn;
  std::optional<std::string> trigger_id;
  std::optional<std::string> blueprint_id;
};

struct AutomationState {
  bool is_running = false;
  std::optional<std::string> current_action;
  std::optional<TimePoint> current_action_start;
  std::optional<TimePoint> last_triggered;
  int64_t trigger_count = 0; // runs admitted
  int64_t total_runs = 0;    // runs finished
  int64_t successful_actions = 0;
  int64_t failed_actions = 0;
  int64_t rejected_runs = 0;
  std::optional<std::string> last_error;

  YAML::Node to_yaml() const;
};

// Audit record of one run attempt
struct AutomationExecution {
  std::string execution_id;
  std::string automation_id;
  TimePoint started_at;
  std::optional<TimePoint> finished_at;
  std::string triggered_by;
  YAML::Node context; // run variables
  std::vector<auto_actions::ActionResult> results;
  bool completed = false;
  std::optional<std::string> error;

  YAML::Node to_yaml() const;
};

// Admitted run, handed from begin_execution() to run()
struct ExecutionTicket {
  std::string execution_id;
  std::string triggered_by;
  TimePoint started_at;
  std::shared_ptr<auto_core::CancellationToken> cancel;
};

/**
 * @brief One automation: triggers, conditions, actions and the execution
 * mode state machine that admits overlapping runs.
 *
 * begin_execution() decides admission synchronously:
 *   - single:   rejected while another run is tracked
 *   - restart:  tracked runs are cancelled and untracked, the new run is
 *               the only one tracked
 *   - queued:   tracked behind earlier runs; run() waits until it is first
 *   - parallel: always admitted
 * A rejection is recorded in the history as a completed execution with the
 * error "Max exceeded - silent"; the warn and error policies also log it.
 *
 * run() evaluates the conditions and executes the top-level actions in
 * order, continuing past failed actions. A cancelled run stops before its
 * next top-level action. All members are thread-safe.
 */
class Automation {
public:
  Automation(AutomationConfig config,
             std::vector<std::unique_ptr<auto_triggers::Trigger>> triggers,
             std::vector<auto_conditions::ConditionPtr> conditions,
             std::vector<auto_actions::ActionPtr> actions,
             std::size_t history_limit = 100);

  Automation(const Automation &) = delete;
  Automation &operator=(const Automation &) = delete;

  // nullopt when the run was rejected; the rejection record is copied to
  // `rejection` when given
  std::optional<ExecutionTicket>
  begin_execution(const std::string &triggered_by,
                  AutomationExecution *rejection = nullptr);

  AutomationExecution run(const ExecutionTicket &ticket, Context ctx,
                          bool skip_conditions = false);

  // begin_execution() + run() on the calling thread. A rejected attempt
  // returns its (completed) rejection record.
  AutomationExecution execute(Context ctx, const std::string &triggered_by,
                              bool skip_conditions = false);

  // Record a run refused before admission (engine limits)
  AutomationExecution record_rejection(const std::string &triggered_by,
                                       const std::string &error);

  // Cancel every tracked run
  void cancel_all();

  const std::string &id() const { return config_.automation_id; }
  AutomationConfig config() const;
  bool enabled() const;
  void set_enabled(bool enabled);

  AutomationState state() const;
  std::vector<AutomationExecution> history() const;
  std::size_t running_count() const;

  const std::vector<std::unique_ptr<auto_triggers::Trigger>> &triggers() const {
    return triggers_;
  }
  const std::vector<auto_conditions::ConditionPtr> &conditions() const {
    return conditions_;
  }
  const std::vector<auto_actions::ActionPtr> &actions() const {
    return actions_;
  }

  YAML::Node to_yaml(bool include_history = false) const;

private:
  struct TrackedRun {
    std::string execution_id;
    std::shared_ptr<auto_core::CancellationToken> cancel;
  };

  std::string next_execution_id();
  void untrack(const std::string &execution_id);
  void finish(AutomationExecution &execution);
  void append_history(const AutomationExecution &execution);

  AutomationConfig config_;
  std::vector<std::unique_ptr<auto_triggers::Trigger>> triggers_;
  std::vector<auto_conditions::ConditionPtr> conditions_;
  std::vector<auto_actions::ActionPtr> actions_;
  std::size_t history_limit_;

  mutable std::mutex mutex_;
  std::condition_variable queue_cv_;
  std::deque<TrackedRun> tracked_; // admission order
  AutomationState state_;
  std::deque<AutomationExecution> history_;
  uint64_t execution_seq_ = 0;
};

} // namespace auto_engine
