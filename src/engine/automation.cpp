#include "engine/automation.hpp"

#include <iostream>
#include <stdexcept>

#include "core/value_utils.hpp"

namespace auto_engine {

namespace {

const char *kMaxExceededError = "Max exceeded - silent";
const char *kRestartReason = "Cancelled by restart";

YAML::Node time_or_null(const std::optional<TimePoint> &tp) {
  return tp ? YAML::Node(auto_core::format_time(*tp))
            : YAML::Node(YAML::NodeType::Null);
}

YAML::Node text_or_null(const std::optional<std::string> &text) {
  return text ? YAML::Node(*text) : YAML::Node(YAML::NodeType::Null);
}

} // namespace

const char *execution_mode_name(ExecutionMode mode) {
  switch (mode) {
  case ExecutionMode::Single:
    return "single";
  case ExecutionMode::Restart:
    return "restart";
  case ExecutionMode::Queued:
    return "queued";
  case ExecutionMode::Parallel:
    return "parallel";
  }
  return "single";
}

const char *max_exceeded_name(MaxExceeded policy) {
  switch (policy) {
  case MaxExceeded::Silent:
    return "silent";
  case MaxExceeded::Warn:
    return "warn";
  case MaxExceeded::Error:
    return "error";
  }
  return "warn";
}

ExecutionMode parse_execution_mode(const std::string &name) {
  if (name == "single") {
    return ExecutionMode::Single;
  } else if (name == "restart") {
    return ExecutionMode::Restart;
  } else if (name == "queued") {
    return ExecutionMode::Queued;
  } else if (name == "parallel") {
    return ExecutionMode::Parallel;
  }
  throw std::runtime_error("Invalid mode: '" + name +
                           "'. Valid values: single, restart, queued, parallel");
}

MaxExceeded parse_max_exceeded(const std::string &name) {
  if (name == "silent") {
    return MaxExceeded::Silent;
  } else if (name == "warn" || name == "warning") {
    return MaxExceeded::Warn;
  } else if (name == "error") {
    return MaxExceeded::Error;
  }
  throw std::runtime_error("Invalid max_exceeded: '" + name +
                           "'. Valid values: silent, warn, error");
}

YAML::Node AutomationState::to_yaml() const {
  YAML::Node out;
  out["is_running"] = is_running;
  out["current_action"] = text_or_null(current_action);
  out["current_action_start"] = time_or_null(current_action_start);
  out["last_triggered"] = time_or_null(last_triggered);
  out["trigger_count"] = trigger_count;
  out["total_runs"] = total_runs;
  out["successful_actions"] = successful_actions;
  out["failed_actions"] = failed_actions;
  out["rejected_runs"] = rejected_runs;
  out["last_error"] = text_or_null(last_error);
  return out;
}

YAML::Node AutomationExecution::to_yaml() const {
  YAML::Node out;
  out["execution_id"] = execution_id;
  out["automation_id"] = automation_id;
  out["started_at"] = auto_core::format_time(started_at);
  out["finished_at"] = time_or_null(finished_at);
  out["triggered_by"] = triggered_by;
  out["context"] = context.IsDefined() ? context : YAML::Node(YAML::NodeType::Map);
  out["results"] = auto_actions::results_to_yaml(results);
  out["completed"] = completed;
  out["error"] = text_or_null(error);
  return out;
}

Automation::Automation(
    AutomationConfig config,
    std::vector<std::unique_ptr<auto_triggers::Trigger>> triggers,
    std::vector<auto_conditions::ConditionPtr> conditions,
    std::vector<auto_actions::ActionPtr> actions, std::size_t history_limit)
    : config_(std::move(config)), triggers_(std::move(triggers)),
      conditions_(std::move(conditions)), actions_(std::move(actions)),
      history_limit_(history_limit == 0 ? 1 : history_limit) {
  if (config_.automation_id.empty()) {
    throw std::invalid_argument("automation id must not be empty");
  }
  if (config_.name.empty()) {
    config_.name = config_.automation_id;
  }
}

AutomationConfig Automation::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

bool Automation::enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.enabled;
}

void Automation::set_enabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.enabled = enabled;
}

AutomationState Automation::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::vector<AutomationExecution> Automation::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<AutomationExecution>(history_.begin(), history_.end());
}

std::size_t Automation::running_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tracked_.size();
}

std::string Automation::next_execution_id() {
  return config_.automation_id + "-" + std::to_string(++execution_seq_);
}

void Automation::append_history(const AutomationExecution &execution) {
  history_.push_back(execution);
  while (history_.size() > history_limit_) {
    history_.pop_front();
  }
}

std::optional<ExecutionTicket>
Automation::begin_execution(const std::string &triggered_by,
                            AutomationExecution *rejection) {
  std::unique_lock<std::mutex> lock(mutex_);
  const TimePoint now = auto_core::Clock::now();

  if (config_.mode == ExecutionMode::Single && !tracked_.empty()) {
    AutomationExecution record;
    record.execution_id = next_execution_id();
    record.automation_id = config_.automation_id;
    record.started_at = now;
    record.finished_at = now;
    record.triggered_by = triggered_by;
    record.completed = true;
    record.error = kMaxExceededError;
    ++state_.rejected_runs;
    append_history(record);
    const MaxExceeded policy = config_.max_exceeded;
    lock.unlock();

    if (policy == MaxExceeded::Warn) {
      std::cerr << "[Automation] WARNING: '" << record.automation_id
                << "' is already running, run triggered by '" << triggered_by
                << "' rejected" << std::endl;
    } else if (policy == MaxExceeded::Error) {
      std::cerr << "[Automation] ERROR: '" << record.automation_id
                << "' is already running, run triggered by '" << triggered_by
                << "' rejected" << std::endl;
    }
    if (rejection) {
      *rejection = record;
    }
    return std::nullopt;
  }

  if (config_.mode == ExecutionMode::Restart) {
    for (auto &run : tracked_) {
      run.cancel->cancel(kRestartReason);
    }
    tracked_.clear();
  }

  ExecutionTicket ticket;
  ticket.execution_id = next_execution_id();
  ticket.triggered_by = triggered_by;
  ticket.started_at = now;
  ticket.cancel = std::make_shared<auto_core::CancellationToken>();
  tracked_.push_back({ticket.execution_id, ticket.cancel});

  state_.is_running = true;
  state_.last_triggered = now;
  ++state_.trigger_count;
  return ticket;
}

void Automation::untrack(const std::string &execution_id) {
  for (auto it = tracked_.begin(); it != tracked_.end(); ++it) {
    if (it->execution_id == execution_id) {
      tracked_.erase(it);
      return;
    }
  }
}

void Automation::finish(AutomationExecution &execution) {
  execution.completed = true;
  execution.finished_at = auto_core::Clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    untrack(execution.execution_id);
    state_.is_running = !tracked_.empty();
    if (tracked_.empty()) {
      state_.current_action.reset();
      state_.current_action_start.reset();
    }
    ++state_.total_runs;
    append_history(execution);
  }
  queue_cv_.notify_all();
}

AutomationExecution Automation::run(const ExecutionTicket &ticket, Context ctx,
                                    bool skip_conditions) {
  AutomationExecution execution;
  execution.execution_id = ticket.execution_id;
  execution.automation_id = config_.automation_id;
  execution.started_at = ticket.started_at;
  execution.triggered_by = ticket.triggered_by;
  execution.context = auto_core::map_to_node(ctx.variables);
  ctx.cancel = ticket.cancel;

  if (config_.mode == ExecutionMode::Queued) {
    std::unique_lock<std::mutex> lock(mutex_);
    queue_cv_.wait(lock, [this, &ticket] {
      return ticket.cancel->is_cancelled() || tracked_.empty() ||
             tracked_.front().execution_id == ticket.execution_id;
    });
  }

  try {
    if (ticket.cancel->is_cancelled()) {
      execution.error = ticket.cancel->reason();
    } else if (!skip_conditions &&
               !auto_conditions::all_of(conditions_, ctx)) {
      execution.error = "Conditions not met";
    } else {
      int failed = 0;
      for (const auto &action : actions_) {
        if (ticket.cancel->is_cancelled()) {
          execution.error = ticket.cancel->reason();
          break;
        }
        {
          std::lock_guard<std::mutex> lock(mutex_);
          state_.current_action = action->id();
          state_.current_action_start = auto_core::Clock::now();
        }
        auto result = action->execute(ctx);
        {
          std::lock_guard<std::mutex> lock(mutex_);
          if (result.success) {
            ++state_.successful_actions;
          } else {
            ++state_.failed_actions;
          }
        }
        if (!result.success) {
          ++failed;
        }
        execution.results.push_back(std::move(result));
      }
      if (!execution.error && ticket.cancel->is_cancelled()) {
        execution.error = ticket.cancel->reason();
      }

      std::lock_guard<std::mutex> lock(mutex_);
      if (execution.error) {
        state_.last_error = execution.error;
      } else if (failed > 0) {
        state_.last_error = std::to_string(failed) + " action(s) failed";
      } else {
        state_.last_error.reset();
      }
    }
  } catch (const std::exception &e) {
    execution.error = e.what();
    std::cerr << "[Automation] ERROR: '" << config_.automation_id
              << "' run " << execution.execution_id << " failed: " << e.what()
              << std::endl;
    std::lock_guard<std::mutex> lock(mutex_);
    state_.last_error = execution.error;
  }

  finish(execution);
  return execution;
}

AutomationExecution Automation::execute(Context ctx,
                                        const std::string &triggered_by,
                                        bool skip_conditions) {
  AutomationExecution rejection;
  auto ticket = begin_execution(triggered_by, &rejection);
  if (!ticket) {
    return rejection;
  }
  return run(*ticket, std::move(ctx), skip_conditions);
}

AutomationExecution Automation::record_rejection(const std::string &triggered_by,
                                                 const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  AutomationExecution record;
  record.execution_id = next_execution_id();
  record.automation_id = config_.automation_id;
  record.started_at = auto_core::Clock::now();
  record.finished_at = record.started_at;
  record.triggered_by = triggered_by;
  record.completed = true;
  record.error = error;
  ++state_.rejected_runs;
  append_history(record);
  return record;
}

void Automation::cancel_all() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &run : tracked_) {
      run.cancel->cancel();
    }
  }
  queue_cv_.notify_all();
}

YAML::Node Automation::to_yaml(bool include_history) const {
  const AutomationConfig cfg = config();
  YAML::Node out;
  out["id"] = cfg.automation_id;
  out["name"] = cfg.name;
  out["description"] = cfg.description;
  out["enabled"] = cfg.enabled;
  out["mode"] = execution_mode_name(cfg.mode);
  out["max_exceeded"] = max_exceeded_name(cfg.max_exceeded);
  if (cfg.trigger_id) {
    out["trigger_id"] = *cfg.trigger_id;
  }
  if (cfg.blueprint_id) {
    out["blueprint_id"] = *cfg.blueprint_id;
  }

  YAML::Node triggers(YAML::NodeType::Sequence);
  for (const auto &trigger : triggers_) {
    triggers.push_back(trigger->to_yaml());
  }
  out["triggers"] = triggers;
  YAML::Node conditions(YAML::NodeType::Sequence);
  for (const auto &condition : conditions_) {
    conditions.push_back(condition->to_yaml());
  }
  out["conditions"] = conditions;
  out["actions"] = auto_actions::actions_to_yaml(actions_);
  out["state"] = state().to_yaml();

  if (include_history) {
    YAML::Node list(YAML::NodeType::Sequence);
    for (const auto &execution : history()) {
      list.push_back(execution.to_yaml());
    }
    out["history"] = list;
  }
  return out;
}

} // namespace auto_engine
