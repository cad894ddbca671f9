#include "actions/flow_actions.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include "core/cancellation.hpp"
#include "core/value_utils.hpp"

namespace auto_actions {

static bool all_succeeded(const std::vector<ActionResult> &results) {
  for (const auto &result : results) {
    if (!result.success) {
      return false;
    }
  }
  return true;
}

// -----------------------------
// DelayAction
// -----------------------------

DelayAction::DelayAction(std::string action_id, std::string delay,
                         std::optional<std::string> delay_template)
    : Action(std::move(action_id), ActionType::Delay), delay_(std::move(delay)),
      delay_template_(std::move(delay_template)) {}

ActionOutcome DelayAction::run(const Context &ctx) const {
  const std::string text =
      delay_template_ ? ctx.render(*delay_template_) : ctx.render_or_raw(delay_);

  double seconds = 0.0;
  try {
    seconds = auto_core::parse_duration(text);
  } catch (const std::invalid_argument &e) {
    return ActionOutcome::failure(std::string("Invalid delay: ") + e.what());
  }

  const auto duration = auto_core::to_duration(seconds);
  if (ctx.cancel) {
    if (!ctx.cancel->wait_for(duration)) {
      return ActionOutcome::failure("Cancelled");
    }
  } else {
    std::this_thread::sleep_for(duration);
  }

  YAML::Node out;
  out["delay_seconds"] = seconds;
  return ActionOutcome::success(out);
}

void DelayAction::describe(YAML::Node &out) const {
  out["delay"] = delay_;
  if (delay_template_) {
    out["delay_template"] = *delay_template_;
  }
}

// -----------------------------
// ChooseAction
// -----------------------------

ChooseAction::ChooseAction(std::string action_id, std::vector<Choice> choices,
                           std::vector<ActionPtr> default_actions)
    : Action(std::move(action_id), ActionType::Choose),
      choices_(std::move(choices)),
      default_actions_(std::move(default_actions)) {}

ActionOutcome ChooseAction::run(const Context &ctx) const {
  for (std::size_t i = 0; i < choices_.size(); ++i) {
    if (!auto_conditions::all_of(choices_[i].conditions, ctx)) {
      continue;
    }
    const auto results = run_sequence(choices_[i].actions, ctx);
    YAML::Node out;
    out["choice_index"] = i;
    out["results"] = results_to_yaml(results);
    if (!all_succeeded(results)) {
      return ActionOutcome::failure("Action in choice " + std::to_string(i) +
                                        " failed",
                                    out);
    }
    return ActionOutcome::success(out);
  }

  if (!default_actions_.empty()) {
    const auto results = run_sequence(default_actions_, ctx);
    YAML::Node out;
    out["choice"] = "default";
    out["results"] = results_to_yaml(results);
    if (!all_succeeded(results)) {
      return ActionOutcome::failure("Action in default choice failed", out);
    }
    return ActionOutcome::success(out);
  }

  return ActionOutcome::failure("No matching choice found and no default action");
}

void ChooseAction::describe(YAML::Node &out) const {
  YAML::Node choices(YAML::NodeType::Sequence);
  for (const auto &choice : choices_) {
    YAML::Node entry;
    YAML::Node conditions(YAML::NodeType::Sequence);
    for (const auto &condition : choice.conditions) {
      conditions.push_back(condition->to_yaml());
    }
    entry["conditions"] = conditions;
    entry["actions"] = actions_to_yaml(choice.actions);
    choices.push_back(entry);
  }
  out["choices"] = choices;
  if (!default_actions_.empty()) {
    out["default"] = actions_to_yaml(default_actions_);
  }
}

// -----------------------------
// ParallelAction
// -----------------------------

ParallelAction::ParallelAction(std::string action_id,
                               std::vector<ActionPtr> actions, int max_parallel)
    : Action(std::move(action_id), ActionType::Parallel),
      actions_(std::move(actions)), max_parallel_(max_parallel) {
  if (max_parallel_ < 0) {
    throw std::invalid_argument("max_parallel must not be negative");
  }
}

ActionOutcome ParallelAction::run(const Context &ctx) const {
  std::unique_ptr<auto_core::CountingSemaphore> limiter;
  if (max_parallel_ > 0) {
    limiter = std::make_unique<auto_core::CountingSemaphore>(max_parallel_);
  }
  auto_core::CountingSemaphore *sem = limiter.get();

  std::vector<std::future<ActionResult>> pending;
  pending.reserve(actions_.size());
  for (const auto &action : actions_) {
    const Action *child = action.get();
    pending.push_back(std::async(std::launch::async, [child, sem, &ctx] {
      auto_core::SemaphoreGuard permit(sem);
      return child->execute(ctx);
    }));
  }

  std::vector<ActionResult> results;
  results.reserve(pending.size());
  for (auto &future : pending) {
    results.push_back(future.get());
  }

  int success_count = 0;
  for (const auto &result : results) {
    if (result.success) {
      ++success_count;
    }
  }
  const int error_count = static_cast<int>(results.size()) - success_count;

  YAML::Node out;
  out["total_actions"] = actions_.size();
  out["success_count"] = success_count;
  out["error_count"] = error_count;
  out["results"] = results_to_yaml(results);
  if (error_count > 0) {
    return ActionOutcome::failure(std::to_string(error_count) + " of " +
                                      std::to_string(results.size()) +
                                      " parallel actions failed",
                                  out);
  }
  return ActionOutcome::success(out);
}

void ParallelAction::describe(YAML::Node &out) const {
  out["actions"] = actions_to_yaml(actions_);
  if (max_parallel_ > 0) {
    out["max_parallel"] = max_parallel_;
  }
}

// -----------------------------
// RepeatAction
// -----------------------------

RepeatAction::RepeatAction(std::string action_id, std::string repeat,
                           std::vector<ActionPtr> sequence,
                           std::optional<std::string> repeat_template)
    : Action(std::move(action_id), ActionType::Repeat),
      repeat_(std::move(repeat)), sequence_(std::move(sequence)),
      repeat_template_(std::move(repeat_template)) {}

ActionOutcome RepeatAction::run(const Context &ctx) const {
  const std::string text = repeat_template_ ? ctx.render(*repeat_template_)
                                            : ctx.render_or_raw(repeat_);
  long count = 0;
  try {
    std::size_t consumed = 0;
    count = std::stol(text, &consumed);
    if (consumed != text.size()) {
      return ActionOutcome::failure("Invalid repeat count: '" + text + "'");
    }
  } catch (const std::logic_error &) {
    return ActionOutcome::failure("Invalid repeat count: '" + text + "'");
  }
  if (count < 0) {
    return ActionOutcome::failure("Invalid repeat count: '" + text + "'");
  }

  std::vector<ActionResult> results;
  for (long i = 0; i < count; ++i) {
    if (ctx.cancel && ctx.cancel->is_cancelled()) {
      break;
    }
    const Context iteration = ctx.with_variable("repeat_index", YAML::Node(i))
                                  .with_variable("repeat_count",
                                                 YAML::Node(count));
    for (auto &result : run_sequence(sequence_, iteration)) {
      results.push_back(std::move(result));
    }
  }

  YAML::Node out;
  out["repeat_count"] = count;
  out["results"] = results_to_yaml(results);
  if (ctx.cancel && ctx.cancel->is_cancelled()) {
    return ActionOutcome::failure("Cancelled", out);
  }
  if (!all_succeeded(results)) {
    return ActionOutcome::failure("Action in repeat sequence failed", out);
  }
  return ActionOutcome::success(out);
}

void RepeatAction::describe(YAML::Node &out) const {
  out["repeat"] = repeat_;
  if (repeat_template_) {
    out["repeat_template"] = *repeat_template_;
  }
  out["sequence"] = actions_to_yaml(sequence_);
}

} // namespace auto_actions
