#pragma once

#include <optional>
#include <string>
#include <vector>

#include "actions/action.hpp"
#include "conditions/condition.hpp"

namespace auto_actions {

/**
 * @brief Suspends the current branch.
 *
 * The duration comes from `delay_template` when set, else from `delay`
 * (seconds, "HH:MM:SS" or unit text like "1h30m"). The wait ends early when
 * the run is cancelled, which fails the action with "Cancelled".
 */
class DelayAction : public Action {
public:
  DelayAction(std::string action_id, std::string delay,
              std::optional<std::string> delay_template);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string delay_;
  std::optional<std::string> delay_template_;
};

struct Choice {
  std::vector<auto_conditions::ConditionPtr> conditions;
  std::vector<ActionPtr> actions;
};

// Runs the actions of the first choice whose conditions all hold, else the
// default actions. Succeeds when every action it ran succeeded.
class ChooseAction : public Action {
public:
  ChooseAction(std::string action_id, std::vector<Choice> choices,
               std::vector<ActionPtr> default_actions);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::vector<Choice> choices_;
  std::vector<ActionPtr> default_actions_;
};

// Runs children concurrently, at most max_parallel at a time (unbounded
// when zero). Results keep declaration order.
class ParallelAction : public Action {
public:
  ParallelAction(std::string action_id, std::vector<ActionPtr> actions,
                 int max_parallel);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::vector<ActionPtr> actions_;
  int max_parallel_;
};

/**
 * @brief Runs `sequence` a resolved number of times.
 *
 * Each iteration sees `repeat_index` (0-based) and `repeat_count` as
 * variables. The count comes from `repeat_template` when set, else from
 * `repeat` (a literal or a template).
 */
class RepeatAction : public Action {
public:
  RepeatAction(std::string action_id, std::string repeat,
               std::vector<ActionPtr> sequence,
               std::optional<std::string> repeat_template);

protected:
  ActionOutcome run(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string repeat_;
  std::vector<ActionPtr> sequence_;
  std::optional<std::string> repeat_template_;
};

} // namespace auto_actions
