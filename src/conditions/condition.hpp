#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "core/context.hpp"

namespace auto_conditions {

using auto_core::Context;

enum class ConditionType {
  State,
  NumericState,
  Time,
  Template,
  Device,
  Zone,
  Sun,
  And,
  Or,
  Not
};

const char *condition_type_name(ConditionType type);

// Throws std::runtime_error listing the valid condition names
ConditionType parse_condition_type(const std::string &name);

struct ConditionConfig {
  std::string condition_id;
  ConditionType type = ConditionType::State;
  bool enabled = true;
  std::map<std::string, YAML::Node> variables;
};

/**
 * @brief Stateless predicate over a context snapshot.
 *
 * evaluate() is total: a disabled condition is true, and a value that cannot
 * be resolved (missing entity, failed numeric cast, template error) makes
 * the condition false.
 */
class Condition {
public:
  explicit Condition(ConditionConfig config) : config_(std::move(config)) {}
  virtual ~Condition() = default;

  Condition(const Condition &) = delete;
  Condition &operator=(const Condition &) = delete;

  bool evaluate(const Context &ctx) const;

  // Configuration map accepted by create_condition()
  YAML::Node to_yaml() const;

  const ConditionConfig &config() const { return config_; }
  const std::string &id() const { return config_.condition_id; }
  ConditionType type() const { return config_.type; }

protected:
  virtual bool test(const Context &ctx) const = 0;
  virtual void describe(YAML::Node &out) const = 0;

private:
  ConditionConfig config_;
};

using ConditionPtr = std::unique_ptr<Condition>;

// True when every condition holds (stops at the first false)
bool all_of(const std::vector<ConditionPtr> &conditions, const Context &ctx);

class AndCondition : public Condition {
public:
  AndCondition(ConditionConfig config, std::vector<ConditionPtr> conditions);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::vector<ConditionPtr> conditions_;
};

class OrCondition : public Condition {
public:
  OrCondition(ConditionConfig config, std::vector<ConditionPtr> conditions);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::vector<ConditionPtr> conditions_;
};

class NotCondition : public Condition {
public:
  NotCondition(ConditionConfig config, ConditionPtr condition);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  ConditionPtr condition_;
};

} // namespace auto_conditions
