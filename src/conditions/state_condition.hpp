#pragma once

#include <optional>
#include <regex>
#include <string>

#include "conditions/condition.hpp"

namespace auto_conditions {

/**
 * @brief Compares an entity state (or attribute) against a target.
 *
 * `state` is an exact match unless `match` is set, in which case a
 * `regex:<pattern>` or `glob:<pattern>` prefix selects pattern matching.
 * `state_not` rejects one value. A missing entity never matches.
 */
class StateCondition : public Condition {
public:
  StateCondition(ConditionConfig config, std::string entity_id,
                 std::optional<std::string> state,
                 std::optional<std::string> state_not,
                 std::optional<std::string> attribute, bool match);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string entity_id_;
  std::optional<std::string> state_;
  std::optional<std::string> state_not_;
  std::optional<std::string> attribute_;
  bool match_;
  std::optional<std::regex> pattern_; // compiled regex:/glob: target
};

// Value strictly inside (above, below); non-numeric values never match
class NumericStateCondition : public Condition {
public:
  NumericStateCondition(ConditionConfig config, std::string entity_id,
                        std::optional<double> above,
                        std::optional<double> below,
                        std::optional<std::string> attribute);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string entity_id_;
  std::optional<double> above_;
  std::optional<double> below_;
  std::optional<std::string> attribute_;
};

// Entity's `zone` attribute equals the configured zone
class ZoneCondition : public Condition {
public:
  ZoneCondition(ConditionConfig config, std::string entity_id,
                std::string zone);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string entity_id_;
  std::string zone_;
};

// Device is known and matches every configured field
class DeviceCondition : public Condition {
public:
  DeviceCondition(ConditionConfig config, std::string device_id,
                  std::optional<std::string> entity_id,
                  std::optional<std::string> domain,
                  std::optional<std::string> device_type,
                  std::optional<std::string> state);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string device_id_;
  std::optional<std::string> entity_id_;
  std::optional<std::string> domain_;
  std::optional<std::string> device_type_;
  std::optional<std::string> state_;
};

// Translate a shell-style glob (`*`, `?`) into an anchored regex
std::string glob_to_regex(const std::string &glob);

} // namespace auto_conditions
