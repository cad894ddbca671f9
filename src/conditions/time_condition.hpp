#pragma once

#include <optional>
#include <string>
#include <vector>

#include "conditions/condition.hpp"

namespace auto_conditions {

// Local time inside [after, before] (wrapping past midnight when
// after > before) and, when given, on one of the listed weekdays
class TimeCondition : public Condition {
public:
  TimeCondition(ConditionConfig config, std::optional<std::string> after,
                std::optional<std::string> before,
                std::vector<std::string> weekdays);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::optional<std::string> after_;
  std::optional<std::string> before_;
  std::vector<std::string> weekdays_;
  std::optional<int> after_seconds_;
  std::optional<int> before_seconds_;
};

// Now is before and/or after a sun event (plus offset seconds). A bound whose
// event is missing from the snapshot is not checked.
class SunCondition : public Condition {
public:
  SunCondition(ConditionConfig config, std::optional<std::string> before,
               std::optional<std::string> after, double before_offset,
               double after_offset);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::optional<std::string> before_;
  std::optional<std::string> after_;
  double before_offset_;
  double after_offset_;
};

// Rendered template is truthy
class TemplateCondition : public Condition {
public:
  TemplateCondition(ConditionConfig config, std::string value_template);

protected:
  bool test(const Context &ctx) const override;
  void describe(YAML::Node &out) const override;

private:
  std::string value_template_;
};

} // namespace auto_conditions
