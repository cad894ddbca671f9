#pragma once

#include <optional>
#include <string>
#include <vector>

#include "triggers/trigger.hpp"

namespace auto_triggers {

/**
 * @brief Wall-clock trigger.
 *
 * Matches when any configured form matches:
 *   - `at`: the local time of day, within one second
 *   - `after` / `before`: inside the window (wraps past midnight when
 *     after > before); either bound alone is an open window
 *   - `interval`: on the first evaluation, then every interval seconds
 * A `weekday` list restricts all forms to those days.
 */
class TimeTrigger : public Trigger {
public:
  TimeTrigger(TriggerConfig config, std::optional<std::string> at,
              std::optional<std::string> after,
              std::optional<std::string> before,
              std::vector<std::string> weekdays,
              std::optional<std::string> interval);

  bool check(const Context &ctx) override;

  std::optional<double> interval_seconds() const { return interval_seconds_; }

protected:
  void describe(YAML::Node &out) const override;

private:
  bool at_matches(TimePoint now);
  bool window_matches(TimePoint now) const;
  bool interval_matches(TimePoint now);

  std::optional<std::string> at_;
  std::optional<std::string> after_;
  std::optional<std::string> before_;
  std::vector<std::string> weekdays_;
  std::optional<std::string> interval_;

  std::optional<int> at_seconds_;
  std::optional<int> after_seconds_;
  std::optional<int> before_seconds_;
  std::optional<double> interval_seconds_;

  std::optional<TimePoint> last_at_match_;
  std::optional<TimePoint> last_interval_fire_;
};

// Fires at sunrise/sunset (plus offset seconds), within one second
class SunTrigger : public Trigger {
public:
  SunTrigger(TriggerConfig config, std::string event, double offset);

  bool check(const Context &ctx) override;

protected:
  void describe(YAML::Node &out) const override;
  void annotate(const Context &ctx, YAML::Node &details) const override;

private:
  std::string event_;
  double offset_;
  std::optional<TimePoint> last_match_;
};

} // namespace auto_triggers
