#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

#include "conditions/condition.hpp"

namespace auto_conditions {

/**
 * @brief Build a condition from a raw configuration map.
 *
 * The variant is selected by `condition` (default "state"). And/Or/Not read
 * their children from `conditions`; Not takes exactly one. Throws
 * std::runtime_error naming the offending field.
 */
ConditionPtr create_condition(const YAML::Node &config,
                              const std::string &default_id);

} // namespace auto_conditions
