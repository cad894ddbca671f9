#pragma once

#include <memory>
#include <string>
#include <yaml-cpp/yaml.h>

#include "triggers/trigger.hpp"

namespace auto_triggers {

/**
 * @brief Build a trigger from a raw configuration map.
 *
 * The variant is selected by `platform` (default "state"). Common keys:
 * `id` (falls back to default_id), `enabled`, `cooldown`, `for`,
 * `variables`. Throws std::runtime_error naming the offending field.
 */
std::unique_ptr<Trigger> create_trigger(const YAML::Node &config,
                                        const std::string &default_id);

} // namespace auto_triggers
