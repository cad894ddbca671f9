#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "actions/action.hpp"

namespace auto_actions {

/**
 * @brief Build an action (and its children) from a raw configuration map.
 *
 * The variant is selected by `action` (default "service");
 * `activate_scene` and `deactivate_scene` are aliases of `scene` with a
 * fixed direction. Common keys: `id` (falls back to default_id), `enabled`,
 * `metadata`. Throws std::runtime_error naming the offending field.
 */
ActionPtr create_action(const YAML::Node &config,
                        const std::string &default_id);

// Build every entry of a sequence, ids default to "<prefix>_<index>"
std::vector<ActionPtr> create_actions(const YAML::Node &list,
                                      const std::string &prefix);

} // namespace auto_actions
