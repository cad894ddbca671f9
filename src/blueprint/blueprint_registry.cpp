#include "blueprint/blueprint_registry.hpp"

#include <algorithm>
#include <iostream>

#include "core/value_utils.hpp"

namespace auto_blueprint {

using auto_core::lower;

YAML::Node BlueprintStatistics::to_yaml() const {
  YAML::Node out;
  out["total_blueprints"] = total_blueprints;
  out["total_instances"] = total_instances;
  out["by_domain"] = YAML::Node(YAML::NodeType::Map);
  for (const auto &[domain, count] : by_domain) {
    out["by_domain"][domain] = count;
  }
  return out;
}

bool BlueprintRegistry::register_blueprint(
    std::shared_ptr<Blueprint> blueprint) {
  if (!blueprint) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &existing : blueprints_) {
    if (existing->id() == blueprint->id()) {
      std::cerr << "[Blueprint] WARNING: blueprint '" << blueprint->id()
                << "' already registered" << std::endl;
      return false;
    }
  }
  blueprints_.push_back(std::move(blueprint));
  return true;
}

bool BlueprintRegistry::unregister_blueprint(const std::string &blueprint_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(blueprints_.begin(), blueprints_.end(),
                         [&](const std::shared_ptr<Blueprint> &blueprint) {
                           return blueprint->id() == blueprint_id;
                         });
  if (it == blueprints_.end()) {
    return false;
  }
  blueprints_.erase(it);
  return true;
}

std::shared_ptr<Blueprint>
BlueprintRegistry::get(const std::string &blueprint_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &blueprint : blueprints_) {
    if (blueprint->id() == blueprint_id) {
      return blueprint;
    }
  }
  return nullptr;
}

std::vector<std::shared_ptr<Blueprint>> BlueprintRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blueprints_;
}

std::vector<std::shared_ptr<Blueprint>>
BlueprintRegistry::search(const BlueprintFilter &filter) const {
  std::vector<std::shared_ptr<Blueprint>> out;
  for (const auto &blueprint : list()) {
    if (filter.domain && blueprint->domain() != filter.domain) {
      continue;
    }
    if (filter.name &&
        lower(blueprint->name()).find(lower(*filter.name)) ==
            std::string::npos) {
      continue;
    }
    if (filter.author &&
        (!blueprint->author() ||
         lower(*blueprint->author()).find(lower(*filter.author)) ==
             std::string::npos)) {
      continue;
    }
    out.push_back(blueprint);
  }
  return out;
}

BlueprintStatistics BlueprintRegistry::statistics() const {
  BlueprintStatistics stats;
  for (const auto &blueprint : list()) {
    ++stats.total_blueprints;
    stats.total_instances += blueprint->instance_count();
    if (blueprint->domain()) {
      ++stats.by_domain[*blueprint->domain()];
    }
  }
  return stats;
}

} // namespace auto_blueprint
