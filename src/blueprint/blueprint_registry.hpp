#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "blueprint/blueprint.hpp"

namespace auto_blueprint {

struct BlueprintFilter {
  std::optional<std::string> domain; // exact match
  std::optional<std::string> name;   // case-insensitive substring
  std::optional<std::string> author; // case-insensitive substring
};

struct BlueprintStatistics {
  std::size_t total_blueprints = 0;
  std::size_t total_instances = 0;
  std::map<std::string, std::size_t> by_domain;

  YAML::Node to_yaml() const;
};

/**
 * @brief Keyed store of blueprints, in registration order.
 *
 * Thread Safety:
 *   All methods are mutex-protected and may be called from any thread.
 */
class BlueprintRegistry {
public:
  // false when the id is already registered
  bool register_blueprint(std::shared_ptr<Blueprint> blueprint);
  bool unregister_blueprint(const std::string &blueprint_id);

  std::shared_ptr<Blueprint> get(const std::string &blueprint_id) const;
  std::vector<std::shared_ptr<Blueprint>> list() const;
  std::vector<std::shared_ptr<Blueprint>>
  search(const BlueprintFilter &filter) const;

  BlueprintStatistics statistics() const;

private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Blueprint>> blueprints_;
};

} // namespace auto_blueprint
