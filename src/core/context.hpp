#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "core/cancellation.hpp"

namespace auto_core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class TemplateRenderer;

// State of one entity as seen by the engine at a tick
struct EntityState {
  std::string state;
  std::map<std::string, YAML::Node> attributes;
};

struct EventData {
  std::string event_type;
  YAML::Node data; // map, may be null
};

struct MqttMessage {
  std::string topic;
  std::string payload;
};

struct DeviceInfo {
  std::string domain;
  std::string type;
  std::string state = "unknown";
  std::vector<std::string> entities;
};

/**
 * @brief Read-only view of the world handed to triggers, conditions and
 * actions.
 *
 * A snapshot is assembled once per scheduler tick and shared (immutably)
 * between every evaluation made during that tick and every run it starts.
 */
struct StateSnapshot {
  TimePoint now = Clock::now();
  std::map<std::string, EntityState> entities;
  std::map<std::string, EntityState> old_states; // entities at previous tick
  std::optional<EventData> event;
  std::optional<MqttMessage> mqtt_message;
  std::map<std::string, TimePoint> sun_events; // "sunrise" / "sunset"
  std::map<std::string, DeviceInfo> devices;
};

// ---- Injected capabilities ----

enum class LogLevel { Debug, Info, Warning, Error };

const char *log_level_name(LogLevel level);

// Throws std::invalid_argument for unknown names
LogLevel parse_log_level(const std::string &name);

// Invoke a device/service action, returns the service result (may be null).
// Failures are reported by throwing.
using ServiceCaller =
    std::function<YAML::Node(const std::string &service, const YAML::Node &data)>;

using ScriptExecutor = std::function<YAML::Node(
    const std::string &script_id,
    const std::map<std::string, YAML::Node> &variables)>;

using Notifier = std::function<void(const std::string &message,
                                    const std::optional<std::string> &title,
                                    const std::optional<std::string> &target)>;

using LogSink = std::function<void(LogLevel level, const std::string &message)>;

class SceneExecutor {
public:
  virtual ~SceneExecutor() = default;

  virtual void activate_scene(const std::string &scene_id) = 0;
  virtual void deactivate_scene(const std::string &scene_id) = 0;
};

// Every member is optional; actions report a failure when theirs is missing
struct Capabilities {
  ServiceCaller service_caller;
  ScriptExecutor script_executor;
  Notifier notifier;
  std::shared_ptr<SceneExecutor> scene_executor;
  LogSink logger;
};

// Default logger: "[LogAction] LEVEL: message" on stderr
LogSink stderr_log_sink();

/**
 * @brief Evaluation context threaded through every check/evaluate/execute
 * call.
 *
 * Copying a Context is cheap: the snapshot, capabilities and renderer are
 * shared. Only `variables` is per-branch (Repeat and Script inject into their
 * own copy).
 */
struct Context {
  std::shared_ptr<const StateSnapshot> state;
  std::map<std::string, YAML::Node> variables;
  std::shared_ptr<const Capabilities> capabilities;
  std::shared_ptr<const TemplateRenderer> renderer;
  std::shared_ptr<CancellationToken> cancel;

  TimePoint now() const;

  // nullptr when the entity is not present in the snapshot
  const EntityState *entity(const std::string &entity_id) const;
  const EntityState *old_entity(const std::string &entity_id) const;

  // Render a template through the shared renderer.
  // Throws TemplateError (also when no renderer is configured)
  std::string render(const std::string &tmpl) const;

  // Render and fall back to the raw text on TemplateError
  std::string render_or_raw(const std::string &tmpl) const;

  Context with_variable(const std::string &key, const YAML::Node &value) const;
};

// Build a context with a fresh cancellation token and the built-in
// expression renderer
Context make_context(std::shared_ptr<const StateSnapshot> state,
                     std::shared_ptr<const Capabilities> capabilities = nullptr);

} // namespace auto_core
