#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "core/context.hpp"
#include "engine/automation.hpp"

namespace auto_engine {

struct EngineOptions {
  double tick_rate_hz = 1.0;
  std::size_t history_limit = 100;
  int max_parallel_runs = 32;
};

struct EngineHealth {
  bool running = false;
  std::size_t automation_count = 0;
  std::size_t enabled_count = 0;
  std::size_t running_count = 0; // automations with a tracked run
  std::size_t in_flight_runs = 0;
  uint64_t tick_count = 0;
  std::optional<std::string> last_tick_error;

  YAML::Node to_yaml() const;
};

/**
 * @brief Registry of automations plus the scheduler that drives them.
 *
 * Each tick assembles one StateSnapshot (old_states = the previous tick's
 * entities) and fires every enabled automation's triggers in registration
 * order. Queued events and bus messages are then evaluated one snapshot
 * each, against Event and MQTT triggers only. A fired trigger dispatches a
 * run of its automation on a worker thread; the execution mode decides
 * admission on the ticker thread, so admission follows fire order.
 *
 * Thread Safety:
 *   World-state updates, registry changes and queries may come from any
 *   thread. tick() is driven by the ticker thread (or directly by tests).
 */
class AutomationEngine {
public:
  using ClockFn = std::function<auto_core::TimePoint()>;

  explicit AutomationEngine(
      EngineOptions options,
      std::shared_ptr<const auto_core::Capabilities> capabilities = nullptr);
  ~AutomationEngine();

  AutomationEngine(const AutomationEngine &) = delete;
  AutomationEngine &operator=(const AutomationEngine &) = delete;

  // ---- Lifecycle ----

  void start();
  // Stops the ticker, cancels tracked runs and waits for in-flight runs
  void stop();
  bool is_running() const { return ticker_running_.load(); }

  // One scheduler iteration
  void tick();

  // Blocks until every dispatched run has finished
  void wait_for_idle();

  // Test hook: replaces the wall clock used for snapshots
  void set_clock(ClockFn clock);

  // ---- Registry ----

  // Throws std::invalid_argument on a duplicate id
  void register_automation(std::shared_ptr<Automation> automation);
  bool unregister_automation(const std::string &automation_id);
  std::shared_ptr<Automation> get_automation(const std::string &id) const;
  std::vector<std::shared_ptr<Automation>> list_automations() const;
  // Case-insensitive substring match on name or description
  std::vector<std::shared_ptr<Automation>>
  search_automations(const std::string &query) const;
  bool set_enabled(const std::string &automation_id, bool enabled);

  /**
   * @brief Manual run outside the trigger path.
   *
   * With wait=true the run executes on the calling thread and the finished
   * record is returned. Otherwise it is dispatched like a trigger fire and
   * the returned record is not yet completed (or is the completed rejection).
   * Throws std::out_of_range for an unknown id and std::logic_error for a
   * disabled automation.
   */
  AutomationExecution
  trigger_automation(const std::string &automation_id,
                     const std::map<std::string, YAML::Node> &variables,
                     bool skip_conditions, bool wait);

  // ---- World state ----

  void update_entities(const std::map<std::string, auto_core::EntityState> &upserts,
                       const std::vector<std::string> &removals);
  void set_devices(const std::map<std::string, auto_core::DeviceInfo> &devices);
  void set_sun_events(const std::map<std::string, auto_core::TimePoint> &events);
  void fire_event(auto_core::EventData event);
  void publish_mqtt(auto_core::MqttMessage message);

  std::map<std::string, auto_core::EntityState> entities() const;

  EngineHealth health() const;
  const EngineOptions &options() const { return options_; }

private:
  struct Registration {
    std::shared_ptr<Automation> automation;
    std::vector<int> subscriptions; // one per trigger
  };

  enum class PassKind { Tick, Event, Mqtt };

  void ticker_thread();
  // Detaches every trigger callback that captures this engine
  void unsubscribe_all();
  void evaluate_pass(const std::shared_ptr<const auto_core::StateSnapshot> &snapshot,
                     PassKind kind);
  void dispatch(const std::shared_ptr<Automation> &automation,
                const auto_triggers::TriggerData &data);
  bool launch(const std::shared_ptr<Automation> &automation,
              const ExecutionTicket &ticket, auto_core::Context ctx,
              bool skip_conditions);
  void prune_finished_runs();
  std::size_t in_flight_runs() const;
  auto_core::Context make_base_context(
      std::shared_ptr<const auto_core::StateSnapshot> snapshot) const;

  EngineOptions options_;
  std::shared_ptr<const auto_core::Capabilities> capabilities_;
  std::shared_ptr<const auto_core::TemplateRenderer> renderer_;

  // Registry (registration order)
  mutable std::mutex registry_mutex_;
  std::vector<Registration> registrations_;

  // World state
  mutable std::mutex world_mutex_;
  std::map<std::string, auto_core::EntityState> entities_;
  std::optional<std::map<std::string, auto_core::EntityState>> previous_entities_;
  std::map<std::string, auto_core::DeviceInfo> devices_;
  std::map<std::string, auto_core::TimePoint> sun_events_;
  std::deque<auto_core::EventData> pending_events_;
  std::deque<auto_core::MqttMessage> pending_mqtt_;
  ClockFn clock_;

  // In-flight runs
  mutable std::mutex runs_mutex_;
  std::list<std::future<void>> runs_;

  // Tick bookkeeping
  std::mutex tick_mutex_;
  std::atomic<uint64_t> tick_count_{0};
  mutable std::mutex health_mutex_;
  std::optional<std::string> last_tick_error_;

  // Ticker thread
  std::unique_ptr<std::thread> ticker_thread_;
  std::atomic<bool> ticker_running_{false};
};

} // namespace auto_engine
