#include "engine/automation_engine.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include "core/template_renderer.hpp"
#include "core/value_utils.hpp"

namespace auto_engine {

using auto_core::Context;
using auto_core::StateSnapshot;
using auto_triggers::TriggerType;

YAML::Node EngineHealth::to_yaml() const {
  YAML::Node out;
  out["running"] = running;
  out["automation_count"] = automation_count;
  out["enabled_count"] = enabled_count;
  out["running_count"] = running_count;
  out["in_flight_runs"] = in_flight_runs;
  out["tick_count"] = tick_count;
  if (last_tick_error) {
    out["last_tick_error"] = *last_tick_error;
  } else {
    out["last_tick_error"] = YAML::Node(YAML::NodeType::Null);
  }
  return out;
}

AutomationEngine::AutomationEngine(
    EngineOptions options,
    std::shared_ptr<const auto_core::Capabilities> capabilities)
    : options_(options), capabilities_(std::move(capabilities)),
      renderer_(std::make_shared<auto_core::ExpressionRenderer>()) {
  if (!capabilities_) {
    capabilities_ = std::make_shared<auto_core::Capabilities>();
  }
  if (options_.tick_rate_hz <= 0.0) {
    throw std::invalid_argument("tick_rate_hz must be positive");
  }
  if (options_.max_parallel_runs < 1) {
    throw std::invalid_argument("max_parallel_runs must be at least 1");
  }
}

AutomationEngine::~AutomationEngine() {
  stop();
  unsubscribe_all();
}

// -----------------------------
// Lifecycle
// -----------------------------

void AutomationEngine::start() {
  if (ticker_running_.load()) {
    std::cerr << "[AutomationEngine] Already running" << std::endl;
    return;
  }

  std::cerr << "[AutomationEngine] Starting ticker thread" << std::endl;
  ticker_running_.store(true);
  ticker_thread_ =
      std::make_unique<std::thread>(&AutomationEngine::ticker_thread, this);
}

void AutomationEngine::stop() {
  if (ticker_running_.load()) {
    std::cerr << "[AutomationEngine] Stopping ticker thread" << std::endl;
    ticker_running_.store(false);
    if (ticker_thread_ && ticker_thread_->joinable()) {
      ticker_thread_->join();
    }
    std::cerr << "[AutomationEngine] Ticker thread stopped" << std::endl;
  }

  for (const auto &automation : list_automations()) {
    automation->cancel_all();
  }
  wait_for_idle();
}

void AutomationEngine::ticker_thread() {
  const double dt = 1.0 / options_.tick_rate_hz;
  const auto tick_duration =
      std::chrono::microseconds(static_cast<long long>(dt * 1e6));

  std::cerr << "[AutomationEngine] Ticker thread started (period="
            << tick_duration.count() << "us)" << std::endl;

  while (ticker_running_.load()) {
    auto tick_start = std::chrono::steady_clock::now();

    try {
      tick();
    } catch (const std::exception &e) {
      std::cerr << "[AutomationEngine] ERROR: tick failed: " << e.what()
                << std::endl;
      std::lock_guard<std::mutex> lock(health_mutex_);
      last_tick_error_ = e.what();
    }

    // Sleep until next tick
    auto elapsed = std::chrono::steady_clock::now() - tick_start;
    if (elapsed < tick_duration) {
      std::this_thread::sleep_for(tick_duration - elapsed);
    }
  }

  std::cerr << "[AutomationEngine] Ticker thread exiting" << std::endl;
}

void AutomationEngine::set_clock(ClockFn clock) {
  std::lock_guard<std::mutex> lock(world_mutex_);
  clock_ = std::move(clock);
}

Context AutomationEngine::make_base_context(
    std::shared_ptr<const StateSnapshot> snapshot) const {
  Context ctx;
  ctx.state = std::move(snapshot);
  ctx.capabilities = capabilities_;
  ctx.renderer = renderer_;
  ctx.cancel = std::make_shared<auto_core::CancellationToken>();
  return ctx;
}

void AutomationEngine::tick() {
  std::lock_guard<std::mutex> tick_lock(tick_mutex_);
  prune_finished_runs();

  auto base = std::make_shared<StateSnapshot>();
  std::deque<auto_core::EventData> events;
  std::deque<auto_core::MqttMessage> messages;
  {
    std::lock_guard<std::mutex> lock(world_mutex_);
    base->now = clock_ ? clock_() : auto_core::Clock::now();
    base->entities = entities_;
    base->old_states = previous_entities_ ? *previous_entities_ : entities_;
    base->sun_events = sun_events_;
    base->devices = devices_;
    previous_entities_ = entities_;
    events.swap(pending_events_);
    messages.swap(pending_mqtt_);
  }

  evaluate_pass(base, PassKind::Tick);

  // Queued inputs see the current entities without transitions
  for (auto &event : events) {
    auto snapshot = std::make_shared<StateSnapshot>(*base);
    snapshot->old_states = snapshot->entities;
    snapshot->event = std::move(event);
    evaluate_pass(snapshot, PassKind::Event);
  }
  for (auto &message : messages) {
    auto snapshot = std::make_shared<StateSnapshot>(*base);
    snapshot->old_states = snapshot->entities;
    snapshot->mqtt_message = std::move(message);
    evaluate_pass(snapshot, PassKind::Mqtt);
  }

  ++tick_count_;
}

void AutomationEngine::evaluate_pass(
    const std::shared_ptr<const StateSnapshot> &snapshot, PassKind kind) {
  const Context ctx = make_base_context(snapshot);

  for (const auto &automation : list_automations()) {
    if (!automation->enabled()) {
      continue;
    }
    try {
      for (const auto &trigger : automation->triggers()) {
        const TriggerType type = trigger->type();
        const bool wanted =
            kind == PassKind::Event ? type == TriggerType::Event
            : kind == PassKind::Mqtt
                ? type == TriggerType::Mqtt
                : type != TriggerType::Event && type != TriggerType::Mqtt;
        if (wanted) {
          trigger->fire(ctx);
        }
      }
    } catch (const std::exception &e) {
      std::cerr << "[AutomationEngine] ERROR: automation '" << automation->id()
                << "' failed during evaluation: " << e.what() << std::endl;
      std::lock_guard<std::mutex> lock(health_mutex_);
      last_tick_error_ = automation->id() + ": " + e.what();
    }
  }
}

// -----------------------------
// Dispatch
// -----------------------------

void AutomationEngine::dispatch(const std::shared_ptr<Automation> &automation,
                                const auto_triggers::TriggerData &data) {
  if (in_flight_runs() >= static_cast<std::size_t>(options_.max_parallel_runs)) {
    std::cerr << "[AutomationEngine] WARNING: max_parallel_runs ("
              << options_.max_parallel_runs << ") reached, run of '"
              << automation->id() << "' rejected" << std::endl;
    automation->record_rejection(data.trigger_id,
                                 "Engine max_parallel_runs reached");
    return;
  }

  auto ticket = automation->begin_execution(data.trigger_id);
  if (!ticket) {
    return;
  }

  Context ctx = data.context.with_variable("trigger", data.details);
  launch(automation, *ticket, std::move(ctx), false);
}

bool AutomationEngine::launch(const std::shared_ptr<Automation> &automation,
                              const ExecutionTicket &ticket, Context ctx,
                              bool skip_conditions) {
  try {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    runs_.push_back(std::async(
        std::launch::async, [automation, ticket, ctx, skip_conditions]() {
          automation->run(ticket, ctx, skip_conditions);
        }));
    return true;
  } catch (const std::system_error &e) {
    std::cerr << "[AutomationEngine] ERROR: cannot start run of '"
              << automation->id() << "': " << e.what() << std::endl;
  }
  // Close the admitted run without executing anything
  ticket.cancel->cancel("Failed to start run");
  automation->run(ticket, std::move(ctx), skip_conditions);
  return false;
}

void AutomationEngine::prune_finished_runs() {
  std::lock_guard<std::mutex> lock(runs_mutex_);
  for (auto it = runs_.begin(); it != runs_.end();) {
    if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      try {
        it->get();
      } catch (const std::exception &e) {
        std::cerr << "[AutomationEngine] ERROR: run failed: " << e.what()
                  << std::endl;
      }
      it = runs_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t AutomationEngine::in_flight_runs() const {
  std::lock_guard<std::mutex> lock(runs_mutex_);
  std::size_t count = 0;
  for (const auto &run : runs_) {
    if (run.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      ++count;
    }
  }
  return count;
}

void AutomationEngine::wait_for_idle() {
  while (true) {
    std::list<std::future<void>> batch;
    {
      std::lock_guard<std::mutex> lock(runs_mutex_);
      if (runs_.empty()) {
        return;
      }
      batch.splice(batch.end(), runs_);
    }
    for (auto &run : batch) {
      try {
        run.get();
      } catch (const std::exception &e) {
        std::cerr << "[AutomationEngine] ERROR: run failed: " << e.what()
                  << std::endl;
      }
    }
  }
}

// -----------------------------
// Registry
// -----------------------------

void AutomationEngine::register_automation(
    std::shared_ptr<Automation> automation) {
  if (!automation) {
    throw std::invalid_argument("automation must not be null");
  }
  std::lock_guard<std::mutex> lock(registry_mutex_);
  for (const auto &reg : registrations_) {
    if (reg.automation->id() == automation->id()) {
      throw std::invalid_argument("Automation already registered: " +
                                  automation->id());
    }
  }

  Registration reg;
  reg.automation = automation;
  std::weak_ptr<Automation> weak = automation;
  for (const auto &trigger : automation->triggers()) {
    reg.subscriptions.push_back(trigger->add_callback(
        [this, weak](const auto_triggers::TriggerData &data) {
          if (auto target = weak.lock()) {
            dispatch(target, data);
          }
        }));
  }
  registrations_.push_back(std::move(reg));

  std::cerr << "[AutomationEngine] Registered automation '"
            << automation->id() << "' (" << automation->triggers().size()
            << " triggers)" << std::endl;
}

void AutomationEngine::unsubscribe_all() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  for (const auto &reg : registrations_) {
    const auto &triggers = reg.automation->triggers();
    for (std::size_t i = 0; i < triggers.size() && i < reg.subscriptions.size();
         ++i) {
      triggers[i]->remove_callback(reg.subscriptions[i]);
    }
  }
  registrations_.clear();
}

bool AutomationEngine::unregister_automation(const std::string &automation_id) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  for (auto it = registrations_.begin(); it != registrations_.end(); ++it) {
    if (it->automation->id() != automation_id) {
      continue;
    }
    const auto &triggers = it->automation->triggers();
    for (std::size_t i = 0; i < triggers.size() && i < it->subscriptions.size();
         ++i) {
      triggers[i]->remove_callback(it->subscriptions[i]);
    }
    registrations_.erase(it);
    std::cerr << "[AutomationEngine] Unregistered automation '"
              << automation_id << "'" << std::endl;
    return true;
  }
  return false;
}

std::shared_ptr<Automation>
AutomationEngine::get_automation(const std::string &id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  for (const auto &reg : registrations_) {
    if (reg.automation->id() == id) {
      return reg.automation;
    }
  }
  return nullptr;
}

std::vector<std::shared_ptr<Automation>>
AutomationEngine::list_automations() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<std::shared_ptr<Automation>> out;
  out.reserve(registrations_.size());
  for (const auto &reg : registrations_) {
    out.push_back(reg.automation);
  }
  return out;
}

std::vector<std::shared_ptr<Automation>>
AutomationEngine::search_automations(const std::string &query) const {
  const std::string needle = auto_core::lower(query);
  std::vector<std::shared_ptr<Automation>> out;
  for (const auto &automation : list_automations()) {
    const AutomationConfig cfg = automation->config();
    if (auto_core::lower(cfg.name).find(needle) != std::string::npos ||
        auto_core::lower(cfg.description).find(needle) != std::string::npos) {
      out.push_back(automation);
    }
  }
  return out;
}

bool AutomationEngine::set_enabled(const std::string &automation_id,
                                   bool enabled) {
  auto automation = get_automation(automation_id);
  if (!automation) {
    return false;
  }
  automation->set_enabled(enabled);
  return true;
}

AutomationExecution AutomationEngine::trigger_automation(
    const std::string &automation_id,
    const std::map<std::string, YAML::Node> &variables, bool skip_conditions,
    bool wait) {
  auto automation = get_automation(automation_id);
  if (!automation) {
    throw std::out_of_range("Automation not found: " + automation_id);
  }
  if (!automation->enabled()) {
    throw std::logic_error("Automation is disabled: " + automation_id);
  }

  auto snapshot = std::make_shared<StateSnapshot>();
  {
    std::lock_guard<std::mutex> lock(world_mutex_);
    snapshot->now = clock_ ? clock_() : auto_core::Clock::now();
    snapshot->entities = entities_;
    snapshot->old_states = entities_;
    snapshot->sun_events = sun_events_;
    snapshot->devices = devices_;
  }

  Context ctx = make_base_context(snapshot);
  for (const auto &[key, value] : variables) {
    ctx.variables[key] = auto_core::clone_node(value);
  }
  YAML::Node trigger;
  trigger["id"] = "manual";
  trigger["platform"] = "manual";
  ctx.variables["trigger"] = trigger;

  if (wait) {
    return automation->execute(ctx, "manual", skip_conditions);
  }

  if (in_flight_runs() >= static_cast<std::size_t>(options_.max_parallel_runs)) {
    return automation->record_rejection("manual",
                                        "Engine max_parallel_runs reached");
  }
  AutomationExecution record;
  auto ticket = automation->begin_execution("manual", &record);
  if (!ticket) {
    return record;
  }

  record.execution_id = ticket->execution_id;
  record.automation_id = automation->id();
  record.started_at = ticket->started_at;
  record.triggered_by = ticket->triggered_by;
  record.context = auto_core::map_to_node(ctx.variables);
  record.completed = false;
  launch(automation, *ticket, std::move(ctx), skip_conditions);
  return record;
}

// -----------------------------
// World state
// -----------------------------

void AutomationEngine::update_entities(
    const std::map<std::string, auto_core::EntityState> &upserts,
    const std::vector<std::string> &removals) {
  std::lock_guard<std::mutex> lock(world_mutex_);
  for (const auto &[entity_id, state] : upserts) {
    entities_[entity_id] = state;
  }
  for (const auto &entity_id : removals) {
    entities_.erase(entity_id);
  }
}

void AutomationEngine::set_devices(
    const std::map<std::string, auto_core::DeviceInfo> &devices) {
  std::lock_guard<std::mutex> lock(world_mutex_);
  devices_ = devices;
}

void AutomationEngine::set_sun_events(
    const std::map<std::string, auto_core::TimePoint> &events) {
  std::lock_guard<std::mutex> lock(world_mutex_);
  sun_events_ = events;
}

void AutomationEngine::fire_event(auto_core::EventData event) {
  std::lock_guard<std::mutex> lock(world_mutex_);
  pending_events_.push_back(std::move(event));
}

void AutomationEngine::publish_mqtt(auto_core::MqttMessage message) {
  std::lock_guard<std::mutex> lock(world_mutex_);
  pending_mqtt_.push_back(std::move(message));
}

std::map<std::string, auto_core::EntityState>
AutomationEngine::entities() const {
  std::lock_guard<std::mutex> lock(world_mutex_);
  return entities_;
}

EngineHealth AutomationEngine::health() const {
  EngineHealth out;
  out.running = ticker_running_.load();
  for (const auto &automation : list_automations()) {
    ++out.automation_count;
    if (automation->enabled()) {
      ++out.enabled_count;
    }
    if (automation->running_count() > 0) {
      ++out.running_count;
    }
  }
  out.in_flight_runs = in_flight_runs();
  out.tick_count = tick_count_.load();
  std::lock_guard<std::mutex> lock(health_mutex_);
  out.last_tick_error = last_tick_error_;
  return out;
}

} // namespace auto_engine
