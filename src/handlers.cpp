#include "handlers.hpp"

#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/value_utils.hpp"
#include "transport/framed_stdio.hpp"

namespace handlers {

using pb::Status;

namespace {

const char *kEngineName = "butler-automation";
const char *kEngineVersion = "1.0.0";

inline void set_status_ok(pb::Response &resp) {
  resp.mutable_status()->set_code(Status::CODE_OK);
  resp.mutable_status()->set_message("ok");
}

inline void set_status(pb::Response &resp, Status::Code code,
                       const std::string &msg) {
  resp.mutable_status()->set_code(code);
  resp.mutable_status()->set_message(msg);
}

std::string to_text(const YAML::Node &node) {
  YAML::Emitter out;
  out << node;
  return out.c_str();
}

// Empty text is an empty map. nullopt (status set) on malformed input.
std::optional<YAML::Node> parse_map(const std::string &text,
                                    const std::string &field,
                                    pb::Response &resp) {
  if (text.empty()) {
    return YAML::Node(YAML::NodeType::Map);
  }
  YAML::Node node;
  try {
    node = YAML::Load(text);
  } catch (const YAML::Exception &e) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT,
               field + ": invalid YAML: " + e.what());
    return std::nullopt;
  }
  if (node.IsNull()) {
    return YAML::Node(YAML::NodeType::Map);
  }
  if (!node.IsMap()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, field + ": expected a map");
    return std::nullopt;
  }
  return node;
}

void fill_summary(const auto_engine::Automation &automation,
                  pb::AutomationSummary &out) {
  const auto config = automation.config();
  const auto state = automation.state();
  out.set_automation_id(config.automation_id);
  out.set_name(config.name);
  out.set_description(config.description);
  out.set_enabled(config.enabled);
  out.set_mode(auto_engine::execution_mode_name(config.mode));
  out.set_is_running(state.is_running);
  out.set_trigger_count(state.trigger_count);
  out.set_total_runs(state.total_runs);
  out.set_blueprint_id(config.blueprint_id.value_or(""));
}

void fill_execution(const auto_engine::AutomationExecution &execution,
                    pb::ExecutionRecord &out) {
  out.set_execution_id(execution.execution_id);
  out.set_triggered_by(execution.triggered_by);
  out.set_completed(execution.completed);
  out.set_error(execution.error.value_or(""));
  out.set_execution_yaml(to_text(execution.to_yaml()));
}

std::shared_ptr<auto_engine::Automation>
find_automation(Runtime &rt, const std::string &automation_id,
                pb::Response &resp) {
  if (automation_id.empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT,
               "automation_id is required");
    return nullptr;
  }
  auto automation = rt.engine.get_automation(automation_id);
  if (!automation) {
    set_status(resp, Status::CODE_NOT_FOUND,
               "unknown automation_id: " + automation_id);
  }
  return automation;
}

} // namespace

void handle_hello(Runtime &rt, const pb::HelloRequest &req,
                  pb::Response &resp) {
  if (req.protocol_version() != "v1") {
    set_status(resp, Status::CODE_FAILED_PRECONDITION,
               "unsupported protocol_version; expected v1");
    return;
  }

  auto *hello = resp.mutable_hello();
  hello->set_protocol_version("v1");
  hello->set_engine_name(kEngineName);
  hello->set_engine_version(kEngineVersion);

  auto &metadata = *hello->mutable_metadata();
  metadata["transport"] = "stdio+uint32_le";
  metadata["max_frame_bytes"] = std::to_string(transport::kMaxFrameBytes);
  metadata["tick_rate_hz"] =
      auto_core::node_to_string(YAML::Node(rt.engine.options().tick_rate_hz));
  metadata["max_parallel_runs"] =
      std::to_string(rt.engine.options().max_parallel_runs);

  set_status_ok(resp);
}

void handle_get_health(Runtime &rt, const pb::GetHealthRequest & /*req*/,
                       pb::Response &resp) {
  const auto health = rt.engine.health();
  auto *out = resp.mutable_get_health();
  out->set_running(health.running);
  out->set_automation_count(static_cast<uint32_t>(health.automation_count));
  out->set_enabled_count(static_cast<uint32_t>(health.enabled_count));
  out->set_running_count(static_cast<uint32_t>(health.running_count));
  out->set_in_flight_runs(static_cast<uint32_t>(health.in_flight_runs));
  out->set_tick_count(health.tick_count);
  out->set_last_tick_error(health.last_tick_error.value_or(""));
  out->set_pending_commands(
      rt.outbox ? static_cast<uint32_t>(rt.outbox->size()) : 0);
  set_status_ok(resp);
}

void handle_list_automations(Runtime &rt,
                             const pb::ListAutomationsRequest &req,
                             pb::Response &resp) {
  const auto automations = req.query().empty()
                               ? rt.engine.list_automations()
                               : rt.engine.search_automations(req.query());
  auto *out = resp.mutable_list_automations();
  for (const auto &automation : automations) {
    fill_summary(*automation, *out->add_automations());
  }
  set_status_ok(resp);
}

void handle_get_automation(Runtime &rt, const pb::GetAutomationRequest &req,
                           pb::Response &resp) {
  auto automation = find_automation(rt, req.automation_id(), resp);
  if (!automation) {
    return;
  }
  auto *out = resp.mutable_get_automation();
  fill_summary(*automation, *out->mutable_summary());
  out->set_automation_yaml(to_text(automation->to_yaml(req.include_history())));
  set_status_ok(resp);
}

void handle_set_automation_enabled(Runtime &rt,
                                   const pb::SetAutomationEnabledRequest &req,
                                   pb::Response &resp) {
  auto automation = find_automation(rt, req.automation_id(), resp);
  if (!automation) {
    return;
  }
  automation->set_enabled(req.enabled());
  resp.mutable_set_automation_enabled();
  set_status_ok(resp);
}

void handle_trigger_automation(Runtime &rt,
                               const pb::TriggerAutomationRequest &req,
                               pb::Response &resp) {
  if (req.automation_id().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT,
               "automation_id is required");
    return;
  }
  auto variables = parse_map(req.variables_yaml(), "variables_yaml", resp);
  if (!variables) {
    return;
  }

  try {
    const auto execution = rt.engine.trigger_automation(
        req.automation_id(), auto_core::node_to_map(*variables),
        req.skip_conditions(), req.wait());
    fill_execution(execution,
                   *resp.mutable_trigger_automation()->mutable_execution());
  } catch (const std::out_of_range &e) {
    set_status(resp, Status::CODE_NOT_FOUND, e.what());
    return;
  } catch (const std::logic_error &e) {
    set_status(resp, Status::CODE_FAILED_PRECONDITION, e.what());
    return;
  }
  set_status_ok(resp);
}

void handle_delete_automation(Runtime &rt,
                              const pb::DeleteAutomationRequest &req,
                              pb::Response &resp) {
  auto automation = find_automation(rt, req.automation_id(), resp);
  if (!automation) {
    return;
  }
  rt.engine.unregister_automation(automation->id());
  automation->cancel_all();

  // Blueprint instances go with their automation
  if (auto blueprint_id = automation->config().blueprint_id) {
    if (auto blueprint = rt.blueprints.get(*blueprint_id)) {
      blueprint->delete_instance(automation->id());
    }
  }
  resp.mutable_delete_automation();
  set_status_ok(resp);
}

void handle_get_executions(Runtime &rt, const pb::GetExecutionsRequest &req,
                           pb::Response &resp) {
  auto automation = find_automation(rt, req.automation_id(), resp);
  if (!automation) {
    return;
  }
  const auto history = automation->history();
  auto *out = resp.mutable_get_executions();
  std::size_t emitted = 0;
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (req.limit() > 0 && emitted >= req.limit()) {
      break;
    }
    fill_execution(*it, *out->add_executions());
    ++emitted;
  }
  set_status_ok(resp);
}

void handle_update_entities(Runtime &rt, const pb::UpdateEntitiesRequest &req,
                            pb::Response &resp) {
  std::map<std::string, auto_core::EntityState> upserts;
  for (const auto &snapshot : req.upserts()) {
    if (snapshot.entity_id().empty()) {
      set_status(resp, Status::CODE_INVALID_ARGUMENT,
                 "upserts: entity_id is required");
      return;
    }
    auto attributes = parse_map(snapshot.attributes_yaml(),
                                snapshot.entity_id() + ".attributes_yaml", resp);
    if (!attributes) {
      return;
    }
    auto_core::EntityState state;
    state.state = snapshot.state();
    state.attributes = auto_core::node_to_map(*attributes);
    upserts[snapshot.entity_id()] = std::move(state);
  }

  std::vector<std::string> removals(req.removals().begin(),
                                    req.removals().end());
  rt.engine.update_entities(upserts, removals);
  resp.mutable_update_entities()->set_entity_count(
      static_cast<uint32_t>(rt.engine.entities().size()));
  set_status_ok(resp);
}

void handle_fire_event(Runtime &rt, const pb::FireEventRequest &req,
                       pb::Response &resp) {
  if (req.event_type().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "event_type is required");
    return;
  }
  auto data = parse_map(req.data_yaml(), "data_yaml", resp);
  if (!data) {
    return;
  }
  rt.engine.fire_event(auto_core::EventData{req.event_type(), *data});
  resp.mutable_fire_event();
  set_status_ok(resp);
}

void handle_publish_mqtt(Runtime &rt, const pb::PublishMqttRequest &req,
                         pb::Response &resp) {
  if (req.topic().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "topic is required");
    return;
  }
  rt.engine.publish_mqtt(auto_core::MqttMessage{req.topic(), req.payload()});
  resp.mutable_publish_mqtt();
  set_status_ok(resp);
}

void handle_set_sun_events(Runtime &rt, const pb::SetSunEventsRequest &req,
                           pb::Response &resp) {
  std::map<std::string, auto_core::TimePoint> events;
  for (const auto &entry : req.events_unix_ms()) {
    const std::string &name = entry.first;
    if (name != "sunrise" && name != "sunset") {
      set_status(resp, Status::CODE_INVALID_ARGUMENT,
                 "unknown sun event '" + name + "' (expected sunrise or sunset)");
      return;
    }
    events[name] = auto_core::TimePoint(
        std::chrono::duration_cast<auto_core::Clock::duration>(
            std::chrono::milliseconds(entry.second)));
  }
  rt.engine.set_sun_events(events);
  resp.mutable_set_sun_events();
  set_status_ok(resp);
}

void handle_poll_commands(Runtime &rt, const pb::PollCommandsRequest &req,
                          pb::Response &resp) {
  auto *out = resp.mutable_poll_commands();
  if (rt.outbox) {
    for (const auto &command : rt.outbox->drain(req.max_commands())) {
      auto *entry = out->add_commands();
      entry->set_sequence(command.sequence);
      entry->set_kind(command.kind);
      entry->set_target(command.target);
      entry->set_data_yaml(to_text(command.data));
    }
  }
  set_status_ok(resp);
}

void handle_list_blueprints(Runtime &rt, const pb::ListBlueprintsRequest &req,
                            pb::Response &resp) {
  auto_blueprint::BlueprintFilter filter;
  if (!req.domain().empty()) {
    filter.domain = req.domain();
  }
  if (!req.name().empty()) {
    filter.name = req.name();
  }
  if (!req.author().empty()) {
    filter.author = req.author();
  }

  auto *out = resp.mutable_list_blueprints();
  for (const auto &blueprint : rt.blueprints.search(filter)) {
    auto *entry = out->add_blueprints();
    entry->set_blueprint_id(blueprint->id());
    entry->set_name(blueprint->name());
    entry->set_description(blueprint->description());
    entry->set_domain(blueprint->domain().value_or(""));
    entry->set_author(blueprint->author().value_or(""));
    entry->set_version(blueprint->version());
    entry->set_instance_count(
        static_cast<uint32_t>(blueprint->instance_count()));
  }
  out->set_statistics_yaml(to_text(rt.blueprints.statistics().to_yaml()));
  set_status_ok(resp);
}

void handle_create_blueprint_instance(
    Runtime &rt, const pb::CreateBlueprintInstanceRequest &req,
    pb::Response &resp) {
  if (req.blueprint_id().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "blueprint_id is required");
    return;
  }
  auto blueprint = rt.blueprints.get(req.blueprint_id());
  if (!blueprint) {
    set_status(resp, Status::CODE_NOT_FOUND,
               "unknown blueprint_id: " + req.blueprint_id());
    return;
  }
  auto parameters = parse_map(req.parameters_yaml(), "parameters_yaml", resp);
  if (!parameters) {
    return;
  }

  auto_engine::ExecutionMode mode = auto_engine::ExecutionMode::Single;
  auto_engine::MaxExceeded max_exceeded = auto_engine::MaxExceeded::Warn;
  try {
    if (!req.mode().empty()) {
      mode = auto_engine::parse_execution_mode(req.mode());
    }
    if (!req.max_exceeded().empty()) {
      max_exceeded = auto_engine::parse_max_exceeded(req.max_exceeded());
    }
  } catch (const std::runtime_error &e) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, e.what());
    return;
  }

  std::optional<std::string> automation_id;
  if (!req.automation_id().empty()) {
    automation_id = req.automation_id();
    if (rt.engine.get_automation(*automation_id)) {
      set_status(resp, Status::CODE_ALREADY_EXISTS,
                 "automation already exists: " + *automation_id);
      return;
    }
  }

  auto_blueprint::BlueprintInstance instance;
  try {
    instance = blueprint->create_instance(
        req.name().empty() ? req.blueprint_id() : req.name(),
        auto_core::node_to_map(*parameters), automation_id);
  } catch (const auto_blueprint::BlueprintValidationError &e) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, e.what());
    return;
  } catch (const std::invalid_argument &e) {
    set_status(resp, Status::CODE_ALREADY_EXISTS, e.what());
    return;
  }

  try {
    rt.engine.register_automation(
        blueprint->create_automation(instance, mode, max_exceeded,
                                     rt.engine.options().history_limit));
  } catch (const std::invalid_argument &e) {
    blueprint->delete_instance(instance.automation_id);
    set_status(resp, Status::CODE_ALREADY_EXISTS, e.what());
    return;
  } catch (const std::runtime_error &e) {
    blueprint->delete_instance(instance.automation_id);
    set_status(resp, Status::CODE_INVALID_ARGUMENT, e.what());
    return;
  }

  auto *out = resp.mutable_create_blueprint_instance();
  out->set_automation_id(instance.automation_id);
  out->set_instance_yaml(to_text(instance.to_yaml()));
  set_status_ok(resp);
}

void handle_unimplemented(pb::Response &resp) {
  set_status(resp, Status::CODE_UNIMPLEMENTED, "operation not implemented");
}

void dispatch(Runtime &rt, const pb::Request &req, pb::Response &resp) {
  resp.set_request_id(req.request_id());
  set_status(resp, Status::CODE_INTERNAL, "uninitialized");

  try {
    switch (req.kind_case()) {
    case pb::Request::kHello:
      handle_hello(rt, req.hello(), resp);
      break;
    case pb::Request::kGetHealth:
      handle_get_health(rt, req.get_health(), resp);
      break;
    case pb::Request::kListAutomations:
      handle_list_automations(rt, req.list_automations(), resp);
      break;
    case pb::Request::kGetAutomation:
      handle_get_automation(rt, req.get_automation(), resp);
      break;
    case pb::Request::kSetAutomationEnabled:
      handle_set_automation_enabled(rt, req.set_automation_enabled(), resp);
      break;
    case pb::Request::kTriggerAutomation:
      handle_trigger_automation(rt, req.trigger_automation(), resp);
      break;
    case pb::Request::kDeleteAutomation:
      handle_delete_automation(rt, req.delete_automation(), resp);
      break;
    case pb::Request::kGetExecutions:
      handle_get_executions(rt, req.get_executions(), resp);
      break;
    case pb::Request::kUpdateEntities:
      handle_update_entities(rt, req.update_entities(), resp);
      break;
    case pb::Request::kFireEvent:
      handle_fire_event(rt, req.fire_event(), resp);
      break;
    case pb::Request::kPublishMqtt:
      handle_publish_mqtt(rt, req.publish_mqtt(), resp);
      break;
    case pb::Request::kSetSunEvents:
      handle_set_sun_events(rt, req.set_sun_events(), resp);
      break;
    case pb::Request::kPollCommands:
      handle_poll_commands(rt, req.poll_commands(), resp);
      break;
    case pb::Request::kListBlueprints:
      handle_list_blueprints(rt, req.list_blueprints(), resp);
      break;
    case pb::Request::kCreateBlueprintInstance:
      handle_create_blueprint_instance(rt, req.create_blueprint_instance(),
                                       resp);
      break;
    default:
      handle_unimplemented(resp);
      break;
    }
  } catch (const std::exception &e) {
    std::cerr << "[Handlers] ERROR: request " << req.request_id()
              << " failed: " << e.what() << std::endl;
    resp.clear_kind();
    set_status(resp, Status::CODE_INTERNAL, e.what());
  }
}

} // namespace handlers
