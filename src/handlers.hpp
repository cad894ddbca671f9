#pragma once

#include <memory>

#include "automation_protocol.pb.h"
#include "blueprint/blueprint_registry.hpp"
#include "command_outbox.hpp"
#include "engine/automation_engine.hpp"

namespace handlers {

namespace pb = butler::automation::v1;

// Everything a request handler may touch
struct Runtime {
  auto_engine::AutomationEngine &engine;
  auto_blueprint::BlueprintRegistry &blueprints;
  std::shared_ptr<CommandOutbox> outbox;
};

void handle_hello(Runtime &rt, const pb::HelloRequest &req, pb::Response &resp);

void handle_get_health(Runtime &rt, const pb::GetHealthRequest &req,
                       pb::Response &resp);

void handle_list_automations(Runtime &rt, const pb::ListAutomationsRequest &req,
                             pb::Response &resp);

void handle_get_automation(Runtime &rt, const pb::GetAutomationRequest &req,
                           pb::Response &resp);

void handle_set_automation_enabled(Runtime &rt,
                                   const pb::SetAutomationEnabledRequest &req,
                                   pb::Response &resp);

void handle_trigger_automation(Runtime &rt,
                               const pb::TriggerAutomationRequest &req,
                               pb::Response &resp);

void handle_delete_automation(Runtime &rt,
                              const pb::DeleteAutomationRequest &req,
                              pb::Response &resp);

void handle_get_executions(Runtime &rt, const pb::GetExecutionsRequest &req,
                           pb::Response &resp);

void handle_update_entities(Runtime &rt, const pb::UpdateEntitiesRequest &req,
                            pb::Response &resp);

void handle_fire_event(Runtime &rt, const pb::FireEventRequest &req,
                       pb::Response &resp);

void handle_publish_mqtt(Runtime &rt, const pb::PublishMqttRequest &req,
                         pb::Response &resp);

void handle_set_sun_events(Runtime &rt, const pb::SetSunEventsRequest &req,
                           pb::Response &resp);

void handle_poll_commands(Runtime &rt, const pb::PollCommandsRequest &req,
                          pb::Response &resp);

void handle_list_blueprints(Runtime &rt, const pb::ListBlueprintsRequest &req,
                            pb::Response &resp);

void handle_create_blueprint_instance(
    Runtime &rt, const pb::CreateBlueprintInstanceRequest &req,
    pb::Response &resp);

void handle_unimplemented(pb::Response &resp);

// Route one request; exceptions escaping a handler become CODE_INTERNAL
void dispatch(Runtime &rt, const pb::Request &req, pb::Response &resp);

} // namespace handlers
