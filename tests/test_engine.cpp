#include <chrono>
#include <gtest/gtest.h>
#include <thread>

#include "actions/action_factory.hpp"
#include "conditions/condition_factory.hpp"
#include "engine/automation_engine.hpp"
#include "triggers/trigger_factory.hpp"
#include "test_support.hpp"

using auto_engine::Automation;
using auto_engine::AutomationConfig;
using auto_engine::AutomationEngine;
using auto_engine::EngineOptions;
using auto_engine::ExecutionMode;
using test_support::entity;
using test_support::Recorder;
using test_support::today_at;

namespace {

// Automation from a YAML document with triggers/conditions/actions lists
std::shared_ptr<Automation> automation_from(const std::string &id,
                                            const std::string &yaml,
                                            ExecutionMode mode =
                                                ExecutionMode::Single) {
  const YAML::Node doc = YAML::Load(yaml);
  AutomationConfig config;
  config.automation_id = id;
  config.name = doc["name"] ? doc["name"].as<std::string>() : id;
  config.description =
      doc["description"] ? doc["description"].as<std::string>() : "";
  config.mode = mode;

  std::vector<std::unique_ptr<auto_triggers::Trigger>> triggers;
  for (std::size_t i = 0; i < doc["triggers"].size(); ++i) {
    triggers.push_back(auto_triggers::create_trigger(
        doc["triggers"][i], "trigger_" + std::to_string(i)));
  }
  std::vector<auto_conditions::ConditionPtr> conditions;
  if (doc["conditions"]) {
    for (std::size_t i = 0; i < doc["conditions"].size(); ++i) {
      conditions.push_back(auto_conditions::create_condition(
          doc["conditions"][i], "condition_" + std::to_string(i)));
    }
  }
  return std::make_shared<Automation>(
      config, std::move(triggers), std::move(conditions),
      auto_actions::create_actions(doc["actions"], "action"));
}

std::map<std::string, auto_core::EntityState>
one(const std::string &entity_id, const std::string &state) {
  return {{entity_id, entity(state)}};
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    EngineOptions options;
    options.tick_rate_hz = 20.0;
    options.max_parallel_runs = 8;
    engine_ = std::make_unique<AutomationEngine>(options,
                                                 recorder_.capabilities());
  }

  void TearDown() override { engine_->stop(); }

  void tick_and_wait() {
    engine_->tick();
    engine_->wait_for_idle();
  }

  Recorder recorder_;
  std::unique_ptr<AutomationEngine> engine_;
};

TEST(EngineOptionsTest, RejectsInvalidOptions) {
  EngineOptions zero_rate;
  zero_rate.tick_rate_hz = 0.0;
  EXPECT_THROW(AutomationEngine engine(zero_rate), std::invalid_argument);

  EngineOptions no_runs;
  no_runs.max_parallel_runs = 0;
  EXPECT_THROW(AutomationEngine engine(no_runs), std::invalid_argument);
}

TEST_F(EngineTest, StateTransitionDispatchesRun) {
  engine_->register_automation(automation_from("hall", R"(
triggers: [{id: door, entity_id: binary_sensor.door, to: 'on'}]
actions: [{service: light.turn_on, entity_id: light.hall}]
)"));

  engine_->update_entities(one("binary_sensor.door", "off"), {});
  tick_and_wait();
  EXPECT_TRUE(recorder_.calls().empty());

  engine_->update_entities(one("binary_sensor.door", "on"), {});
  tick_and_wait();
  ASSERT_EQ(recorder_.names(), std::vector<std::string>{"service:light.turn_on"});

  const auto history = engine_->get_automation("hall")->history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].triggered_by, "door");
  EXPECT_EQ(history[0].context["trigger"]["to_state"].as<std::string>(), "on");
  EXPECT_EQ(history[0].context["trigger"]["from_state"].as<std::string>(), "off");

  // No further transition, no further run
  tick_and_wait();
  EXPECT_EQ(recorder_.calls().size(), 1u);
}

TEST_F(EngineTest, FirstTickHasNoTransitions) {
  engine_->register_automation(automation_from("hall", R"(
triggers: [{entity_id: binary_sensor.door, to: 'on'}]
actions: [{service: light.turn_on}]
)"));
  engine_->update_entities(one("binary_sensor.door", "on"), {});
  tick_and_wait();
  EXPECT_TRUE(recorder_.calls().empty());
}

TEST_F(EngineTest, ConditionsUseTickSnapshot) {
  engine_->register_automation(automation_from("guarded", R"(
triggers: [{entity_id: sensor.motion, to: detected}]
conditions: [{entity_id: sun.sun, state: below_horizon}]
actions: [{service: light.turn_on}]
)"));
  std::map<std::string, auto_core::EntityState> initial{
      {"sensor.motion", entity("clear")}, {"sun.sun", entity("above_horizon")}};
  engine_->update_entities(initial, {});
  tick_and_wait();

  engine_->update_entities(one("sensor.motion", "detected"), {});
  tick_and_wait();
  EXPECT_TRUE(recorder_.calls().empty());
  EXPECT_EQ(engine_->get_automation("guarded")->history()[0].error.value_or(""),
            "Conditions not met");
}

TEST_F(EngineTest, EventsAreEvaluatedOncePerEvent) {
  engine_->register_automation(automation_from("bell", R"(
triggers: [{platform: event, event_type: doorbell}]
actions: [{action: notify, message: "Ring {{ trigger.event_data.button }}"}]
)", ExecutionMode::Parallel));

  engine_->fire_event({"doorbell", YAML::Load("{button: front}")});
  engine_->fire_event({"doorbell", YAML::Load("{button: back}")});
  engine_->fire_event({"other", YAML::Node()});
  tick_and_wait();
  EXPECT_EQ(recorder_.count("notify"), 2u);

  tick_and_wait();
  EXPECT_EQ(recorder_.count("notify"), 2u);
}

TEST_F(EngineTest, MqttMessagesTriggerMatchingAutomations) {
  engine_->register_automation(automation_from("garage", R"(
triggers: [{platform: mqtt, topic: garage/door, payload: open}]
actions: [{service: cover.open}]
)"));
  engine_->publish_mqtt({"garage/door", "closed"});
  tick_and_wait();
  EXPECT_TRUE(recorder_.calls().empty());

  engine_->publish_mqtt({"garage/door", "open"});
  tick_and_wait();
  EXPECT_EQ(recorder_.count("service:cover.open"), 1u);
}

TEST_F(EngineTest, ClockDrivesTimeTriggers) {
  engine_->register_automation(automation_from("alarm", R"(
triggers: [{platform: time, at: '07:30'}]
actions: [{service: media.play}]
)"));
  auto now = today_at(7, 29, 0);
  engine_->set_clock([&now] { return now; });

  tick_and_wait();
  EXPECT_TRUE(recorder_.calls().empty());
  now = today_at(7, 30, 0);
  tick_and_wait();
  EXPECT_EQ(recorder_.count("service:media.play"), 1u);
}

TEST_F(EngineTest, SunEventsReachTriggers) {
  engine_->register_automation(automation_from("dusk", R"(
triggers: [{platform: sun, event: sunset}]
actions: [{service: light.turn_on}]
)"));
  const auto sunset = today_at(19, 0);
  engine_->set_sun_events({{"sunset", sunset}});
  engine_->set_clock([sunset] { return sunset; });
  tick_and_wait();
  EXPECT_EQ(recorder_.calls().size(), 1u);
}

TEST_F(EngineTest, DisabledAutomationIsSkipped) {
  engine_->register_automation(automation_from("bell", R"(
triggers: [{platform: event, event_type: doorbell}]
actions: [{service: chime.ring}]
)"));
  EXPECT_TRUE(engine_->set_enabled("bell", false));
  EXPECT_FALSE(engine_->set_enabled("missing", false));
  engine_->fire_event({"doorbell", YAML::Node()});
  tick_and_wait();
  EXPECT_TRUE(recorder_.calls().empty());
}

TEST_F(EngineTest, ManualTriggerWaitsForResult) {
  engine_->register_automation(automation_from("scene", R"(
triggers: [{platform: event, event_type: never}]
conditions: [{entity_id: light.kitchen, state: 'on'}]
actions: [{action: template, value_template: "{{ trigger.platform }} {{ who }}"}]
)"));

  std::map<std::string, YAML::Node> variables{{"who", YAML::Node("lee")}};
  const auto skipped = engine_->trigger_automation("scene", variables, false, true);
  EXPECT_EQ(skipped.error.value_or(""), "Conditions not met");

  const auto forced = engine_->trigger_automation("scene", variables, true, true);
  EXPECT_TRUE(forced.completed);
  EXPECT_EQ(forced.triggered_by, "manual");
  ASSERT_EQ(forced.results.size(), 1u);
  EXPECT_EQ(forced.results[0].data["result"].as<std::string>(), "manual lee");
}

TEST_F(EngineTest, ManualTriggerErrors) {
  engine_->register_automation(automation_from("off", R"(
triggers: [{platform: event, event_type: never}]
actions: [{service: a.b}]
)"));
  engine_->set_enabled("off", false);
  EXPECT_THROW(engine_->trigger_automation("missing", {}, false, true),
               std::out_of_range);
  EXPECT_THROW(engine_->trigger_automation("off", {}, false, true),
               std::logic_error);
}

TEST_F(EngineTest, ManualTriggerWithoutWaitRunsInBackground) {
  engine_->register_automation(automation_from("bg", R"(
triggers: [{platform: event, event_type: never}]
actions: [{service: a.b}]
)"));
  const auto record = engine_->trigger_automation("bg", {}, false, false);
  EXPECT_FALSE(record.completed);
  EXPECT_EQ(record.execution_id, "bg-1");
  engine_->wait_for_idle();
  EXPECT_EQ(recorder_.calls().size(), 1u);
}

TEST(EngineLimitTest, MaxParallelRunsRejectsExtraRuns) {
  Recorder recorder;
  EngineOptions options;
  options.max_parallel_runs = 1;
  AutomationEngine engine(options, recorder.capabilities());
  engine.register_automation(automation_from("slow", R"(
triggers: [{platform: event, event_type: never}]
actions: [{action: delay, delay: 5}]
)", ExecutionMode::Parallel));

  const auto first = engine.trigger_automation("slow", {}, false, false);
  EXPECT_FALSE(first.error.has_value());
  const auto second = engine.trigger_automation("slow", {}, false, false);
  EXPECT_TRUE(second.completed);
  EXPECT_EQ(second.error.value_or(""), "Engine max_parallel_runs reached");
  EXPECT_EQ(engine.health().in_flight_runs, 1u);

  // stop() cancels the delay
  const auto started = std::chrono::steady_clock::now();
  engine.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
  EXPECT_EQ(engine.health().in_flight_runs, 0u);
}

TEST_F(EngineTest, RegistryOperations) {
  engine_->register_automation(automation_from("kitchen_lights", R"(
name: Kitchen Lights
description: Motion based lighting
triggers: [{platform: event, event_type: x}]
actions: []
)"));
  engine_->register_automation(automation_from("garden", R"(
name: Garden Water
description: Sprinklers at dawn
triggers: [{platform: event, event_type: x}]
actions: []
)"));

  EXPECT_THROW(engine_->register_automation(automation_from("garden", R"(
triggers: []
actions: []
)")),
               std::invalid_argument);

  EXPECT_EQ(engine_->list_automations().size(), 2u);
  ASSERT_EQ(engine_->search_automations("KITCHEN").size(), 1u);
  EXPECT_EQ(engine_->search_automations("dawn")[0]->id(), "garden");
  EXPECT_TRUE(engine_->search_automations("nothing").empty());
  EXPECT_EQ(engine_->get_automation("missing"), nullptr);

  EXPECT_TRUE(engine_->unregister_automation("garden"));
  EXPECT_FALSE(engine_->unregister_automation("garden"));
  EXPECT_EQ(engine_->list_automations().size(), 1u);
}

TEST_F(EngineTest, UnregisteredAutomationNoLongerRuns) {
  auto automation = automation_from("bell", R"(
triggers: [{platform: event, event_type: doorbell}]
actions: [{service: chime.ring}]
)");
  engine_->register_automation(automation);
  engine_->unregister_automation("bell");

  // Firing the trigger directly reaches no engine callback
  auto ctx = test_support::SnapshotBuilder().event("doorbell").context();
  EXPECT_TRUE(automation->triggers()[0]->fire(ctx));
  engine_->wait_for_idle();
  EXPECT_TRUE(recorder_.calls().empty());
}

TEST(EngineLifetimeTest, AutomationOutlivingEngineFiresSafely) {
  Recorder recorder;
  auto automation = automation_from("bell", R"(
triggers: [{platform: event, event_type: doorbell}]
actions: [{service: chime.ring}]
)");
  {
    AutomationEngine engine(EngineOptions{}, recorder.capabilities());
    engine.register_automation(automation);
    engine.stop();
  }

  // The destroyed engine left no callback behind on the trigger
  auto ctx = test_support::SnapshotBuilder().event("doorbell").context();
  EXPECT_TRUE(automation->triggers()[0]->fire(ctx));
  EXPECT_TRUE(automation->history().empty());
  EXPECT_TRUE(recorder.calls().empty());
}

TEST_F(EngineTest, EntityUpdatesAndRemovals) {
  engine_->update_entities({{"light.a", entity("on")}, {"light.b", entity("off")}},
                           {});
  engine_->update_entities(one("light.a", "off"), {"light.b"});
  const auto entities = engine_->entities();
  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities.at("light.a").state, "off");
}

TEST_F(EngineTest, HealthReflectsRegistryAndTicks) {
  engine_->register_automation(automation_from("a", R"(
triggers: [{platform: event, event_type: x}]
actions: []
)"));
  engine_->register_automation(automation_from("b", R"(
triggers: [{platform: event, event_type: x}]
actions: []
)"));
  engine_->set_enabled("b", false);
  engine_->tick();
  engine_->tick();

  const auto health = engine_->health();
  EXPECT_FALSE(health.running);
  EXPECT_EQ(health.automation_count, 2u);
  EXPECT_EQ(health.enabled_count, 1u);
  EXPECT_EQ(health.tick_count, 2u);
  EXPECT_FALSE(health.last_tick_error.has_value());
  EXPECT_EQ(health.to_yaml()["tick_count"].as<int>(), 2);
}

TEST_F(EngineTest, TickerThreadDrivesEvaluation) {
  engine_->register_automation(automation_from("bell", R"(
triggers: [{platform: event, event_type: doorbell}]
actions: [{service: chime.ring}]
)"));
  engine_->start();
  EXPECT_TRUE(engine_->is_running());
  engine_->fire_event({"doorbell", YAML::Node()});

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (recorder_.calls().empty() &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  engine_->stop();
  EXPECT_FALSE(engine_->is_running());
  EXPECT_EQ(recorder_.count("service:chime.ring"), 1u);
  EXPECT_GT(engine_->health().tick_count, 0u);
}
