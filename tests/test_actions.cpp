#include <algorithm>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <thread>

#include "actions/action_factory.hpp"
#include "actions/flow_actions.hpp"
#include "test_support.hpp"

using auto_actions::ActionType;
using auto_actions::create_action;
using test_support::entity;
using test_support::Recorder;
using test_support::SnapshotBuilder;

namespace {

auto_actions::ActionPtr make(const std::string &yaml) {
  return create_action(YAML::Load(yaml), "action_0");
}

} // namespace

class ActionTest : public ::testing::Test {
protected:
  test_support::Context context() {
    return SnapshotBuilder()
        .set("light.kitchen", entity("on"))
        .set("sensor.temperature", entity("18"))
        .context(recorder_.capabilities());
  }

  Recorder recorder_;
};

TEST_F(ActionTest, ServiceMergesDataAndRendersTemplates) {
  auto action = make(R"({action: service, service: light.turn_on,
      entity_id: light.kitchen, data: {brightness: 200},
      data_template: {note: "{{ states('sensor.temperature') }}"}})");
  const auto result = action->execute(context());

  ASSERT_TRUE(result.success) << result.error.value_or("");
  EXPECT_EQ(result.action_type, "service");
  const auto calls = recorder_.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].name, "service:light.turn_on");
  EXPECT_EQ(calls[0].data["entity_id"].as<std::string>(), "light.kitchen");
  EXPECT_EQ(calls[0].data["brightness"].as<int>(), 200);
  EXPECT_EQ(calls[0].data["note"].as<std::string>(), "18");
  EXPECT_TRUE(result.data["result"]["ok"].as<bool>());
}

TEST_F(ActionTest, ActionDefaultsToServiceCall) {
  auto action = make("{service: switch.toggle}");
  EXPECT_EQ(action->type(), ActionType::Service);
  EXPECT_TRUE(action->execute(context()).success);
}

TEST_F(ActionTest, MissingCapabilityFails) {
  auto action = make("{service: switch.toggle}");
  const auto result = action->execute(SnapshotBuilder().context());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""), "No service caller available in context");
}

TEST_F(ActionTest, ScriptReceivesContextAndOverlayVariables) {
  auto action = make(R"({action: script, script_id: morning,
      variables: {greeting: "hi {{ who }}"}})");
  auto ctx = context().with_variable("who", YAML::Node("sam"));
  ASSERT_TRUE(action->execute(ctx).success);

  const auto calls = recorder_.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].name, "script:morning");
  EXPECT_EQ(calls[0].data["who"].as<std::string>(), "sam");
  EXPECT_EQ(calls[0].data["greeting"].as<std::string>(), "hi sam");
}

TEST_F(ActionTest, NotifyRendersMessageTemplate) {
  auto action = make(R"({action: notify, message: plain, title: Alert,
      message_template: "Temp is {{ states('sensor.temperature') }}"})");
  const auto result = action->execute(context());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.data["message"].as<std::string>(), "Temp is 18");
  EXPECT_EQ(recorder_.calls()[0].data["title"].as<std::string>(), "Alert");
}

TEST_F(ActionTest, SceneActivationAndDeactivation) {
  ASSERT_TRUE(make("{action: scene, scene_id: movie}")->execute(context()).success);
  ASSERT_TRUE(make("{action: deactivate_scene, scene: movie}")
                  ->execute(context())
                  .success);
  EXPECT_EQ(recorder_.names(),
            (std::vector<std::string>{"scene_on:movie", "scene_off:movie"}));
  EXPECT_THROW(make("{action: scene}"), std::runtime_error);
}

TEST_F(ActionTest, TemplateAndLogActions) {
  const auto rendered =
      make("{action: template, value_template: '{{ 6 * 7 }}'}")->execute(context());
  EXPECT_EQ(rendered.data["result"].as<std::string>(), "42");

  const auto logged =
      make(R"({action: log, level: warning, message: 'light is {{ states("light.kitchen") }}'})")
          ->execute(context());
  ASSERT_TRUE(logged.success);
  const auto calls = recorder_.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].data["level"].as<std::string>(), "warning");
  EXPECT_EQ(calls[0].data["message"].as<std::string>(), "light is on");
  EXPECT_THROW(make("{action: log, level: loud, message: x}"), std::runtime_error);
}

TEST_F(ActionTest, DisabledActionIsRefused) {
  auto action = make("{service: light.turn_on, enabled: false}");
  auto result = action->execute(context());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""), "Action is disabled");
  EXPECT_TRUE(recorder_.calls().empty());

  action->enable();
  EXPECT_TRUE(action->execute(context()).success);
}

TEST_F(ActionTest, CancelledContextIsRefused) {
  auto ctx = context();
  ctx.cancel->cancel();
  const auto result = make("{service: light.turn_on}")->execute(ctx);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""), "Cancelled");
}

TEST_F(ActionTest, UnknownActionTagIsRejected) {
  EXPECT_THROW(make("{action: teleport}"), std::runtime_error);
  EXPECT_THROW(make("{action: delay}"), std::runtime_error);
  EXPECT_THROW(make("{action: repeat, sequence: []}"), std::runtime_error);
}

TEST_F(ActionTest, DelayWaitsAndReportsSeconds) {
  const auto started = std::chrono::steady_clock::now();
  const auto result = make("{action: delay, delay: 0.05}")->execute(context());
  ASSERT_TRUE(result.success);
  EXPECT_GE(std::chrono::steady_clock::now() - started,
            std::chrono::milliseconds(40));
  EXPECT_DOUBLE_EQ(result.data["delay_seconds"].as<double>(), 0.05);
}

TEST_F(ActionTest, DelayStopsOnCancellation) {
  auto action = make("{action: delay, delay: '10s'}");
  auto ctx = context();
  auto pending = std::async(std::launch::async,
                            [&action, &ctx] { return action->execute(ctx); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ctx.cancel->cancel();

  ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  const auto result = pending.get();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""), "Cancelled");
}

TEST_F(ActionTest, DelayRejectsBadDuration) {
  const auto result = make("{action: delay, delay: soon}")->execute(context());
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.value_or("").find("Invalid delay"), std::string::npos);
}

TEST_F(ActionTest, ChooseRunsFirstMatchingChoice) {
  auto action = make(R"({action: choose, choices: [
      {conditions: [{entity_id: light.kitchen, state: 'off'}],
       actions: [{service: first.branch}]},
      {conditions: [{entity_id: light.kitchen, state: 'on'}],
       actions: [{service: second.branch}]}],
      default: [{service: default.branch}]})");
  const auto result = action->execute(context());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.data["choice_index"].as<int>(), 1);
  EXPECT_EQ(result.data["results"].size(), 1u);
  EXPECT_EQ(recorder_.names(), std::vector<std::string>{"service:second.branch"});
}

TEST_F(ActionTest, ChooseFallsBackToDefault) {
  auto action = make(R"({action: choose, choices: [
      {conditions: [{entity_id: light.kitchen, state: 'off'}],
       actions: [{service: first.branch}]}],
      default: [{service: default.branch}]})");
  const auto result = action->execute(context());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.data["choice"].as<std::string>(), "default");
  EXPECT_EQ(recorder_.names(), std::vector<std::string>{"service:default.branch"});
}

TEST_F(ActionTest, ChooseWithoutMatchOrDefaultFails) {
  auto action = make(R"({action: choose, choices: [
      {conditions: [{entity_id: light.kitchen, state: 'off'}],
       actions: [{service: first.branch}]}]})");
  const auto result = action->execute(context());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""),
            "No matching choice found and no default action");
}

TEST_F(ActionTest, ParallelRespectsMaxParallel) {
  recorder_.service_latency = std::chrono::milliseconds(30);
  auto action = make(R"({action: parallel, max_parallel: 2, actions: [
      {service: a.one}, {service: a.two}, {service: a.three},
      {service: a.four}, {service: a.five}]})");
  const auto result = action->execute(context());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.data["total_actions"].as<int>(), 5);
  EXPECT_EQ(result.data["success_count"].as<int>(), 5);
  EXPECT_EQ(result.data["error_count"].as<int>(), 0);
  EXPECT_LE(recorder_.max_concurrent(), 2);
  // Results keep declaration order
  EXPECT_EQ(result.data["results"][4]["action_id"].as<std::string>(),
            "action_0_4");
}

TEST_F(ActionTest, ParallelFailsWhenAnyChildFails) {
  auto action = make(R"({action: parallel, actions: [
      {service: a.one}, {action: delay, delay: nonsense}]})");
  const auto result = action->execute(context());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.data["success_count"].as<int>(), 1);
  EXPECT_EQ(result.data["error_count"].as<int>(), 1);
}

TEST_F(ActionTest, RepeatRunsSequenceWithIndex) {
  auto action = make(R"({action: repeat, repeat: 3, sequence: [
      {action: template, value_template: "{{ repeat_index }}/{{ repeat_count }}"},
      {service: light.toggle}]})");
  const auto result = action->execute(context());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.data["repeat_count"].as<int>(), 3);
  ASSERT_EQ(result.data["results"].size(), 6u);
  EXPECT_EQ(result.data["results"][4]["data"]["result"].as<std::string>(), "2/3");
  EXPECT_EQ(recorder_.count("service:light.toggle"), 3u);
}

TEST_F(ActionTest, RepeatTemplateAndInvalidCount) {
  auto templated = make(R"({action: repeat,
      repeat_template: "{{ 1 + 1 }}", sequence: [{service: x.y}]})");
  EXPECT_TRUE(templated->execute(context()).success);
  EXPECT_EQ(recorder_.count("service:x.y"), 2u);

  auto invalid = make("{action: repeat, repeat: many, sequence: []}");
  const auto result = invalid->execute(context());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""), "Invalid repeat count: 'many'");
}

TEST_F(ActionTest, RepeatStopsWhenCancelled) {
  auto action = make(R"({action: repeat, repeat: 100, sequence: [
      {action: delay, delay: 0.02}]})");
  auto ctx = context();
  auto pending = std::async(std::launch::async,
                            [&action, &ctx] { return action->execute(ctx); });
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  ctx.cancel->cancel();

  const auto result = pending.get();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.value_or(""), "Cancelled");
  EXPECT_LT(result.data["results"].size(), 100u);
}

TEST_F(ActionTest, NestedIdsAndMetadata) {
  auto action = make(R"({id: outer, action: parallel,
      metadata: {owner: tests},
      actions: [{service: a.b}]})");
  const YAML::Node out = action->to_yaml();
  EXPECT_EQ(out["action"].as<std::string>(), "parallel");
  EXPECT_EQ(out["actions"][0]["id"].as<std::string>(), "outer_0");
  EXPECT_EQ(action->get_metadata("owner").as<std::string>(), "tests");
}

TEST_F(ActionTest, DelayRejectsOutOfRangeDuration) {
  const auto started = std::chrono::steady_clock::now();
  for (const char *yaml : {"{action: delay, delay: '1e30'}",
                           "{action: delay, delay: nan}",
                           "{action: delay, delay_template: "
                           "\"{{ states('sensor.temperature') }}e30\"}"}) {
    const auto result = make(yaml)->execute(context());
    EXPECT_FALSE(result.success) << yaml;
    EXPECT_NE(result.error.value_or("").find("Invalid delay"), std::string::npos)
        << yaml;
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
}

TEST_F(ActionTest, ToYamlRebuildsEquivalentActions) {
  const std::vector<std::string> configs = {
      R"({action: service, service: light.turn_on, entity_id: light.kitchen,
          data: {brightness: 200},
          data_template: {note: "{{ states('sensor.temperature') }}"}})",
      R"({action: script, script_id: morning, variables: {greeting: hello}})",
      R"({action: notify, message: plain, title: Alert, target: phone,
          message_template: "Temp is {{ states('sensor.temperature') }}"})",
      "{action: activate_scene, scene_id: movie}",
      "{action: deactivate_scene, scene_id: movie}",
      "{action: template, value_template: '{{ 6 * 7 }}'}",
      "{action: log, level: warning, message: 'light is {{ states(\"light.kitchen\") }}'}",
      "{action: delay, delay: 0.01}",
      "{action: delay, delay: soon}",
      "{service: light.turn_off, enabled: false, metadata: {owner: tests}}",
      R"({action: choose, choices: [
          {conditions: [{entity_id: light.kitchen, state: 'off'}],
           actions: [{service: first.branch}]},
          {conditions: [{condition: numeric_state, entity_id: sensor.temperature,
                         below: 20}],
           actions: [{service: second.branch}, {action: log, message: cold}]}],
          default: [{service: default.branch}]})",
      R"({action: choose, choices: [
          {conditions: [{entity_id: light.kitchen, state: 'off'}],
           actions: [{service: first.branch}]}]})",
      R"({action: parallel, max_parallel: 2, actions: [
          {service: a.one}, {service: a.two}, {action: notify, message: done}]})",
      R"({action: repeat, repeat: 3, sequence: [
          {action: template, value_template: "{{ repeat_index }}"},
          {service: light.toggle}]})",
      R"({action: repeat, repeat_template: "{{ 1 + 1 }}", sequence: [
          {action: script, script_id: tick}]})",
  };

  auto sorted_names = [](const Recorder &recorder) {
    auto names = recorder.names();
    std::sort(names.begin(), names.end());
    return names;
  };

  for (const auto &yaml : configs) {
    SCOPED_TRACE(yaml);
    Recorder original_calls;
    Recorder rebuilt_calls;
    auto original = make(yaml);
    const YAML::Node config = original->to_yaml();
    auto rebuilt = create_action(YAML::Load(YAML::Dump(config)), "other");

    EXPECT_EQ(rebuilt->id(), original->id());
    EXPECT_EQ(rebuilt->type(), original->type());
    EXPECT_EQ(YAML::Dump(rebuilt->to_yaml()), YAML::Dump(config));

    auto run = [](const auto_actions::ActionPtr &action, Recorder &recorder) {
      return action->execute(SnapshotBuilder()
                                 .set("light.kitchen", entity("on"))
                                 .set("sensor.temperature", entity("18"))
                                 .context(recorder.capabilities()));
    };
    const auto expected = run(original, original_calls);
    const auto actual = run(rebuilt, rebuilt_calls);

    EXPECT_EQ(actual.success, expected.success);
    EXPECT_EQ(actual.error, expected.error);
    EXPECT_EQ(actual.action_id, expected.action_id);
    EXPECT_EQ(actual.action_type, expected.action_type);
    EXPECT_EQ(sorted_names(rebuilt_calls), sorted_names(original_calls));

    const auto expected_calls = original_calls.calls();
    const auto actual_calls = rebuilt_calls.calls();
    if (expected_calls.size() == 1 && actual_calls.size() == 1) {
      EXPECT_EQ(YAML::Dump(actual_calls[0].data), YAML::Dump(expected_calls[0].data));
    }
    if (original->type() != ActionType::Choose &&
        original->type() != ActionType::Parallel &&
        original->type() != ActionType::Repeat &&
        original->type() != ActionType::Delay) {
      EXPECT_EQ(YAML::Dump(actual.data), YAML::Dump(expected.data));
    }
  }
}
