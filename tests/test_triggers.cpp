#include <cctype>
#include <gtest/gtest.h>

#include "triggers/event_trigger.hpp"
#include "triggers/state_trigger.hpp"
#include "triggers/time_trigger.hpp"
#include "triggers/trigger_factory.hpp"
#include "test_support.hpp"

using auto_triggers::create_trigger;
using auto_triggers::TriggerData;
using auto_triggers::TriggerType;
using test_support::entity;
using test_support::plus_seconds;
using test_support::SnapshotBuilder;
using test_support::today_at;

namespace {

std::unique_ptr<auto_triggers::Trigger> make(const std::string &yaml) {
  return create_trigger(YAML::Load(yaml), "trigger_0");
}

// Snapshot where entity moved from `from` to `to` at `now`
test_support::Context transition(const std::string &entity_id,
                                 const std::string &from,
                                 const std::string &to,
                                 auto_core::TimePoint now) {
  return SnapshotBuilder()
      .at(now)
      .old(entity_id, entity(from))
      .set(entity_id, entity(to))
      .context();
}

test_support::Context steady(const std::string &entity_id,
                             const std::string &value,
                             auto_core::TimePoint now) {
  return transition(entity_id, value, value, now);
}

} // namespace

TEST(TriggerFactoryTest, BuildsEveryPlatform) {
  EXPECT_EQ(make("{entity_id: light.a}")->type(), TriggerType::State);
  EXPECT_EQ(make("{platform: numeric_state, entity_id: s.t, above: 3}")->type(),
            TriggerType::NumericState);
  EXPECT_EQ(make("{platform: time, at: '07:00'}")->type(), TriggerType::Time);
  EXPECT_EQ(make("{platform: event, event_type: x}")->type(), TriggerType::Event);
  EXPECT_EQ(make("{platform: template, value_template: '{{ 1 }}'}")->type(),
            TriggerType::Template);
  EXPECT_EQ(make("{platform: sun, event: sunset}")->type(), TriggerType::Sun);
  EXPECT_EQ(make("{platform: mqtt, topic: a/b}")->type(), TriggerType::Mqtt);
}

TEST(TriggerFactoryTest, RejectsInvalidConfiguration) {
  EXPECT_THROW(make("{platform: laser}"), std::runtime_error);
  EXPECT_THROW(make("{platform: state}"), std::runtime_error);
  EXPECT_THROW(make("{platform: numeric_state, entity_id: s.t}"),
               std::runtime_error);
  EXPECT_THROW(make("{platform: time}"), std::runtime_error);
  EXPECT_THROW(make("{platform: time, at: '25:99'}"), std::runtime_error);
  EXPECT_THROW(make("{platform: sun, event: noon}"), std::runtime_error);
  EXPECT_THROW(make("[1, 2]"), std::runtime_error);
}

TEST(TriggerFactoryTest, UsesDefaultIdAndKeepsConfiguredId) {
  EXPECT_EQ(make("{entity_id: light.a}")->id(), "trigger_0");
  EXPECT_EQ(make("{id: motion, entity_id: light.a}")->id(), "motion");
}

TEST(StateTriggerTest, FiresOnMatchingTransition) {
  auto trigger = make("{entity_id: binary_sensor.door, from: 'off', to: 'on'}");
  const auto now = auto_core::Clock::now();

  EXPECT_TRUE(trigger->fire(transition("binary_sensor.door", "off", "on", now)));
  EXPECT_FALSE(trigger->fire(transition("binary_sensor.door", "on", "off", now)));
  EXPECT_FALSE(trigger->fire(steady("binary_sensor.door", "on", now)));
  EXPECT_EQ(trigger->trigger_count(), 1);
}

TEST(StateTriggerTest, MissingEntityNeverFires) {
  auto trigger = make("{entity_id: light.ghost}");
  EXPECT_FALSE(trigger->fire(SnapshotBuilder().context()));
}

TEST(StateTriggerTest, AttributeTransitions) {
  auto trigger = make("{entity_id: light.a, attribute: brightness, to: '255'}");
  auto ctx = SnapshotBuilder()
                 .old("light.a", entity("on", "brightness: 100"))
                 .set("light.a", entity("on", "brightness: 255"))
                 .context();
  EXPECT_TRUE(trigger->fire(ctx));
}

TEST(StateTriggerTest, CallbackReceivesTransitionDetails) {
  auto trigger = make(
      "{id: door_open, entity_id: binary_sensor.door, to: 'on', "
      "variables: {room: hall}}");
  std::optional<TriggerData> received;
  trigger->add_callback([&](const TriggerData &data) { received = data; });

  ASSERT_TRUE(trigger->fire(
      transition("binary_sensor.door", "off", "on", auto_core::Clock::now())));
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->trigger_id, "door_open");
  EXPECT_EQ(received->trigger_count, 1);
  EXPECT_EQ(received->details["platform"].as<std::string>(), "state");
  EXPECT_EQ(received->details["entity_id"].as<std::string>(),
            "binary_sensor.door");
  EXPECT_EQ(received->details["from_state"].as<std::string>(), "off");
  EXPECT_EQ(received->details["to_state"].as<std::string>(), "on");
  EXPECT_EQ(received->details["room"].as<std::string>(), "hall");
}

TEST(StateTriggerTest, RemovedCallbackIsNotCalled) {
  auto trigger = make("{entity_id: light.a}");
  int calls = 0;
  const int id = trigger->add_callback([&](const TriggerData &) { ++calls; });
  EXPECT_TRUE(trigger->remove_callback(id));
  EXPECT_FALSE(trigger->remove_callback(id));
  trigger->fire(transition("light.a", "off", "on", auto_core::Clock::now()));
  EXPECT_EQ(calls, 0);
}

TEST(StateTriggerTest, ForDurationRequiresStableValue) {
  auto trigger = make("{entity_id: light.a, to: 'on', for: 10}");
  const auto t0 = auto_core::Clock::now();

  EXPECT_FALSE(trigger->fire(transition("light.a", "off", "on", t0)));
  EXPECT_FALSE(trigger->fire(steady("light.a", "on", plus_seconds(t0, 5))));
  EXPECT_TRUE(trigger->fire(steady("light.a", "on", plus_seconds(t0, 10))));
  // Fires once per qualifying transition
  EXPECT_FALSE(trigger->fire(steady("light.a", "on", plus_seconds(t0, 20))));
}

TEST(StateTriggerTest, ForDurationResetsWhenValueChanges) {
  auto trigger = make("{entity_id: light.a, to: 'on', for: 10}");
  const auto t0 = auto_core::Clock::now();

  EXPECT_FALSE(trigger->fire(transition("light.a", "off", "on", t0)));
  EXPECT_FALSE(trigger->fire(transition("light.a", "on", "off", plus_seconds(t0, 4))));
  EXPECT_FALSE(trigger->fire(steady("light.a", "off", plus_seconds(t0, 12))));
  EXPECT_EQ(trigger->trigger_count(), 0);
}

TEST(TriggerTest, CooldownSuppressesRefire) {
  auto trigger = make("{platform: event, event_type: ping, cooldown: 30}");
  const auto t0 = auto_core::Clock::now();
  auto at = [](auto_core::TimePoint now) {
    return SnapshotBuilder().at(now).event("ping").context();
  };

  EXPECT_TRUE(trigger->fire(at(t0)));
  EXPECT_FALSE(trigger->fire(at(plus_seconds(t0, 10))));
  EXPECT_TRUE(trigger->fire(at(plus_seconds(t0, 31))));
  EXPECT_EQ(trigger->trigger_count(), 2);
}

TEST(TriggerTest, DisabledTriggerNeverFires) {
  auto trigger = make("{platform: event, event_type: ping, enabled: false}");
  EXPECT_FALSE(trigger->fire(SnapshotBuilder().event("ping").context()));
  trigger->set_enabled(true);
  EXPECT_TRUE(trigger->fire(SnapshotBuilder().event("ping").context()));
  EXPECT_TRUE(trigger->last_triggered().has_value());
}

TEST(NumericStateTriggerTest, FiresOnceOnRangeEntry) {
  auto trigger = make("{platform: numeric_state, entity_id: sensor.t, above: 25}");
  auto value = [](const std::string &v) {
    return SnapshotBuilder().set("sensor.t", entity(v)).context();
  };

  EXPECT_FALSE(trigger->fire(value("20")));
  EXPECT_TRUE(trigger->fire(value("26")));
  EXPECT_FALSE(trigger->fire(value("27")));
  EXPECT_FALSE(trigger->fire(value("25")));
  EXPECT_TRUE(trigger->fire(value("30")));
}

TEST(NumericStateTriggerTest, OpenRangeAndNonNumericValues) {
  auto trigger = make(
      "{platform: numeric_state, entity_id: sensor.h, above: 40, below: 60}");
  auto value = [](const std::string &v) {
    return SnapshotBuilder().set("sensor.h", entity(v)).context();
  };

  EXPECT_FALSE(trigger->fire(value("60")));
  EXPECT_FALSE(trigger->fire(value("unavailable")));
  EXPECT_TRUE(trigger->fire(value("50")));
}

TEST(NumericStateTriggerTest, ForDurationGate) {
  auto trigger = make(
      "{platform: numeric_state, entity_id: sensor.t, below: 10, for: '1m'}");
  const auto t0 = auto_core::Clock::now();
  auto value = [](const std::string &v, auto_core::TimePoint now) {
    return SnapshotBuilder().at(now).set("sensor.t", entity(v)).context();
  };

  EXPECT_FALSE(trigger->fire(value("5", t0)));
  EXPECT_FALSE(trigger->fire(value("5", plus_seconds(t0, 30))));
  EXPECT_TRUE(trigger->fire(value("5", plus_seconds(t0, 60))));
  EXPECT_FALSE(trigger->fire(value("5", plus_seconds(t0, 120))));
}

TEST(TimeTriggerTest, AtMatchesOncePerWindow) {
  auto trigger = make("{platform: time, at: '07:30'}");
  auto at = [](auto_core::TimePoint now) {
    return SnapshotBuilder().at(now).context();
  };

  EXPECT_FALSE(trigger->fire(at(today_at(7, 29, 50))));
  EXPECT_TRUE(trigger->fire(at(today_at(7, 30, 0))));
  EXPECT_FALSE(trigger->fire(at(today_at(7, 30, 1))));
  EXPECT_FALSE(trigger->fire(at(today_at(7, 31, 0))));
}

TEST(TimeTriggerTest, WindowWrapsPastMidnight) {
  auto trigger = make("{platform: time, after: '22:00', before: '06:00'}");
  auto at = [](auto_core::TimePoint now) {
    return SnapshotBuilder().at(now).context();
  };

  EXPECT_TRUE(trigger->fire(at(today_at(23, 0))));
  EXPECT_TRUE(trigger->fire(at(today_at(5, 0))));
  EXPECT_FALSE(trigger->fire(at(today_at(12, 0))));
}

TEST(TimeTriggerTest, WeekdayFilter) {
  const auto now = today_at(12, 0);
  const std::string today = auto_core::weekday_name(now);
  const std::string other = today == "monday" ? "tuesday" : "monday";
  auto ctx = SnapshotBuilder().at(now).context();

  std::string capitalized = today;
  capitalized[0] = static_cast<char>(std::toupper(capitalized[0]));

  // Day names are case-insensitive
  auto matching =
      make("{platform: time, after: '00:00', weekday: [" + capitalized + "]}");
  auto excluded = make("{platform: time, after: '00:00', weekday: [" + other + "]}");
  EXPECT_TRUE(matching->fire(ctx));
  EXPECT_FALSE(excluded->fire(ctx));
}

TEST(TimeTriggerTest, IntervalFiresImmediatelyThenEveryPeriod) {
  auto trigger = make("{platform: time, interval: '5m'}");
  const auto t0 = auto_core::Clock::now();
  auto at = [](auto_core::TimePoint now) {
    return SnapshotBuilder().at(now).context();
  };

  EXPECT_TRUE(trigger->fire(at(t0)));
  EXPECT_FALSE(trigger->fire(at(plus_seconds(t0, 120))));
  EXPECT_TRUE(trigger->fire(at(plus_seconds(t0, 300))));
  EXPECT_FALSE(trigger->fire(at(plus_seconds(t0, 400))));
}

TEST(SunTriggerTest, FiresAtEventPlusOffset) {
  auto trigger = make("{platform: sun, event: sunset, offset: -600}");
  const auto sunset = today_at(19, 0);
  auto at = [&](auto_core::TimePoint now) {
    return SnapshotBuilder().at(now).sun("sunset", sunset).context();
  };

  EXPECT_FALSE(trigger->fire(at(sunset)));
  EXPECT_TRUE(trigger->fire(at(today_at(18, 50))));
  EXPECT_FALSE(trigger->fire(at(today_at(18, 50, 1))));
}

TEST(SunTriggerTest, MissingAlmanacNeverFires) {
  auto trigger = make("{platform: sun, event: sunrise}");
  EXPECT_FALSE(trigger->fire(SnapshotBuilder().context()));
}

TEST(EventTriggerTest, MatchesTypeAndDataSubset) {
  auto trigger = make(
      "{platform: event, event_type: button_pressed, "
      "event_data: {button: kitchen}}");

  EXPECT_TRUE(trigger->fire(SnapshotBuilder()
                                .event("button_pressed",
                                       "{button: kitchen, clicks: 2}")
                                .context()));
  EXPECT_FALSE(trigger->fire(
      SnapshotBuilder().event("button_pressed", "{button: hall}").context()));
  EXPECT_FALSE(trigger->fire(SnapshotBuilder().event("button_pressed").context()));
  EXPECT_FALSE(trigger->fire(
      SnapshotBuilder().event("other", "{button: kitchen}").context()));
  EXPECT_FALSE(trigger->fire(SnapshotBuilder().context()));
}

TEST(MqttTriggerTest, MatchesTopicAndOptionalPayload) {
  auto any_payload = make("{platform: mqtt, topic: home/door}");
  auto open_only = make("{platform: mqtt, topic: home/door, payload: open}");

  auto open = SnapshotBuilder().mqtt("home/door", "open").context();
  auto closed = SnapshotBuilder().mqtt("home/door", "closed").context();
  auto elsewhere = SnapshotBuilder().mqtt("home/window", "open").context();

  EXPECT_TRUE(any_payload->fire(closed));
  EXPECT_FALSE(any_payload->fire(elsewhere));
  EXPECT_TRUE(open_only->fire(open));
  EXPECT_FALSE(open_only->fire(closed));
}

TEST(TemplateTriggerTest, FiresWhileTruthy) {
  auto trigger = make(
      "{platform: template, "
      "value_template: \"{{ states('sensor.t') | float > 30 }}\"}");

  EXPECT_FALSE(trigger->fire(SnapshotBuilder().set("sensor.t", entity("20")).context()));
  EXPECT_TRUE(trigger->fire(SnapshotBuilder().set("sensor.t", entity("31")).context()));
}

TEST(TemplateTriggerTest, RenderErrorDoesNotFire) {
  auto trigger = make("{platform: template, value_template: '{{ 1 + }}'}");
  EXPECT_FALSE(trigger->fire(SnapshotBuilder().context()));
}

TEST(TriggerTest, ToYamlRoundTripsThroughFactory) {
  auto trigger = make("{id: t1, platform: mqtt, topic: a/b, payload: go, cooldown: 5}");
  const YAML::Node config = trigger->to_yaml();
  EXPECT_EQ(config["platform"].as<std::string>(), "mqtt");
  auto rebuilt = create_trigger(config, "ignored");
  EXPECT_EQ(rebuilt->id(), "t1");
  EXPECT_EQ(rebuilt->type(), TriggerType::Mqtt);
}
