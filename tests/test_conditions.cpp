#include <gtest/gtest.h>

#include "conditions/condition_factory.hpp"
#include "conditions/state_condition.hpp"
#include "test_support.hpp"

using auto_conditions::ConditionType;
using auto_conditions::create_condition;
using test_support::entity;
using test_support::SnapshotBuilder;
using test_support::today_at;

namespace {

auto_conditions::ConditionPtr make(const std::string &yaml) {
  return create_condition(YAML::Load(yaml), "condition_0");
}

test_support::Context home() {
  return SnapshotBuilder()
      .set("light.kitchen", entity("on", "brightness: 200"))
      .set("sensor.temperature", entity("21.5"))
      .set("sensor.broken", entity("unavailable"))
      .set("person.alex", entity("home", "zone: home"))
      .set("media_player.living_room", entity("playing_music"))
      .context();
}

} // namespace

TEST(StateConditionTest, ExactStateAndStateNot) {
  auto ctx = home();
  EXPECT_TRUE(make("{entity_id: light.kitchen, state: 'on'}")->evaluate(ctx));
  EXPECT_FALSE(make("{entity_id: light.kitchen, state: 'off'}")->evaluate(ctx));
  EXPECT_TRUE(make("{entity_id: light.kitchen, state_not: 'off'}")->evaluate(ctx));
  EXPECT_FALSE(make("{entity_id: light.kitchen, state_not: 'on'}")->evaluate(ctx));
  EXPECT_TRUE(make("{entity_id: light.kitchen, attribute: brightness, state: '200'}")
                  ->evaluate(ctx));
}

TEST(StateConditionTest, MissingEntityIsFalse) {
  auto ctx = home();
  EXPECT_FALSE(make("{entity_id: light.ghost, state: 'on'}")->evaluate(ctx));
  EXPECT_FALSE(make("{entity_id: light.ghost, state_not: 'on'}")->evaluate(ctx));
}

TEST(StateConditionTest, PatternMatching) {
  auto ctx = home();
  EXPECT_TRUE(make("{entity_id: media_player.living_room, match: true, "
                   "state: 'regex:play'}")
                  ->evaluate(ctx));
  // regex: anchors at the start of the value
  EXPECT_FALSE(make("{entity_id: media_player.living_room, match: true, "
                    "state: 'regex:music'}")
                   ->evaluate(ctx));
  EXPECT_TRUE(make("{entity_id: media_player.living_room, match: true, "
                   "state: 'glob:play*'}")
                  ->evaluate(ctx));
  EXPECT_FALSE(make("{entity_id: media_player.living_room, match: true, "
                    "state: 'glob:play'}")
                   ->evaluate(ctx));
  // Without match the prefix is literal text
  EXPECT_FALSE(make("{entity_id: media_player.living_room, "
                    "state: 'glob:play*'}")
                   ->evaluate(ctx));
}

TEST(StateConditionTest, InvalidRegexIsRejected) {
  EXPECT_THROW(make("{entity_id: a.b, match: true, state: 'regex:(['}"),
               std::runtime_error);
}

TEST(StateConditionTest, GlobTranslation) {
  EXPECT_EQ(auto_conditions::glob_to_regex("a*b?.c"), "a.*b.\\.c");
}

TEST(NumericStateConditionTest, OpenRange) {
  auto ctx = home();
  EXPECT_TRUE(make("{condition: numeric_state, entity_id: sensor.temperature, "
                   "above: 20, below: 22}")
                  ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: numeric_state, entity_id: sensor.temperature, "
                    "above: 21.5}")
                   ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: numeric_state, entity_id: sensor.broken, "
                    "below: 100}")
                   ->evaluate(ctx));
  EXPECT_THROW(make("{condition: numeric_state, entity_id: sensor.temperature}"),
               std::runtime_error);
}

TEST(TimeConditionTest, WindowAndWrap) {
  auto at = [](int h, int m) { return SnapshotBuilder().at(today_at(h, m)).context(); };
  auto day = make("{condition: time, after: '08:00', before: '18:00'}");
  auto night = make("{condition: time, after: '22:00', before: '06:00'}");

  EXPECT_TRUE(day->evaluate(at(12, 0)));
  EXPECT_FALSE(day->evaluate(at(19, 0)));
  EXPECT_TRUE(night->evaluate(at(23, 30)));
  EXPECT_TRUE(night->evaluate(at(2, 0)));
  EXPECT_FALSE(night->evaluate(at(12, 0)));
}

TEST(TimeConditionTest, WeekdayFilter) {
  const auto now = today_at(12, 0);
  const std::string today = auto_core::weekday_name(now);
  const std::string other = today == "sunday" ? "monday" : "sunday";
  auto ctx = SnapshotBuilder().at(now).context();

  EXPECT_TRUE(make("{condition: time, weekday: [" + today + "]}")->evaluate(ctx));
  EXPECT_FALSE(make("{condition: time, weekday: [" + other + "]}")->evaluate(ctx));
}

TEST(SunConditionTest, BeforeAndAfterEvents) {
  const auto sunrise = today_at(6, 30);
  const auto sunset = today_at(19, 0);
  auto at = [&](int h, int m) {
    return SnapshotBuilder()
        .at(today_at(h, m))
        .sun("sunrise", sunrise)
        .sun("sunset", sunset)
        .context();
  };
  auto daytime = make("{condition: sun, after: sunrise, before: sunset}");
  auto late = make("{condition: sun, after: sunset, after_offset: 3600}");

  EXPECT_TRUE(daytime->evaluate(at(12, 0)));
  EXPECT_FALSE(daytime->evaluate(at(5, 0)));
  EXPECT_FALSE(daytime->evaluate(at(20, 0)));
  EXPECT_FALSE(late->evaluate(at(19, 30)));
  EXPECT_TRUE(late->evaluate(at(20, 30)));
}

TEST(SunConditionTest, MissingEventIsNotChecked) {
  auto cond = make("{condition: sun, before: sunset}");
  EXPECT_TRUE(cond->evaluate(SnapshotBuilder().context()));
}

TEST(TemplateConditionTest, TruthyRender) {
  auto ctx = home();
  EXPECT_TRUE(make("{condition: template, "
                   "value_template: \"{{ is_state('light.kitchen', 'on') }}\"}")
                  ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: template, "
                    "value_template: \"{{ states('sensor.temperature') | float > 25 }}\"}")
                   ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: template, value_template: '{{ 1 + }}'}")
                   ->evaluate(ctx));
}

TEST(ZoneConditionTest, ComparesZoneAttribute) {
  auto ctx = home();
  EXPECT_TRUE(make("{condition: zone, entity_id: person.alex, zone: home}")
                  ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: zone, entity_id: person.alex, zone: work}")
                   ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: zone, entity_id: light.kitchen, zone: home}")
                   ->evaluate(ctx));
}

TEST(DeviceConditionTest, MatchesKnownDeviceFields) {
  auto_core::DeviceInfo lock;
  lock.domain = "lock";
  lock.type = "deadbolt";
  lock.state = "locked";
  lock.entities = {"lock.front_door"};
  auto ctx = SnapshotBuilder().device("dev_front", lock).context();

  EXPECT_TRUE(make("{condition: device, device_id: dev_front, domain: lock, "
                   "type: deadbolt, state: locked, entity_id: lock.front_door}")
                  ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: device, device_id: dev_front, state: unlocked}")
                   ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: device, device_id: dev_front, "
                    "entity_id: lock.back_door}")
                   ->evaluate(ctx));
  EXPECT_FALSE(make("{condition: device, device_id: dev_missing}")->evaluate(ctx));
}

TEST(LogicalConditionTest, AndOrNot) {
  auto ctx = home();
  auto both = make(R"({condition: and, conditions: [
      {entity_id: light.kitchen, state: 'on'},
      {condition: zone, entity_id: person.alex, zone: home}]})");
  auto either = make(R"({condition: or, conditions: [
      {entity_id: light.kitchen, state: 'off'},
      {condition: zone, entity_id: person.alex, zone: home}]})");
  auto negated = make(R"({condition: not, conditions: [
      {entity_id: light.kitchen, state: 'off'}]})");
  auto empty_and = make("{condition: and, conditions: []}");
  auto empty_or = make("{condition: or, conditions: []}");

  EXPECT_TRUE(both->evaluate(ctx));
  EXPECT_TRUE(either->evaluate(ctx));
  EXPECT_TRUE(negated->evaluate(ctx));
  EXPECT_TRUE(empty_and->evaluate(ctx));
  EXPECT_FALSE(empty_or->evaluate(ctx));
}

TEST(LogicalConditionTest, NotRequiresExactlyOneChild) {
  EXPECT_THROW(make("{condition: not, conditions: []}"), std::runtime_error);
  EXPECT_THROW(make("{condition: and}"), std::runtime_error);
}

TEST(ConditionTest, DisabledConditionPasses) {
  auto cond = make("{entity_id: light.kitchen, state: 'off', enabled: false}");
  EXPECT_TRUE(cond->evaluate(home()));
}

TEST(ConditionTest, ChildIdsDeriveFromParent) {
  auto cond = make(R"({id: guard, condition: and, conditions: [
      {entity_id: a.b, state: x}]})");
  const YAML::Node out = cond->to_yaml();
  EXPECT_EQ(out["condition"].as<std::string>(), "and");
  EXPECT_EQ(out["conditions"][0]["id"].as<std::string>(), "guard_0");
}

TEST(ConditionTest, AllOfStopsAtFirstFailure) {
  std::vector<auto_conditions::ConditionPtr> list;
  list.push_back(make("{entity_id: light.kitchen, state: 'on'}"));
  list.push_back(make("{entity_id: light.kitchen, state: 'off'}"));
  EXPECT_FALSE(auto_conditions::all_of(list, home()));
  list.pop_back();
  EXPECT_TRUE(auto_conditions::all_of(list, home()));
}

TEST(ConditionTest, ToYamlRebuildsEquivalentConditions) {
  auto_core::DeviceInfo lock;
  lock.domain = "lock";
  lock.type = "deadbolt";
  lock.state = "locked";
  lock.entities = {"lock.front_door"};

  auto at = [&](int hour, const std::string &kitchen) {
    return SnapshotBuilder()
        .at(today_at(hour, 0))
        .set("light.kitchen", entity(kitchen, "brightness: 200"))
        .set("sensor.temperature", entity(hour < 12 ? "18" : "23.5"))
        .set("person.alex", entity("home", hour < 12 ? "zone: home" : "zone: work"))
        .set("media_player.living_room", entity("playing_music"))
        .sun("sunrise", today_at(6, 30))
        .sun("sunset", today_at(19, 0))
        .device("dev_front", lock)
        .context();
  };
  const std::vector<test_support::Context> contexts = {
      at(2, "off"), at(9, "on"), at(13, "on"), at(21, "off")};

  const std::vector<std::string> configs = {
      "{entity_id: light.kitchen, state: 'on'}",
      "{entity_id: light.kitchen, state_not: 'on'}",
      "{entity_id: light.kitchen, attribute: brightness, state: '200'}",
      "{entity_id: media_player.living_room, match: true, state: 'glob:play*'}",
      "{entity_id: media_player.living_room, match: true, state: 'regex:pause'}",
      "{condition: numeric_state, entity_id: sensor.temperature, above: 20, below: 30}",
      "{condition: numeric_state, entity_id: light.kitchen, attribute: brightness, "
      "below: 100}",
      "{condition: time, after: '08:00', before: '18:00'}",
      "{condition: time, after: '20:00', before: '06:00'}",
      "{condition: time, weekday: [" + auto_core::weekday_name(today_at(12, 0)) + "]}",
      "{condition: sun, after: sunrise, before: sunset}",
      "{condition: sun, after: sunset, after_offset: 3600}",
      "{condition: sun, before: sunrise, before_offset: -1800}",
      "{condition: template, value_template: \"{{ states('sensor.temperature') "
      "| float > 20 }}\"}",
      "{condition: zone, entity_id: person.alex, zone: home}",
      "{condition: device, device_id: dev_front, domain: lock, type: deadbolt, "
      "state: locked, entity_id: lock.front_door}",
      "{entity_id: light.kitchen, state: 'off', enabled: false}",
      R"({condition: and, conditions: [
          {entity_id: light.kitchen, state: 'on'},
          {condition: or, conditions: [
              {condition: zone, entity_id: person.alex, zone: home},
              {condition: not, conditions: [{condition: time, after: '12:00'}]}]}]})",
  };

  for (const auto &yaml : configs) {
    SCOPED_TRACE(yaml);
    auto original = make(yaml);
    const YAML::Node config = original->to_yaml();
    auto rebuilt = create_condition(YAML::Load(YAML::Dump(config)), "other");

    EXPECT_EQ(rebuilt->id(), original->id());
    EXPECT_EQ(rebuilt->type(), original->type());
    EXPECT_EQ(YAML::Dump(rebuilt->to_yaml()), YAML::Dump(config));
    for (std::size_t i = 0; i < contexts.size(); ++i) {
      EXPECT_EQ(rebuilt->evaluate(contexts[i]), original->evaluate(contexts[i]))
          << "context " << i;
    }
  }
}
