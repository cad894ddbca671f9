#include "conditions/state_condition.hpp"

#include <algorithm>
#include <stdexcept>

#include "core/value_utils.hpp"

namespace auto_conditions {

using auto_core::entity_value;

std::string glob_to_regex(const std::string &glob) {
  std::string out;
  for (char c : glob) {
    switch (c) {
    case '*':
      out += ".*";
      break;
    case '?':
      out += '.';
      break;
    case '.':
    case '\\':
    case '+':
    case '^':
    case '$':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
    case '|':
      out += '\\';
      out += c;
      break;
    default:
      out += c;
    }
  }
  return out;
}

// -----------------------------
// StateCondition
// -----------------------------

StateCondition::StateCondition(ConditionConfig config, std::string entity_id,
                               std::optional<std::string> state,
                               std::optional<std::string> state_not,
                               std::optional<std::string> attribute,
                               bool match)
    : Condition(std::move(config)), entity_id_(std::move(entity_id)),
      state_(std::move(state)), state_not_(std::move(state_not)),
      attribute_(std::move(attribute)), match_(match) {
  if (!match_ || !state_) {
    return;
  }
  try {
    if (state_->rfind("regex:", 0) == 0) {
      pattern_.emplace(state_->substr(6));
    } else if (state_->rfind("glob:", 0) == 0) {
      pattern_.emplace(glob_to_regex(state_->substr(5)));
    }
  } catch (const std::regex_error &e) {
    throw std::runtime_error("state: invalid pattern '" + *state_ +
                             "': " + e.what());
  }
}

bool StateCondition::test(const Context &ctx) const {
  const auto current = entity_value(ctx.entity(entity_id_), attribute_);
  if (!current) {
    return false;
  }
  if (state_) {
    if (pattern_) {
      // regex: anchors at the start only, glob: must cover the whole value
      const bool is_glob = state_->rfind("glob:", 0) == 0;
      const bool ok =
          is_glob ? std::regex_match(*current, *pattern_)
                  : std::regex_search(*current, *pattern_,
                                      std::regex_constants::match_continuous);
      if (!ok) {
        return false;
      }
    } else if (*current != *state_) {
      return false;
    }
  }
  return !(state_not_ && *current == *state_not_);
}

void StateCondition::describe(YAML::Node &out) const {
  out["entity_id"] = entity_id_;
  if (state_) {
    out["state"] = *state_;
  }
  if (state_not_) {
    out["state_not"] = *state_not_;
  }
  if (attribute_) {
    out["attribute"] = *attribute_;
  }
  if (match_) {
    out["match"] = true;
  }
}

// -----------------------------
// NumericStateCondition
// -----------------------------

NumericStateCondition::NumericStateCondition(
    ConditionConfig config, std::string entity_id, std::optional<double> above,
    std::optional<double> below, std::optional<std::string> attribute)
    : Condition(std::move(config)), entity_id_(std::move(entity_id)),
      above_(above), below_(below), attribute_(std::move(attribute)) {}

bool NumericStateCondition::test(const Context &ctx) const {
  const auto text = entity_value(ctx.entity(entity_id_), attribute_);
  if (!text) {
    return false;
  }
  double value = 0.0;
  try {
    std::size_t consumed = 0;
    value = std::stod(*text, &consumed);
    if (consumed != text->size()) {
      return false;
    }
  } catch (const std::logic_error &) {
    return false;
  }
  if (above_ && value <= *above_) {
    return false;
  }
  return !(below_ && value >= *below_);
}

void NumericStateCondition::describe(YAML::Node &out) const {
  out["entity_id"] = entity_id_;
  if (above_) {
    out["above"] = *above_;
  }
  if (below_) {
    out["below"] = *below_;
  }
  if (attribute_) {
    out["attribute"] = *attribute_;
  }
}

// -----------------------------
// ZoneCondition
// -----------------------------

ZoneCondition::ZoneCondition(ConditionConfig config, std::string entity_id,
                             std::string zone)
    : Condition(std::move(config)), entity_id_(std::move(entity_id)),
      zone_(std::move(zone)) {}

bool ZoneCondition::test(const Context &ctx) const {
  const auto zone =
      entity_value(ctx.entity(entity_id_), std::optional<std::string>("zone"));
  return zone && *zone == zone_;
}

void ZoneCondition::describe(YAML::Node &out) const {
  out["entity_id"] = entity_id_;
  out["zone"] = zone_;
}

// -----------------------------
// DeviceCondition
// -----------------------------

DeviceCondition::DeviceCondition(ConditionConfig config, std::string device_id,
                                 std::optional<std::string> entity_id,
                                 std::optional<std::string> domain,
                                 std::optional<std::string> device_type,
                                 std::optional<std::string> state)
    : Condition(std::move(config)), device_id_(std::move(device_id)),
      entity_id_(std::move(entity_id)), domain_(std::move(domain)),
      device_type_(std::move(device_type)), state_(std::move(state)) {}

bool DeviceCondition::test(const Context &ctx) const {
  if (!ctx.state) {
    return false;
  }
  auto it = ctx.state->devices.find(device_id_);
  if (it == ctx.state->devices.end()) {
    return false;
  }
  const auto &device = it->second;
  if (entity_id_ && std::find(device.entities.begin(), device.entities.end(),
                              *entity_id_) == device.entities.end()) {
    return false;
  }
  if (domain_ && device.domain != *domain_) {
    return false;
  }
  if (device_type_ && device.type != *device_type_) {
    return false;
  }
  return !(state_ && device.state != *state_);
}

void DeviceCondition::describe(YAML::Node &out) const {
  out["device_id"] = device_id_;
  if (entity_id_) {
    out["entity_id"] = *entity_id_;
  }
  if (domain_) {
    out["domain"] = *domain_;
  }
  if (device_type_) {
    out["type"] = *device_type_;
  }
  if (state_) {
    out["state"] = *state_;
  }
}

} // namespace auto_conditions
