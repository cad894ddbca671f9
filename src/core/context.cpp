#include "core/context.hpp"

#include <iostream>
#include <stdexcept>

#include "core/template_renderer.hpp"

namespace auto_core {

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  }
  return "info";
}

LogLevel parse_log_level(const std::string &name) {
  if (name == "debug") {
    return LogLevel::Debug;
  } else if (name == "info") {
    return LogLevel::Info;
  } else if (name == "warning" || name == "warn") {
    return LogLevel::Warning;
  } else if (name == "error") {
    return LogLevel::Error;
  }
  throw std::invalid_argument("Invalid log level: '" + name +
                              "'. Valid values: debug, info, warning, error");
}

LogSink stderr_log_sink() {
  return [](LogLevel level, const std::string &message) {
    std::string tag;
    switch (level) {
    case LogLevel::Debug:
      tag = "DEBUG";
      break;
    case LogLevel::Info:
      tag = "INFO";
      break;
    case LogLevel::Warning:
      tag = "WARNING";
      break;
    case LogLevel::Error:
      tag = "ERROR";
      break;
    }
    std::cerr << "[LogAction] " << tag << ": " << message << std::endl;
  };
}

TimePoint Context::now() const { return state ? state->now : Clock::now(); }

const EntityState *Context::entity(const std::string &entity_id) const {
  if (!state) {
    return nullptr;
  }
  auto it = state->entities.find(entity_id);
  return it == state->entities.end() ? nullptr : &it->second;
}

const EntityState *Context::old_entity(const std::string &entity_id) const {
  if (!state) {
    return nullptr;
  }
  auto it = state->old_states.find(entity_id);
  return it == state->old_states.end() ? nullptr : &it->second;
}

std::string Context::render(const std::string &tmpl) const {
  if (!renderer) {
    throw TemplateError("no template renderer configured");
  }
  return renderer->render(tmpl, *this);
}

std::string Context::render_or_raw(const std::string &tmpl) const {
  try {
    return render(tmpl);
  } catch (const TemplateError &e) {
    std::cerr << "[Template] WARNING: render failed for '" << tmpl
              << "': " << e.what() << std::endl;
    return tmpl;
  }
}

Context Context::with_variable(const std::string &key,
                               const YAML::Node &value) const {
  Context copy = *this;
  // Replace the entry; assigning through an existing Node would rebind the
  // node shared with this context
  copy.variables.erase(key);
  copy.variables.emplace(key, value);
  return copy;
}

Context make_context(std::shared_ptr<const StateSnapshot> state,
                     std::shared_ptr<const Capabilities> capabilities) {
  Context ctx;
  ctx.state = state ? std::move(state) : std::make_shared<StateSnapshot>();
  ctx.capabilities = capabilities ? std::move(capabilities)
                                  : std::make_shared<Capabilities>();
  ctx.renderer = std::make_shared<ExpressionRenderer>();
  ctx.cancel = std::make_shared<CancellationToken>();
  return ctx;
}

} // namespace auto_core
