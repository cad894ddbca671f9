#pragma once

#include <stdexcept>
#include <string>

namespace auto_core {

struct Context;

class TemplateError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Rendering capability shared by every template-aware trigger, condition and
// action. Implementations must be safe to call from several runs at once.
class TemplateRenderer {
public:
  virtual ~TemplateRenderer() = default;

  // Throws TemplateError on syntax or evaluation errors
  virtual std::string render(const std::string &tmpl,
                             const Context &ctx) const = 0;
};

/**
 * @brief Built-in renderer for `{{ expression }}` templates.
 *
 * Text outside braces is copied verbatim. Expressions cover literals,
 * variable paths, comparisons, boolean logic, arithmetic, `~` concatenation,
 * inline `a if cond else b`, `is [not] defined|none` tests, the functions
 * states(), state_attr(), is_state(), is_state_attr(), now(), float(), int()
 * and the filters int, float, string, lower, upper, trim, round, length,
 * abs, default.
 *
 * Lookup order for bare names: context variables, then `event`,
 * `mqtt_message` and `states` from the snapshot.
 */
class ExpressionRenderer : public TemplateRenderer {
public:
  std::string render(const std::string &tmpl,
                     const Context &ctx) const override;
};

// Truthiness of rendered text: "true", "1", "yes", "on" (case-insensitive)
bool is_truthy_text(const std::string &text);

} // namespace auto_core
