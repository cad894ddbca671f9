#include "core/template_renderer.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <vector>

#include "core/context.hpp"
#include "core/value_utils.hpp"

namespace auto_core {

bool is_truthy_text(const std::string &text) {
  const std::string t = lower(text);
  return t == "true" || t == "1" || t == "yes" || t == "on";
}

namespace {

// -----------------------------
// Values
// -----------------------------

struct TValue {
  enum class Kind { Undefined, None, Bool, Int, Float, String, Node };

  Kind kind = Kind::Undefined;
  bool b = false;
  int64_t i = 0;
  double f = 0.0;
  std::string s;
  YAML::Node node;
  std::string name; // for "'x' is undefined" messages

  static TValue undefined(const std::string &name) {
    TValue v;
    v.name = name;
    return v;
  }
  static TValue none() {
    TValue v;
    v.kind = Kind::None;
    return v;
  }
  static TValue boolean(bool value) {
    TValue v;
    v.kind = Kind::Bool;
    v.b = value;
    return v;
  }
  static TValue integer(int64_t value) {
    TValue v;
    v.kind = Kind::Int;
    v.i = value;
    return v;
  }
  static TValue real(double value) {
    TValue v;
    v.kind = Kind::Float;
    v.f = value;
    return v;
  }
  static TValue string(std::string value) {
    TValue v;
    v.kind = Kind::String;
    v.s = std::move(value);
    return v;
  }
  static TValue collection(const YAML::Node &value) {
    TValue v;
    v.kind = Kind::Node;
    v.node = value;
    return v;
  }

  bool is_number() const { return kind == Kind::Int || kind == Kind::Float; }
  double as_double() const { return kind == Kind::Int ? double(i) : f; }
};

TValue from_scalar_text(const std::string &text) {
  static const std::regex int_re(R"(^[-+]?\d+$)");
  static const std::regex float_re(
      R"(^[-+]?(\d+\.\d*|\.\d+|\d+)([eE][-+]?\d+)?$)");
  if (std::regex_match(text, int_re)) {
    try {
      return TValue::integer(std::stoll(text));
    } catch (const std::out_of_range &) {
      return TValue::real(std::stod(text));
    }
  }
  if (std::regex_match(text, float_re)) {
    return TValue::real(std::stod(text));
  }
  const std::string l = lower(text);
  if (l == "true") {
    return TValue::boolean(true);
  }
  if (l == "false") {
    return TValue::boolean(false);
  }
  if (l == "null" || l == "~" || l == "none") {
    return TValue::none();
  }
  return TValue::string(text);
}

TValue from_node(const YAML::Node &node, const std::string &name) {
  if (!node.IsDefined()) {
    return TValue::undefined(name);
  }
  if (node.IsNull()) {
    return TValue::none();
  }
  if (node.IsScalar()) {
    // Quoted scalars stay strings
    if (node.Tag() == "!") {
      return TValue::string(node.Scalar());
    }
    return from_scalar_text(node.Scalar());
  }
  return TValue::collection(node);
}

std::string format_float(double value) {
  if (std::isfinite(value) && value == std::floor(value) &&
      std::fabs(value) < 1e15) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << value;
    return os.str();
  }
  std::ostringstream os;
  os << std::setprecision(15) << value;
  return os.str();
}

std::string to_text(const TValue &v) {
  switch (v.kind) {
  case TValue::Kind::Undefined:
    return "";
  case TValue::Kind::None:
    return "None";
  case TValue::Kind::Bool:
    return v.b ? "True" : "False";
  case TValue::Kind::Int:
    return std::to_string(v.i);
  case TValue::Kind::Float:
    return format_float(v.f);
  case TValue::Kind::String:
    return v.s;
  case TValue::Kind::Node:
    return node_to_string(v.node);
  }
  return "";
}

// Checked int64 arithmetic; overflow is a TemplateError
constexpr int64_t kIntMin = std::numeric_limits<int64_t>::min();
constexpr int64_t kIntMax = std::numeric_limits<int64_t>::max();

int64_t checked_add(int64_t a, int64_t b) {
  if ((b > 0 && a > kIntMax - b) || (b < 0 && a < kIntMin - b)) {
    throw TemplateError("integer overflow in '+'");
  }
  return a + b;
}

int64_t checked_sub(int64_t a, int64_t b) {
  if ((b < 0 && a > kIntMax + b) || (b > 0 && a < kIntMin + b)) {
    throw TemplateError("integer overflow in '-'");
  }
  return a - b;
}

int64_t checked_mul(int64_t a, int64_t b) {
  bool overflow = false;
  if (a > 0) {
    overflow = b > 0 ? a > kIntMax / b : b < kIntMin / a;
  } else if (a < 0) {
    overflow = b > 0 ? a < kIntMin / b : (b != 0 && b < kIntMax / a);
  }
  if (overflow) {
    throw TemplateError("integer overflow in '*'");
  }
  return a * b;
}

int64_t checked_neg(int64_t a) {
  if (a == kIntMin) {
    throw TemplateError("integer overflow in unary '-'");
  }
  return -a;
}

// Floor division and floor modulo (sign of the divisor)
int64_t floor_div(int64_t a, int64_t b) {
  if (b == 0) {
    throw TemplateError("division by zero");
  }
  if (a == kIntMin && b == -1) {
    throw TemplateError("integer overflow in '//'");
  }
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

int64_t floor_mod(int64_t a, int64_t b) {
  if (b == 0) {
    throw TemplateError("division by zero");
  }
  if (b == -1) {
    return 0;
  }
  int64_t r = a % b;
  if (r != 0 && ((r < 0) != (b < 0))) {
    r += b;
  }
  return r;
}

// 2^63 is exactly representable, INT64_MAX is not
bool fits_int64(double value) {
  constexpr double kLimit = 9223372036854775808.0;
  return std::isfinite(value) && value < kLimit && value >= -kLimit;
}

// Float to int64 truncation; non-finite and out-of-range values throw
int64_t checked_truncate(double value) {
  if (!fits_int64(value)) {
    throw TemplateError("cannot convert '" + format_float(value) +
                        "' to int");
  }
  return static_cast<int64_t>(value);
}

bool truthy(const TValue &v) {
  switch (v.kind) {
  case TValue::Kind::Undefined:
  case TValue::Kind::None:
    return false;
  case TValue::Kind::Bool:
    return v.b;
  case TValue::Kind::Int:
    return v.i != 0;
  case TValue::Kind::Float:
    return v.f != 0.0;
  case TValue::Kind::String:
    return !v.s.empty();
  case TValue::Kind::Node:
    return v.node.size() > 0;
  }
  return false;
}

// -----------------------------
// Lexer
// -----------------------------

enum class Tok { End, Name, Number, String, Op };

struct Token {
  Tok type = Tok::End;
  std::string text;
};

std::vector<Token> tokenize(const std::string &src) {
  std::vector<Token> out;
  std::size_t pos = 0;
  while (pos < src.size()) {
    const char c = src[pos];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++pos;
      continue;
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      std::size_t end = pos;
      while (end < src.size() &&
             (std::isalnum(static_cast<unsigned char>(src[end])) ||
              src[end] == '_')) {
        ++end;
      }
      out.push_back({Tok::Name, src.substr(pos, end - pos)});
      pos = end;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
      std::size_t end = pos;
      bool seen_dot = false;
      while (end < src.size() &&
             (std::isdigit(static_cast<unsigned char>(src[end])) ||
              (src[end] == '.' && !seen_dot && end + 1 < src.size() &&
               std::isdigit(static_cast<unsigned char>(src[end + 1]))))) {
        if (src[end] == '.') {
          seen_dot = true;
        }
        ++end;
      }
      out.push_back({Tok::Number, src.substr(pos, end - pos)});
      pos = end;
      continue;
    }
    if (c == '\'' || c == '"') {
      std::string text;
      std::size_t end = pos + 1;
      while (end < src.size() && src[end] != c) {
        if (src[end] == '\\' && end + 1 < src.size()) {
          ++end;
        }
        text.push_back(src[end]);
        ++end;
      }
      if (end >= src.size()) {
        throw TemplateError("unterminated string literal");
      }
      out.push_back({Tok::String, text});
      pos = end + 1;
      continue;
    }
    static const char *kTwoChar[] = {"==", "!=", "<=", ">=", "//"};
    bool matched = false;
    for (const char *op : kTwoChar) {
      if (src.compare(pos, 2, op) == 0) {
        out.push_back({Tok::Op, op});
        pos += 2;
        matched = true;
        break;
      }
    }
    if (matched) {
      continue;
    }
    if (std::string("<>+-*/%~|()[].,").find(c) != std::string::npos) {
      out.push_back({Tok::Op, std::string(1, c)});
      ++pos;
      continue;
    }
    throw TemplateError(std::string("unexpected character '") + c + "'");
  }
  out.push_back({Tok::End, ""});
  return out;
}

// -----------------------------
// Parser / evaluator
// -----------------------------

class Evaluator {
public:
  Evaluator(const std::vector<Token> &tokens, const Context &ctx)
      : tokens_(tokens), ctx_(ctx) {}

  TValue evaluate() {
    TValue v = ternary();
    if (peek().type != Tok::End) {
      throw TemplateError("unexpected token '" + peek().text + "'");
    }
    return v;
  }

private:
  const Token &peek(std::size_t ahead = 0) const {
    const std::size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[idx];
  }

  bool accept_op(const std::string &op) {
    if (peek().type == Tok::Op && peek().text == op) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool accept_name(const std::string &name) {
    if (peek().type == Tok::Name && peek().text == name) {
      ++pos_;
      return true;
    }
    return false;
  }

  void expect_op(const std::string &op) {
    if (!accept_op(op)) {
      throw TemplateError("expected '" + op + "' but found '" + peek().text +
                          "'");
    }
  }

  // Parses an operand without evaluating it when `skip` is set, so that
  // `x is defined and x.y` never touches an undefined `x`.
  template <typename Fn> TValue parse_maybe_skipped(bool skip, Fn fn) {
    const bool saved = skip_;
    skip_ = skip_ || skip;
    TValue v = fn();
    skip_ = saved;
    return v;
  }

  TValue ternary() {
    // Branch order in source is value, condition, alternative; the
    // condition is parsed first from a lookahead copy.
    const std::size_t start = pos_;
    const bool saved = skip_;
    skip_ = true;
    or_expr();
    skip_ = saved;
    if (!accept_name("if")) {
      pos_ = start;
      return or_expr();
    }
    const TValue cond = or_expr();
    const bool take = truthy(cond);
    const std::size_t after_cond = pos_;
    pos_ = start;
    TValue value = parse_maybe_skipped(!take, [this] { return or_expr(); });
    pos_ = after_cond;
    TValue other = TValue::none();
    if (accept_name("else")) {
      other = parse_maybe_skipped(take, [this] { return ternary(); });
    }
    return take ? value : other;
  }

  TValue or_expr() {
    TValue left = and_expr();
    while (accept_name("or")) {
      const bool done = truthy(left);
      TValue right = parse_maybe_skipped(done, [this] { return and_expr(); });
      if (!done) {
        left = right;
      }
    }
    return left;
  }

  TValue and_expr() {
    TValue left = not_expr();
    while (accept_name("and")) {
      const bool done = !truthy(left);
      TValue right = parse_maybe_skipped(done, [this] { return not_expr(); });
      if (!done) {
        left = right;
      }
    }
    return left;
  }

  TValue not_expr() {
    if (accept_name("not")) {
      return TValue::boolean(!truthy(not_expr()));
    }
    return comparison();
  }

  TValue comparison() {
    TValue left = concat();
    while (true) {
      if (peek().type == Tok::Op &&
          (peek().text == "==" || peek().text == "!=" || peek().text == "<" ||
           peek().text == "<=" || peek().text == ">" || peek().text == ">=")) {
        const std::string op = peek().text;
        ++pos_;
        TValue right = concat();
        left = skip_ ? TValue::none()
                     : TValue::boolean(compare(op, left, right));
      } else if (accept_name("in")) {
        TValue right = concat();
        left = skip_ ? TValue::none()
                     : TValue::boolean(contains(right, left));
      } else if (peek().type == Tok::Name && peek().text == "not" &&
                 peek(1).type == Tok::Name && peek(1).text == "in") {
        pos_ += 2;
        TValue right = concat();
        left = skip_ ? TValue::none()
                     : TValue::boolean(!contains(right, left));
      } else if (accept_name("is")) {
        const bool negate = accept_name("not");
        if (peek().type != Tok::Name) {
          throw TemplateError("expected test name after 'is'");
        }
        const std::string test = peek().text;
        ++pos_;
        bool result = false;
        if (test == "defined") {
          result = left.kind != TValue::Kind::Undefined;
        } else if (test == "none") {
          result = left.kind == TValue::Kind::None;
        } else if (test == "number") {
          result = left.is_number();
        } else if (test == "string") {
          result = left.kind == TValue::Kind::String;
        } else {
          throw TemplateError("unknown test '" + test + "'");
        }
        left = TValue::boolean(negate ? !result : result);
      } else {
        return left;
      }
    }
  }

  TValue concat() {
    TValue left = additive();
    while (accept_op("~")) {
      TValue right = additive();
      left = TValue::string(to_text(left) + to_text(right));
    }
    return left;
  }

  TValue additive() {
    TValue left = term();
    while (true) {
      if (accept_op("+")) {
        TValue right = term();
        if (skip_) {
          left = TValue::none();
        } else if (left.kind == TValue::Kind::String &&
            right.kind == TValue::Kind::String) {
          left = TValue::string(left.s + right.s);
        } else {
          left = arithmetic('+', left, right);
        }
      } else if (accept_op("-")) {
        TValue right = term();
        left = skip_ ? TValue::none() : arithmetic('-', left, right);
      } else {
        return left;
      }
    }
  }

  TValue term() {
    TValue left = unary();
    while (true) {
      char op = 0;
      if (accept_op("*")) {
        op = '*';
      } else if (accept_op("//")) {
        op = 'f';
      } else if (accept_op("/")) {
        op = '/';
      } else if (accept_op("%")) {
        op = '%';
      } else {
        return left;
      }
      TValue right = unary();
      left = skip_ ? TValue::none() : arithmetic(op, left, right);
    }
  }

  TValue unary() {
    if (accept_op("-")) {
      TValue v = unary();
      if (skip_) {
        return v;
      }
      require_number(v, "-");
      return v.kind == TValue::Kind::Int ? TValue::integer(checked_neg(v.i))
                                         : TValue::real(-v.f);
    }
    if (accept_op("+")) {
      TValue v = unary();
      if (!skip_) {
        require_number(v, "+");
      }
      return v;
    }
    return filtered();
  }

  TValue filtered() {
    TValue value = postfix();
    while (accept_op("|")) {
      if (peek().type != Tok::Name) {
        throw TemplateError("expected filter name after '|'");
      }
      const std::string name = peek().text;
      ++pos_;
      std::vector<TValue> args;
      if (accept_op("(")) {
        args = arguments();
      }
      value = skip_ ? TValue::none() : apply_filter(name, value, args);
    }
    return value;
  }

  TValue postfix() {
    TValue value = primary();
    while (true) {
      if (accept_op(".")) {
        if (peek().type != Tok::Name && peek().type != Tok::Number) {
          throw TemplateError("expected attribute name after '.'");
        }
        const std::string key = peek().text;
        ++pos_;
        value = skip_ ? TValue::none() : member(value, key);
      } else if (accept_op("[")) {
        TValue key = ternary();
        expect_op("]");
        value = skip_ ? TValue::none() : member(value, to_text(key));
      } else {
        return value;
      }
    }
  }

  std::vector<TValue> arguments() {
    std::vector<TValue> args;
    if (accept_op(")")) {
      return args;
    }
    do {
      args.push_back(ternary());
    } while (accept_op(","));
    expect_op(")");
    return args;
  }

  TValue primary() {
    const Token tok = peek();
    switch (tok.type) {
    case Tok::Number:
      ++pos_;
      return from_scalar_text(tok.text);
    case Tok::String:
      ++pos_;
      return TValue::string(tok.text);
    case Tok::Name: {
      ++pos_;
      if (tok.text == "true" || tok.text == "True") {
        return TValue::boolean(true);
      }
      if (tok.text == "false" || tok.text == "False") {
        return TValue::boolean(false);
      }
      if (tok.text == "none" || tok.text == "None") {
        return TValue::none();
      }
      if (accept_op("(")) {
        const auto args = arguments();
        return skip_ ? TValue::none() : call(tok.text, args);
      }
      return lookup(tok.text);
    }
    case Tok::Op:
      if (accept_op("(")) {
        TValue v = ternary();
        expect_op(")");
        return v;
      }
      if (accept_op("[")) {
        YAML::Node list(YAML::NodeType::Sequence);
        if (!accept_op("]")) {
          do {
            list.push_back(to_text(ternary()));
          } while (accept_op(","));
          expect_op("]");
        }
        return TValue::collection(list);
      }
      throw TemplateError("unexpected token '" + tok.text + "'");
    case Tok::End:
      break;
    }
    throw TemplateError("unexpected end of expression");
  }

  // ---- semantics ----

  static void require_number(const TValue &v, const std::string &op) {
    if (!v.is_number()) {
      throw TemplateError("unsupported operand for '" + op + "': '" +
                          to_text(v) + "'");
    }
  }

  static TValue arithmetic(char op, const TValue &a, const TValue &b) {
    require_number(a, std::string(1, op));
    require_number(b, std::string(1, op));
    if (op == '/') {
      if (b.as_double() == 0.0) {
        throw TemplateError("division by zero");
      }
      return TValue::real(a.as_double() / b.as_double());
    }
    if (a.kind == TValue::Kind::Int && b.kind == TValue::Kind::Int) {
      switch (op) {
      case '+':
        return TValue::integer(checked_add(a.i, b.i));
      case '-':
        return TValue::integer(checked_sub(a.i, b.i));
      case '*':
        return TValue::integer(checked_mul(a.i, b.i));
      case 'f':
        return TValue::integer(floor_div(a.i, b.i));
      case '%':
        return TValue::integer(floor_mod(a.i, b.i));
      }
    }
    const double x = a.as_double();
    const double y = b.as_double();
    switch (op) {
    case '+':
      return TValue::real(x + y);
    case '-':
      return TValue::real(x - y);
    case '*':
      return TValue::real(x * y);
    case 'f':
      if (y == 0.0) {
        throw TemplateError("division by zero");
      }
      return TValue::real(std::floor(x / y));
    case '%':
      if (y == 0.0) {
        throw TemplateError("division by zero");
      }
      return TValue::real(std::fmod(x, y));
    }
    throw TemplateError("unknown operator");
  }

  static bool compare(const std::string &op, const TValue &a,
                      const TValue &b) {
    if (op == "==" || op == "!=") {
      bool equal = false;
      if (a.is_number() && b.is_number()) {
        equal = a.as_double() == b.as_double();
      } else if (a.kind == TValue::Kind::Bool &&
                 b.kind == TValue::Kind::Bool) {
        equal = a.b == b.b;
      } else if (a.kind == b.kind) {
        equal = to_text(a) == to_text(b);
      }
      return op == "==" ? equal : !equal;
    }
    int order = 0;
    if (a.is_number() && b.is_number()) {
      const double x = a.as_double();
      const double y = b.as_double();
      order = x < y ? -1 : (x > y ? 1 : 0);
    } else if (a.kind == TValue::Kind::String &&
               b.kind == TValue::Kind::String) {
      order = a.s.compare(b.s);
    } else {
      throw TemplateError("cannot order '" + to_text(a) + "' and '" +
                          to_text(b) + "'");
    }
    if (op == "<") {
      return order < 0;
    }
    if (op == "<=") {
      return order <= 0;
    }
    if (op == ">") {
      return order > 0;
    }
    return order >= 0;
  }

  static bool contains(const TValue &haystack, const TValue &needle) {
    if (haystack.kind == TValue::Kind::String) {
      return haystack.s.find(to_text(needle)) != std::string::npos;
    }
    if (haystack.kind == TValue::Kind::Node) {
      const std::string key = to_text(needle);
      if (haystack.node.IsMap()) {
        return static_cast<bool>(haystack.node[key]);
      }
      for (const auto &item : haystack.node) {
        if (node_to_string(item) == key) {
          return true;
        }
      }
      return false;
    }
    throw TemplateError("'in' requires a string, list or mapping");
  }

  static TValue member(const TValue &value, const std::string &key) {
    if (value.kind == TValue::Kind::Undefined) {
      throw TemplateError("'" + value.name + "' is undefined");
    }
    const std::string path = value.name.empty() ? key : value.name + "." + key;
    if (value.kind != TValue::Kind::Node) {
      return TValue::undefined(path);
    }
    if (value.node.IsMap()) {
      TValue out = from_node(value.node[key], path);
      out.name = path;
      return out;
    }
    if (value.node.IsSequence()) {
      try {
        const long idx = std::stol(key);
        if (idx >= 0 && static_cast<std::size_t>(idx) < value.node.size()) {
          return from_node(value.node[static_cast<std::size_t>(idx)], path);
        }
      } catch (const std::logic_error &) {
        // non-numeric index
      }
    }
    return TValue::undefined(path);
  }

  YAML::Node entity_node(const EntityState &entity) const {
    YAML::Node node(YAML::NodeType::Map);
    node["state"] = entity.state;
    YAML::Node attrs(YAML::NodeType::Map);
    for (const auto &[key, value] : entity.attributes) {
      attrs[key] = value;
    }
    node["attributes"] = attrs;
    return node;
  }

  TValue lookup(const std::string &name) const {
    auto it = ctx_.variables.find(name);
    if (it != ctx_.variables.end()) {
      TValue v = from_node(it->second, name);
      v.name = name;
      return v;
    }
    if (ctx_.state) {
      if (name == "event" && ctx_.state->event) {
        YAML::Node node(YAML::NodeType::Map);
        node["event_type"] = ctx_.state->event->event_type;
        node["data"] = ctx_.state->event->data;
        TValue v = TValue::collection(node);
        v.name = name;
        return v;
      }
      if (name == "mqtt_message" && ctx_.state->mqtt_message) {
        YAML::Node node(YAML::NodeType::Map);
        node["topic"] = ctx_.state->mqtt_message->topic;
        node["payload"] = ctx_.state->mqtt_message->payload;
        TValue v = TValue::collection(node);
        v.name = name;
        return v;
      }
      if (name == "states") {
        // states.<domain>.<object_id>.state
        YAML::Node root(YAML::NodeType::Map);
        for (const auto &[entity_id, entity] : ctx_.state->entities) {
          const auto dot = entity_id.find('.');
          if (dot == std::string::npos) {
            continue;
          }
          root[entity_id.substr(0, dot)][entity_id.substr(dot + 1)] =
              entity_node(entity);
        }
        TValue v = TValue::collection(root);
        v.name = name;
        return v;
      }
    }
    return TValue::undefined(name);
  }

  static void require_args(const std::string &fn,
                           const std::vector<TValue> &args, std::size_t min,
                           std::size_t max) {
    if (args.size() < min || args.size() > max) {
      throw TemplateError("wrong number of arguments for '" + fn + "'");
    }
  }

  TValue call(const std::string &fn, const std::vector<TValue> &args) const {
    if (fn == "states") {
      require_args(fn, args, 1, 1);
      const EntityState *e = ctx_.entity(to_text(args[0]));
      return TValue::string(e ? e->state : "unknown");
    }
    if (fn == "state_attr") {
      require_args(fn, args, 2, 2);
      auto value = entity_value(ctx_.entity(to_text(args[0])),
                                std::optional<std::string>(to_text(args[1])));
      if (!value) {
        return TValue::none();
      }
      const EntityState *e = ctx_.entity(to_text(args[0]));
      return from_node(e->attributes.at(to_text(args[1])), to_text(args[1]));
    }
    if (fn == "is_state") {
      require_args(fn, args, 2, 2);
      const EntityState *e = ctx_.entity(to_text(args[0]));
      return TValue::boolean(e && e->state == to_text(args[1]));
    }
    if (fn == "is_state_attr") {
      require_args(fn, args, 3, 3);
      auto value = entity_value(ctx_.entity(to_text(args[0])),
                                std::optional<std::string>(to_text(args[1])));
      return TValue::boolean(value && *value == to_text(args[2]));
    }
    if (fn == "now") {
      require_args(fn, args, 0, 0);
      return TValue::string(format_time(ctx_.now()));
    }
    if (fn == "float" || fn == "int") {
      require_args(fn, args, 1, 2);
      std::vector<TValue> rest(args.begin() + 1, args.end());
      return apply_filter(fn, args[0], rest);
    }
    throw TemplateError("unknown function '" + fn + "'");
  }

  static TValue apply_filter(const std::string &name, const TValue &value,
                             const std::vector<TValue> &args) {
    if (name == "default" || name == "d") {
      require_args(name, args, 1, 2);
      const bool use_falsy = args.size() == 2 && truthy(args[1]);
      if (value.kind == TValue::Kind::Undefined ||
          (use_falsy && !truthy(value))) {
        return args[0];
      }
      return value;
    }
    if (name == "float") {
      require_args(name, args, 0, 1);
      if (value.is_number()) {
        return TValue::real(value.as_double());
      }
      try {
        std::size_t consumed = 0;
        const std::string text = to_text(value);
        const double d = std::stod(text, &consumed);
        if (consumed == text.size()) {
          return TValue::real(d);
        }
      } catch (const std::logic_error &) {
        // fall through to the default
      }
      return args.empty() ? TValue::real(0.0) : args[0];
    }
    if (name == "int") {
      require_args(name, args, 0, 1);
      if (value.kind == TValue::Kind::Int) {
        return value;
      }
      if (value.kind == TValue::Kind::Float) {
        return TValue::integer(checked_truncate(value.f));
      }
      const std::string text = to_text(value);
      try {
        std::size_t consumed = 0;
        const int64_t i = std::stoll(text, &consumed);
        if (consumed == text.size()) {
          return TValue::integer(i);
        }
      } catch (const std::logic_error &) {
        // not an integer literal, try a float
      }
      try {
        std::size_t consumed = 0;
        const double d = std::stod(text, &consumed);
        if (consumed == text.size() && fits_int64(d)) {
          return TValue::integer(static_cast<int64_t>(d));
        }
      } catch (const std::logic_error &) {
        // fall through to the default
      }
      return args.empty() ? TValue::integer(0) : args[0];
    }
    if (name == "string") {
      return TValue::string(to_text(value));
    }
    if (name == "lower") {
      return TValue::string(lower(to_text(value)));
    }
    if (name == "upper") {
      std::string text = to_text(value);
      for (auto &c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      }
      return TValue::string(text);
    }
    if (name == "trim") {
      const std::string text = to_text(value);
      const auto first = text.find_first_not_of(" \t\r\n");
      if (first == std::string::npos) {
        return TValue::string("");
      }
      const auto last = text.find_last_not_of(" \t\r\n");
      return TValue::string(text.substr(first, last - first + 1));
    }
    if (name == "round") {
      require_args(name, args, 0, 1);
      require_number(value, "round");
      const int64_t digits = args.empty() ? 0 : args[0].i;
      const double scale = std::pow(10.0, static_cast<double>(digits));
      return TValue::real(std::round(value.as_double() * scale) / scale);
    }
    if (name == "abs") {
      require_number(value, "abs");
      return value.kind == TValue::Kind::Int
                 ? TValue::integer(value.i < 0 ? -value.i : value.i)
                 : TValue::real(std::fabs(value.f));
    }
    if (name == "length" || name == "count") {
      if (value.kind == TValue::Kind::Node) {
        return TValue::integer(static_cast<int64_t>(value.node.size()));
      }
      return TValue::integer(static_cast<int64_t>(to_text(value).size()));
    }
    throw TemplateError("unknown filter '" + name + "'");
  }

  const std::vector<Token> &tokens_;
  const Context &ctx_;
  std::size_t pos_ = 0;
  bool skip_ = false;
};

} // namespace

std::string ExpressionRenderer::render(const std::string &tmpl,
                                       const Context &ctx) const {
  if (tmpl.find("{{") == std::string::npos &&
      tmpl.find("{%") == std::string::npos) {
    return tmpl;
  }

  std::string out;
  std::size_t pos = 0;
  while (pos < tmpl.size()) {
    const std::size_t open = tmpl.find('{', pos);
    if (open == std::string::npos || open + 1 >= tmpl.size()) {
      out.append(tmpl, pos, std::string::npos);
      break;
    }
    const char kind = tmpl[open + 1];
    if (kind == '%') {
      throw TemplateError("statement blocks are not supported");
    }
    if (kind != '{') {
      out.append(tmpl, pos, open + 1 - pos);
      pos = open + 1;
      continue;
    }
    out.append(tmpl, pos, open - pos);
    const std::size_t close = tmpl.find("}}", open + 2);
    if (close == std::string::npos) {
      throw TemplateError("unterminated '{{' in template");
    }
    const std::string expr = tmpl.substr(open + 2, close - open - 2);
    const auto tokens = tokenize(expr);
    if (tokens.size() == 1) {
      throw TemplateError("empty expression");
    }
    Evaluator evaluator(tokens, ctx);
    out += to_text(evaluator.evaluate());
    pos = close + 2;
  }
  return out;
}

} // namespace auto_core
