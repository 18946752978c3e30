#include "stepflow/condition/condition_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <string>
#include <vector>

namespace stepflow {

namespace {

enum class TokenType : std::uint8_t {
  Number,
  String,
  Op,
  LParen,
  RParen,
  Dot,
  Ident,
};

struct Token {
  TokenType type;
  std::string text;
  std::size_t pos;
};

auto lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return std::tolower(c); });
  return out;
}

auto is_ident_start(char c) -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

auto is_ident_char(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

auto is_digit(char c) -> bool {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto tokenize(std::string_view src) -> DetailedResult<std::vector<Token>> {
  std::vector<Token> tokens;
  std::size_t i = 0;
  while (i < src.size()) {
    char c = src[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }

    std::size_t start = i;
    if (is_digit(c) || (c == '-' && i + 1 < src.size() && is_digit(src[i + 1]))) {
      ++i;
      while (i < src.size() && is_digit(src[i])) ++i;
      if (i + 1 < src.size() && src[i] == '.' && is_digit(src[i + 1])) {
        ++i;
        while (i < src.size() && is_digit(src[i])) ++i;
      }
      tokens.push_back({TokenType::Number, std::string(src.substr(start, i - start)), start});
      continue;
    }
    if (c == '"') {
      auto end = src.find('"', i + 1);
      if (end == std::string_view::npos) {
        return fail(Error::ValidationError,
                    std::format("Unexpected character '\"' at position {}", start));
      }
      tokens.push_back({TokenType::String, std::string(src.substr(i + 1, end - i - 1)), start});
      i = end + 1;
      continue;
    }
    if (i + 1 < src.size()) {
      auto two = src.substr(i, 2);
      if (two == "==" || two == "!=" || two == ">=" || two == "<=") {
        tokens.push_back({TokenType::Op, std::string(two), start});
        i += 2;
        continue;
      }
    }
    if (c == '>' || c == '<') {
      tokens.push_back({TokenType::Op, std::string(1, c), start});
      ++i;
      continue;
    }
    if (c == '(' || c == ')' || c == '.') {
      auto type = c == '(' ? TokenType::LParen
                           : (c == ')' ? TokenType::RParen : TokenType::Dot);
      tokens.push_back({type, std::string(1, c), start});
      ++i;
      continue;
    }
    if (is_ident_start(c)) {
      while (i < src.size() && is_ident_char(src[i])) ++i;
      tokens.push_back({TokenType::Ident, std::string(src.substr(start, i - start)), start});
      continue;
    }
    return fail(Error::ValidationError,
                std::format("Unexpected character '{}' at position {}", c, start));
  }
  return tokens;
}

auto type_name(const nlohmann::json& v) -> std::string {
  return v.type_name();
}

// Unicode code points in a UTF-8 string.
auto utf8_length(const std::string& s) -> std::int64_t {
  return std::ranges::count_if(
      s, [](unsigned char c) { return (c & 0xC0) != 0x80; });
}

auto parse_number(std::string_view text) -> std::optional<nlohmann::json> {
  auto first = text.data();
  auto last = text.data() + text.size();
  if (text.find_first_of(".eE") == std::string_view::npos) {
    std::int64_t iv{};
    auto [p, ec] = std::from_chars(first, last, iv);
    if (ec == std::errc{} && p == last) {
      return nlohmann::json(iv);
    }
  }
  double dv{};
  auto [p, ec] = std::from_chars(first, last, dv);
  if (ec == std::errc{} && p == last) {
    return nlohmann::json(dv);
  }
  return std::nullopt;
}

// Converts `value` towards the type of `like` for mixed-type comparisons.
auto coerce_to(const nlohmann::json& like, const nlohmann::json& value)
    -> std::optional<nlohmann::json> {
  if (like.is_number()) {
    if (value.is_string()) {
      return parse_number(value.get<std::string>());
    }
    if (value.is_boolean()) {
      return nlohmann::json(value.get<bool>() ? 1 : 0);
    }
    return std::nullopt;
  }
  if (like.is_string()) {
    if (value.is_number()) {
      return nlohmann::json(value.dump());
    }
    if (value.is_boolean()) {
      return nlohmann::json(value.get<bool>() ? "true" : "false");
    }
    return std::nullopt;
  }
  if (like.is_boolean()) {
    if (value.is_number()) {
      return nlohmann::json(value.get<double>() != 0.0);
    }
    if (value.is_string()) {
      auto s = lower(value.get<std::string>());
      if (s == "true") return nlohmann::json(true);
      if (s == "false") return nlohmann::json(false);
    }
  }
  return std::nullopt;
}

auto contains(const nlohmann::json& left, const nlohmann::json& right) -> bool {
  if (left.is_string()) {
    return right.is_string() &&
           left.get_ref<const std::string&>().find(
               right.get_ref<const std::string&>()) != std::string::npos;
  }
  if (left.is_array()) {
    return std::ranges::any_of(left, [&](const nlohmann::json& e) { return e == right; });
  }
  if (left.is_object()) {
    return right.is_string() && left.contains(right.get<std::string>());
  }
  return false;
}

template <typename T>
auto apply_order(const std::string& op, const T& a, const T& b) -> bool {
  if (op == "==") return a == b;
  if (op == "!=") return a != b;
  if (op == ">") return a > b;
  if (op == "<") return a < b;
  if (op == ">=") return a >= b;
  return a <= b;
}

auto compare(const nlohmann::json& left, const std::string& op,
             const nlohmann::json& right) -> DetailedResult<bool> {
  if (left.is_null() && right.is_null()) {
    return op == "==";
  }
  if (left.is_null() || right.is_null()) {
    return op == "!=";
  }
  if (op == "contains") {
    return contains(left, right);
  }

  if (left.is_number() && right.is_number()) {
    if (left.is_number_integer() && right.is_number_integer()) {
      return apply_order(op, left.get<std::int64_t>(), right.get<std::int64_t>());
    }
    return apply_order(op, left.get<double>(), right.get<double>());
  }

  auto rhs = right;
  if (left.type() != right.type()) {
    auto coerced = coerce_to(left, right);
    if (!coerced) {
      if (op == "==" || op == "!=") {
        return op == "!=";
      }
      return fail(Error::ValidationError,
                  std::format("Cannot compare {} with {} using {}",
                              type_name(left), type_name(right), op));
    }
    rhs = std::move(*coerced);
    if (left.is_number()) {
      return compare(left, op, rhs);
    }
  }

  if (left.is_string()) {
    return apply_order(op, left.get_ref<const std::string&>(),
                       rhs.get_ref<const std::string&>());
  }
  if (left.is_boolean()) {
    return apply_order(op, left.get<bool>(), rhs.get<bool>());
  }
  if (op == "==" || op == "!=") {
    return (left == rhs) == (op == "==");
  }
  return fail(Error::ValidationError,
              std::format("Cannot compare {} values using {}", type_name(left), op));
}

class Parser {
public:
  Parser(std::vector<Token> tokens, const StepResults& results,
         const std::optional<StepId>& source)
      : tokens_(std::move(tokens)), results_(results), source_(source) {
  }

  auto parse_expression() -> DetailedResult<bool> {
    auto left = parse_term();
    if (!left) {
      return left;
    }
    bool value = *left;
    while (auto kw = peek_keyword()) {
      if (*kw != "and" && *kw != "or") {
        break;
      }
      ++pos_;
      // Both operands are always evaluated so errors on the right surface.
      auto right = parse_term();
      if (!right) {
        return right;
      }
      value = *kw == "and" ? (value && *right) : (value || *right);
    }
    return value;
  }

  auto parse_accessor_only() -> DetailedResult<nlohmann::json> {
    auto value = parse_accessor(false);
    if (!value) {
      return value;
    }
    if (auto r = expect_end(); !r) {
      return std::unexpected(r.error());
    }
    return value;
  }

  auto expect_end() -> DetailedResult<void> {
    if (pos_ < tokens_.size()) {
      const auto& t = tokens_[pos_];
      return fail(Error::ValidationError,
                  std::format("Unexpected token '{}' at position {}", t.text, t.pos));
    }
    return {};
  }

private:
  auto at_end() const -> bool { return pos_ >= tokens_.size(); }

  auto peek_keyword() const -> std::optional<std::string> {
    if (at_end() || tokens_[pos_].type != TokenType::Ident) {
      return std::nullopt;
    }
    return lower(tokens_[pos_].text);
  }

  auto unexpected_token() const -> std::unexpected<ErrorInfo> {
    if (at_end()) {
      return fail(Error::ValidationError, "Unexpected end of expression");
    }
    const auto& t = tokens_[pos_];
    return fail(Error::ValidationError,
                std::format("Unexpected token '{}' at position {}", t.text, t.pos));
  }

  auto parse_term() -> DetailedResult<bool> {
    if (peek_keyword() == "not") {
      ++pos_;
      auto inner = parse_term();
      if (!inner) {
        return inner;
      }
      return !*inner;
    }
    if (!at_end() && tokens_[pos_].type == TokenType::LParen) {
      ++pos_;
      auto inner = parse_expression();
      if (!inner) {
        return inner;
      }
      if (at_end() || tokens_[pos_].type != TokenType::RParen) {
        return unexpected_token();
      }
      ++pos_;
      return inner;
    }
    return parse_comparison();
  }

  auto parse_comparison() -> DetailedResult<bool> {
    if (auto kw = peek_keyword(); (kw == "true" || kw == "false") && literal_stands_alone()) {
      ++pos_;
      return *kw == "true";
    }

    auto left = parse_value();
    if (!left) {
      return std::unexpected(left.error());
    }

    if (auto kw = peek_keyword()) {
      if (*kw == "is_null") {
        ++pos_;
        return left->is_null();
      }
      if (*kw == "is_not_null") {
        ++pos_;
        return !left->is_null();
      }
    }

    std::string op;
    if (!at_end() && tokens_[pos_].type == TokenType::Op) {
      op = tokens_[pos_].text;
    } else if (peek_keyword() == "contains") {
      op = "contains";
    } else {
      return unexpected_token();
    }
    ++pos_;

    auto right = parse_value();
    if (!right) {
      return std::unexpected(right.error());
    }
    return compare(*left, op, *right);
  }

  // A bare true/false term: the next token ends the term rather than starting
  // a comparison.
  auto literal_stands_alone() const -> bool {
    auto next = pos_ + 1;
    if (next >= tokens_.size() || tokens_[next].type == TokenType::RParen) {
      return true;
    }
    if (tokens_[next].type != TokenType::Ident) {
      return false;
    }
    auto kw = lower(tokens_[next].text);
    return kw == "and" || kw == "or";
  }

  auto parse_value() -> DetailedResult<nlohmann::json> {
    if (at_end()) {
      return unexpected_token();
    }
    const auto& t = tokens_[pos_];
    switch (t.type) {
      case TokenType::Number: {
        ++pos_;
        auto n = parse_number(t.text);
        if (!n) {
          return fail(Error::ValidationError,
                      std::format("Invalid number '{}' at position {}", t.text, t.pos));
        }
        return *n;
      }
      case TokenType::String:
        ++pos_;
        return nlohmann::json(t.text);
      case TokenType::Ident: {
        auto kw = lower(t.text);
        if (kw == "true" || kw == "false") {
          ++pos_;
          return nlohmann::json(kw == "true");
        }
        if (kw == "null") {
          ++pos_;
          return nlohmann::json(nullptr);
        }
        if (kw == "len") {
          return parse_len();
        }
        if (kw == "result") {
          return parse_accessor(true);
        }
        return unexpected_token();
      }
      default:
        return unexpected_token();
    }
  }

  auto parse_len() -> DetailedResult<nlohmann::json> {
    auto start = tokens_[pos_].pos;
    ++pos_;
    if (at_end() || tokens_[pos_].type != TokenType::LParen) {
      return unexpected_token();
    }
    ++pos_;
    auto arg = parse_accessor(true);
    if (!arg) {
      return arg;
    }
    if (at_end() || tokens_[pos_].type != TokenType::RParen) {
      return unexpected_token();
    }
    ++pos_;

    if (arg->is_null()) {
      return nlohmann::json(0);
    }
    if (arg->is_string()) {
      return nlohmann::json(utf8_length(arg->get_ref<const std::string&>()));
    }
    if (arg->is_array() || arg->is_object()) {
      return nlohmann::json(static_cast<std::int64_t>(arg->size()));
    }
    return fail(Error::ValidationError,
                std::format("len() at position {} requires a string, array or "
                            "object, got {}",
                            start, type_name(*arg)));
  }

  // Conditions must name at least one field; resolve() also accepts a bare
  // `result` for the whole value.
  auto parse_accessor(bool require_field) -> DetailedResult<nlohmann::json> {
    if (peek_keyword() != "result") {
      return unexpected_token();
    }
    auto start = tokens_[pos_].pos;
    ++pos_;
    if (require_field && (at_end() || tokens_[pos_].type != TokenType::Dot)) {
      return fail(Error::ValidationError,
                  std::format("Expected field access after 'result' at position {}",
                              start));
    }

    auto root = bind_root();
    if (!root) {
      return std::unexpected(root.error());
    }
    const nlohmann::json* current = *root;
    while (!at_end() && tokens_[pos_].type == TokenType::Dot) {
      ++pos_;
      if (at_end() || tokens_[pos_].type != TokenType::Ident) {
        return unexpected_token();
      }
      const auto& field = tokens_[pos_].text;
      ++pos_;
      if (current == nullptr || !current->is_object()) {
        current = nullptr;
        continue;
      }
      auto it = current->find(field);
      current = it != current->end() ? &*it : nullptr;
    }
    return current != nullptr ? *current : nlohmann::json(nullptr);
  }

  auto bind_root() -> DetailedResult<const nlohmann::json*> {
    if (source_) {
      const auto* r = results_.find(*source_);
      if (r == nullptr) {
        return fail(Error::ValidationError,
                    std::format("Source step {} has no result", *source_));
      }
      return r;
    }
    const auto* r = results_.latest();
    if (r == nullptr) {
      return fail(Error::ValidationError, "No step results available for 'result'");
    }
    return r;
  }

  std::vector<Token> tokens_;
  std::size_t pos_{0};
  const StepResults& results_;
  const std::optional<StepId>& source_;
};

auto trim(std::string_view s) -> std::string_view {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string_view::npos) {
    return {};
  }
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

}  // namespace

auto ConditionEvaluator::evaluate(std::string_view condition,
                                  const StepResults& results,
                                  const std::optional<StepId>& source_step_id)
    -> DetailedResult<bool> {
  auto text = trim(condition);
  auto lowered = lower(text);
  if (text.empty() || lowered == "true") {
    return true;
  }
  if (lowered == "false") {
    return false;
  }

  auto tokens = tokenize(text);
  if (!tokens) {
    return std::unexpected(tokens.error());
  }
  Parser parser{std::move(*tokens), results, source_step_id};
  auto value = parser.parse_expression();
  if (!value) {
    return value;
  }
  if (auto r = parser.expect_end(); !r) {
    return std::unexpected(r.error());
  }
  return value;
}

auto ConditionEvaluator::resolve(std::string_view accessor,
                                 const StepResults& results,
                                 const std::optional<StepId>& source_step_id)
    -> DetailedResult<nlohmann::json> {
  auto tokens = tokenize(trim(accessor));
  if (!tokens) {
    return std::unexpected(tokens.error());
  }
  Parser parser{std::move(*tokens), results, source_step_id};
  return parser.parse_accessor_only();
}

}  // namespace stepflow
