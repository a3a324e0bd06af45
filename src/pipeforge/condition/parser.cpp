#include "pipeforge/condition/expression.hpp"

#include "pipeforge/util/log.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cctype>
#include <format>
#include <optional>
#include <utility>

namespace pipeforge {

using namespace condition;

namespace {

enum class TokenKind : std::uint8_t {
  LParen,
  RParen,
  Comma,
  And,
  Or,
  Bang,
  Equal,
  NotEqual,
  String,
  Ident,
  End,
};

struct Token {
  TokenKind kind{TokenKind::End};
  std::string text;
  std::size_t offset{0};
};

[[nodiscard]] auto is_ident_start(char c) -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] auto is_ident_char(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
         c == '.' || c == '-';
}

[[nodiscard]] auto strip_wrapper(std::string_view text) -> std::string {
  auto body = boost::algorithm::trim_copy(std::string(text));
  if (boost::algorithm::starts_with(body, "${{") &&
      boost::algorithm::ends_with(body, "}}") && body.size() >= 5) {
    body = boost::algorithm::trim_copy(body.substr(3, body.size() - 5));
  }
  return body;
}

[[nodiscard]] auto function_named(std::string_view name)
    -> std::optional<Function> {
  using boost::algorithm::iequals;
  if (iequals(name, "startsWith")) {
    return Function::StartsWith;
  }
  if (iequals(name, "endsWith")) {
    return Function::EndsWith;
  }
  if (iequals(name, "contains")) {
    return Function::Contains;
  }
  if (iequals(name, "matches")) {
    return Function::Matches;
  }
  return std::nullopt;
}

} // namespace

class ConditionParser {
public:
  ConditionParser(std::string_view source, Condition &out)
      : text_(strip_wrapper(source)), out_(out) {
    out_.source_ = std::string(source);
  }

  [[nodiscard]] auto run() -> Result<void> {
    if (text_.empty()) {
      return reject(Error::InvalidCondition, "empty expression", 0);
    }
    if (auto lexed = lex(); !lexed) {
      return fail(lexed.error());
    }
    auto root = parse_or();
    if (!root) {
      return fail(root.error());
    }
    if (peek().kind != TokenKind::End) {
      return reject(Error::InvalidCondition,
                    std::format("unexpected '{}'", peek().text), peek().offset);
    }
    out_.root_ = *root;
    return ok();
  }

  [[nodiscard]] auto diagnostic() const -> const std::string & {
    return diagnostic_;
  }

private:
  auto reject(Error e, std::string message, std::size_t offset)
      -> std::unexpected<std::error_code> {
    diagnostic_ = std::format("{} at offset {} in '{}'", message, offset, text_);
    return fail(e);
  }

  [[nodiscard]] auto lex() -> Result<void> {
    std::size_t i = 0;
    while (i < text_.size()) {
      const char c = text_[i];
      if (std::isspace(static_cast<unsigned char>(c)) != 0) {
        ++i;
        continue;
      }
      const auto two = std::string_view(text_).substr(i, 2);
      if (two == "&&") {
        tokens_.push_back({TokenKind::And, "&&", i});
        i += 2;
      } else if (two == "||") {
        tokens_.push_back({TokenKind::Or, "||", i});
        i += 2;
      } else if (two == "==") {
        tokens_.push_back({TokenKind::Equal, "==", i});
        i += 2;
      } else if (two == "!=") {
        tokens_.push_back({TokenKind::NotEqual, "!=", i});
        i += 2;
      } else if (c == '!') {
        tokens_.push_back({TokenKind::Bang, "!", i++});
      } else if (c == '(') {
        tokens_.push_back({TokenKind::LParen, "(", i++});
      } else if (c == ')') {
        tokens_.push_back({TokenKind::RParen, ")", i++});
      } else if (c == ',') {
        tokens_.push_back({TokenKind::Comma, ",", i++});
      } else if (c == '\'' || c == '"') {
        auto lexed = lex_string(i);
        if (!lexed) {
          return fail(lexed.error());
        }
      } else if (is_ident_start(c)) {
        const auto start = i;
        while (i < text_.size() && is_ident_char(text_[i])) {
          ++i;
        }
        tokens_.push_back(
            {TokenKind::Ident, text_.substr(start, i - start), start});
      } else {
        return reject(Error::InvalidCondition,
                      std::format("unexpected character '{}'", c), i);
      }
    }
    tokens_.push_back({TokenKind::End, "<end>", text_.size()});
    return ok();
  }

  // 'it''s' and "say \"hi\"" are both accepted.
  [[nodiscard]] auto lex_string(std::size_t &i) -> Result<void> {
    const char quote = text_[i];
    const auto start = i++;
    std::string value;
    while (i < text_.size()) {
      const char c = text_[i];
      if (quote == '\'' && c == '\'') {
        if (i + 1 < text_.size() && text_[i + 1] == '\'') {
          value.push_back('\'');
          i += 2;
          continue;
        }
        ++i;
        tokens_.push_back({TokenKind::String, std::move(value), start});
        return ok();
      }
      if (quote == '"' && c == '\\' && i + 1 < text_.size()) {
        value.push_back(text_[i + 1]);
        i += 2;
        continue;
      }
      if (quote == '"' && c == '"') {
        ++i;
        tokens_.push_back({TokenKind::String, std::move(value), start});
        return ok();
      }
      value.push_back(c);
      ++i;
    }
    return reject(Error::InvalidCondition, "unterminated string", start);
  }

  [[nodiscard]] auto peek() const -> const Token & { return tokens_[pos_]; }

  auto advance() -> const Token & {
    const auto &tok = tokens_[pos_];
    if (tok.kind != TokenKind::End) {
      ++pos_;
    }
    return tok;
  }

  auto push(Node node) -> NodeRef {
    out_.nodes_.push_back(std::move(node));
    return static_cast<NodeRef>(out_.nodes_.size() - 1);
  }

  [[nodiscard]] auto expect(TokenKind kind, std::string_view what)
      -> Result<void> {
    if (peek().kind != kind) {
      return reject(Error::InvalidCondition,
                    std::format("expected {} but found '{}'", what, peek().text),
                    peek().offset);
    }
    advance();
    return ok();
  }

  [[nodiscard]] auto parse_or() -> Result<NodeRef> {
    auto lhs = parse_and();
    if (!lhs) {
      return lhs;
    }
    while (peek().kind == TokenKind::Or) {
      advance();
      auto rhs = parse_and();
      if (!rhs) {
        return rhs;
      }
      lhs = push(Binary{BinaryOp::Or, *lhs, *rhs});
    }
    return lhs;
  }

  [[nodiscard]] auto parse_and() -> Result<NodeRef> {
    auto lhs = parse_unary();
    if (!lhs) {
      return lhs;
    }
    while (peek().kind == TokenKind::And) {
      advance();
      auto rhs = parse_unary();
      if (!rhs) {
        return rhs;
      }
      lhs = push(Binary{BinaryOp::And, *lhs, *rhs});
    }
    return lhs;
  }

  [[nodiscard]] auto parse_unary() -> Result<NodeRef> {
    if (peek().kind == TokenKind::Bang) {
      advance();
      auto operand = parse_unary();
      if (!operand) {
        return operand;
      }
      return push(Not{*operand});
    }
    return parse_comparison();
  }

  [[nodiscard]] auto parse_comparison() -> Result<NodeRef> {
    auto lhs = parse_primary();
    if (!lhs) {
      return lhs;
    }
    const auto kind = peek().kind;
    if (kind != TokenKind::Equal && kind != TokenKind::NotEqual) {
      return lhs;
    }
    advance();
    auto rhs = parse_primary();
    if (!rhs) {
      return rhs;
    }
    return push(Binary{kind == TokenKind::Equal ? BinaryOp::Equal
                                                : BinaryOp::NotEqual,
                       *lhs, *rhs});
  }

  [[nodiscard]] auto parse_primary() -> Result<NodeRef> {
    const auto tok = advance();
    switch (tok.kind) {
    case TokenKind::String:
      return push(Literal{Value{tok.text}});
    case TokenKind::LParen: {
      auto inner = parse_or();
      if (!inner) {
        return inner;
      }
      if (auto closed = expect(TokenKind::RParen, "')'"); !closed) {
        return fail(closed.error());
      }
      return inner;
    }
    case TokenKind::Ident:
      return parse_identifier(tok);
    default:
      return reject(Error::InvalidCondition,
                    std::format("unexpected '{}'", tok.text), tok.offset);
    }
  }

  [[nodiscard]] auto parse_identifier(const Token &tok) -> Result<NodeRef> {
    if (tok.text == "true" || tok.text == "false") {
      return push(Literal{Value{tok.text == "true"}});
    }
    if (peek().kind == TokenKind::LParen) {
      auto fn = function_named(tok.text);
      if (!fn) {
        return reject(Error::InvalidCondition,
                      std::format("unknown function '{}'", tok.text),
                      tok.offset);
      }
      advance();
      auto lhs = parse_or();
      if (!lhs) {
        return lhs;
      }
      if (auto comma = expect(TokenKind::Comma, "','"); !comma) {
        return fail(comma.error());
      }
      auto rhs = parse_or();
      if (!rhs) {
        return rhs;
      }
      if (auto closed = expect(TokenKind::RParen, "')'"); !closed) {
        return fail(closed.error());
      }
      return push(Call{*fn, *lhs, *rhs});
    }
    if (!is_context_variable(tok.text)) {
      return reject(Error::UnknownVariable,
                    std::format("unknown variable '{}'", tok.text), tok.offset);
    }
    return push(Variable{tok.text});
  }

  std::string text_;
  Condition &out_;
  std::vector<Token> tokens_;
  std::size_t pos_{0};
  std::string diagnostic_;
};

auto Condition::parse(std::string_view text, std::string *diagnostic)
    -> Result<Condition> {
  Condition out;
  ConditionParser parser(text, out);
  if (auto res = parser.run(); !res) {
    log::debug("condition rejected: {}", parser.diagnostic());
    if (diagnostic != nullptr) {
      *diagnostic = parser.diagnostic();
    }
    return fail(res.error());
  }
  return ok(std::move(out));
}

auto Condition::variables() const -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &node : nodes_) {
    if (const auto *var = std::get_if<Variable>(&node)) {
      out.push_back(var->name);
    }
  }
  return out;
}

} // namespace pipeforge
