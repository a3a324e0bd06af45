#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/pipeline/run_context.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pipeforge {

namespace condition {

using Value = std::variant<bool, std::string>;
using NodeRef = std::uint32_t;

enum class BinaryOp : std::uint8_t { And, Or, Equal, NotEqual };
enum class Function : std::uint8_t { StartsWith, EndsWith, Contains, Matches };

struct Literal {
  Value value;
};
struct Variable {
  std::string name;
};
struct Not {
  NodeRef operand;
};
struct Binary {
  BinaryOp op;
  NodeRef lhs;
  NodeRef rhs;
};
struct Call {
  Function fn;
  NodeRef lhs;
  NodeRef rhs;
};

using Node = std::variant<Literal, Variable, Not, Binary, Call>;

} // namespace condition

/// A parsed gate expression.
///
///   expr    := or
///   or      := and ( "||" and )*
///   and     := unary ( "&&" unary )*
///   unary   := "!" unary | cmp
///   cmp     := primary ( ("==" | "!=") primary )?
///   primary := "true" | "false" | string | ident | call | "(" expr ")"
///   call    := ("startsWith" | "endsWith" | "contains" | "matches")
///              "(" expr "," expr ")"
///
/// The whole expression may be wrapped in `${{ ... }}`. Nodes live in a flat
/// arena and refer to each other by index.
class Condition {
public:
  /// InvalidCondition on a syntax error, UnknownVariable when an identifier
  /// is not a run context variable.
  [[nodiscard]] static auto parse(std::string_view text,
                                  std::string *diagnostic = nullptr)
      -> Result<Condition>;

  /// Strictly typed: `&&`, `||` and `!` need booleans, the string functions
  /// need strings, `==` needs operands of the same type. Violations return
  /// TypeMismatch; a variable without a value returns
  /// ConditionEvaluationFailed.
  [[nodiscard]] auto evaluate(const RunContext &ctx) const -> Result<bool>;

  [[nodiscard]] auto source() const noexcept -> const std::string & {
    return source_;
  }
  [[nodiscard]] auto variables() const -> std::vector<std::string>;

private:
  friend class ConditionParser;

  std::string source_;
  std::vector<condition::Node> nodes_;
  condition::NodeRef root_{0};
};

/// Parse and evaluate in one step. Any error means the gate stays closed.
[[nodiscard]] auto evaluate(std::string_view expr, const RunContext &ctx)
    -> Result<bool>;

} // namespace pipeforge
