#include "pipeforge/condition/expression.hpp"

#include "pipeforge/util/glob.hpp"
#include "pipeforge/util/log.hpp"
#include "pipeforge/util/util.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace pipeforge {

using namespace condition;

namespace {

class Evaluator {
public:
  Evaluator(const std::vector<Node> &nodes, const RunContext &ctx)
      : nodes_(nodes), ctx_(ctx) {}

  [[nodiscard]] auto eval(NodeRef ref) const -> Result<Value> {
    return std::visit(
        overloaded{
            [](const Literal &lit) -> Result<Value> { return ok(lit.value); },
            [this](const Variable &var) -> Result<Value> {
              auto value = ctx_.lookup(var.name);
              if (!value) {
                return fail(value.error());
              }
              return ok(Value{std::move(*value)});
            },
            [this](const Not &n) -> Result<Value> {
              auto operand = eval_bool(n.operand);
              if (!operand) {
                return fail(operand.error());
              }
              return ok(Value{!*operand});
            },
            [this](const Binary &b) { return eval_binary(b); },
            [this](const Call &c) { return eval_call(c); },
        },
        nodes_[ref]);
  }

  [[nodiscard]] auto eval_bool(NodeRef ref) const -> Result<bool> {
    auto value = eval(ref);
    if (!value) {
      return fail(value.error());
    }
    if (const auto *b = std::get_if<bool>(&*value)) {
      return ok(*b);
    }
    return fail(Error::TypeMismatch);
  }

private:
  [[nodiscard]] auto eval_string(NodeRef ref) const -> Result<std::string> {
    auto value = eval(ref);
    if (!value) {
      return fail(value.error());
    }
    if (auto *s = std::get_if<std::string>(&*value)) {
      return ok(std::move(*s));
    }
    return fail(Error::TypeMismatch);
  }

  // `&&` and `||` short-circuit, so `event == 'pull_request' && base_ref ==
  // 'main'` is safe on a push.
  [[nodiscard]] auto eval_binary(const Binary &b) const -> Result<Value> {
    switch (b.op) {
    case BinaryOp::And:
    case BinaryOp::Or: {
      auto lhs = eval_bool(b.lhs);
      if (!lhs) {
        return fail(lhs.error());
      }
      if (b.op == BinaryOp::And ? !*lhs : *lhs) {
        return ok(Value{*lhs});
      }
      auto rhs = eval_bool(b.rhs);
      if (!rhs) {
        return fail(rhs.error());
      }
      return ok(Value{*rhs});
    }
    case BinaryOp::Equal:
    case BinaryOp::NotEqual: {
      auto lhs = eval(b.lhs);
      if (!lhs) {
        return fail(lhs.error());
      }
      auto rhs = eval(b.rhs);
      if (!rhs) {
        return fail(rhs.error());
      }
      if (lhs->index() != rhs->index()) {
        return fail(Error::TypeMismatch);
      }
      const bool equal = *lhs == *rhs;
      return ok(Value{b.op == BinaryOp::Equal ? equal : !equal});
    }
    }
    return fail(Error::InvalidCondition);
  }

  [[nodiscard]] auto eval_call(const Call &c) const -> Result<Value> {
    auto subject = eval_string(c.lhs);
    if (!subject) {
      return fail(subject.error());
    }
    auto arg = eval_string(c.rhs);
    if (!arg) {
      return fail(arg.error());
    }
    switch (c.fn) {
    case Function::StartsWith:
      return ok(Value{boost::algorithm::starts_with(*subject, *arg)});
    case Function::EndsWith:
      return ok(Value{boost::algorithm::ends_with(*subject, *arg)});
    case Function::Contains:
      return ok(Value{boost::algorithm::contains(*subject, *arg)});
    case Function::Matches: {
      auto pattern = GlobPattern::compile(*arg);
      if (!pattern) {
        return fail(Error::ConditionEvaluationFailed);
      }
      return ok(Value{pattern->matches(*subject)});
    }
    }
    return fail(Error::InvalidCondition);
  }

  const std::vector<Node> &nodes_;
  const RunContext &ctx_;
};

} // namespace

auto Condition::evaluate(const RunContext &ctx) const -> Result<bool> {
  if (nodes_.empty()) {
    return fail(Error::InvalidCondition);
  }
  return Evaluator(nodes_, ctx).eval_bool(root_);
}

auto evaluate(std::string_view expr, const RunContext &ctx) -> Result<bool> {
  auto parsed = Condition::parse(expr);
  if (!parsed) {
    return fail(parsed.error());
  }
  auto result = parsed->evaluate(ctx);
  if (!result) {
    log::debug("condition '{}' not evaluable: {}", expr,
               result.error().message());
  }
  return result;
}

} // namespace pipeforge
