#include "pipeforge/trigger/trigger_evaluator.hpp"

#include "pipeforge/util/glob.hpp"
#include "pipeforge/util/log.hpp"

#include <format>
#include <ranges>

namespace pipeforge {

namespace {

[[nodiscard]] auto quote(std::string_view text) -> std::string {
  std::string out = "'";
  for (char c : text) {
    out.push_back(c);
    if (c == '\'') {
      out.push_back('\'');
    }
  }
  out.push_back('\'');
  return out;
}

// `(variable == 'a' || ...)`, or `(fn(variable, 'a') || ...)` with `fn`.
[[nodiscard]] auto any_of(std::string_view variable,
                          const std::vector<std::string> &values,
                          std::string_view fn = {}) -> std::string {
  std::string out = "(";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += " || ";
    }
    out += fn.empty() ? std::format("{} == {}", variable, quote(values[i]))
                      : std::format("{}({}, {})", fn, variable,
                                    quote(values[i]));
  }
  out += ")";
  return out;
}

[[nodiscard]] auto is_event(EventKind kind) -> std::string {
  return std::format("event == {}", quote(to_string_view(kind)));
}

} // namespace

auto trigger_condition(const TriggerClause &clause) -> std::string {
  switch (clause.event) {
  case EventKind::Push: {
    if (clause.branches.empty() && clause.tags.empty()) {
      return std::format("{} || {}", is_event(EventKind::Push),
                         is_event(EventKind::TagPush));
    }
    std::vector<std::string> terms;
    if (!clause.branches.empty()) {
      terms.push_back(std::format("{} && {}", is_event(EventKind::Push),
                                  any_of("ref_name", clause.branches)));
    }
    if (!clause.tags.empty()) {
      terms.push_back(std::format("{} && {}", is_event(EventKind::TagPush),
                                  any_of("ref_name", clause.tags, "matches")));
    }
    return terms.size() == 1
               ? terms.front()
               : std::format("({}) || ({})", terms[0], terms[1]);
  }
  case EventKind::TagPush:
    return clause.tags.empty()
               ? is_event(EventKind::TagPush)
               : std::format("{} && {}", is_event(EventKind::TagPush),
                             any_of("ref_name", clause.tags, "matches"));
  case EventKind::PullRequest:
    return clause.branches.empty()
               ? is_event(EventKind::PullRequest)
               : std::format("{} && {}", is_event(EventKind::PullRequest),
                             any_of("base_ref", clause.branches));
  }
  return "false";
}

auto TriggerEvaluator::create(std::vector<TriggerClause> clauses)
    -> Result<TriggerEvaluator> {
  TriggerEvaluator out;
  out.clauses_.reserve(clauses.size());
  for (auto &clause : clauses) {
    for (const auto &tag : clause.tags) {
      if (auto pattern = GlobPattern::compile(tag); !pattern) {
        log::error("trigger tag pattern '{}' is not a valid glob", tag);
        return fail(pattern.error());
      }
    }
    std::string diagnostic;
    auto condition = Condition::parse(trigger_condition(clause), &diagnostic);
    if (!condition) {
      log::error("trigger clause cannot be compiled: {}", diagnostic);
      return fail(condition.error());
    }
    out.clauses_.push_back(
        CompiledClause{std::move(clause), std::move(*condition)});
  }
  return ok(std::move(out));
}

auto TriggerEvaluator::matches(const CompiledClause &compiled,
                               const RunContext &ctx) -> bool {
  auto verdict = compiled.condition.evaluate(ctx);
  if (!verdict) {
    log::debug("trigger '{}' could not be evaluated: {}",
               compiled.condition.source(), verdict.error().message());
    return false;
  }
  return *verdict;
}

auto TriggerEvaluator::matching_clause(const RunContext &ctx) const -> int {
  for (auto [i, clause] : std::views::enumerate(clauses_)) {
    if (matches(clause, ctx)) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

auto TriggerEvaluator::should_run(const RunContext &ctx) const -> bool {
  const int idx = matching_clause(ctx);
  if (idx < 0) {
    log::info("no trigger clause matches {} of '{}'", to_string_view(ctx.event),
              ctx.full_ref());
    return false;
  }
  log::debug("trigger clause #{} matches {} of '{}'", idx,
             to_string_view(ctx.event), ctx.full_ref());
  return true;
}

} // namespace pipeforge
