#pragma once

#include "pipeforge/condition/expression.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/pipeline/run_context.hpp"

#include <string>
#include <vector>

namespace pipeforge {

/// One `[[on]]` entry of a pipeline.
///
///   push          branch push whose name is in `branches`, or tag push whose
///                 name matches a glob in `tags`; both empty matches any push
///   tag_push      tag push matching `tags` (empty = any tag)
///   pull_request  pull request whose target branch is in `branches`
///                 (empty = any target)
struct TriggerClause {
  EventKind event{EventKind::Push};
  std::vector<std::string> branches;
  std::vector<std::string> tags;

  auto operator==(const TriggerClause &) const -> bool = default;
};

/// The clause as a condition over the run context, e.g.
/// `event == 'tag_push' && (matches(ref_name, 'v*'))`.
[[nodiscard]] auto trigger_condition(const TriggerClause &clause)
    -> std::string;

/// Pure predicate over the pipeline's trigger clauses, each compiled into a
/// Condition. Fails closed: no clauses, no matching clause, or a clause that
/// cannot be evaluated means the run does not start.
class TriggerEvaluator {
public:
  [[nodiscard]] static auto create(std::vector<TriggerClause> clauses)
      -> Result<TriggerEvaluator>;

  [[nodiscard]] auto should_run(const RunContext &ctx) const -> bool;

  /// Index of the first matching clause, -1 when none matches.
  [[nodiscard]] auto matching_clause(const RunContext &ctx) const -> int;

private:
  struct CompiledClause {
    TriggerClause clause;
    Condition condition;
  };

  [[nodiscard]] static auto matches(const CompiledClause &clause,
                                    const RunContext &ctx) -> bool;

  std::vector<CompiledClause> clauses_;
};

} // namespace pipeforge
