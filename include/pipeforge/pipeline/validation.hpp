#pragma once

#include "pipeforge/condition/expression.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/pipeline/graph.hpp"
#include "pipeforge/pipeline/stage_spec.hpp"
#include "pipeforge/trigger/trigger_evaluator.hpp"

#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace pipeforge {

struct ValidationIssue {
  std::error_code code;
  std::string message;
};

/// Executor-specific step check, usually IStepExecutor::validate.
using StepCheck =
    std::function<Result<void>(const StepSpec &step, std::string *diag)>;

/// A pipeline that passed validation, with its references resolved.
struct ValidatedPipeline {
  /// One node per stage, in declaration order; edges point from a needed
  /// stage to the stage that needs it.
  Graph stage_graph;
  /// Parsed gate per stage, nullopt for ungated stages.
  std::vector<std::optional<Condition>> conditions;
  TriggerEvaluator triggers;
};

/// Every problem found in `spec`, in the order the checks run.
[[nodiscard]] auto collect_issues(const PipelineSpec &spec,
                                  const StepCheck &check_step)
    -> std::vector<ValidationIssue>;

/// Fails with the code of the first issue; `diagnostic` receives all issue
/// messages joined with "; ".
[[nodiscard]] auto validate_pipeline(const PipelineSpec &spec,
                                     const StepCheck &check_step,
                                     std::string *diagnostic = nullptr)
    -> Result<ValidatedPipeline>;

} // namespace pipeforge
