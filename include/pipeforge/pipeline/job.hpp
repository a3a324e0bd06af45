#pragma once

#include "pipeforge/pipeline/graph.hpp"
#include "pipeforge/pipeline/stage_spec.hpp"
#include "pipeforge/pipeline/template.hpp"
#include "pipeforge/util/id.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pipeforge {

/// Axis values of one job, in axis declaration order.
using MatrixAssignment = std::vector<std::pair<std::string, std::string>>;

/// `os=linux,arch=x64`; empty for a stage without a matrix.
[[nodiscard]] auto make_qualifier(const MatrixAssignment &assignment)
    -> std::string;

/// `build` or `build[os=linux]`.
[[nodiscard]] auto make_job_id(std::string_view stage,
                               std::string_view qualifier) -> JobId;

/// One concrete, schedulable unit: a stage resolved against one matrix
/// assignment. Steps, env and artifact paths have their matrix tokens
/// substituted.
struct JobInstance {
  JobId id;
  std::string stage;
  NodeIndex stage_index{kInvalidNode};
  std::size_t instance{0};
  MatrixAssignment assignment;
  std::string qualifier;
  std::vector<StepSpec> steps;
  EnvMap env;
  std::vector<ArtifactDecl> produces;
  std::vector<ArtifactRef> consumes;
  bool fail_fast{true};
  RunPolicy run_policy{RunPolicy::OnSuccess};
  std::optional<std::chrono::seconds> timeout;

  /// Apply `lookup` to every templated field.
  auto render(const TemplateLookup &lookup) -> void;
};

} // namespace pipeforge
