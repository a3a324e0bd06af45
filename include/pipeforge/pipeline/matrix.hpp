#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/pipeline/job.hpp"

#include <vector>

namespace pipeforge {

/// Cartesian product of the stage's axes, first axis varying slowest. A stage
/// without axes yields one job; an axis without values is EmptyMatrixAxis.
/// Each job's templates are rendered in a single pass: `matrix.<axis>` first,
/// then `context` for everything else. Tokens neither answers stay as written.
[[nodiscard]] auto expand_matrix(const StageSpec &stage,
                                 NodeIndex stage_index = kInvalidNode,
                                 const TemplateLookup &context = {})
    -> Result<std::vector<JobInstance>>;

/// Number of jobs `expand_matrix` would produce, 0 for an empty axis.
[[nodiscard]] auto matrix_size(const StageSpec &stage) noexcept
    -> std::size_t;

/// `matrix.<axis>` lookup for one assignment.
[[nodiscard]] auto matrix_lookup(const MatrixAssignment &assignment)
    -> TemplateLookup;

/// Matrix lookup falling back to `context`.
[[nodiscard]] auto job_lookup(const MatrixAssignment &assignment,
                              TemplateLookup context) -> TemplateLookup;

} // namespace pipeforge
