#pragma once

#include "pipeforge/cli/commands.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/pipeline/run_context.hpp"
#include "pipeforge/pipeline/stage_spec.hpp"

#include <string_view>

namespace pipeforge::cli {

/// Load a pipeline document, printing the diagnostic on failure.
[[nodiscard]] auto load_pipeline_or_print(std::string_view path)
    -> Result<PipelineSpec>;

[[nodiscard]] auto make_context_or_print(const EventOptions &opts)
    -> Result<RunContext>;

/// Prints a validation failure in the requested format.
auto print_invalid(std::string_view file, std::string_view diagnostic,
                   std::error_code ec, bool json) -> void;

} // namespace pipeforge::cli
