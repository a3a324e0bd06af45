#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/pipeline/stage_spec.hpp"

#include <string>
#include <string_view>

namespace pipeforge {

/// Reads pipeline documents (TOML). Loading only checks the document shape;
/// semantic checks need the registered executors and live in
/// validate_pipeline.
class PipelineLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<PipelineSpec>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<PipelineSpec>;
};

} // namespace pipeforge
