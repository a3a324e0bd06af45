#include "pipeforge/pipeline/stage_spec.hpp"

#include <algorithm>
#include <filesystem>

namespace pipeforge {

auto has_parent_component(std::string_view path) -> bool {
  const std::filesystem::path p(path);
  return std::ranges::any_of(
      p, [](const std::filesystem::path &part) { return part == ".."; });
}

auto StageSpec::produces_artifact(std::string_view artifact) const -> bool {
  return std::ranges::any_of(
      produces, [&](const ArtifactDecl &d) { return d.name == artifact; });
}

auto PipelineSpec::find_stage(std::string_view stage) const
    -> const StageSpec * {
  auto it = std::ranges::find(stages, stage, &StageSpec::name);
  return it == stages.end() ? nullptr : &*it;
}

} // namespace pipeforge
