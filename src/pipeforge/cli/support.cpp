#include "pipeforge/cli/support.hpp"

#include "pipeforge/config/pipeline_definition.hpp"
#include "pipeforge/util/json.hpp"

#include <print>
#include <string>

namespace pipeforge::cli {

auto load_pipeline_or_print(std::string_view path) -> Result<PipelineSpec> {
  std::string diagnostic;
  auto spec = PipelineLoader::load_from_file(path, &diagnostic);
  if (!spec) {
    std::println(stderr, "Error: cannot load pipeline '{}': {}", path,
                 diagnostic.empty() ? spec.error().message() : diagnostic);
  }
  return spec;
}

auto make_context_or_print(const EventOptions &opts) -> Result<RunContext> {
  auto ctx =
      RunContext::from_event(opts.event, opts.ref, opts.actor, opts.base_ref);
  if (!ctx) {
    std::println(stderr, "Error: invalid event '{}' for ref '{}': {}",
                 opts.event, opts.ref, ctx.error().message());
  }
  return ctx;
}

auto print_invalid(std::string_view file, std::string_view diagnostic,
                   std::error_code ec, bool json) -> void {
  const std::string error =
      diagnostic.empty() ? ec.message() : std::string(diagnostic);
  if (json) {
    JsonValue out{
        {"file", std::string(file)},
        {"valid", false},
        {"error", error},
        {"code", ec.message()},
    };
    std::println("{}", dump_json(out));
    return;
  }
  std::println(stderr, "Error: pipeline '{}' is invalid: {}", file, error);
}

} // namespace pipeforge::cli
