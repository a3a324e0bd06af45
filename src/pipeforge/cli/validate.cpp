#include "pipeforge/cli/commands.hpp"
#include "pipeforge/cli/formatting.hpp"
#include "pipeforge/cli/support.hpp"
#include "pipeforge/core/runtime.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/pipeline/matrix.hpp"
#include "pipeforge/pipeline/validation.hpp"
#include "pipeforge/util/json.hpp"

#include <cstdint>
#include <print>
#include <string>

namespace pipeforge::cli {

auto cmd_validate(const ValidateOptions &opts) -> int {
  auto spec = load_pipeline_or_print(opts.pipeline_file);
  if (!spec) {
    return kExitInvalid;
  }

  // Executors are only asked to check step parameters; nothing is started.
  Runtime runtime(1);
  auto executor = create_default_executor(runtime);
  std::string diagnostic;
  auto valid = validate_pipeline(
      *spec,
      [&](const StepSpec &step, std::string *diag) {
        return executor->validate(step, diag);
      },
      &diagnostic);
  if (!valid) {
    print_invalid(opts.pipeline_file, diagnostic, valid.error(), opts.json);
    return kExitInvalid;
  }

  std::size_t jobs = 0;
  for (const auto &stage : spec->stages) {
    jobs += matrix_size(stage);
  }

  if (opts.json) {
    JsonValue out{
        {"file", opts.pipeline_file},
        {"pipeline", spec->name},
        {"valid", true},
        {"stages", static_cast<std::int64_t>(spec->stages.size())},
        {"jobs", static_cast<std::int64_t>(jobs)},
        {"triggers", static_cast<std::int64_t>(spec->triggers.size())},
    };
    std::println("{}", dump_json(out));
    return kExitOk;
  }

  std::println("{} pipeline '{}' is valid: {} stage(s), {} job(s), {} "
               "trigger(s)",
               fmt::ansi::green("✓"), spec->name, spec->stages.size(),
               jobs, spec->triggers.size());
  return kExitOk;
}

} // namespace pipeforge::cli
