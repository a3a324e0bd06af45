#include "pipeforge/app/run_controller.hpp"
#include "pipeforge/artifact/artifact_store.hpp"
#include "pipeforge/cli/commands.hpp"
#include "pipeforge/cli/formatting.hpp"
#include "pipeforge/cli/support.hpp"
#include "pipeforge/core/runtime.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/util/json.hpp"

#include <print>
#include <string>

namespace pipeforge::cli {

namespace {

auto plan_json(const RunPlan &plan) -> JsonValue {
  JsonValue stages = JsonValue::array_t{};
  for (const auto &stage : plan.stages) {
    JsonValue needs = JsonValue::array_t{};
    for (const auto &need : stage.needs) {
      needs.get_array().emplace_back(need);
    }
    JsonValue jobs = JsonValue::array_t{};
    for (const auto &id : stage.jobs) {
      jobs.get_array().emplace_back(id.str());
    }
    JsonValue obj{
        {"name", stage.name},
        {"needs", std::move(needs)},
        {"gate_open", stage.gate_open},
        {"jobs", std::move(jobs)},
    };
    if (!stage.gate_open) {
      obj["gate_message"] = stage.gate_message;
    }
    stages.get_array().push_back(std::move(obj));
  }
  return JsonValue{
      {"pipeline", plan.pipeline},
      {"event", std::string(to_string_view(plan.context.event))},
      {"ref", plan.context.full_ref()},
      {"triggered", plan.triggered},
      {"matching_clause", plan.matching_clause},
      {"stages", std::move(stages)},
  };
}

auto print_plan(const RunPlan &plan) -> void {
  std::println("Pipeline {} for {} of {}", fmt::ansi::bold(plan.pipeline),
               to_string_view(plan.context.event), plan.context.full_ref());
  if (!plan.triggered) {
    std::println("{} no trigger clause matches; nothing would run",
                 fmt::ansi::cyan("not triggered"));
    return;
  }
  std::println("triggered by clause #{}\n", plan.matching_clause + 1);

  fmt::Table table({{"STAGE", 16}, {"NEEDS", 20}, {"GATE", 8}, {"JOBS", 40}});
  table.print_header();
  for (const auto &stage : plan.stages) {
    std::string needs;
    for (const auto &need : stage.needs) {
      needs += needs.empty() ? need : "," + need;
    }
    std::string jobs;
    for (const auto &id : stage.jobs) {
      jobs += jobs.empty() ? id.str() : " " + id.str();
    }
    table.print_row({stage.name, needs.empty() ? "-" : needs,
                     stage.gate_open ? fmt::ansi::green("open")
                                     : fmt::ansi::cyan("closed"),
                     jobs});
  }
  for (const auto &stage : plan.stages) {
    if (!stage.gate_open) {
      std::println("\n{}: {}", stage.name, fmt::ansi::dim(stage.gate_message));
    }
  }
}

} // namespace

auto cmd_plan(const PlanOptions &opts) -> int {
  auto spec = load_pipeline_or_print(opts.pipeline_file);
  if (!spec) {
    return kExitInvalid;
  }
  auto ctx = make_context_or_print(opts.event);
  if (!ctx) {
    return kExitInvalid;
  }

  Runtime runtime(1);
  auto executor = create_default_executor(runtime);
  InMemoryArtifactStore store;
  RunController controller(runtime, *executor, store);

  std::string diagnostic;
  auto plan = controller.plan(*spec, *ctx, &diagnostic);
  if (!plan) {
    print_invalid(opts.pipeline_file, diagnostic, plan.error(), opts.json);
    return kExitInvalid;
  }

  if (opts.json) {
    std::println("{}", dump_json(plan_json(*plan)));
  } else {
    print_plan(*plan);
  }
  return kExitOk;
}

} // namespace pipeforge::cli
