#pragma once

#include "pipeforge/artifact/artifact_store.hpp"
#include "pipeforge/core/coroutine.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/pipeline/pipeline_run.hpp"
#include "pipeforge/pipeline/run_context.hpp"
#include "pipeforge/pipeline/stage_spec.hpp"
#include "pipeforge/pipeline/template.hpp"
#include "pipeforge/pipeline/validation.hpp"
#include "pipeforge/report/run_result.hpp"
#include "pipeforge/scheduler/job_scheduler.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pipeforge {

class Runtime;

struct StagePlan {
  std::string name;
  std::vector<std::string> needs;
  bool gate_open{true};
  std::string gate_message;
  std::vector<JobId> jobs;
};

/// What a run would do for an event, without running anything.
struct RunPlan {
  std::string pipeline;
  RunContext context;
  bool triggered{false};
  /// Index of the trigger clause that fired, -1 when none did.
  int matching_clause{-1};
  /// Declaration order; empty when not triggered.
  std::vector<StagePlan> stages;
};

/// Runs one pipeline for one event: validates the pipeline, evaluates the
/// triggers, expands every stage, closes the gates whose condition does not
/// hold and hands the job graph to the scheduler.
///
/// Specification problems fail the call before any job starts; everything
/// that happens once jobs run is reported in the RunResult.
class RunController {
public:
  RunController(Runtime &runtime, IStepExecutor &executor,
                IArtifactStore &store, SchedulerOptions options = {});

  RunController(const RunController &) = delete;
  auto operator=(const RunController &) -> RunController & = delete;

  [[nodiscard]] auto validate(const PipelineSpec &spec,
                              std::string *diagnostic = nullptr) const
      -> Result<ValidatedPipeline>;

  [[nodiscard]] auto plan(const PipelineSpec &spec, const RunContext &ctx,
                          std::string *diagnostic = nullptr) const
      -> Result<RunPlan>;

  /// Must be awaited on shard 0. `spec` must outlive the returned task.
  [[nodiscard]] auto run_async(const PipelineSpec &spec, RunContext ctx,
                               std::string *diagnostic = nullptr)
      -> task<Result<RunResult>>;

  /// Blocks until the run finishes. Not callable from shard 0.
  [[nodiscard]] auto run(const PipelineSpec &spec, RunContext ctx,
                         std::string *diagnostic = nullptr)
      -> Result<RunResult>;

  /// Thread safe. A cancel before the run starts applies to the next run.
  auto cancel() -> void;

private:
  [[nodiscard]] auto expand_jobs(const PipelineSpec &spec,
                                 const RunContext &ctx) const
      -> Result<std::vector<JobInstance>>;
  auto close_gates(const PipelineSpec &spec, const ValidatedPipeline &valid,
                   const RunContext &ctx, PipelineRun &run) const -> void;

  Runtime &runtime_;
  IStepExecutor &executor_;
  JobScheduler scheduler_;
};

/// `${{ <context variable> }}` lookup over a run context. Variables without a
/// value for this event render empty.
[[nodiscard]] auto context_lookup(const RunContext &ctx) -> TemplateLookup;

/// Why a gate is closed, or nullopt when it is open.
[[nodiscard]] auto evaluate_gate(const Condition &condition,
                                 const RunContext &ctx)
    -> std::optional<std::string>;

} // namespace pipeforge
