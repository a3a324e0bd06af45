#include "pipeforge/app/run_controller.hpp"

#include "pipeforge/core/runtime.hpp"
#include "pipeforge/pipeline/matrix.hpp"
#include "pipeforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <format>
#include <future>
#include <utility>

namespace pipeforge {

auto context_lookup(const RunContext &ctx) -> TemplateLookup {
  return [&ctx](std::string_view name) -> std::optional<std::string> {
    auto value = ctx.lookup(name);
    if (!value) {
      // Known variable without a value for this event, such as base_ref on
      // a push.
      if (value.error() == make_error_code(Error::ConditionEvaluationFailed)) {
        return std::string{};
      }
      return std::nullopt;
    }
    return std::move(*value);
  };
}

auto evaluate_gate(const Condition &condition, const RunContext &ctx)
    -> std::optional<std::string> {
  auto verdict = condition.evaluate(ctx);
  if (!verdict) {
    return std::format("condition '{}' could not be evaluated: {}",
                       condition.source(), verdict.error().message());
  }
  if (!*verdict) {
    return std::format("condition '{}' is false", condition.source());
  }
  return std::nullopt;
}

RunController::RunController(Runtime &runtime, IStepExecutor &executor,
                             IArtifactStore &store, SchedulerOptions options)
    : runtime_(runtime), executor_(executor),
      scheduler_(runtime, executor, store, std::move(options)) {}

auto RunController::validate(const PipelineSpec &spec,
                             std::string *diagnostic) const
    -> Result<ValidatedPipeline> {
  return validate_pipeline(
      spec,
      [this](const StepSpec &step, std::string *diag) {
        return executor_.validate(step, diag);
      },
      diagnostic);
}

auto RunController::expand_jobs(const PipelineSpec &spec,
                                const RunContext &ctx) const
    -> Result<std::vector<JobInstance>> {
  const auto lookup = context_lookup(ctx);
  std::vector<JobInstance> jobs;
  for (std::size_t s = 0; s < spec.stages.size(); ++s) {
    StageSpec stage = spec.stages[s];
    for (const auto &[key, value] : spec.env) {
      stage.env.try_emplace(key, value);
    }
    auto expanded = expand_matrix(stage, static_cast<NodeIndex>(s), lookup);
    if (!expanded) {
      return fail(expanded.error());
    }
    for (auto &job : *expanded) {
      jobs.push_back(std::move(job));
    }
  }
  return ok(std::move(jobs));
}

auto RunController::close_gates(const PipelineSpec &spec,
                                const ValidatedPipeline &valid,
                                const RunContext &ctx, PipelineRun &run) const
    -> void {
  for (NodeIndex s : valid.stage_graph.topological_order()) {
    const auto &condition = valid.conditions[s];
    if (!condition) {
      continue;
    }
    auto closed = evaluate_gate(*condition, ctx);
    if (!closed) {
      log::debug("stage '{}': gate open", spec.stages[s].name);
      continue;
    }
    log::info("stage '{}' skipped: {}", spec.stages[s].name, *closed);
    if (auto r = run.close_gate(s, *closed); !r) {
      log::error("stage '{}': cannot close gate: {}", spec.stages[s].name,
                 r.error().message());
    }
  }
}

auto RunController::plan(const PipelineSpec &spec, const RunContext &ctx,
                         std::string *diagnostic) const -> Result<RunPlan> {
  auto valid = validate(spec, diagnostic);
  if (!valid) {
    return fail(valid.error());
  }

  RunPlan plan;
  plan.pipeline = spec.name;
  plan.context = ctx;
  plan.matching_clause = valid->triggers.matching_clause(ctx);
  plan.triggered = plan.matching_clause >= 0;
  if (!plan.triggered) {
    return ok(std::move(plan));
  }

  auto jobs = expand_jobs(spec, ctx);
  if (!jobs) {
    return fail(jobs.error());
  }
  plan.stages.reserve(spec.stages.size());
  for (std::size_t s = 0; s < spec.stages.size(); ++s) {
    StagePlan stage;
    stage.name = spec.stages[s].name;
    stage.needs = spec.stages[s].needs;
    if (const auto &condition = valid->conditions[s]) {
      if (auto closed = evaluate_gate(*condition, ctx)) {
        stage.gate_open = false;
        stage.gate_message = std::move(*closed);
      }
    }
    plan.stages.push_back(std::move(stage));
  }
  for (const auto &job : *jobs) {
    plan.stages[job.stage_index].jobs.push_back(job.id);
  }
  return ok(std::move(plan));
}

auto RunController::run_async(const PipelineSpec &spec, RunContext ctx,
                              std::string *diagnostic)
    -> task<Result<RunResult>> {
  if (runtime_.current_shard() != 0) {
    log::error("run controller must run on shard 0");
    co_return fail(Error::InvalidState);
  }

  auto valid = validate(spec, diagnostic);
  if (!valid) {
    co_return fail(valid.error());
  }

  RunResult result;
  result.run_id = generate_run_id();
  result.pipeline = spec.name;
  result.context = ctx;
  result.started_at = std::chrono::system_clock::now();

  result.triggered = valid->triggers.should_run(ctx);
  if (!result.triggered) {
    log::info("pipeline '{}' not triggered by {} of '{}'", spec.name,
              to_string_view(ctx.event), ctx.full_ref());
    result.status = RunStatus::NotTriggered;
    result.finished_at = std::chrono::system_clock::now();
    co_return ok(std::move(result));
  }

  auto jobs = expand_jobs(spec, ctx);
  if (!jobs) {
    co_return fail(jobs.error());
  }
  auto run = PipelineRun::create(valid->stage_graph, std::move(*jobs));
  if (!run) {
    log::error("pipeline '{}': cannot build the job graph: {}", spec.name,
               run.error().message());
    co_return fail(run.error());
  }
  close_gates(spec, *valid, ctx, *run);

  log::info("run {}: pipeline '{}' triggered by {} of '{}' ({} job(s))",
            result.run_id, spec.name, to_string_view(ctx.event),
            ctx.full_ref(), run->job_count());
  auto output = co_await scheduler_.execute(*run, ctx, result.run_id);

  result.status = run->status();
  result.finished_at = std::chrono::system_clock::now();

  result.stages.reserve(run->stage_count());
  for (std::size_t s = 0; s < run->stage_count(); ++s) {
    const auto idx = static_cast<NodeIndex>(s);
    const auto outcome = run->stage_outcome(idx);
    StageReport stage{.name = spec.stages[s].name,
                      .status = outcome.status,
                      .cause = outcome.cause,
                      .skip_reason = outcome.skip_reason,
                      .fail_fast_triggered = outcome.fail_fast_triggered,
                      .jobs = {}};
    for (NodeIndex j : run->stage_jobs(idx)) {
      stage.jobs.push_back(run->job(j).id);
    }
    result.stages.push_back(std::move(stage));
  }

  result.jobs.reserve(run->job_count());
  for (std::size_t i = 0; i < run->job_count(); ++i) {
    const auto idx = static_cast<NodeIndex>(i);
    const auto &job = run->job(idx);
    const auto &record = run->record(idx);
    auto &out = output.jobs[i];
    result.jobs.push_back(JobReport{.id = job.id,
                                    .stage = job.stage,
                                    .matrix = job.assignment,
                                    .qualifier = job.qualifier,
                                    .status = record.state,
                                    .cause = record.cause,
                                    .skip_reason = record.skip_reason,
                                    .message = record.message,
                                    .steps = std::move(out.steps),
                                    .produced = std::move(out.produced),
                                    .started_at = record.started_at,
                                    .finished_at = record.finished_at});
  }
  result.artifacts = std::move(output.manifest);
  result.outputs = std::move(output.outputs);
  co_return ok(std::move(result));
}

auto RunController::run(const PipelineSpec &spec, RunContext ctx,
                        std::string *diagnostic) -> Result<RunResult> {
  if (runtime_.current_shard() == 0) {
    log::error("blocking run requested from shard 0");
    return fail(Error::InvalidState);
  }
  auto fut = boost::asio::co_spawn(
      runtime_.executor_for(0), run_async(spec, std::move(ctx), diagnostic),
      boost::asio::use_future);
  return fut.get();
}

auto RunController::cancel() -> void {
  log::warn("run cancellation requested");
  scheduler_.cancel();
}

} // namespace pipeforge
