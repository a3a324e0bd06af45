#include "pipeforge/report/run_result.hpp"

#include "pipeforge/util/time.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace pipeforge {

namespace {

[[nodiscard]] auto same_outcome(const JobReport &a, const JobReport &b)
    -> bool {
  return a.id == b.id && a.stage == b.stage && a.matrix == b.matrix &&
         a.qualifier == b.qualifier && a.status == b.status &&
         a.cause == b.cause && a.skip_reason == b.skip_reason &&
         a.message == b.message && a.steps == b.steps &&
         a.produced == b.produced;
}

[[nodiscard]] auto context_json(const RunContext &ctx) -> JsonValue {
  JsonValue out{
      {"event", std::string(to_string_view(ctx.event))},
      {"ref", ctx.full_ref()},
      {"ref_name", ctx.ref_name},
      {"ref_kind", std::string(to_string_view(ctx.ref_kind))},
      {"actor", ctx.actor},
  };
  if (ctx.base_ref) {
    out["base_ref"] = *ctx.base_ref;
  }
  return out;
}

[[nodiscard]] auto stage_json(const StageReport &stage) -> JsonValue {
  JsonValue jobs = JsonValue::array_t{};
  for (const auto &id : stage.jobs) {
    jobs.get_array().emplace_back(id.str());
  }
  JsonValue out{
      {"name", stage.name},
      {"status", std::string(to_string_view(stage.status))},
      {"jobs", std::move(jobs)},
  };
  if (stage.cause != FailureCause::None) {
    out["cause"] = std::string(to_string_view(stage.cause));
  }
  if (stage.skip_reason != SkipReason::None) {
    out["skip_reason"] = std::string(to_string_view(stage.skip_reason));
  }
  if (stage.fail_fast_triggered) {
    out["fail_fast_triggered"] = true;
  }
  return out;
}

[[nodiscard]] auto step_json(const StepOutcome &step) -> JsonValue {
  JsonValue out{
      {"name", step.name},
      {"exit_code", step.exit_code},
      {"stdout", step.stdout_output},
      {"stderr", step.stderr_output},
  };
  if (!step.error.empty()) {
    out["error"] = step.error;
  }
  if (step.cancelled) {
    out["cancelled"] = true;
  }
  return out;
}

[[nodiscard]] auto job_json(const JobReport &job) -> JsonValue {
  JsonValue matrix = JsonValue::object_t{};
  for (const auto &[axis, value] : job.matrix) {
    matrix[axis] = value;
  }
  JsonValue steps = JsonValue::array_t{};
  for (const auto &step : job.steps) {
    steps.get_array().push_back(step_json(step));
  }
  JsonValue produced = JsonValue::array_t{};
  for (const auto &name : job.produced) {
    produced.get_array().emplace_back(name);
  }
  JsonValue out{
      {"id", job.id.str()},
      {"stage", job.stage},
      {"qualifier", job.qualifier},
      {"matrix", std::move(matrix)},
      {"status", std::string(to_string_view(job.status))},
      {"steps", std::move(steps)},
      {"produced", std::move(produced)},
  };
  if (job.cause != FailureCause::None) {
    out["cause"] = std::string(to_string_view(job.cause));
  }
  if (job.skip_reason != SkipReason::None) {
    out["skip_reason"] = std::string(to_string_view(job.skip_reason));
  }
  if (!job.message.empty()) {
    out["message"] = job.message;
  }
  if (const auto started = util::format_iso8601(job.started_at);
      !started.empty()) {
    out["started_at"] = started;
    out["finished_at"] = util::format_iso8601(job.finished_at);
  }
  return out;
}

[[nodiscard]] auto artifact_json(const ArtifactManifestEntry &entry)
    -> JsonValue {
  return JsonValue{
      {"stage", entry.key.stage},
      {"qualifier", entry.key.qualifier},
      {"name", entry.key.name},
      {"job", entry.producer.str()},
      {"size", static_cast<std::int64_t>(entry.size)},
      {"retained", entry.retained},
  };
}

} // namespace

auto RunResult::find_stage(std::string_view name) const
    -> const StageReport * {
  auto it = std::ranges::find(stages, name, &StageReport::name);
  return it == stages.end() ? nullptr : &*it;
}

auto RunResult::find_job(std::string_view id) const -> const JobReport * {
  auto it = std::ranges::find_if(
      jobs, [&](const JobReport &job) { return job.id.value() == id; });
  return it == jobs.end() ? nullptr : &*it;
}

auto RunResult::find_output(const ArtifactKey &key) const
    -> std::shared_ptr<const Artifact> {
  auto it = std::ranges::find_if(
      outputs, [&](const auto &artifact) { return artifact->key == key; });
  return it == outputs.end() ? nullptr : *it;
}

auto RunResult::outcome_equals(const RunResult &other) const -> bool {
  return pipeline == other.pipeline && context == other.context &&
         triggered == other.triggered && status == other.status &&
         stages == other.stages && artifacts == other.artifacts &&
         std::ranges::equal(jobs, other.jobs, same_outcome);
}

auto to_json(const RunResult &result) -> JsonValue {
  JsonValue stages = JsonValue::array_t{};
  for (const auto &stage : result.stages) {
    stages.get_array().push_back(stage_json(stage));
  }
  JsonValue jobs = JsonValue::array_t{};
  for (const auto &job : result.jobs) {
    jobs.get_array().push_back(job_json(job));
  }
  JsonValue artifacts = JsonValue::array_t{};
  for (const auto &entry : result.artifacts) {
    artifacts.get_array().push_back(artifact_json(entry));
  }
  return JsonValue{
      {"run_id", result.run_id.str()},
      {"pipeline", result.pipeline},
      {"context", context_json(result.context)},
      {"triggered", result.triggered},
      {"status", std::string(to_string_view(result.status))},
      {"started_at", util::format_iso8601(result.started_at)},
      {"finished_at", util::format_iso8601(result.finished_at)},
      {"stages", std::move(stages)},
      {"jobs", std::move(jobs)},
      {"artifacts", std::move(artifacts)},
  };
}

auto render_json(const RunResult &result, bool pretty) -> std::string {
  const auto json = to_json(result);
  return pretty ? dump_json_pretty(json) : dump_json(json);
}

} // namespace pipeforge
