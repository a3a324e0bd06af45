#include "pipeforge/scheduler/job_scheduler.hpp"

#include "pipeforge/core/asio_awaitable.hpp"
#include "pipeforge/core/runtime.hpp"
#include "pipeforge/executor/executor_utils.hpp"
#include "pipeforge/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <thread>
#include <tuple>

namespace pipeforge {

namespace {

inline constexpr std::string_view kArtifactsDirName = ".pipeforge-artifacts";
inline constexpr std::string_view kUnqualified = "_";

[[nodiscard]] auto write_file(const std::filesystem::path &path,
                              std::string_view data) -> Result<void> {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    return fail(ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return fail(Error::FileOpenFailed);
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!out) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

[[nodiscard]] auto read_file(const std::filesystem::path &path)
    -> Result<std::string> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return fail(Error::FileNotFound);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileOpenFailed);
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

} // namespace

struct JobScheduler::JobVerdict {
  enum class Kind : std::uint8_t { Succeeded, Failed, Cancelled };

  Kind kind{Kind::Succeeded};
  FailureCause cause{FailureCause::None};
  std::string message;

  [[nodiscard]] static auto failed(FailureCause cause, std::string message)
      -> JobVerdict {
    return {Kind::Failed, cause, std::move(message)};
  }
};

struct JobScheduler::ActiveRun {
  PipelineRun &run;
  const RunContext &ctx;
  RunId run_id;
  std::filesystem::path run_dir;
  std::vector<std::shared_ptr<JobSlot>> slots;
  std::vector<JobOutput> outputs;
  std::vector<std::pair<NodeIndex, ArtifactManifestEntry>> manifest;
  std::map<ArtifactKey, std::vector<NodeIndex>> consumers;
  std::size_t in_flight{0};
  bool cancelled{false};
};

auto resolve_artifact_ref(const PipelineRun &run, const ArtifactRef &ref)
    -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  for (const auto &job : run.jobs()) {
    if (job.stage != ref.stage) {
      continue;
    }
    for (NodeIndex idx : run.stage_jobs(job.stage_index)) {
      if (!ref.qualifier || run.job(idx).qualifier == *ref.qualifier) {
        out.push_back(idx);
      }
    }
    break;
  }
  return out;
}

auto job_slug(NodeIndex idx, const JobId &id) -> std::string {
  std::string safe;
  safe.reserve(id.value().size());
  for (char c : id.value()) {
    const auto uc = static_cast<unsigned char>(c);
    safe.push_back(std::isalnum(uc) != 0 || c == '-' || c == '.' ? c : '_');
  }
  return std::format("{:03}-{}", idx, safe);
}

JobScheduler::JobScheduler(Runtime &runtime, IStepExecutor &executor,
                           IArtifactStore &store, SchedulerOptions options)
    : runtime_(runtime), executor_(executor), store_(store),
      options_(std::move(options)),
      max_parallel_(options_.max_parallel_jobs > 0
                        ? options_.max_parallel_jobs
                        : std::max(1U, std::thread::hardware_concurrency())) {
  if (options_.workspace_root.empty()) {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    options_.workspace_root = (ec ? std::filesystem::path("/tmp") : tmp) /
                              "pipeforge";
  }
}

JobScheduler::~JobScheduler() = default;

auto JobScheduler::cancel() -> void {
  cancel_requested_.store(true, std::memory_order_release);
  runtime_.post_to(0, [this] { wake(); });
}

auto JobScheduler::wake() -> void {
  if (wakeup_) {
    wakeup_->cancel();
  }
}

auto JobScheduler::execute(PipelineRun &run, const RunContext &ctx,
                           RunId run_id) -> task<SchedulerOutput> {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer wakeup(executor);
  wakeup_ = &wakeup;

  ActiveRun active{.run = run,
                   .ctx = ctx,
                   .run_id = std::move(run_id),
                   .run_dir = {},
                   .slots = {},
                   .outputs = {},
                   .manifest = {},
                   .consumers = {},
                   .in_flight = 0,
                   .cancelled = false};
  active.run_dir = options_.workspace_root / active.run_id.str();
  active.outputs.resize(run.job_count());
  active.slots.reserve(run.job_count());
  for (std::size_t i = 0; i < run.job_count(); ++i) {
    active.slots.push_back(std::make_shared<JobSlot>());
  }
  for (std::size_t i = 0; i < run.job_count(); ++i) {
    const auto consumer = static_cast<NodeIndex>(i);
    for (const auto &ref : run.job(consumer).consumes) {
      for (NodeIndex producer : resolve_artifact_ref(run, ref)) {
        const auto &pj = run.job(producer);
        active.consumers[ArtifactKey{pj.stage, pj.qualifier, ref.name}]
            .push_back(consumer);
      }
    }
  }

  log::info("run {}: scheduling {} job(s), at most {} in parallel",
            active.run_id, run.job_count(), max_parallel_);

  while (true) {
    if (!active.cancelled &&
        cancel_requested_.load(std::memory_order_acquire)) {
      active.cancelled = true;
      log::warn("run {}: cancellation requested", active.run_id);
      run.cancel_all("run cancelled");
    }
    forward_stop_requests(active);
    dispose_consumed(active);
    dispatch(active);
    if (run.is_complete() && active.in_flight == 0) {
      break;
    }
    wakeup.expires_at(boost::asio::steady_timer::time_point::max());
    auto [ec] = co_await wakeup.async_wait(use_nothrow);
    (void)ec; // cancelled on purpose by wake()
  }
  wakeup_ = nullptr;
  // A pending cancel belonged to this run.
  cancel_requested_.store(false, std::memory_order_release);

  if (!options_.keep_workspace) {
    std::error_code ec;
    std::filesystem::remove_all(active.run_dir, ec);
    if (ec) {
      log::warn("run {}: cannot remove {}: {}", active.run_id,
                active.run_dir.string(), ec.message());
    }
  }

  std::ranges::sort(active.manifest, [](const auto &a, const auto &b) {
    return std::tie(a.first, a.second.key.name) <
           std::tie(b.first, b.second.key.name);
  });

  SchedulerOutput output;
  output.outputs = collect_outputs(active);
  output.jobs = std::move(active.outputs);
  output.manifest.reserve(active.manifest.size());
  for (auto &[_, entry] : active.manifest) {
    output.manifest.push_back(std::move(entry));
  }
  log::info("run {}: finished with status {}", active.run_id,
            to_string_view(run.status()));
  co_return output;
}

auto JobScheduler::dispatch(ActiveRun &active) -> void {
  for (NodeIndex idx : active.run.ready_jobs()) {
    if (active.in_flight >= max_parallel_) {
      log::debug("run {}: concurrency limit reached ({})", active.run_id,
                 max_parallel_);
      break;
    }
    if (auto r = active.run.mark_started(idx); !r) {
      log::error("run {}: cannot start job {}: {}", active.run_id,
                 active.run.job(idx).id, r.error().message());
      continue;
    }
    ++active.in_flight;
    runtime_.spawn(run_job(active, idx));
  }
}

auto JobScheduler::forward_stop_requests(ActiveRun &active) -> void {
  for (NodeIndex idx : active.run.drain_stop_requests()) {
    log::info("run {}: stopping job {}: {}", active.run_id,
              active.run.job(idx).id, active.run.record(idx).message);
    active.slots[idx]->stop.request_stop();
  }
}

auto JobScheduler::dispose_consumed(ActiveRun &active) -> void {
  if (options_.retain_artifacts) {
    return;
  }
  for (auto &[_, entry] : active.manifest) {
    if (!entry.retained) {
      continue;
    }
    auto it = active.consumers.find(entry.key);
    if (it == active.consumers.end() || it->second.empty()) {
      continue; // final output
    }
    const bool all_done = std::ranges::all_of(it->second, [&](NodeIndex c) {
      return is_terminal(active.run.record(c).state);
    });
    if (!all_done) {
      continue;
    }
    if (auto r = store_.erase(entry.key); !r) {
      log::warn("run {}: disposing artifact {} failed: {}", active.run_id,
                entry.key, r.error().message());
    }
    entry.retained = false;
  }
}

auto JobScheduler::collect_outputs(ActiveRun &active)
    -> std::vector<std::shared_ptr<const Artifact>> {
  std::vector<std::shared_ptr<const Artifact>> out;
  for (auto &[_, entry] : active.manifest) {
    if (!entry.retained) {
      continue;
    }
    auto artifact = store_.get(entry.key);
    if (!artifact) {
      log::warn("run {}: retained artifact {} left the store: {}",
                active.run_id, entry.key, artifact.error().message());
      entry.retained = false;
      continue;
    }
    if (auto r = store_.erase(entry.key); !r) {
      log::warn("run {}: releasing artifact {} failed: {}", active.run_id,
                entry.key, r.error().message());
    }
    out.push_back(std::move(*artifact));
  }
  return out;
}

auto JobScheduler::execute_job(ActiveRun &active, NodeIndex idx)
    -> task<JobVerdict> {
  using enum JobVerdict::Kind;
  const auto &run = active.run;
  const auto &job = run.job(idx);
  auto slot = active.slots[idx];
  auto &out = active.outputs[idx];
  const auto timeout = job.timeout ? job.timeout : options_.default_timeout;

  std::optional<boost::asio::steady_timer> deadline;
  if (timeout) {
    deadline.emplace(co_await boost::asio::this_coro::executor, *timeout);
    deadline->async_wait([slot](boost::system::error_code ec) {
      if (!ec) {
        slot->timed_out = true;
        slot->stop.request_stop();
      }
    });
  }

  slot->workspace = active.run_dir / job_slug(idx, job.id);
  const auto artifacts_dir = slot->workspace / kArtifactsDirName;
  std::error_code ec;
  std::filesystem::create_directories(artifacts_dir, ec);
  if (ec) {
    co_return JobVerdict::failed(
        FailureCause::StepFailure,
        std::format("cannot create workspace {}: {}",
                    slot->workspace.string(), ec.message()));
  }

  for (const auto &ref : job.consumes) {
    const auto producers = resolve_artifact_ref(run, ref);
    if (producers.empty()) {
      co_return JobVerdict::failed(
          FailureCause::MissingArtifact,
          std::format("no producer for artifact {}/{}", ref.stage, ref.name));
    }
    for (NodeIndex p : producers) {
      const auto &pj = run.job(p);
      const ArtifactKey key{pj.stage, pj.qualifier, ref.name};
      const auto producer_state = run.record(p).state;
      if (producer_state != JobState::Succeeded) {
        co_return JobVerdict::failed(
            FailureCause::MissingArtifact,
            std::format("artifact {} is missing: producer {} is {}", key,
                        pj.id, to_string_view(producer_state)));
      }
      auto artifact = store_.get(key);
      if (!artifact) {
        co_return JobVerdict::failed(
            FailureCause::MissingArtifact,
            std::format("artifact {} is missing: {}", key,
                        artifact.error().message()));
      }
      const auto dest =
          artifacts_dir / pj.stage /
          (pj.qualifier.empty() ? std::string(kUnqualified) : pj.qualifier) /
          ref.name;
      if (auto w = write_file(dest, (*artifact)->data); !w) {
        co_return JobVerdict::failed(
            FailureCause::StepFailure,
            std::format("cannot materialize artifact {}: {}", key,
                        w.error().message()));
      }
    }
  }

  EnvMap env;
  env.insert_or_assign("PIPEFORGE_RUN_ID", active.run_id.str());
  env.insert_or_assign("PIPEFORGE_JOB", job.id.str());
  env.insert_or_assign("PIPEFORGE_STAGE", job.stage);
  env.insert_or_assign("PIPEFORGE_WORKSPACE", slot->workspace.string());
  env.insert_or_assign("PIPEFORGE_ARTIFACTS_DIR", artifacts_dir.string());
  env.insert_or_assign("PIPEFORGE_EVENT",
                       std::string(to_string_view(active.ctx.event)));
  env.insert_or_assign("PIPEFORGE_REF", active.ctx.full_ref());
  env.insert_or_assign("PIPEFORGE_REF_NAME", active.ctx.ref_name);
  env.insert_or_assign("PIPEFORGE_ACTOR", active.ctx.actor);
  for (const auto &[axis, value] : job.assignment) {
    env.insert_or_assign("PIPEFORGE_MATRIX_" + to_env_suffix(axis), value);
  }
  for (const auto &[key, value] : job.env) {
    env.insert_or_assign(key, value);
  }

  const StepOutcome *failed_step = nullptr;
  for (const auto &step : job.steps) {
    if (slot->stop.stop_requested()) {
      break;
    }
    StepRequest req{.job = job.id,
                    .step = step,
                    .working_dir = {},
                    .env = env,
                    .stop = slot->stop.get_token()};
    const std::filesystem::path dir(step.working_dir);
    req.working_dir =
        (dir.empty() ? slot->workspace
                     : dir.is_absolute() ? dir : slot->workspace / dir)
            .string();
    for (const auto &[key, value] : step.env) {
      req.env.insert_or_assign(key, value);
    }

    auto res = co_await execute_async(executor_, std::move(req));
    out.steps.push_back(StepOutcome{.name = step.name,
                                    .exit_code = res.exit_code,
                                    .stdout_output =
                                        std::move(res.stdout_output),
                                    .stderr_output =
                                        std::move(res.stderr_output),
                                    .error = std::move(res.error),
                                    .cancelled = res.cancelled});
    if (!res.succeeded()) {
      failed_step = &out.steps.back();
      break;
    }
  }

  if (slot->timed_out) {
    co_return JobVerdict::failed(
        FailureCause::Timeout,
        std::format("job exceeded its timeout of {}s",
                    timeout ? timeout->count() : 0));
  }
  if (slot->stop.stop_requested() &&
      (failed_step || out.steps.size() < job.steps.size())) {
    co_return JobVerdict{Cancelled, FailureCause::None, {}};
  }
  if (failed_step) {
    co_return JobVerdict::failed(
        FailureCause::StepFailure,
        failed_step->error.empty()
            ? std::format("step '{}' exited with code {}", failed_step->name,
                          failed_step->exit_code)
            : std::format("step '{}' failed: {}", failed_step->name,
                          failed_step->error));
  }

  // Read every declared artifact before publishing any of them.
  std::vector<Artifact> produced;
  produced.reserve(job.produces.size());
  for (const auto &decl : job.produces) {
    if (decl.path.empty() || decl.path.front() == '/' ||
        has_parent_component(decl.path)) {
      co_return JobVerdict::failed(
          FailureCause::StepFailure,
          std::format("artifact '{}' path {} leaves the job workspace",
                      decl.name, decl.path));
    }
    const auto path = slot->workspace / decl.path;
    auto data = read_file(path);
    if (!data) {
      co_return JobVerdict::failed(
          FailureCause::StepFailure,
          std::format("artifact '{}' was not produced at {}", decl.name,
                      decl.path));
    }
    produced.push_back(Artifact{
        .key = ArtifactKey{job.stage, job.qualifier, decl.name},
        .producer = job.id,
        .data = std::move(*data),
        .created_at = std::chrono::system_clock::now()});
  }
  for (auto &artifact : produced) {
    ArtifactManifestEntry entry{.key = artifact.key,
                                .producer = job.id,
                                .size = artifact.size(),
                                .retained = true};
    if (auto r = store_.put(std::move(artifact)); !r) {
      co_return JobVerdict::failed(
          FailureCause::StepFailure,
          std::format("cannot publish artifact {}: {}", entry.key,
                      r.error().message()));
    }
    out.produced.push_back(entry.key.name);
    active.manifest.emplace_back(idx, std::move(entry));
  }
  co_return JobVerdict{};
}

auto JobScheduler::run_job(ActiveRun &active, NodeIndex idx) -> spawn_task {
  auto &run = active.run;
  const auto &job = run.job(idx);
  auto slot = active.slots[idx];

  log::info("run {}: job {} started", active.run_id, job.id);
  const auto verdict = co_await execute_job(active, idx);

  Result<void> applied;
  switch (verdict.kind) {
  case JobVerdict::Kind::Succeeded:
    applied = run.mark_succeeded(idx);
    break;
  case JobVerdict::Kind::Failed:
    log::warn("run {}: job {} failed ({}): {}", active.run_id, job.id,
              to_string_view(verdict.cause), verdict.message);
    applied = run.mark_failed(idx, verdict.cause, verdict.message);
    break;
  case JobVerdict::Kind::Cancelled:
    applied = run.mark_cancelled(idx, verdict.message);
    break;
  }
  if (!applied) {
    log::error("run {}: cannot record outcome of job {}: {}", active.run_id,
               job.id, applied.error().message());
  } else {
    log::info("run {}: job {} {}", active.run_id, job.id,
              to_string_view(run.record(idx).state));
  }

  if (!options_.keep_workspace && !slot->workspace.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(slot->workspace, ec);
  }

  --active.in_flight;
  wake();
}

} // namespace pipeforge
