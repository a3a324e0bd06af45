#pragma once

#include "pipeforge/artifact/artifact_store.hpp"
#include "pipeforge/core/coroutine.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/pipeline/pipeline_run.hpp"
#include "pipeforge/pipeline/run_context.hpp"
#include "pipeforge/util/id.hpp"

#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace pipeforge {

class Runtime;

struct SchedulerOptions {
  /// Engine-wide limit on running jobs; 0 means one per hardware thread.
  std::size_t max_parallel_jobs{0};
  /// Applies to jobs whose stage has no timeout of its own.
  std::optional<std::chrono::seconds> default_timeout;
  std::filesystem::path workspace_root;
  bool keep_workspace{false};
  bool retain_artifacts{false};
};

struct StepOutcome {
  std::string name;
  int exit_code{0};
  std::string stdout_output;
  std::string stderr_output;
  std::string error;
  bool cancelled{false};

  auto operator==(const StepOutcome &) const -> bool = default;
};

struct JobOutput {
  std::vector<StepOutcome> steps;
  std::vector<std::string> produced;
};

struct SchedulerOutput {
  /// Indexed like the jobs of the PipelineRun.
  std::vector<JobOutput> jobs;
  std::vector<ArtifactManifestEntry> manifest;
  /// Contents of the retained manifest entries, in manifest order. The store
  /// holds nothing of the run once execute() returns.
  std::vector<std::shared_ptr<const Artifact>> outputs;
};

/// Drives a PipelineRun to completion: starts ready jobs up to the
/// concurrency limit, runs their steps through the step executor, moves
/// artifacts between jobs and forwards fail-fast and cancellation stop
/// requests. All run bookkeeping happens on shard 0.
class JobScheduler {
public:
  JobScheduler(Runtime &runtime, IStepExecutor &executor,
               IArtifactStore &store, SchedulerOptions options);
  ~JobScheduler();

  JobScheduler(const JobScheduler &) = delete;
  auto operator=(const JobScheduler &) -> JobScheduler & = delete;

  /// Must be awaited on shard 0. `run` must outlive the returned task.
  [[nodiscard]] auto execute(PipelineRun &run, const RunContext &ctx,
                             RunId run_id) -> task<SchedulerOutput>;

  /// Thread safe; cancels the run being executed, if any.
  auto cancel() -> void;

  [[nodiscard]] auto options() const noexcept -> const SchedulerOptions & {
    return options_;
  }

private:
  struct JobSlot {
    std::stop_source stop;
    bool timed_out{false};
    std::filesystem::path workspace;
  };

  struct ActiveRun;
  struct JobVerdict;

  auto execute_job(ActiveRun &active, NodeIndex idx) -> task<JobVerdict>;
  auto run_job(ActiveRun &active, NodeIndex idx) -> spawn_task;
  auto dispatch(ActiveRun &active) -> void;
  auto forward_stop_requests(ActiveRun &active) -> void;
  auto dispose_consumed(ActiveRun &active) -> void;
  auto collect_outputs(ActiveRun &active)
      -> std::vector<std::shared_ptr<const Artifact>>;
  auto wake() -> void;

  Runtime &runtime_;
  IStepExecutor &executor_;
  IArtifactStore &store_;
  SchedulerOptions options_;
  std::size_t max_parallel_;

  std::atomic<bool> cancel_requested_{false};
  // Only touched on shard 0.
  boost::asio::steady_timer *wakeup_{nullptr};
};

/// Producer jobs an artifact reference resolves to, in instance order.
/// An unqualified reference yields every instance of the producing stage.
[[nodiscard]] auto resolve_artifact_ref(const PipelineRun &run,
                                        const ArtifactRef &ref)
    -> std::vector<NodeIndex>;

/// Directory-safe name for a job, unique within the run.
[[nodiscard]] auto job_slug(NodeIndex idx, const JobId &id) -> std::string;

} // namespace pipeforge
