#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/pipeline/graph.hpp"
#include "pipeforge/pipeline/job.hpp"
#include "pipeforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

enum class JobState : std::uint8_t {
  Pending,
  Ready,
  Running,
  Succeeded,
  Failed,
  Cancelled,
  Skipped,
};
BOOST_DESCRIBE_ENUM(JobState, Pending, Ready, Running, Succeeded, Failed,
                    Cancelled, Skipped)
PIPEFORGE_DEFINE_ENUM_SERDE(JobState, JobState::Pending)

[[nodiscard]] constexpr auto is_terminal(JobState s) noexcept -> bool {
  return s == JobState::Succeeded || s == JobState::Failed ||
         s == JobState::Cancelled || s == JobState::Skipped;
}

enum class FailureCause : std::uint8_t {
  None,
  StepFailure,
  MissingArtifact,
  Timeout,
};
BOOST_DESCRIBE_ENUM(FailureCause, None, StepFailure, MissingArtifact, Timeout)
PIPEFORGE_DEFINE_ENUM_SERDE(FailureCause, FailureCause::None)

enum class SkipReason : std::uint8_t {
  None,
  GateClosed,
  DependencyFailed,
};
BOOST_DESCRIBE_ENUM(SkipReason, None, GateClosed, DependencyFailed)
PIPEFORGE_DEFINE_ENUM_SERDE(SkipReason, SkipReason::None)

enum class StageStatus : std::uint8_t {
  Succeeded,
  Failed,
  Skipped,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(StageStatus, Succeeded, Failed, Skipped, Cancelled)
PIPEFORGE_DEFINE_ENUM_SERDE(StageStatus, StageStatus::Failed)

enum class RunStatus : std::uint8_t {
  Succeeded,
  Failed,
  Cancelled,
  NotTriggered,
};
BOOST_DESCRIBE_ENUM(RunStatus, Succeeded, Failed, Cancelled, NotTriggered)
PIPEFORGE_DEFINE_ENUM_SERDE(RunStatus, RunStatus::Failed)

struct JobRecord {
  JobState state{JobState::Pending};
  FailureCause cause{FailureCause::None};
  SkipReason skip_reason{SkipReason::None};
  std::string message;
  bool stop_requested{false};
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
};

struct StageOutcome {
  StageStatus status{StageStatus::Succeeded};
  FailureCause cause{FailureCause::None};
  SkipReason skip_reason{SkipReason::None};
  bool fail_fast_triggered{false};
};

/// Job-level state machine for one run. Every job of a stage depends on every
/// job of the stages it needs; all transitions go through the mark_* calls,
/// which keep per-job dependency counters and propagate terminal states
/// downstream. Not thread safe: the scheduler drives it from one strand.
class PipelineRun {
public:
  /// `jobs` must be grouped by stage and carry `stage_index` into
  /// `stage_graph`; the stage graph must be acyclic.
  [[nodiscard]] static auto create(const Graph &stage_graph,
                                   std::vector<JobInstance> jobs)
      -> Result<PipelineRun>;

  ~PipelineRun();
  PipelineRun(PipelineRun &&) noexcept;
  PipelineRun &operator=(PipelineRun &&) noexcept;
  PipelineRun(const PipelineRun &) = delete;
  PipelineRun &operator=(const PipelineRun &) = delete;

  [[nodiscard]] auto job_count() const noexcept -> std::size_t;
  [[nodiscard]] auto stage_count() const noexcept -> std::size_t;
  [[nodiscard]] auto job(NodeIndex idx) const -> const JobInstance &;
  [[nodiscard]] auto jobs() const noexcept -> std::span<const JobInstance>;
  [[nodiscard]] auto record(NodeIndex idx) const -> const JobRecord &;
  [[nodiscard]] auto stage_jobs(NodeIndex stage_idx) const
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto job_graph() const noexcept -> const Graph &;

  /// Ready jobs in index order.
  [[nodiscard]] auto ready_jobs() const -> std::vector<NodeIndex>;
  [[nodiscard]] auto ready_count() const noexcept -> std::size_t;
  [[nodiscard]] auto running_count() const noexcept -> std::size_t;

  /// Skip every job of a stage whose condition did not hold. Only valid
  /// before any job of that stage started.
  [[nodiscard]] auto close_gate(NodeIndex stage_idx, std::string_view message)
      -> Result<void>;

  [[nodiscard]] auto mark_started(NodeIndex idx) -> Result<void>;
  [[nodiscard]] auto mark_succeeded(NodeIndex idx) -> Result<void>;
  [[nodiscard]] auto mark_failed(NodeIndex idx, FailureCause cause,
                                 std::string_view message) -> Result<void>;
  /// A running job that stopped because it was asked to.
  [[nodiscard]] auto mark_cancelled(NodeIndex idx, std::string_view message)
      -> Result<void>;

  /// Cancel the whole run: pending and ready jobs become cancelled, running
  /// jobs are queued for a stop request.
  auto cancel_all(std::string_view message) -> void;
  [[nodiscard]] auto cancel_requested() const noexcept -> bool;

  /// Running jobs that must be told to stop (fail-fast or run cancellation).
  /// Each job is returned once.
  [[nodiscard]] auto drain_stop_requests() -> std::vector<NodeIndex>;

  [[nodiscard]] auto is_complete() const noexcept -> bool;
  [[nodiscard]] auto stage_outcome(NodeIndex stage_idx) const -> StageOutcome;
  /// Overall status; only meaningful once is_complete().
  [[nodiscard]] auto status() const -> RunStatus;

private:
  PipelineRun();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pipeforge
