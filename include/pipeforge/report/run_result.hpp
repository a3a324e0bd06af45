#pragma once

#include "pipeforge/artifact/artifact_store.hpp"
#include "pipeforge/pipeline/job.hpp"
#include "pipeforge/pipeline/pipeline_run.hpp"
#include "pipeforge/pipeline/run_context.hpp"
#include "pipeforge/scheduler/job_scheduler.hpp"
#include "pipeforge/util/id.hpp"
#include "pipeforge/util/json.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

struct StageReport {
  std::string name;
  StageStatus status{StageStatus::Succeeded};
  FailureCause cause{FailureCause::None};
  SkipReason skip_reason{SkipReason::None};
  bool fail_fast_triggered{false};
  std::vector<JobId> jobs;

  auto operator==(const StageReport &) const -> bool = default;
};

struct JobReport {
  JobId id;
  std::string stage;
  MatrixAssignment matrix;
  std::string qualifier;
  JobState status{JobState::Pending};
  FailureCause cause{FailureCause::None};
  SkipReason skip_reason{SkipReason::None};
  std::string message;
  std::vector<StepOutcome> steps;
  std::vector<std::string> produced;
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
};

/// Everything a run leaves behind for the caller and for publishing tools.
struct RunResult {
  RunId run_id;
  std::string pipeline;
  RunContext context;
  bool triggered{false};
  RunStatus status{RunStatus::NotTriggered};
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
  /// Declaration order.
  std::vector<StageReport> stages;
  /// Stage order, then instance order.
  std::vector<JobReport> jobs;
  std::vector<ArtifactManifestEntry> artifacts;
  /// Contents of the retained artifacts. Not part of the JSON report.
  std::vector<std::shared_ptr<const Artifact>> outputs;

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return status == RunStatus::Succeeded;
  }

  [[nodiscard]] auto find_stage(std::string_view name) const
      -> const StageReport *;
  [[nodiscard]] auto find_job(std::string_view id) const -> const JobReport *;
  [[nodiscard]] auto find_output(const ArtifactKey &key) const
      -> std::shared_ptr<const Artifact>;

  /// Equal in everything but run id and timestamps.
  [[nodiscard]] auto outcome_equals(const RunResult &other) const -> bool;
};

[[nodiscard]] auto to_json(const RunResult &result) -> JsonValue;
[[nodiscard]] auto render_json(const RunResult &result, bool pretty = true)
    -> std::string;

} // namespace pipeforge
