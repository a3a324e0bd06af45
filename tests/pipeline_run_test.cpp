#include "pipeforge/pipeline/matrix.hpp"
#include "pipeforge/pipeline/pipeline_run.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace pipeforge;

namespace {

// Builds the stage graph and job list for a set of stages, the way the run
// controller does before scheduling.
struct Fixture {
  Graph stages;
  std::vector<JobInstance> jobs;

  explicit Fixture(const std::vector<StageSpec> &specs) {
    for (const auto &spec : specs) {
      EXPECT_TRUE(stages.add_node(spec.name));
    }
    for (const auto &spec : specs) {
      for (const auto &need : spec.needs) {
        EXPECT_TRUE(stages.add_edge(need, spec.name));
      }
    }
    for (std::size_t s = 0; s < specs.size(); ++s) {
      auto expanded = expand_matrix(specs[s], static_cast<NodeIndex>(s));
      EXPECT_TRUE(expanded);
      for (auto &job : *expanded) {
        jobs.push_back(std::move(job));
      }
    }
  }

  auto create() -> PipelineRun {
    auto run = PipelineRun::create(stages, jobs);
    EXPECT_TRUE(run);
    return std::move(*run);
  }
};

auto index_of(const PipelineRun &run, std::string_view id) -> NodeIndex {
  return run.job_graph().index_of(id);
}

auto state_of(const PipelineRun &run, std::string_view id) -> JobState {
  return run.record(index_of(run, id)).state;
}

auto start_and_succeed(PipelineRun &run, std::string_view id) -> void {
  const auto idx = index_of(run, id);
  ASSERT_TRUE(run.mark_started(idx));
  ASSERT_TRUE(run.mark_succeeded(idx));
}

auto linear_stages() -> std::vector<StageSpec> {
  return {StageBuilder("test").shell("t", "make test").build(),
          StageBuilder("build")
              .needs("test")
              .axis("os", {"linux", "macos"})
              .shell("b", "make")
              .build(),
          StageBuilder("release").needs("build").shell("r", "release").build()};
}

} // namespace

TEST(PipelineRunTest, RootJobsStartReady) {
  Fixture f(linear_stages());
  auto run = f.create();
  EXPECT_EQ(run.job_count(), 4U);
  EXPECT_EQ(run.stage_count(), 3U);
  EXPECT_EQ(run.ready_jobs(), (std::vector<NodeIndex>{0}));
  EXPECT_EQ(state_of(run, "build[os=linux]"), JobState::Pending);
  EXPECT_FALSE(run.is_complete());
}

TEST(PipelineRunTest, EveryJobOfAStageWaitsForEveryPrerequisiteJob) {
  Fixture f(linear_stages());
  auto run = f.create();
  start_and_succeed(run, "test");
  EXPECT_EQ(run.ready_count(), 2U);

  start_and_succeed(run, "build[os=linux]");
  EXPECT_EQ(state_of(run, "release"), JobState::Pending);
  start_and_succeed(run, "build[os=macos]");
  EXPECT_EQ(state_of(run, "release"), JobState::Ready);

  start_and_succeed(run, "release");
  EXPECT_TRUE(run.is_complete());
  EXPECT_EQ(run.status(), RunStatus::Succeeded);
  EXPECT_EQ(run.stage_outcome(1).status, StageStatus::Succeeded);
}

TEST(PipelineRunTest, TransitionsAreChecked) {
  Fixture f(linear_stages());
  auto run = f.create();
  const auto build = index_of(run, "build[os=linux]");
  EXPECT_EQ(run.mark_started(build).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(run.mark_succeeded(0).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(run.mark_started(99).error(), make_error_code(Error::NotFound));
  start_and_succeed(run, "test");
  EXPECT_EQ(run.mark_failed(0, FailureCause::StepFailure, "late").error(),
            make_error_code(Error::InvalidState));
}

TEST(PipelineRunTest, FailFastCancelsSiblingsAndSkipsDownstream) {
  Fixture f(linear_stages());
  auto run = f.create();
  start_and_succeed(run, "test");
  const auto linux_job = index_of(run, "build[os=linux]");
  const auto mac_job = index_of(run, "build[os=macos]");
  ASSERT_TRUE(run.mark_started(linux_job));
  ASSERT_TRUE(run.mark_started(mac_job));

  ASSERT_TRUE(run.mark_failed(linux_job, FailureCause::StepFailure, "boom"));
  EXPECT_EQ(run.record(linux_job).state, JobState::Failed);
  EXPECT_EQ(run.record(linux_job).cause, FailureCause::StepFailure);
  // The running sibling is asked to stop exactly once.
  EXPECT_EQ(run.drain_stop_requests(), (std::vector<NodeIndex>{mac_job}));
  EXPECT_TRUE(run.drain_stop_requests().empty());
  EXPECT_TRUE(run.record(mac_job).stop_requested);

  ASSERT_TRUE(run.mark_cancelled(mac_job, "stopped"));
  EXPECT_EQ(state_of(run, "release"), JobState::Skipped);
  EXPECT_EQ(run.record(index_of(run, "release")).skip_reason,
            SkipReason::DependencyFailed);

  ASSERT_TRUE(run.is_complete());
  const auto build = run.stage_outcome(1);
  EXPECT_EQ(build.status, StageStatus::Failed);
  EXPECT_EQ(build.cause, FailureCause::StepFailure);
  EXPECT_TRUE(build.fail_fast_triggered);
  const auto release = run.stage_outcome(2);
  EXPECT_EQ(release.status, StageStatus::Skipped);
  EXPECT_EQ(release.skip_reason, SkipReason::DependencyFailed);
  EXPECT_EQ(run.status(), RunStatus::Failed);
}

TEST(PipelineRunTest, FailFastCancelsSiblingsThatHaveNotStarted) {
  Fixture f({StageBuilder("test")
                 .axis("shard", {"1", "2", "3"})
                 .shell("t", "make test")
                 .build()});
  auto run = f.create();
  ASSERT_TRUE(run.mark_started(0));
  ASSERT_TRUE(run.mark_failed(0, FailureCause::Timeout, "too slow"));
  EXPECT_EQ(run.record(1).state, JobState::Cancelled);
  EXPECT_EQ(run.record(2).state, JobState::Cancelled);
  EXPECT_NE(run.record(1).message.find("fail-fast"), std::string::npos);
  EXPECT_TRUE(run.is_complete());
  EXPECT_EQ(run.stage_outcome(0).cause, FailureCause::Timeout);
}

TEST(PipelineRunTest, WithoutFailFastSiblingsKeepRunning) {
  Fixture f({StageBuilder("test")
                 .axis("shard", {"1", "2"})
                 .fail_fast(false)
                 .shell("t", "make test")
                 .build()});
  auto run = f.create();
  ASSERT_TRUE(run.mark_started(0));
  ASSERT_TRUE(run.mark_started(1));
  ASSERT_TRUE(run.mark_failed(0, FailureCause::StepFailure, "boom"));
  EXPECT_TRUE(run.drain_stop_requests().empty());
  EXPECT_EQ(run.record(1).state, JobState::Running);
  ASSERT_TRUE(run.mark_succeeded(1));

  const auto outcome = run.stage_outcome(0);
  EXPECT_EQ(outcome.status, StageStatus::Failed);
  EXPECT_FALSE(outcome.fail_fast_triggered);
  EXPECT_EQ(run.status(), RunStatus::Failed);
}

TEST(PipelineRunTest, ClosedGateSkipsStageAndItsDependents) {
  Fixture f(linear_stages());
  auto run = f.create();
  ASSERT_TRUE(run.close_gate(1, "condition 'false' is false"));
  EXPECT_EQ(state_of(run, "build[os=linux]"), JobState::Skipped);
  EXPECT_EQ(run.record(1).skip_reason, SkipReason::GateClosed);

  start_and_succeed(run, "test");
  EXPECT_EQ(state_of(run, "release"), JobState::Skipped);
  EXPECT_EQ(run.record(index_of(run, "release")).skip_reason,
            SkipReason::GateClosed);
  EXPECT_TRUE(run.is_complete());
  EXPECT_EQ(run.stage_outcome(1).status, StageStatus::Skipped);
  EXPECT_EQ(run.stage_outcome(1).skip_reason, SkipReason::GateClosed);
  EXPECT_EQ(run.status(), RunStatus::Succeeded);
}

TEST(PipelineRunTest, ClosingTheGateOfAnAlreadySkippedStageKeepsGateReason) {
  Fixture f(linear_stages());
  auto run = f.create();
  ASSERT_TRUE(run.close_gate(0, "closed upstream"));
  EXPECT_EQ(state_of(run, "release"), JobState::Skipped);
  ASSERT_TRUE(run.close_gate(2, "closed here"));
  EXPECT_EQ(run.record(index_of(run, "release")).message, "closed here");
}

TEST(PipelineRunTest, GateCannotCloseOnceAJobStarted) {
  Fixture f(linear_stages());
  auto run = f.create();
  ASSERT_TRUE(run.mark_started(0));
  EXPECT_EQ(run.close_gate(0, "late").error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(run.close_gate(42, "nope").error(),
            make_error_code(Error::NotFound));
}

TEST(PipelineRunTest, AlwaysStageRunsAfterFailure) {
  Fixture f({StageBuilder("build").shell("b", "make").build(),
             StageBuilder("notify")
                 .needs("build")
                 .always_run()
                 .shell("n", "notify")
                 .build()});
  auto run = f.create();
  ASSERT_TRUE(run.mark_started(0));
  ASSERT_TRUE(run.mark_failed(0, FailureCause::StepFailure, "boom"));
  EXPECT_EQ(run.record(1).state, JobState::Ready);
  start_and_succeed(run, "notify");
  EXPECT_EQ(run.stage_outcome(1).status, StageStatus::Succeeded);
  EXPECT_EQ(run.status(), RunStatus::Failed);
}

TEST(PipelineRunTest, SuccessRacingAStopRequestStaysSuccess) {
  Fixture f({StageBuilder("test")
                 .axis("shard", {"1", "2"})
                 .shell("t", "make test")
                 .build()});
  auto run = f.create();
  ASSERT_TRUE(run.mark_started(0));
  ASSERT_TRUE(run.mark_started(1));
  ASSERT_TRUE(run.mark_failed(0, FailureCause::StepFailure, "boom"));
  ASSERT_TRUE(run.mark_succeeded(1));
  EXPECT_EQ(run.record(1).state, JobState::Succeeded);
  EXPECT_TRUE(run.record(1).message.empty());
  EXPECT_EQ(run.stage_outcome(0).status, StageStatus::Failed);
}

TEST(PipelineRunTest, CancelAllCancelsWaitingAndStopsRunning) {
  Fixture f(linear_stages());
  auto run = f.create();
  ASSERT_TRUE(run.mark_started(0));
  run.cancel_all("run cancelled");
  EXPECT_TRUE(run.cancel_requested());
  EXPECT_EQ(state_of(run, "build[os=linux]"), JobState::Cancelled);
  EXPECT_EQ(state_of(run, "release"), JobState::Cancelled);
  EXPECT_EQ(run.drain_stop_requests(), (std::vector<NodeIndex>{0}));
  EXPECT_FALSE(run.is_complete());

  ASSERT_TRUE(run.mark_cancelled(0, "run cancelled"));
  EXPECT_TRUE(run.is_complete());
  EXPECT_EQ(run.stage_outcome(0).status, StageStatus::Cancelled);
  EXPECT_EQ(run.status(), RunStatus::Cancelled);
}

TEST(PipelineRunTest, DuplicateJobIdsAreRejected) {
  Graph stages;
  ASSERT_TRUE(stages.add_node("a"));
  auto jobs = expand_matrix(StageBuilder("a").shell("s", "x").build(), 0);
  ASSERT_TRUE(jobs);
  jobs->push_back(jobs->front());
  auto run = PipelineRun::create(stages, std::move(*jobs));
  ASSERT_FALSE(run);
  EXPECT_EQ(run.error(), make_error_code(Error::AlreadyExists));
}
