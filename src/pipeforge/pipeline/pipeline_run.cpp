#include "pipeforge/pipeline/pipeline_run.hpp"

#include "pipeforge/util/log.hpp"

#include <boost/dynamic_bitset.hpp>

#include <format>
#include <ranges>
#include <utility>

namespace pipeforge {

struct PipelineRun::Impl {
  auto init(const Graph &stage_graph, std::vector<JobInstance> jobs)
      -> Result<void> {
    jobs_ = std::move(jobs);
    const auto n = jobs_.size();
    stage_jobs_.resize(stage_graph.size());

    for (auto [i, job] : std::views::enumerate(jobs_)) {
      if (job.stage_index >= stage_graph.size()) {
        log::error("job '{}' refers to unknown stage index {}", job.id,
                   job.stage_index);
        return fail(Error::InvalidArgument);
      }
      auto added = graph_.add_node(job.id.str());
      if (!added) {
        log::error("duplicate job id '{}'", job.id);
        return fail(added.error());
      }
      stage_jobs_[job.stage_index].push_back(static_cast<NodeIndex>(i));
    }

    for (auto [i, job] : std::views::enumerate(jobs_)) {
      for (NodeIndex prereq_stage : stage_graph.deps(job.stage_index)) {
        for (NodeIndex prereq : stage_jobs_[prereq_stage]) {
          if (auto r = graph_.add_edge(prereq, static_cast<NodeIndex>(i));
              !r) {
            return fail(r.error());
          }
        }
      }
    }

    records_.resize(n);
    in_degree_.resize(n, 0);
    terminal_dep_count_.resize(n, 0);
    success_dep_count_.resize(n, 0);
    blocked_dep_count_.resize(n, 0);
    ready_mask_.resize(n);
    running_mask_.resize(n);
    succeeded_mask_.resize(n);
    failed_mask_.resize(n);
    cancelled_mask_.resize(n);
    skipped_mask_.resize(n);
    gate_closed_.resize(stage_graph.size());
    fail_fast_triggered_.resize(stage_graph.size());

    pending_count_ = n;
    for (std::size_t i = 0; i < n; ++i) {
      const auto idx = static_cast<NodeIndex>(i);
      in_degree_[i] = static_cast<int>(graph_.deps(idx).size());
      if (in_degree_[i] == 0) {
        make_ready(idx);
      }
    }
    return ok();
  }

  [[nodiscard]] auto is_pending(NodeIndex idx) const -> bool {
    return records_[idx].state == JobState::Pending;
  }

  auto make_ready(NodeIndex idx) -> void {
    ready_mask_.set(idx);
    ++ready_count_;
    --pending_count_;
    records_[idx].state = JobState::Ready;
  }

  auto terminal_mask(JobState state) -> boost::dynamic_bitset<> & {
    switch (state) {
    case JobState::Succeeded:
      return succeeded_mask_;
    case JobState::Failed:
      return failed_mask_;
    case JobState::Cancelled:
      return cancelled_mask_;
    default:
      return skipped_mask_;
    }
  }

  auto leave_current(NodeIndex idx) -> void {
    if (ready_mask_.test(idx)) {
      ready_mask_.reset(idx);
      --ready_count_;
    } else if (running_mask_.test(idx)) {
      running_mask_.reset(idx);
      --running_count_;
    } else {
      --pending_count_;
    }
  }

  // The single place a job reaches a terminal state.
  auto settle(NodeIndex idx, JobState state, std::string_view message,
              bool propagate) -> void {
    leave_current(idx);
    terminal_mask(state).set(idx);
    ++terminal_count_;

    auto &rec = records_[idx];
    rec.state = state;
    rec.finished_at = std::chrono::system_clock::now();
    if (!message.empty()) {
      rec.message = std::string(message);
    }

    const bool blocks = state == JobState::Failed ||
                        state == JobState::Cancelled ||
                        (state == JobState::Skipped &&
                         rec.skip_reason == SkipReason::DependencyFailed);
    for (NodeIndex dep : graph_.dependents(idx)) {
      ++terminal_dep_count_[dep];
      if (state == JobState::Succeeded) {
        ++success_dep_count_[dep];
      } else if (blocks) {
        ++blocked_dep_count_[dep];
      }
    }

    log::debug("job {} -> {}", jobs_[idx].id, to_string_view(state));
    if (propagate) {
      propagate_terminal_to_downstream(idx);
    }
  }

  auto skip(NodeIndex idx, SkipReason reason, std::string_view message)
      -> void {
    records_[idx].skip_reason = reason;
    settle(idx, JobState::Skipped, message, true);
  }

  auto propagate_terminal_to_downstream(NodeIndex terminal_job) -> void {
    for (NodeIndex dep : graph_.dependents(terminal_job)) {
      if (!is_pending(dep)) {
        continue;
      }
      const int total = in_degree_[dep];
      const bool all_done = terminal_dep_count_[dep] == total;

      if (jobs_[dep].run_policy == RunPolicy::Always) {
        if (all_done) {
          make_ready(dep);
        }
        continue;
      }
      if (blocked_dep_count_[dep] > 0) {
        skip(dep, SkipReason::DependencyFailed,
             "a prerequisite job did not succeed");
      } else if (success_dep_count_[dep] == total) {
        make_ready(dep);
      } else if (all_done) {
        skip(dep, SkipReason::GateClosed, "a prerequisite stage was skipped");
      }
    }
  }

  auto trigger_fail_fast(NodeIndex failed_job) -> void {
    const auto &job = jobs_[failed_job];
    fail_fast_triggered_.set(job.stage_index);
    const auto message =
        std::format("cancelled by fail-fast after {} failed", job.id);
    for (NodeIndex sibling : stage_jobs_[job.stage_index]) {
      if (sibling == failed_job) {
        continue;
      }
      auto &rec = records_[sibling];
      if (rec.state == JobState::Pending || rec.state == JobState::Ready) {
        settle(sibling, JobState::Cancelled, message, true);
      } else if (rec.state == JobState::Running) {
        request_stop(sibling, message);
      }
    }
  }

  auto request_stop(NodeIndex idx, std::string_view message) -> void {
    auto &rec = records_[idx];
    if (rec.stop_requested) {
      return;
    }
    rec.stop_requested = true;
    rec.message = std::string(message);
    stop_requests_.push_back(idx);
  }

  [[nodiscard]] auto check_index(NodeIndex idx) const -> Result<void> {
    if (static_cast<std::size_t>(idx) >= jobs_.size()) {
      return fail(Error::NotFound);
    }
    return ok();
  }

  [[nodiscard]] auto check_running(NodeIndex idx) const -> Result<void> {
    if (auto r = check_index(idx); !r) {
      return r;
    }
    if (!running_mask_.test(idx)) {
      return fail(Error::InvalidState);
    }
    return ok();
  }

  Graph graph_;
  std::vector<JobInstance> jobs_;
  std::vector<JobRecord> records_;
  std::vector<std::vector<NodeIndex>> stage_jobs_;

  std::vector<int> in_degree_;
  std::vector<int> terminal_dep_count_;
  std::vector<int> success_dep_count_;
  // Failed, cancelled, or skipped because of a failure further up.
  std::vector<int> blocked_dep_count_;

  boost::dynamic_bitset<> ready_mask_;
  boost::dynamic_bitset<> running_mask_;
  boost::dynamic_bitset<> succeeded_mask_;
  boost::dynamic_bitset<> failed_mask_;
  boost::dynamic_bitset<> cancelled_mask_;
  boost::dynamic_bitset<> skipped_mask_;
  boost::dynamic_bitset<> gate_closed_;
  boost::dynamic_bitset<> fail_fast_triggered_;

  std::size_t pending_count_{0};
  std::size_t ready_count_{0};
  std::size_t running_count_{0};
  std::size_t terminal_count_{0};

  std::vector<NodeIndex> stop_requests_;
  bool cancel_requested_{false};
};

PipelineRun::PipelineRun() : impl_(std::make_unique<Impl>()) {}

PipelineRun::~PipelineRun() = default;
PipelineRun::PipelineRun(PipelineRun &&) noexcept = default;
PipelineRun &PipelineRun::operator=(PipelineRun &&) noexcept = default;

auto PipelineRun::create(const Graph &stage_graph,
                         std::vector<JobInstance> jobs) -> Result<PipelineRun> {
  PipelineRun run;
  if (auto r = run.impl_->init(stage_graph, std::move(jobs)); !r) {
    return fail(r.error());
  }
  return run;
}

auto PipelineRun::job_count() const noexcept -> std::size_t {
  return impl_->jobs_.size();
}

auto PipelineRun::stage_count() const noexcept -> std::size_t {
  return impl_->stage_jobs_.size();
}

auto PipelineRun::job(NodeIndex idx) const -> const JobInstance & {
  return impl_->jobs_.at(idx);
}

auto PipelineRun::jobs() const noexcept -> std::span<const JobInstance> {
  return impl_->jobs_;
}

auto PipelineRun::record(NodeIndex idx) const -> const JobRecord & {
  return impl_->records_.at(idx);
}

auto PipelineRun::stage_jobs(NodeIndex stage_idx) const
    -> std::span<const NodeIndex> {
  return impl_->stage_jobs_.at(stage_idx);
}

auto PipelineRun::job_graph() const noexcept -> const Graph & {
  return impl_->graph_;
}

auto PipelineRun::ready_jobs() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  out.reserve(impl_->ready_count_);
  for (auto i = impl_->ready_mask_.find_first();
       i != boost::dynamic_bitset<>::npos; i = impl_->ready_mask_.find_next(i)) {
    out.push_back(static_cast<NodeIndex>(i));
  }
  return out;
}

auto PipelineRun::ready_count() const noexcept -> std::size_t {
  return impl_->ready_count_;
}

auto PipelineRun::running_count() const noexcept -> std::size_t {
  return impl_->running_count_;
}

auto PipelineRun::close_gate(NodeIndex stage_idx, std::string_view message)
    -> Result<void> {
  if (static_cast<std::size_t>(stage_idx) >= impl_->stage_jobs_.size()) {
    return fail(Error::NotFound);
  }
  for (NodeIndex idx : impl_->stage_jobs_[stage_idx]) {
    const auto state = impl_->records_[idx].state;
    if (state != JobState::Pending && state != JobState::Ready &&
        state != JobState::Skipped) {
      return fail(Error::InvalidState);
    }
  }
  impl_->gate_closed_.set(stage_idx);
  for (NodeIndex idx : impl_->stage_jobs_[stage_idx]) {
    auto &rec = impl_->records_[idx];
    if (rec.state == JobState::Skipped) {
      // Already skipped through a closed prerequisite; the own gate wins.
      rec.skip_reason = SkipReason::GateClosed;
      rec.message = std::string(message);
      continue;
    }
    impl_->skip(idx, SkipReason::GateClosed, message);
  }
  return ok();
}

auto PipelineRun::mark_started(NodeIndex idx) -> Result<void> {
  if (auto r = impl_->check_index(idx); !r) {
    return r;
  }
  if (!impl_->ready_mask_.test(idx)) {
    return fail(Error::InvalidState);
  }
  impl_->ready_mask_.reset(idx);
  impl_->running_mask_.set(idx);
  --impl_->ready_count_;
  ++impl_->running_count_;

  auto &rec = impl_->records_[idx];
  rec.state = JobState::Running;
  rec.started_at = std::chrono::system_clock::now();
  return ok();
}

auto PipelineRun::mark_succeeded(NodeIndex idx) -> Result<void> {
  if (auto r = impl_->check_running(idx); !r) {
    return r;
  }
  // A success that raced a stop request is still a success.
  auto &rec = impl_->records_[idx];
  if (rec.stop_requested) {
    rec.message.clear();
  }
  impl_->settle(idx, JobState::Succeeded, {}, true);
  return ok();
}

auto PipelineRun::mark_failed(NodeIndex idx, FailureCause cause,
                              std::string_view message) -> Result<void> {
  if (auto r = impl_->check_running(idx); !r) {
    return r;
  }
  impl_->records_[idx].cause =
      cause == FailureCause::None ? FailureCause::StepFailure : cause;
  impl_->settle(idx, JobState::Failed, message, true);
  if (impl_->jobs_[idx].fail_fast) {
    impl_->trigger_fail_fast(idx);
  }
  return ok();
}

auto PipelineRun::mark_cancelled(NodeIndex idx, std::string_view message)
    -> Result<void> {
  if (auto r = impl_->check_running(idx); !r) {
    return r;
  }
  impl_->settle(idx, JobState::Cancelled, message, true);
  return ok();
}

auto PipelineRun::cancel_all(std::string_view message) -> void {
  if (is_complete()) {
    return;
  }
  impl_->cancel_requested_ = true;
  // Everything not yet running is cancelled outright; propagation is not
  // needed because every downstream job is cancelled in the same pass.
  for (std::size_t i = 0; i < impl_->jobs_.size(); ++i) {
    const auto idx = static_cast<NodeIndex>(i);
    const auto state = impl_->records_[idx].state;
    if (state == JobState::Pending || state == JobState::Ready) {
      impl_->settle(idx, JobState::Cancelled, message, false);
    } else if (state == JobState::Running) {
      impl_->request_stop(idx, message);
    }
  }
}

auto PipelineRun::cancel_requested() const noexcept -> bool {
  return impl_->cancel_requested_;
}

auto PipelineRun::drain_stop_requests() -> std::vector<NodeIndex> {
  return std::exchange(impl_->stop_requests_, {});
}

auto PipelineRun::is_complete() const noexcept -> bool {
  return impl_->terminal_count_ == impl_->jobs_.size();
}

auto PipelineRun::stage_outcome(NodeIndex stage_idx) const -> StageOutcome {
  StageOutcome out;
  if (impl_->gate_closed_.test(stage_idx)) {
    out.status = StageStatus::Skipped;
    out.skip_reason = SkipReason::GateClosed;
    return out;
  }
  out.fail_fast_triggered = impl_->fail_fast_triggered_.test(stage_idx);

  bool any_failed = false;
  bool any_cancelled = false;
  bool all_skipped = true;
  for (NodeIndex idx : impl_->stage_jobs_.at(stage_idx)) {
    const auto &rec = impl_->records_[idx];
    switch (rec.state) {
    case JobState::Failed:
      if (!any_failed) {
        out.cause = rec.cause;
      }
      any_failed = true;
      all_skipped = false;
      break;
    case JobState::Cancelled:
      any_cancelled = true;
      all_skipped = false;
      break;
    case JobState::Skipped:
      if (out.skip_reason != SkipReason::DependencyFailed) {
        out.skip_reason = rec.skip_reason;
      }
      break;
    default:
      all_skipped = false;
      break;
    }
  }

  if (all_skipped) {
    out.status = StageStatus::Skipped;
  } else if (any_failed || out.fail_fast_triggered) {
    out.status = StageStatus::Failed;
    out.skip_reason = SkipReason::None;
  } else if (any_cancelled) {
    out.status = StageStatus::Cancelled;
    out.skip_reason = SkipReason::None;
  } else {
    out.status = StageStatus::Succeeded;
    out.skip_reason = SkipReason::None;
  }
  return out;
}

auto PipelineRun::status() const -> RunStatus {
  if (impl_->cancel_requested_) {
    return RunStatus::Cancelled;
  }
  for (std::size_t s = 0; s < impl_->stage_jobs_.size(); ++s) {
    const auto outcome = stage_outcome(static_cast<NodeIndex>(s));
    if (outcome.status == StageStatus::Skipped) {
      continue;
    }
    if (outcome.status != StageStatus::Succeeded) {
      return RunStatus::Failed;
    }
  }
  return RunStatus::Succeeded;
}

} // namespace pipeforge
