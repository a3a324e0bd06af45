#include "pipeforge/pipeline/matrix.hpp"

#include "pipeforge/util/log.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <format>

namespace pipeforge {

auto make_qualifier(const MatrixAssignment &assignment) -> std::string {
  std::string out;
  for (const auto &[axis, value] : assignment) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(axis).append("=").append(value);
  }
  return out;
}

auto make_job_id(std::string_view stage, std::string_view qualifier) -> JobId {
  if (qualifier.empty()) {
    return JobId{stage};
  }
  return JobId{std::format("{}[{}]", stage, qualifier)};
}

auto JobInstance::render(const TemplateLookup &lookup) -> void {
  auto apply = [&](std::string &field) {
    field = render_template(field, lookup);
  };
  for (auto &step : steps) {
    apply(step.name);
    apply(step.working_dir);
    for (auto &[_, value] : step.params) {
      apply(value);
    }
    for (auto &[_, value] : step.env) {
      apply(value);
    }
  }
  for (auto &[_, value] : env) {
    apply(value);
  }
  for (auto &artifact : produces) {
    apply(artifact.path);
  }
}

auto matrix_lookup(const MatrixAssignment &assignment) -> TemplateLookup {
  return [assignment](std::string_view name) -> std::optional<std::string> {
    constexpr std::string_view kPrefix = "matrix.";
    if (!boost::algorithm::starts_with(name, kPrefix)) {
      return std::nullopt;
    }
    const auto axis = name.substr(kPrefix.size());
    for (const auto &[key, value] : assignment) {
      if (key == axis) {
        return value;
      }
    }
    return std::nullopt;
  };
}

auto job_lookup(const MatrixAssignment &assignment, TemplateLookup context)
    -> TemplateLookup {
  return [matrix = matrix_lookup(assignment), context = std::move(context)](
             std::string_view name) -> std::optional<std::string> {
    if (auto value = matrix(name)) {
      return value;
    }
    return context ? context(name) : std::nullopt;
  };
}

auto matrix_size(const StageSpec &stage) noexcept -> std::size_t {
  std::size_t total = 1;
  for (const auto &axis : stage.matrix) {
    total *= axis.values.size();
  }
  return total;
}

auto expand_matrix(const StageSpec &stage, NodeIndex stage_index,
                   const TemplateLookup &context)
    -> Result<std::vector<JobInstance>> {
  for (const auto &axis : stage.matrix) {
    if (axis.values.empty()) {
      log::error("stage '{}': matrix axis '{}' has no values", stage.name,
                 axis.name);
      return fail(Error::EmptyMatrixAxis);
    }
  }

  const auto total = matrix_size(stage);
  std::vector<JobInstance> jobs;
  jobs.reserve(total);

  // Mixed-radix counter over the axes; the last axis varies fastest.
  std::vector<std::size_t> digits(stage.matrix.size(), 0);
  for (std::size_t n = 0; n < total; ++n) {
    MatrixAssignment assignment;
    assignment.reserve(stage.matrix.size());
    for (std::size_t a = 0; a < stage.matrix.size(); ++a) {
      assignment.emplace_back(stage.matrix[a].name,
                              stage.matrix[a].values[digits[a]]);
    }

    JobInstance job;
    job.stage = stage.name;
    job.stage_index = stage_index;
    job.instance = n;
    job.qualifier = make_qualifier(assignment);
    job.id = make_job_id(stage.name, job.qualifier);
    job.steps = stage.steps;
    job.env = stage.env;
    job.produces = stage.produces;
    job.consumes = stage.consumes;
    job.fail_fast = stage.fail_fast;
    job.run_policy = stage.run_policy;
    job.timeout = stage.timeout;
    job.assignment = std::move(assignment);
    job.render(job_lookup(job.assignment, context));
    jobs.push_back(std::move(job));

    for (std::size_t a = stage.matrix.size(); a-- > 0;) {
      if (++digits[a] < stage.matrix[a].values.size()) {
        break;
      }
      digits[a] = 0;
    }
  }

  log::debug("stage '{}' expanded into {} job(s)", stage.name, jobs.size());
  return ok(std::move(jobs));
}

} // namespace pipeforge
