#include "pipeforge/pipeline/validation.hpp"

#include "pipeforge/pipeline/matrix.hpp"
#include "pipeforge/pipeline/run_context.hpp"
#include "pipeforge/pipeline/template.hpp"
#include "pipeforge/util/glob.hpp"
#include "pipeforge/util/id.hpp"
#include "pipeforge/util/log.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <format>
#include <string_view>
#include <utility>

namespace pipeforge {

namespace {

class IssueCollector {
public:
  auto add(Error code, std::string message) -> void {
    issues_.push_back({make_error_code(code), std::move(message)});
  }

  auto add(std::error_code code, std::string message) -> void {
    issues_.push_back({code, std::move(message)});
  }

  [[nodiscard]] auto take() && -> std::vector<ValidationIssue> {
    return std::move(issues_);
  }

private:
  std::vector<ValidationIssue> issues_;
};

[[nodiscard]] auto declares_axis(const StageSpec &stage, std::string_view axis)
    -> bool {
  return std::ranges::any_of(
      stage.matrix, [&](const MatrixAxis &a) { return a.name == axis; });
}

// `stage` is null for pipeline-level text, where only context variables
// are available.
auto check_tokens(std::string_view text, const StageSpec *stage,
                  std::string_view where, IssueCollector &out) -> void {
  constexpr std::string_view kMatrixPrefix = "matrix.";
  for (const auto &token : template_tokens(text)) {
    if (is_context_variable(token)) {
      continue;
    }
    if (stage && boost::algorithm::starts_with(token, kMatrixPrefix) &&
        declares_axis(*stage, std::string_view(token).substr(
                                  kMatrixPrefix.size()))) {
      continue;
    }
    out.add(Error::UnknownVariable,
            std::format("{}: unknown template variable '{}'", where, token));
  }
}

auto check_stage_templates(const StageSpec &stage, IssueCollector &out)
    -> void {
  const auto where = std::format("stage '{}'", stage.name);
  for (const auto &step : stage.steps) {
    const auto step_where = std::format("{} step '{}'", where, step.name);
    check_tokens(step.name, &stage, step_where, out);
    check_tokens(step.working_dir, &stage, step_where, out);
    for (const auto &[_, value] : step.params) {
      check_tokens(value, &stage, step_where, out);
    }
    for (const auto &[_, value] : step.env) {
      check_tokens(value, &stage, step_where, out);
    }
  }
  for (const auto &[_, value] : stage.env) {
    check_tokens(value, &stage, where, out);
  }
  for (const auto &artifact : stage.produces) {
    check_tokens(artifact.path, &stage, where, out);
  }
}

auto check_matrix(const StageSpec &stage, IssueCollector &out) -> void {
  ankerl::unordered_dense::set<std::string_view> axes;
  for (const auto &axis : stage.matrix) {
    if (axis.name.empty()) {
      out.add(Error::InvalidArgument,
              std::format("stage '{}': matrix axis name cannot be empty",
                          stage.name));
      continue;
    }
    if (!axes.insert(axis.name).second) {
      out.add(Error::InvalidArgument,
              std::format("stage '{}': duplicate matrix axis '{}'",
                          stage.name, axis.name));
    }
    if (axis.values.empty()) {
      out.add(Error::EmptyMatrixAxis,
              std::format("stage '{}': matrix axis '{}' has no values",
                          stage.name, axis.name));
      continue;
    }
    ankerl::unordered_dense::set<std::string_view> values;
    for (const auto &value : axis.values) {
      if (!values.insert(value).second) {
        out.add(Error::InvalidArgument,
                std::format("stage '{}': matrix axis '{}' repeats value '{}'",
                            stage.name, axis.name, value));
      }
    }
  }
}

auto check_produces(const StageSpec &stage, IssueCollector &out) -> void {
  ankerl::unordered_dense::set<std::string_view> names;
  for (const auto &artifact : stage.produces) {
    if (artifact.name.empty()) {
      out.add(Error::InvalidArtifactRef,
              std::format("stage '{}': produced artifact needs a name",
                          stage.name));
      continue;
    }
    if (artifact.name == "." || artifact.name == ".." ||
        artifact.name.find_first_of("/\\") != std::string::npos) {
      out.add(Error::InvalidArtifactRef,
              std::format("stage '{}': artifact name '{}' must be a single "
                          "path component",
                          stage.name, artifact.name));
    }
    if (!names.insert(artifact.name).second) {
      out.add(Error::InvalidArtifactRef,
              std::format("stage '{}': artifact '{}' is declared twice",
                          stage.name, artifact.name));
    }
    if (artifact.path.empty()) {
      out.add(Error::InvalidArtifactRef,
              std::format("stage '{}': artifact '{}' needs a path",
                          stage.name, artifact.name));
    } else if (artifact.path.front() == '/') {
      out.add(Error::InvalidArtifactRef,
              std::format("stage '{}': artifact '{}' path must be relative "
                          "to the job workspace",
                          stage.name, artifact.name));
    } else if (has_parent_component(artifact.path)) {
      out.add(Error::InvalidArtifactRef,
              std::format("stage '{}': artifact '{}' path must stay inside "
                          "the job workspace",
                          stage.name, artifact.name));
    }
  }
}

[[nodiscard]] auto producer_qualifiers(const StageSpec &producer)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  auto jobs = expand_matrix(producer);
  if (!jobs) {
    return out;
  }
  out.reserve(jobs->size());
  for (auto &job : *jobs) {
    out.push_back(std::move(job.qualifier));
  }
  return out;
}

// Needs an acyclic graph: ancestry is only meaningful then.
auto check_consumes(const PipelineSpec &spec, const Graph &graph,
                    IssueCollector &out) -> void {
  for (const auto &stage : spec.stages) {
    const auto idx = graph.index_of(stage.name);
    if (idx == kInvalidNode) {
      continue;
    }
    const auto ancestors = graph.ancestors(idx);
    for (const auto &ref : stage.consumes) {
      const auto producer_idx = graph.index_of(ref.stage);
      const auto *producer = spec.find_stage(ref.stage);
      if (producer_idx == kInvalidNode || !producer) {
        out.add(Error::InvalidArtifactRef,
                std::format("stage '{}': consumes '{}' from unknown stage "
                            "'{}'",
                            stage.name, ref.name, ref.stage));
        continue;
      }
      if (std::ranges::find(ancestors, producer_idx) == ancestors.end()) {
        out.add(Error::InvalidArtifactRef,
                std::format("stage '{}': consumes from '{}', which is not a "
                            "prerequisite",
                            stage.name, ref.stage));
        continue;
      }
      if (!producer->produces_artifact(ref.name)) {
        out.add(Error::InvalidArtifactRef,
                std::format("stage '{}': stage '{}' does not produce '{}'",
                            stage.name, ref.stage, ref.name));
        continue;
      }
      if (ref.qualifier) {
        const auto qualifiers = producer_qualifiers(*producer);
        if (std::ranges::find(qualifiers, *ref.qualifier) ==
            qualifiers.end()) {
          out.add(Error::InvalidArtifactRef,
                  std::format("stage '{}': no instance '{}' of stage '{}'",
                              stage.name, *ref.qualifier, ref.stage));
        }
      }
    }
  }
}

auto check_triggers(const PipelineSpec &spec, IssueCollector &out) -> void {
  for (std::size_t i = 0; i < spec.triggers.size(); ++i) {
    for (const auto &tag : spec.triggers[i].tags) {
      if (!GlobPattern::compile(tag)) {
        out.add(Error::InvalidArgument,
                std::format("trigger #{}: invalid tag pattern '{}'", i + 1,
                            tag));
      }
    }
    for (const auto &branch : spec.triggers[i].branches) {
      if (branch.empty()) {
        out.add(Error::InvalidArgument,
                std::format("trigger #{}: empty branch name", i + 1));
      }
    }
  }
}

} // namespace

auto collect_issues(const PipelineSpec &spec, const StepCheck &check_step)
    -> std::vector<ValidationIssue> {
  IssueCollector out;

  if (spec.stages.empty()) {
    out.add(Error::InvalidArgument, "pipeline must have at least one stage");
    return std::move(out).take();
  }

  Graph graph;
  for (const auto &stage : spec.stages) {
    if (stage.name.empty()) {
      out.add(Error::InvalidArgument, "stage name cannot be empty");
      continue;
    }
    if (!is_valid_id_text(stage.name)) {
      out.add(Error::InvalidArgument,
              std::format("stage '{}' contains control characters",
                          stage.name));
      continue;
    }
    if (!graph.add_node(stage.name)) {
      out.add(Error::AlreadyExists,
              std::format("duplicate stage name '{}'", stage.name));
    }
  }

  for (const auto &stage : spec.stages) {
    if (stage.steps.empty()) {
      out.add(Error::InvalidArgument,
              std::format("stage '{}' has no steps", stage.name));
    }
    for (const auto &step : stage.steps) {
      std::string diag;
      if (auto r = check_step(step, &diag); !r) {
        out.add(r.error(),
                std::format("stage '{}': {}", stage.name,
                            diag.empty() ? r.error().message() : diag));
      }
    }
    if (stage.timeout && stage.timeout->count() <= 0) {
      out.add(Error::InvalidArgument,
              std::format("stage '{}': timeout must be positive",
                          stage.name));
    }
  }

  bool edges_complete = true;
  for (const auto &stage : spec.stages) {
    for (const auto &need : stage.needs) {
      if (need == stage.name) {
        out.add(Error::DanglingReference,
                std::format("stage '{}' needs itself", stage.name));
        edges_complete = false;
        continue;
      }
      if (!graph.has_node(need)) {
        out.add(Error::DanglingReference,
                std::format("stage '{}' needs unknown stage '{}'", stage.name,
                            need));
        edges_complete = false;
        continue;
      }
      if (!graph.has_node(stage.name)) {
        continue;
      }
      if (auto r = graph.add_edge(need, stage.name); !r) {
        out.add(r.error(), std::format("stage '{}': cannot depend on '{}'",
                                       stage.name, need));
        edges_complete = false;
      }
    }
  }

  std::vector<std::string> cycle;
  const bool acyclic = static_cast<bool>(graph.check_acyclic(&cycle));
  if (!acyclic) {
    std::string path;
    for (const auto &key : cycle) {
      if (!path.empty()) {
        path += " -> ";
      }
      path += key;
    }
    out.add(Error::CycleDetected,
            std::format("dependency cycle between stages: {}", path));
  }

  for (const auto &stage : spec.stages) {
    check_matrix(stage, out);
    if (!stage.condition.empty()) {
      std::string diag;
      if (auto c = Condition::parse(stage.condition, &diag); !c) {
        out.add(c.error(), std::format("stage '{}': condition '{}': {}",
                                       stage.name, stage.condition,
                                       diag.empty() ? c.error().message()
                                                    : diag));
      }
    }
    check_stage_templates(stage, out);
    check_produces(stage, out);
  }
  for (const auto &[_, value] : spec.env) {
    check_tokens(value, nullptr, "pipeline env", out);
  }

  if (acyclic && edges_complete) {
    check_consumes(spec, graph, out);
  }
  check_triggers(spec, out);

  return std::move(out).take();
}

auto validate_pipeline(const PipelineSpec &spec, const StepCheck &check_step,
                       std::string *diagnostic) -> Result<ValidatedPipeline> {
  auto issues = collect_issues(spec, check_step);
  if (!issues.empty()) {
    std::string joined;
    for (const auto &issue : issues) {
      log::error("pipeline validation error: {}", issue.message);
      if (!joined.empty()) {
        joined += "; ";
      }
      joined += issue.message;
    }
    if (diagnostic) {
      *diagnostic = std::move(joined);
    }
    return fail(issues.front().code);
  }

  ValidatedPipeline out;
  for (const auto &stage : spec.stages) {
    if (auto r = out.stage_graph.add_node(stage.name); !r) {
      return fail(r.error());
    }
  }
  for (const auto &stage : spec.stages) {
    for (const auto &need : stage.needs) {
      if (auto r = out.stage_graph.add_edge(need, stage.name); !r) {
        return fail(r.error());
      }
    }
  }

  out.conditions.reserve(spec.stages.size());
  for (const auto &stage : spec.stages) {
    if (stage.condition.empty()) {
      out.conditions.emplace_back(std::nullopt);
      continue;
    }
    auto parsed = Condition::parse(stage.condition);
    if (!parsed) {
      return fail(parsed.error());
    }
    out.conditions.emplace_back(std::move(*parsed));
  }

  auto triggers = TriggerEvaluator::create(spec.triggers);
  if (!triggers) {
    if (diagnostic) {
      *diagnostic = "invalid trigger clause";
    }
    return fail(triggers.error());
  }
  out.triggers = std::move(*triggers);
  return ok(std::move(out));
}

} // namespace pipeforge
