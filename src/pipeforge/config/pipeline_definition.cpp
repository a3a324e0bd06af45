#include "pipeforge/config/pipeline_definition.hpp"
#include "pipeforge/config/toml_util.hpp"

#include "pipeforge/util/enum.hpp"
#include "pipeforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <chrono>
#include <filesystem>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pipeforge {
namespace detail {

using TomlEnv = std::map<std::string, std::string>;

struct TriggerToml {
  std::string event;
  std::vector<std::string> branches;
  std::vector<std::string> tags;
};

struct StepToml {
  std::string name;
  std::string executor{kShellExecutor};
  std::string run;
  std::string working_dir;
  TomlEnv env;
  TomlEnv with; // extra executor parameters
};

struct MatrixAxisToml {
  std::string axis;
  std::vector<std::string> values;
};

struct ProducesToml {
  std::string name;
  std::string path;
};

struct ConsumesToml {
  std::string stage;
  std::string name;
  std::string matrix;
};

struct StageToml {
  std::string name;
  std::vector<std::string> needs;
  std::string condition;
  bool fail_fast{true};
  std::string run_when{"on_success"};
  int timeout_sec{0};
  std::vector<MatrixAxisToml> matrix;
  TomlEnv env;
  std::vector<StepToml> steps;
  std::vector<ProducesToml> produces;
  // "stage/name" or a table
  std::vector<std::variant<std::string, ConsumesToml>> consumes;
};

struct PipelineToml {
  std::string name;
  TomlEnv env;
  std::vector<TriggerToml> on;
  std::vector<StageToml> stages;
};

} // namespace detail
} // namespace pipeforge

namespace glz {
template <> struct meta<pipeforge::detail::TriggerToml> {
  using T = pipeforge::detail::TriggerToml;
  static constexpr auto value = object("event", &T::event, "branches",
                                       &T::branches, "tags", &T::tags);
};

template <> struct meta<pipeforge::detail::StepToml> {
  using T = pipeforge::detail::StepToml;
  static constexpr auto value =
      object("name", &T::name, "executor", &T::executor, "run", &T::run,
             "working_dir", &T::working_dir, "env", &T::env, "with", &T::with);
};

template <> struct meta<pipeforge::detail::MatrixAxisToml> {
  using T = pipeforge::detail::MatrixAxisToml;
  static constexpr auto value =
      object("axis", &T::axis, "values", &T::values);
};

template <> struct meta<pipeforge::detail::ProducesToml> {
  using T = pipeforge::detail::ProducesToml;
  static constexpr auto value = object("name", &T::name, "path", &T::path);
};

template <> struct meta<pipeforge::detail::ConsumesToml> {
  using T = pipeforge::detail::ConsumesToml;
  static constexpr auto value =
      object("stage", &T::stage, "name", &T::name, "matrix", &T::matrix);
};

template <> struct meta<pipeforge::detail::StageToml> {
  using T = pipeforge::detail::StageToml;
  static constexpr auto value = object(
      "name", &T::name, "needs", &T::needs, "if", &T::condition, "fail_fast",
      &T::fail_fast, "run_when", &T::run_when, "timeout_sec", &T::timeout_sec,
      "matrix", &T::matrix, "env", &T::env, "steps", &T::steps, "produces",
      &T::produces, "consumes", &T::consumes);
};

template <> struct meta<pipeforge::detail::PipelineToml> {
  using T = pipeforge::detail::PipelineToml;
  static constexpr auto value = object("name", &T::name, "env", &T::env, "on",
                                       &T::on, "stages", &T::stages);
};
} // namespace glz

namespace pipeforge {
namespace {

[[nodiscard]] auto to_env(detail::TomlEnv raw) -> EnvMap {
  EnvMap out;
  for (auto &[key, value] : raw) {
    out.emplace(key, std::move(value));
  }
  return out;
}

[[nodiscard]] auto parse_trigger(const detail::TriggerToml &raw,
                                 std::size_t index,
                                 std::vector<std::string> &errors)
    -> std::optional<TriggerClause> {
  auto event = util::try_parse_enum<EventKind>(raw.event);
  if (!event) {
    errors.push_back(std::format("trigger #{}: unknown event '{}'", index + 1,
                                 raw.event));
    return std::nullopt;
  }
  if (*event == EventKind::PullRequest && !raw.tags.empty()) {
    errors.push_back(std::format(
        "trigger #{}: pull_request triggers cannot filter on tags",
        index + 1));
    return std::nullopt;
  }
  if (*event == EventKind::TagPush && !raw.branches.empty()) {
    errors.push_back(std::format(
        "trigger #{}: tag_push triggers cannot filter on branches",
        index + 1));
    return std::nullopt;
  }
  return TriggerClause{
      .event = *event, .branches = raw.branches, .tags = raw.tags};
}

[[nodiscard]] auto parse_step(detail::StepToml raw) -> StepSpec {
  StepSpec step;
  step.executor = std::move(raw.executor);
  step.working_dir = std::move(raw.working_dir);
  step.env = to_env(std::move(raw.env));
  step.params = to_env(std::move(raw.with));
  if (!raw.run.empty()) {
    step.params.insert_or_assign("run", raw.run);
  }
  step.name = raw.name.empty() ? raw.run : std::move(raw.name);
  return step;
}

[[nodiscard]] auto parse_consumes(
    const std::variant<std::string, detail::ConsumesToml> &raw,
    std::string_view stage, std::vector<std::string> &errors)
    -> std::optional<ArtifactRef> {
  if (const auto *text = std::get_if<std::string>(&raw)) {
    const auto slash = text->find('/');
    if (slash == std::string::npos || slash == 0 ||
        slash + 1 == text->size()) {
      errors.push_back(std::format(
          "stage '{}': consumes entry '{}' must be 'stage/artifact'", stage,
          *text));
      return std::nullopt;
    }
    return ArtifactRef{.stage = text->substr(0, slash),
                       .name = text->substr(slash + 1),
                       .qualifier = std::nullopt};
  }
  const auto &table = std::get<detail::ConsumesToml>(raw);
  if (table.stage.empty() || table.name.empty()) {
    errors.push_back(std::format(
        "stage '{}': consumes entries need 'stage' and 'name'", stage));
    return std::nullopt;
  }
  ArtifactRef ref{.stage = table.stage, .name = table.name,
                  .qualifier = std::nullopt};
  if (!table.matrix.empty()) {
    ref.qualifier = table.matrix;
  }
  return ref;
}

[[nodiscard]] auto parse_stage(detail::StageToml raw, std::size_t index,
                               std::vector<std::string> &errors)
    -> StageSpec {
  StageSpec stage;
  stage.name = std::move(raw.name);
  const auto label = stage.name.empty()
                         ? std::format("stage #{}", index + 1)
                         : std::format("stage '{}'", stage.name);

  stage.needs = std::move(raw.needs);
  stage.condition = std::move(raw.condition);
  stage.fail_fast = raw.fail_fast;
  if (auto policy = util::try_parse_enum<RunPolicy>(raw.run_when)) {
    stage.run_policy = *policy;
  } else {
    errors.push_back(std::format("{}: unknown run_when '{}'", label,
                                 raw.run_when));
  }
  if (raw.timeout_sec < 0) {
    errors.push_back(std::format("{}: negative timeout_sec", label));
  } else if (raw.timeout_sec > 0) {
    stage.timeout = std::chrono::seconds{raw.timeout_sec};
  }

  stage.matrix.reserve(raw.matrix.size());
  for (auto &axis : raw.matrix) {
    stage.matrix.push_back(
        MatrixAxis{.name = std::move(axis.axis),
                   .values = std::move(axis.values)});
  }
  stage.env = to_env(std::move(raw.env));

  stage.steps.reserve(raw.steps.size());
  for (auto &step : raw.steps) {
    stage.steps.push_back(parse_step(std::move(step)));
  }
  for (auto &artifact : raw.produces) {
    stage.produces.push_back(ArtifactDecl{.name = std::move(artifact.name),
                                          .path = std::move(artifact.path)});
  }
  for (const auto &entry : raw.consumes) {
    if (auto ref = parse_consumes(entry, label, errors)) {
      stage.consumes.push_back(std::move(*ref));
    }
  }
  return stage;
}

[[nodiscard]] auto parse_pipeline(std::string_view text,
                                  std::string *diagnostic)
    -> Result<PipelineSpec> {
  auto raw_result =
      toml_util::parse_toml<detail::PipelineToml>(text, diagnostic);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  std::vector<std::string> errors;
  PipelineSpec spec;
  spec.name = std::move(raw.name);
  spec.env = to_env(std::move(raw.env));
  for (std::size_t i = 0; i < raw.on.size(); ++i) {
    if (auto clause = parse_trigger(raw.on[i], i, errors)) {
      spec.triggers.push_back(std::move(*clause));
    }
  }
  spec.stages.reserve(raw.stages.size());
  for (std::size_t i = 0; i < raw.stages.size(); ++i) {
    spec.stages.push_back(parse_stage(std::move(raw.stages[i]), i, errors));
  }

  if (!errors.empty()) {
    std::string joined;
    for (const auto &err : errors) {
      log::error("pipeline parse error: {}", err);
      if (!joined.empty()) {
        joined += "; ";
      }
      joined += err;
    }
    if (diagnostic) {
      *diagnostic = std::move(joined);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(spec));
}

} // namespace

auto PipelineLoader::load_from_file(std::string_view path,
                                    std::string *diagnostic)
    -> Result<PipelineSpec> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("cannot read pipeline file '{}'", path);
    }
    return fail(text.error());
  }
  auto spec = load_from_string(*text, diagnostic);
  if (spec && spec->name.empty()) {
    spec->name = std::filesystem::path(path).stem().string();
  }
  return spec;
}

auto PipelineLoader::load_from_string(std::string_view toml_str,
                                      std::string *diagnostic)
    -> Result<PipelineSpec> {
  try {
    return parse_pipeline(toml_str, diagnostic);
  } catch (const std::exception &e) {
    log::error("TOML parse error: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

} // namespace pipeforge
