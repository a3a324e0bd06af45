#include "pipeforge/config/engine_config.hpp"
#include "pipeforge/config/toml_util.hpp"

#include "pipeforge/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <chrono>
#include <cstdlib>
#include <format>
#include <string>
#include <string_view>

namespace pipeforge {
namespace detail {

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct SchedulerToml {
  int workers{0};
  int max_parallel_jobs{0};
  int job_timeout_sec{0};
};

struct ArtifactsToml {
  bool retain{false};
};

struct WorkspaceToml {
  std::string root;
  bool keep{false};
};

struct EngineToml {
  LoggingToml logging{};
  SchedulerToml scheduler{};
  ArtifactsToml artifacts{};
  WorkspaceToml workspace{};
};

} // namespace detail
} // namespace pipeforge

namespace glz {
template <> struct meta<pipeforge::detail::LoggingToml> {
  using T = pipeforge::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<pipeforge::detail::SchedulerToml> {
  using T = pipeforge::detail::SchedulerToml;
  static constexpr auto value =
      object("workers", &T::workers, "max_parallel_jobs",
             &T::max_parallel_jobs, "job_timeout_sec", &T::job_timeout_sec);
};

template <> struct meta<pipeforge::detail::ArtifactsToml> {
  using T = pipeforge::detail::ArtifactsToml;
  static constexpr auto value = object("retain", &T::retain);
};

template <> struct meta<pipeforge::detail::WorkspaceToml> {
  using T = pipeforge::detail::WorkspaceToml;
  static constexpr auto value = object("root", &T::root, "keep", &T::keep);
};

template <> struct meta<pipeforge::detail::EngineToml> {
  using T = pipeforge::detail::EngineToml;
  static constexpr auto value =
      object("logging", &T::logging, "scheduler", &T::scheduler, "artifacts",
             &T::artifacts, "workspace", &T::workspace);
};
} // namespace glz

namespace pipeforge {
namespace {

[[nodiscard]] auto env_flag(std::string_view v) -> bool {
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

// Throws boost::bad_lexical_cast on malformed numbers.
auto apply_env_overrides(EngineConfig &cfg) -> void {
  if (const char *v = std::getenv("PIPEFORGE_LOG_LEVEL"); v != nullptr) {
    cfg.logging.level = v;
  }
  if (const char *v = std::getenv("PIPEFORGE_LOG_FILE"); v != nullptr) {
    cfg.logging.file = v;
  }
  if (const char *v = std::getenv("PIPEFORGE_WORKERS"); v != nullptr) {
    cfg.scheduler.workers = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PIPEFORGE_MAX_PARALLEL_JOBS");
      v != nullptr) {
    cfg.scheduler.max_parallel_jobs = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PIPEFORGE_JOB_TIMEOUT_SEC"); v != nullptr) {
    cfg.scheduler.job_timeout_sec = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PIPEFORGE_RETAIN_ARTIFACTS");
      v != nullptr) {
    cfg.artifacts.retain = env_flag(v);
  }
  if (const char *v = std::getenv("PIPEFORGE_WORKSPACE_ROOT"); v != nullptr) {
    cfg.workspace.root = v;
  }
  if (const char *v = std::getenv("PIPEFORGE_KEEP_WORKSPACE"); v != nullptr) {
    cfg.workspace.keep = env_flag(v);
  }
}

[[nodiscard]] auto check_config(const EngineConfig &cfg,
                                std::string *diagnostic) -> Result<void> {
  std::string problem;
  if (cfg.scheduler.workers < 0) {
    problem = "scheduler.workers must not be negative";
  } else if (cfg.scheduler.max_parallel_jobs < 0) {
    problem = "scheduler.max_parallel_jobs must not be negative";
  } else if (cfg.scheduler.job_timeout_sec < 0) {
    problem = "scheduler.job_timeout_sec must not be negative";
  } else if (!log::parse_level(cfg.logging.level)) {
    problem = std::format("unknown log level '{}'", cfg.logging.level);
  }
  if (problem.empty()) {
    return ok();
  }
  log::error("invalid engine configuration: {}", problem);
  if (diagnostic) {
    *diagnostic = std::move(problem);
  }
  return fail(Error::ParseError);
}

[[nodiscard]] auto finish(EngineConfig cfg, std::string *diagnostic)
    -> Result<EngineConfig> {
  try {
    apply_env_overrides(cfg);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("invalid PIPEFORGE_* environment override: {}", e.what());
    if (diagnostic) {
      *diagnostic =
          std::format("invalid numeric environment override: {}", e.what());
    }
    return fail(Error::ParseError);
  }
  if (auto r = check_config(cfg, diagnostic); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string *diagnostic)
    -> Result<EngineConfig> {
  auto raw_result =
      toml_util::parse_toml<detail::EngineToml>(toml_text, diagnostic);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  EngineConfig cfg{};
  cfg.logging.level = std::move(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);
  cfg.scheduler.workers = raw.scheduler.workers;
  cfg.scheduler.max_parallel_jobs = raw.scheduler.max_parallel_jobs;
  cfg.scheduler.job_timeout_sec = raw.scheduler.job_timeout_sec;
  cfg.artifacts.retain = raw.artifacts.retain;
  cfg.workspace.root = std::move(raw.workspace.root);
  cfg.workspace.keep = raw.workspace.keep;
  return finish(std::move(cfg), diagnostic);
}

} // namespace

auto EngineConfig::scheduler_options() const -> SchedulerOptions {
  SchedulerOptions options;
  options.max_parallel_jobs =
      static_cast<std::size_t>(std::max(0, scheduler.max_parallel_jobs));
  if (scheduler.job_timeout_sec > 0) {
    options.default_timeout = std::chrono::seconds{scheduler.job_timeout_sec};
  }
  options.workspace_root = workspace.root;
  options.keep_workspace = workspace.keep;
  options.retain_artifacts = artifacts.retain;
  return options;
}

auto ConfigLoader::load_from_file(std::string_view path,
                                  std::string *diagnostic)
    -> Result<EngineConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("cannot read config file '{}'", path);
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    std::string *diagnostic)
    -> Result<EngineConfig> {
  return convert_toml(toml_str, diagnostic);
}

auto ConfigLoader::from_environment(std::string *diagnostic)
    -> Result<EngineConfig> {
  return finish(EngineConfig{}, diagnostic);
}

} // namespace pipeforge
