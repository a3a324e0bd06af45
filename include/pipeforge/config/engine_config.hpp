#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/scheduler/job_scheduler.hpp"

#include <string>
#include <string_view>

namespace pipeforge {

struct LoggingConfig {
  std::string level{"info"};
  std::string file; // empty = stderr

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct SchedulerConfig {
  int workers{0};           // io threads, 0 = hardware concurrency
  int max_parallel_jobs{0}; // 0 = hardware concurrency
  int job_timeout_sec{0};   // 0 = none

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct ArtifactsConfig {
  bool retain{false};

  auto operator==(const ArtifactsConfig &) const -> bool = default;
};

struct WorkspaceConfig {
  std::string root; // empty = <tmp>/pipeforge
  bool keep{false};

  auto operator==(const WorkspaceConfig &) const -> bool = default;
};

struct EngineConfig {
  LoggingConfig logging;
  SchedulerConfig scheduler;
  ArtifactsConfig artifacts;
  WorkspaceConfig workspace;

  [[nodiscard]] auto scheduler_options() const -> SchedulerOptions;

  auto operator==(const EngineConfig &) const -> bool = default;
};

class ConfigLoader {
public:
  /// Reads the file, applies PIPEFORGE_* environment overrides, validates.
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
  /// Defaults plus environment overrides, for runs without a config file.
  [[nodiscard]] static auto from_environment(std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
};

} // namespace pipeforge
