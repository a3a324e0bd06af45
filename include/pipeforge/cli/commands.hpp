#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace pipeforge::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitRunFailed = 1;
inline constexpr int kExitInvalid = 2;

struct EventOptions {
  std::string event{"push"};
  std::string ref;
  std::string actor;
  std::optional<std::string> base_ref;
};

struct ValidateOptions {
  std::string pipeline_file;
  bool json{false};
};

struct PlanOptions {
  std::string pipeline_file;
  EventOptions event;
  bool json{false};
};

struct RunOptions {
  std::string pipeline_file;
  EventOptions event;
  std::string config_file;
  std::optional<std::size_t> max_parallel;
  std::optional<std::string> log_level;
  std::optional<std::string> artifacts_out;
  bool json{false};
};

auto cmd_validate(const ValidateOptions &opts) -> int;
auto cmd_plan(const PlanOptions &opts) -> int;
auto cmd_run(const RunOptions &opts) -> int;

} // namespace pipeforge::cli
