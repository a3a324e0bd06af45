#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/pipeline/run_context.hpp"
#include "pipeforge/pipeline/stage_spec.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace pipeforge::test {

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

[[nodiscard]] inline auto
make_temp_dir(std::string_view prefix = "pipeforge_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  char *path = ::mkdtemp(templ.data());
  return path ? std::string(path) : "";
}

// Removes the directory tree when the test ends.
class TempDir {
public:
  explicit TempDir(std::string_view prefix = "pipeforge_test_")
      : path_(make_temp_dir(prefix)) {
    if (path_.empty()) {
      throw std::runtime_error("mkdtemp failed");
    }
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path & {
    return path_;
  }

private:
  std::filesystem::path path_;
};

[[nodiscard]] inline auto write_text_file(const std::filesystem::path &path,
                                          std::string_view content) -> bool {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  return static_cast<bool>(out);
}

[[nodiscard]] inline auto read_text_file(const std::filesystem::path &path)
    -> std::optional<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

[[nodiscard]] inline auto context(std::string_view event, std::string_view ref,
                                  std::optional<std::string> base_ref =
                                      std::nullopt) -> RunContext {
  auto ctx = RunContext::from_event(event, ref, "tester", std::move(base_ref));
  if (!ctx) {
    throw std::runtime_error("invalid test context");
  }
  return std::move(*ctx);
}

[[nodiscard]] inline auto tag_push(std::string_view tag) -> RunContext {
  return context("push", std::string("refs/tags/") + std::string(tag));
}

[[nodiscard]] inline auto branch_push(std::string_view branch) -> RunContext {
  return context("push", std::string("refs/heads/") + std::string(branch));
}

[[nodiscard]] inline auto pull_request(std::string_view source,
                                       std::string base) -> RunContext {
  return context("pull_request", source, std::move(base));
}

[[nodiscard]] inline auto push_trigger() -> TriggerClause {
  return TriggerClause{.event = EventKind::Push, .branches = {}, .tags = {}};
}

[[nodiscard]] inline auto pipeline(std::string name,
                                   std::vector<StageSpec> stages)
    -> PipelineSpec {
  PipelineSpec spec;
  spec.name = std::move(name);
  spec.triggers.push_back(push_trigger());
  spec.stages = std::move(stages);
  return spec;
}

/// Step executor driven by the step's `run` text instead of a shell.
/// Commands are separated by ';' and run in order:
///
///   ok                      succeed
///   fail                    exit with code 1
///   sleep:<ms>              wait, or end as cancelled once stop is requested
///   produce:<path>:<text>   write <text> to <path> below the working dir
///   expect:<path>           fail unless <path> exists below
///                           $PIPEFORGE_ARTIFACTS_DIR
///   echo:<text>             append <text> to stdout
///
/// Every step runs on its own thread and completes through the sink, the
/// way a real executor completes from its own shard.
class ScriptedExecutor final : public IStepExecutor {
public:
  struct Call {
    JobId job;
    std::string step;
    EnvMap env;
    std::string working_dir;
  };

  ~ScriptedExecutor() override {
    std::vector<std::jthread> threads;
    {
      std::scoped_lock lock(mu_);
      threads = std::move(threads_);
    }
    // jthread joins on destruction.
  }

  auto start(StepRequest req, ExecutionSink sink) -> Result<void> override {
    if (auto r = validate(req.step, nullptr); !r) {
      return r;
    }
    {
      std::scoped_lock lock(mu_);
      calls_.push_back(Call{.job = req.job,
                            .step = req.step.name,
                            .env = req.env,
                            .working_dir = req.working_dir});
    }
    const auto now = running_.fetch_add(1) + 1;
    auto seen = max_running_.load();
    while (now > seen && !max_running_.compare_exchange_weak(seen, now)) {
    }
    started_.fetch_add(1);

    std::scoped_lock lock(mu_);
    threads_.emplace_back([this, req = std::move(req),
                           sink = std::move(sink)]() mutable {
      auto result = interpret(req);
      running_.fetch_sub(1);
      if (sink.on_complete) {
        sink.on_complete(req.job, std::move(result));
      }
    });
    return ok();
  }

  [[nodiscard]] auto supports(std::string_view executor) const
      -> bool override {
    return executor == kShellExecutor;
  }

  [[nodiscard]] auto validate(const StepSpec &step, std::string *diag) const
      -> Result<void> override {
    if (!supports(step.executor)) {
      if (diag) {
        *diag = "unknown executor '" + step.executor + "'";
      }
      return fail(Error::UnknownExecutor);
    }
    if (step.param("run").empty()) {
      if (diag) {
        *diag = "step '" + step.name + "' has no run command";
      }
      return fail(Error::InvalidArgument);
    }
    return ok();
  }

  [[nodiscard]] auto calls() const -> std::vector<Call> {
    std::scoped_lock lock(mu_);
    return calls_;
  }

  [[nodiscard]] auto calls_for(std::string_view job) const
      -> std::vector<Call> {
    std::vector<Call> out;
    for (auto &call : calls()) {
      if (call.job == job) {
        out.push_back(std::move(call));
      }
    }
    return out;
  }

  [[nodiscard]] auto started() const noexcept -> int { return started_.load(); }
  [[nodiscard]] auto running() const noexcept -> int { return running_.load(); }
  [[nodiscard]] auto max_running() const noexcept -> int {
    return max_running_.load();
  }

private:
  static auto interpret(const StepRequest &req) -> StepResult {
    StepResult result;
    std::vector<std::string> commands;
    const std::string script(req.step.param("run"));
    boost::algorithm::split(commands, script, boost::algorithm::is_any_of(";"));

    for (const auto &command : commands) {
      if (command.empty() || command == "ok") {
        continue;
      }
      if (command == "fail") {
        result.exit_code = 1;
        result.stderr_output += "scripted failure\n";
        return result;
      }
      if (command.starts_with("sleep:")) {
        const auto ms = std::stoi(command.substr(6));
        const auto deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (std::chrono::steady_clock::now() < deadline) {
          if (req.stop.stop_requested()) {
            result.exit_code = 137;
            result.cancelled = true;
            result.error = "cancelled";
            return result;
          }
          std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        continue;
      }
      if (command.starts_with("produce:")) {
        const auto rest = command.substr(8);
        const auto colon = rest.find(':');
        const auto rel = rest.substr(0, colon);
        const auto text =
            colon == std::string::npos ? std::string{} : rest.substr(colon + 1);
        if (!write_text_file(std::filesystem::path(req.working_dir) / rel,
                             text)) {
          result.exit_code = 2;
          result.error = "cannot write " + rel;
          return result;
        }
        continue;
      }
      if (command.starts_with("expect:")) {
        auto it = req.env.find("PIPEFORGE_ARTIFACTS_DIR");
        const auto path =
            std::filesystem::path(it == req.env.end() ? "" : it->second) /
            command.substr(7);
        if (!std::filesystem::exists(path)) {
          result.exit_code = 3;
          result.stderr_output += "missing " + path.string() + "\n";
          return result;
        }
        continue;
      }
      if (command.starts_with("echo:")) {
        result.stdout_output += command.substr(5) + "\n";
        continue;
      }
      result.exit_code = 127;
      result.stderr_output += "unknown command: " + command + "\n";
      return result;
    }
    return result;
  }

  mutable std::mutex mu_;
  std::vector<Call> calls_;
  std::vector<std::jthread> threads_;
  std::atomic<int> running_{0};
  std::atomic<int> max_running_{0};
  std::atomic<int> started_{0};
};

} // namespace pipeforge::test
