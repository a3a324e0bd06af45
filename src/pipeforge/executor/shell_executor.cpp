#include "pipeforge/core/asio_awaitable.hpp"
#include "pipeforge/core/coroutine.hpp"
#include "pipeforge/core/runtime.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/executor/executor_utils.hpp"
#include "pipeforge/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pipeforge {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 10UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
inline constexpr std::string_view kRunParam = "run";

[[nodiscard]] auto build_process_env(const EnvMap &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);

  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    if (custom.contains(std::string_view(key_sv.data(), key_sv.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }

  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }

  return bp::process_environment(std::move(env_vec));
}

struct ActiveProcess {
  pid_t pid{-1};
  bool killed{false};
};

// Owned by one shard; only touched from that shard's thread.
struct ShellShardState {
  std::unordered_map<std::uint64_t, ActiveProcess> active_processes;
};

[[nodiscard]] auto read_pipe_all(boost::asio::readable_pipe &pipe,
                                 std::string &out,
                                 boost::asio::cancellation_signal &cancel_sig)
    -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (ec) {
      co_return;
    }
    if (bytes > 0 && out.size() < kMaxOutputSize) {
      const auto remaining = kMaxOutputSize - out.size();
      const auto to_append = std::min<std::size_t>(remaining, bytes);
      out.append(buffer.data(), to_append);
    }
  }
}

// Once a killed process is reaped, stop reading: orphaned grandchildren may
// keep the pipes open.
[[nodiscard]] auto wait_process(bp::process &proc, ShellShardState &state,
                                std::uint64_t request_id,
                                boost::asio::cancellation_signal &stdout_cancel,
                                boost::asio::cancellation_signal &stderr_cancel)
    -> task<int> {
  auto [ec, exit_code] = co_await proc.async_wait(use_nothrow);
  auto it = state.active_processes.find(request_id);
  if (it != state.active_processes.end() && it->second.killed) {
    stdout_cancel.emit(boost::asio::cancellation_type::total);
    stderr_cancel.emit(boost::asio::cancellation_type::total);
  }
  if (ec) {
    log::warn("waiting for pid {} failed: {}", proc.id(), ec.message());
    co_return kExitCodeNotStarted;
  }
  co_return exit_code;
}

} // namespace

class ShellExecutor final : public IStepExecutor {
public:
  explicit ShellExecutor(Runtime &rt)
      : runtime_{&rt}, shard_states_(rt.shard_count()) {}

  ShellExecutor(ShellExecutor &&) noexcept = delete;
  ShellExecutor &operator=(ShellExecutor &&) = delete;
  ShellExecutor(const ShellExecutor &) = delete;
  ShellExecutor &operator=(const ShellExecutor &) = delete;

  auto start(StepRequest req, ExecutionSink sink) -> Result<void> override {
    if (auto r = validate(req.step, nullptr); !r) {
      return r;
    }
    for (const auto &[key, _] : req.env) {
      if (!is_valid_env_key(key)) {
        log::error("invalid environment variable key '{}' for job {}", key,
                   req.job);
        return fail(Error::InvalidArgument);
      }
    }

    log::info("shell step start: job={} step='{}' cmd='{}'", req.job,
              req.step.name, cmd_preview(req.step.param(kRunParam)));

    const auto request_id =
        next_request_id_.fetch_add(1, std::memory_order_relaxed);
    const auto owner = owner_shard(request_id);
    runtime_->spawn_on(owner, execute_command(std::move(req), std::move(sink),
                                              request_id, owner));
    return ok();
  }

  auto supports(std::string_view executor) const -> bool override {
    return executor == kShellExecutor;
  }

  auto validate(const StepSpec &step, std::string *diag) const
      -> Result<void> override {
    if (step.param(kRunParam).empty()) {
      if (diag) {
        *diag = std::format("step '{}': shell executor needs a non-empty "
                            "'run' command",
                            step.name);
      }
      return fail(Error::InvalidArgument);
    }
    for (const auto &[key, _] : step.env) {
      if (!is_valid_env_key(key)) {
        if (diag) {
          *diag = std::format("step '{}': invalid environment key '{}'",
                              step.name, key);
        }
        return fail(Error::InvalidArgument);
      }
    }
    return ok();
  }

private:
  auto execute_command(StepRequest req, ExecutionSink sink,
                       std::uint64_t request_id, shard_id owner)
      -> spawn_task {
    auto &state = shard_states_[owner];
    auto executor = co_await boost::asio::this_coro::executor;
    StepResult result;

    if (req.stop.stop_requested()) {
      result.exit_code = kExitCodeNotStarted;
      result.cancelled = true;
      result.error = "cancelled before start";
      if (sink.on_complete) {
        sink.on_complete(req.job, std::move(result));
      }
      co_return;
    }

    boost::asio::readable_pipe stdout_pipe(executor);
    boost::asio::readable_pipe stderr_pipe(executor);
    result.stdout_output.reserve(kInitialOutputReserve);
    result.stderr_output.reserve(kInitialOutputReserve);

    std::optional<bp::process> proc;
    try {
      std::vector<std::string> args;
      args.emplace_back("-c");
      args.emplace_back(req.step.param(kRunParam));
      auto stdio = bp::process_stdio{
          .in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
      auto env = build_process_env(req.env);

      if (!req.working_dir.empty()) {
        proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                     bp::process_start_dir{req.working_dir}, std::move(env));
      } else {
        proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                     std::move(env));
      }
    } catch (const std::exception &ex) {
      log::error("failed to spawn shell for job {}: {}", req.job, ex.what());
      result.exit_code = kExitCodeNotStarted;
      result.error = std::format("failed to spawn process: {}", ex.what());
      if (sink.on_complete) {
        sink.on_complete(req.job, std::move(result));
      }
      co_return;
    }

    const auto pid = proc->id();
    state.active_processes[request_id] = ActiveProcess{.pid = pid};
    log::debug("shell process started pid={} job={}", pid, req.job);

    // Runs on whichever thread requests the stop; the kill itself happens
    // on the owning shard, where the pid is known to be unreaped.
    std::stop_callback on_stop(req.stop, [this, owner, request_id] {
      runtime_->post_to(owner, [this, owner, request_id] {
        kill_process(owner, request_id);
      });
    });

    boost::asio::cancellation_signal stdout_cancel;
    boost::asio::cancellation_signal stderr_cancel;
    using namespace awaitable_ops;
    result.exit_code = co_await (
        read_pipe_all(stdout_pipe, result.stdout_output, stdout_cancel) &&
        read_pipe_all(stderr_pipe, result.stderr_output, stderr_cancel) &&
        wait_process(*proc, state, request_id, stdout_cancel, stderr_cancel));

    const bool killed = state.active_processes[request_id].killed;
    state.active_processes.erase(request_id);
    // A step that finished before the stop landed keeps its own result.
    result.cancelled = killed && result.exit_code != 0;
    if (result.cancelled) {
      result.error = "cancelled";
    }

    log::info("shell step finish: job={} step='{}' exit_code={} cancelled={}",
              req.job, req.step.name, result.exit_code, result.cancelled);
    if (sink.on_complete) {
      sink.on_complete(req.job, std::move(result));
    }
  }

  auto kill_process(shard_id owner, std::uint64_t request_id) -> void {
    auto &active = shard_states_[owner].active_processes;
    auto it = active.find(request_id);
    if (it == active.end() || it->second.pid <= 0 || it->second.killed) {
      return;
    }
    it->second.killed = true;
    if (::kill(it->second.pid, SIGKILL) != 0) {
      log::warn("kill({}) failed", it->second.pid);
      return;
    }
    log::info("killed shell process pid={}", it->second.pid);
  }

  [[nodiscard]] auto owner_shard(std::uint64_t request_id) const noexcept
      -> shard_id {
    const auto shards = std::max(1U, runtime_->shard_count());
    return static_cast<shard_id>(request_id % shards);
  }

  Runtime *runtime_;
  std::vector<ShellShardState> shard_states_;
  std::atomic<std::uint64_t> next_request_id_{0};
};

auto create_shell_executor(Runtime &rt) -> std::unique_ptr<IStepExecutor> {
  return std::make_unique<ShellExecutor>(rt);
}

} // namespace pipeforge
