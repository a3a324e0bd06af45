#pragma once

#include "pipeforge/core/coroutine.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/pipeline/stage_spec.hpp"
#include "pipeforge/util/id.hpp"

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/dispatch.hpp>

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace pipeforge {

/// Exit code reported for a step that could not be run at all.
inline constexpr int kExitCodeNotStarted = -1;

struct StepRequest {
  JobId job;
  StepSpec step;
  std::string working_dir;
  /// Complete step environment on top of the engine's own environment.
  EnvMap env;
  /// Cooperative cancellation; executors must stop the step promptly once
  /// stop is requested.
  std::stop_token stop;
};

struct StepResult {
  int exit_code{0};
  std::string stdout_output;
  std::string stderr_output;
  std::string error;
  bool cancelled{false};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0 && error.empty() && !cancelled;
  }
};

struct ExecutionSink {
  std::move_only_function<void(const JobId &job, StepResult result)>
      on_complete;
};

class Runtime;

class IStepExecutor {
public:
  virtual ~IStepExecutor() = default;

  /// Launch the step; on success `sink.on_complete` fires exactly once.
  [[nodiscard]] virtual auto start(StepRequest req, ExecutionSink sink)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto supports(std::string_view executor) const
      -> bool = 0;

  /// Static checks of the executor specific step parameters. Problems are
  /// appended to `diag` when given.
  [[nodiscard]] virtual auto validate(const StepSpec &step,
                                      std::string *diag) const
      -> Result<void> = 0;
};

[[nodiscard]] auto create_shell_executor(Runtime &rt)
    -> std::unique_ptr<IStepExecutor>;

/// Composite executor with every built-in executor registered.
[[nodiscard]] auto create_default_executor(Runtime &rt)
    -> std::unique_ptr<IStepExecutor>;

inline auto execute_async(IStepExecutor &executor, StepRequest req)
    -> task<StepResult> {
  auto result =
      co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>,
                                           void(StepResult)>(
          [&executor, req = std::move(req)](auto handler) mutable {
            ExecutionSink sink;
            // Shared so a failed start() can still complete the handler.
            auto shared_h =
                std::make_shared<decltype(handler)>(std::move(handler));
            // Executors complete on their own shard; resume the awaiting
            // coroutine on its executor.
            sink.on_complete = [shared_h](const JobId &,
                                          StepResult res) mutable {
              auto ex = boost::asio::get_associated_executor(*shared_h);
              boost::asio::dispatch(
                  ex, [shared_h, res = std::move(res)]() mutable {
                    std::move (*shared_h)(std::move(res));
                  });
            };

            auto start_res = executor.start(std::move(req), std::move(sink));
            if (!start_res) {
              StepResult err_result;
              err_result.exit_code = kExitCodeNotStarted;
              err_result.error = start_res.error().message();
              std::move (*shared_h)(std::move(err_result));
            }
          },
          boost::asio::use_awaitable);

  co_return result;
}

} // namespace pipeforge
