#include "pipeforge/app/run_controller.hpp"
#include "pipeforge/core/runtime.hpp"
#include "pipeforge/executor/composite_executor.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/executor/executor_utils.hpp"
#include "test_utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <future>
#include <stop_token>
#include <string>
#include <thread>

#include "gtest/gtest.h"

using namespace pipeforge;
using namespace std::chrono_literals;

namespace {

auto shell_step(std::string command) -> StepSpec {
  StepSpec step;
  step.name = "step";
  step.params.emplace("run", std::move(command));
  return step;
}

class ShellExecutorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(runtime_.start());
    executor_ = create_default_executor(runtime_);
  }

  void TearDown() override {
    executor_.reset();
    runtime_.stop();
  }

  auto submit(StepRequest req) -> std::future<StepResult> {
    return boost::asio::co_spawn(runtime_.executor_for(0),
                                 execute_async(*executor_, std::move(req)),
                                 boost::asio::use_future);
  }

  auto run(StepSpec step, EnvMap env = {}, std::string working_dir = {})
      -> StepResult {
    StepRequest req{.job = JobId{"job"},
                    .step = std::move(step),
                    .working_dir = std::move(working_dir),
                    .env = std::move(env),
                    .stop = {}};
    auto fut = submit(std::move(req));
    if (fut.wait_for(10s) != std::future_status::ready) {
      ADD_FAILURE() << "step did not finish";
      return {};
    }
    return fut.get();
  }

  Runtime runtime_{2};
  std::unique_ptr<IStepExecutor> executor_;
};

} // namespace

TEST_F(ShellExecutorTest, CapturesStdoutAndStderr) {
  auto result = run(shell_step("echo hello; echo oops >&2"));
  EXPECT_TRUE(result.succeeded());
  EXPECT_EQ(result.stdout_output, "hello\n");
  EXPECT_EQ(result.stderr_output, "oops\n");
}

TEST_F(ShellExecutorTest, ReportsExitCode) {
  auto result = run(shell_step("exit 7"));
  EXPECT_EQ(result.exit_code, 7);
  EXPECT_FALSE(result.succeeded());
  EXPECT_FALSE(result.cancelled);
}

TEST_F(ShellExecutorTest, PassesEnvironment) {
  auto result = run(shell_step("printf '%s' \"$PIPEFORGE_JOB\""),
                    {{"PIPEFORGE_JOB", "build[os=linux]"}});
  EXPECT_TRUE(result.succeeded());
  EXPECT_EQ(result.stdout_output, "build[os=linux]");
}

TEST_F(ShellExecutorTest, RunsInWorkingDirectory) {
  test::TempDir dir;
  auto result = run(shell_step("pwd -P"), {}, dir.path().string());
  EXPECT_TRUE(result.succeeded());
  const auto expected = std::filesystem::canonical(dir.path()).string() + "\n";
  EXPECT_EQ(result.stdout_output, expected);
}

TEST_F(ShellExecutorTest, StopRequestKillsTheProcess) {
  std::stop_source stop;
  StepRequest req{.job = JobId{"slow"},
                  .step = shell_step("exec sleep 30"),
                  .working_dir = {},
                  .env = {},
                  .stop = stop.get_token()};
  const auto begin = std::chrono::steady_clock::now();
  auto fut = submit(std::move(req));
  std::this_thread::sleep_for(200ms);
  stop.request_stop();
  ASSERT_EQ(fut.wait_for(10s), std::future_status::ready);
  auto result = fut.get();
  EXPECT_TRUE(result.cancelled);
  EXPECT_FALSE(result.succeeded());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
}

TEST_F(ShellExecutorTest, AlreadyStoppedStepDoesNotStart) {
  std::stop_source stop;
  stop.request_stop();
  StepRequest req{.job = JobId{"never"},
                  .step = shell_step("echo ran"),
                  .working_dir = {},
                  .env = {},
                  .stop = stop.get_token()};
  auto fut = submit(std::move(req));
  ASSERT_EQ(fut.wait_for(10s), std::future_status::ready);
  auto result = fut.get();
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.exit_code, kExitCodeNotStarted);
  EXPECT_TRUE(result.stdout_output.empty());
}

TEST_F(ShellExecutorTest, UnknownExecutorFailsToStart) {
  auto step = shell_step("echo hi");
  step.executor = "docker";
  std::string diag;
  auto check = executor_->validate(step, &diag);
  ASSERT_FALSE(check);
  EXPECT_EQ(check.error(), make_error_code(Error::UnknownExecutor));
  EXPECT_FALSE(executor_->supports("docker"));

  auto result = run(step);
  EXPECT_EQ(result.exit_code, kExitCodeNotStarted);
  EXPECT_FALSE(result.error.empty());
}

TEST_F(ShellExecutorTest, EmptyCommandIsInvalid) {
  std::string diag;
  auto check = executor_->validate(shell_step(""), &diag);
  ASSERT_FALSE(check);
  EXPECT_EQ(check.error(), make_error_code(Error::InvalidArgument));
  EXPECT_NE(diag.find("non-empty"), std::string::npos);
}

TEST_F(ShellExecutorTest, InvalidEnvironmentKeyIsRejected) {
  auto step = shell_step("true");
  step.env.emplace("BAD KEY", "x");
  EXPECT_EQ(executor_->validate(step, nullptr).error(),
            make_error_code(Error::InvalidArgument));
}

TEST(ExecutorUtilsTest, EnvironmentKeys) {
  EXPECT_TRUE(is_valid_env_key("PIPEFORGE_RUN_ID"));
  EXPECT_TRUE(is_valid_env_key("_x1"));
  EXPECT_FALSE(is_valid_env_key(""));
  EXPECT_FALSE(is_valid_env_key("1ABC"));
  EXPECT_FALSE(is_valid_env_key("A-B"));
  EXPECT_EQ(to_env_suffix("node-version"), "NODE_VERSION");
}

TEST(CompositeExecutorTest, RoutesByExecutorName) {
  CompositeStepExecutor composite;
  composite.register_executor("shell",
                              std::make_unique<test::ScriptedExecutor>());
  EXPECT_TRUE(composite.supports("shell"));
  EXPECT_FALSE(composite.supports("docker"));
  EXPECT_EQ(composite.registered(), (std::vector<std::string>{"shell"}));

  auto step = shell_step("ok");
  step.executor = "docker";
  StepRequest req{.job = JobId{"j"},
                  .step = step,
                  .working_dir = {},
                  .env = {},
                  .stop = {}};
  auto started = composite.start(std::move(req), ExecutionSink{});
  ASSERT_FALSE(started);
  EXPECT_EQ(started.error(), make_error_code(Error::UnknownExecutor));
}

// End to end through a real shell: a producer writes a file that the
// consumer reads back from its artifacts directory.
TEST(ShellPipelineTest, ArtifactsFlowBetweenShellJobs) {
  Runtime runtime(2);
  ASSERT_TRUE(runtime.start());
  auto executor = create_default_executor(runtime);
  InMemoryArtifactStore store;
  test::TempDir workspace;
  SchedulerOptions options;
  options.workspace_root = workspace.path();
  options.keep_workspace = true;
  RunController controller(runtime, *executor, store, options);

  auto spec = test::pipeline(
      "shell",
      {StageBuilder("build")
           .axis("os", {"linux", "macos"})
           .shell("compile",
                  "mkdir -p out && printf 'bin-%s' \"$PIPEFORGE_MATRIX_OS\" "
                  "> out/app")
           .produces("binary", "out/app")
           .build(),
       StageBuilder("package")
           .needs("build")
           .consumes("build", "binary", "os=macos")
           .shell("read",
                  "cat \"$PIPEFORGE_ARTIFACTS_DIR/build/os=macos/binary\"")
           .build()});

  std::string diag;
  auto result =
      controller.run(spec, test::branch_push("main"), &diag);
  runtime.stop();
  ASSERT_TRUE(result) << diag;
  EXPECT_EQ(result->status, RunStatus::Succeeded);
  const auto *package = result->find_job("package");
  ASSERT_NE(package, nullptr);
  ASSERT_EQ(package->steps.size(), 1U);
  EXPECT_EQ(package->steps[0].stdout_output, "bin-macos");
}
