#include "pipeforge/cli/commands.hpp"
#include "test_utils.hpp"

#include <format>
#include <string>

#include "gtest/gtest.h"

using namespace pipeforge;

namespace {

constexpr std::string_view kBuildPipeline = R"(
name = "cli"

[[on]]
event = "push"
branches = ["main"]

[[stages]]
name = "build"
matrix = [ { axis = "os", values = ["linux", "macos"] } ]
steps = [ { name = "compile", run = "mkdir -p out && printf '%s' \"$PIPEFORGE_MATRIX_OS\" > out/app" } ]
produces = [ { name = "app", path = "out/app" } ]
)";

class CliTest : public ::testing::Test {
protected:
  auto write_pipeline(std::string_view text) -> std::string {
    const auto path = dir_.path() / "pipeline.toml";
    EXPECT_TRUE(test::write_text_file(path, text));
    return path.string();
  }

  auto run_options(std::string file, std::string ref) -> cli::RunOptions {
    const auto config = dir_.path() / "engine.toml";
    EXPECT_TRUE(test::write_text_file(
        config, std::format("[logging]\nlevel = \"error\"\n\n[workspace]\n"
                            "root = \"{}\"\n",
                            (dir_.path() / "work").string())));
    cli::RunOptions opts;
    opts.pipeline_file = std::move(file);
    opts.event.ref = std::move(ref);
    opts.config_file = config.string();
    opts.log_level = "error";
    return opts;
  }

  test::TempDir dir_;
};

} // namespace

TEST_F(CliTest, ValidateAcceptsWellFormedPipeline) {
  cli::ValidateOptions opts;
  opts.pipeline_file = write_pipeline(kBuildPipeline);
  EXPECT_EQ(cli::cmd_validate(opts), cli::kExitOk);
  opts.json = true;
  EXPECT_EQ(cli::cmd_validate(opts), cli::kExitOk);
}

TEST_F(CliTest, ValidateRejectsBrokenPipeline) {
  cli::ValidateOptions opts;
  opts.pipeline_file = write_pipeline(R"(
[[stages]]
name = "deploy"
needs = ["build"]
steps = [ { run = "true" } ]
)");
  EXPECT_EQ(cli::cmd_validate(opts), cli::kExitInvalid);

  opts.pipeline_file = (dir_.path() / "missing.toml").string();
  EXPECT_EQ(cli::cmd_validate(opts), cli::kExitInvalid);
}

TEST_F(CliTest, PlanNeedsAValidEvent) {
  cli::PlanOptions opts;
  opts.pipeline_file = write_pipeline(kBuildPipeline);
  opts.event.ref = "refs/heads/main";
  EXPECT_EQ(cli::cmd_plan(opts), cli::kExitOk);

  opts.event.event = "merge";
  EXPECT_EQ(cli::cmd_plan(opts), cli::kExitInvalid);
}

TEST_F(CliTest, RunWritesRetainedArtifacts) {
  auto opts = run_options(write_pipeline(kBuildPipeline), "refs/heads/main");
  const auto out = dir_.path() / "artifacts";
  opts.artifacts_out = out.string();
  ASSERT_EQ(cli::cmd_run(opts), cli::kExitOk);
  EXPECT_EQ(test::read_text_file(out / "build" / "os=linux" / "app"), "linux");
  EXPECT_EQ(test::read_text_file(out / "build" / "os=macos" / "app"), "macos");
}

TEST_F(CliTest, FailedRunExitsWithRunFailure) {
  auto opts = run_options(write_pipeline(R"(
[[on]]
event = "push"

[[stages]]
name = "test"
steps = [ { run = "exit 4" } ]
)"),
                          "refs/heads/dev");
  opts.json = true;
  EXPECT_EQ(cli::cmd_run(opts), cli::kExitRunFailed);
}

TEST_F(CliTest, UntriggeredRunSucceeds) {
  auto opts = run_options(write_pipeline(kBuildPipeline), "refs/heads/dev");
  EXPECT_EQ(cli::cmd_run(opts), cli::kExitOk);
}
