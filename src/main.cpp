#include "pipeforge/cli/commands.hpp"
#include "pipeforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("PIPEFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_event_options(CLI::App *cmd, pipeforge::cli::EventOptions &event)
    -> void {
  cmd->add_option("-e,--event", event.event,
                  "Triggering event: push|pull_request|tag_push")
      ->default_val("push");
  cmd->add_option("-r,--ref", event.ref,
                  "Pushed ref or pull request source (refs/tags/v1.2.3, main)")
      ->required();
  cmd->add_option("-a,--actor", event.actor, "Who caused the event");
  cmd->add_option("-b,--base-ref", event.base_ref,
                  "Target branch of a pull request");
}
} // namespace

int main(int argc, char *argv[]) {
  // stdout carries reports; logs go to stderr.
  pipeforge::log::set_output_stderr();
  pipeforge::log::set_level(pipeforge::log::Level::Warn);

  CLI::App app{"PipeForge", "A CI/CD pipeline execution engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  pipeforge validate -p ci.toml\n"
             "  pipeforge plan -p ci.toml --event push --ref refs/tags/v1.2.3\n"
             "  pipeforge run -p ci.toml --event pull_request --ref feature "
             "--base-ref main\n"
             "\nTip: Set PIPEFORGE_CONFIG=engine.toml to skip -c on every "
             "run.");

  pipeforge::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Parse and validate a pipeline document");
  validate
      ->add_option("-p,--pipeline", validate_opts.pipeline_file,
                   "Pipeline document (TOML)")
      ->required()
      ->check(CLI::ExistingFile);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(pipeforge::cli::cmd_validate(validate_opts));
  });

  pipeforge::cli::PlanOptions plan_opts;
  auto *plan = app.add_subcommand(
      "plan", "Show what a run would do for an event, without running it");
  plan->add_option("-p,--pipeline", plan_opts.pipeline_file,
                   "Pipeline document (TOML)")
      ->required()
      ->check(CLI::ExistingFile);
  add_event_options(plan, plan_opts.event);
  plan->add_flag("--json", plan_opts.json, "Output JSON");
  plan->callback(
      [&plan_opts]() { std::exit(pipeforge::cli::cmd_plan(plan_opts)); });

  pipeforge::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Run a pipeline for one event");
  run->footer("\nExit status: 0 succeeded or not triggered, 1 failed or "
              "cancelled, 2 invalid pipeline or configuration.");
  run->add_option("-p,--pipeline", run_opts.pipeline_file,
                  "Pipeline document (TOML)")
      ->required()
      ->check(CLI::ExistingFile);
  add_event_options(run, run_opts.event);
  run_opts.config_file = default_config();
  run->add_option("-c,--config", run_opts.config_file, "Engine config file")
      ->check(CLI::ExistingFile);
  run->add_option("-j,--max-parallel", run_opts.max_parallel,
                  "Engine-wide limit on running jobs")
      ->check(CLI::PositiveNumber);
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
  run->add_option("--artifacts-out", run_opts.artifacts_out,
                  "Write retained artifacts below this directory");
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback([&run_opts]() { std::exit(pipeforge::cli::cmd_run(run_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
