#include "pipeforge/app/run_controller.hpp"
#include "pipeforge/artifact/artifact_store.hpp"
#include "pipeforge/cli/commands.hpp"
#include "pipeforge/cli/formatting.hpp"
#include "pipeforge/cli/support.hpp"
#include "pipeforge/config/engine_config.hpp"
#include "pipeforge/core/runtime.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/report/run_result.hpp"
#include "pipeforge/util/log.hpp"

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <string>

namespace pipeforge::cli {

namespace {

auto load_config_or_print(const RunOptions &opts) -> Result<EngineConfig> {
  std::string diagnostic;
  auto config = opts.config_file.empty()
                    ? ConfigLoader::from_environment(&diagnostic)
                    : ConfigLoader::load_from_file(opts.config_file,
                                                   &diagnostic);
  if (!config) {
    std::println(stderr, "Error: invalid engine configuration: {}",
                 diagnostic.empty() ? config.error().message() : diagnostic);
  }
  return config;
}

auto setup_logging(const EngineConfig &config,
                   const std::optional<std::string> &level_override) -> bool {
  if (!config.logging.file.empty() &&
      !log::set_output_file(config.logging.file)) {
    std::println(stderr, "Error: failed to open log file: {}",
                 config.logging.file);
    return false;
  }
  log::set_level(level_override.value_or(config.logging.level));
  return true;
}

auto write_artifacts(const RunResult &result,
                     const std::filesystem::path &out_dir) -> Result<void> {
  for (const auto &artifact : result.outputs) {
    const auto &key = artifact->key;
    const auto dir = out_dir / key.stage /
                     (key.qualifier.empty() ? std::string("_") : key.qualifier);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      log::error("cannot create {}: {}", dir.string(), ec.message());
      return fail(Error::FileOpenFailed);
    }
    std::ofstream out(dir / key.name, std::ios::binary);
    out.write(artifact->data.data(),
              static_cast<std::streamsize>(artifact->data.size()));
    if (!out) {
      log::error("cannot write artifact {} to {}", key, dir.string());
      return fail(Error::FileOpenFailed);
    }
  }
  return ok();
}

auto print_result(const RunResult &result) -> void {
  std::println("Run {} of pipeline {}: {}", result.run_id,
               fmt::ansi::bold(result.pipeline),
               fmt::colorize_state(to_string_view(result.status)));
  if (!result.triggered) {
    std::println("no trigger clause matches {} of {}",
                 to_string_view(result.context.event),
                 result.context.full_ref());
    return;
  }

  std::println("");
  fmt::Table stages({{"STAGE", 16}, {"STATUS", 10}, {"DETAIL", 40}});
  stages.print_header();
  for (const auto &stage : result.stages) {
    std::string detail;
    if (stage.cause != FailureCause::None) {
      detail = to_string_view(stage.cause);
    } else if (stage.skip_reason != SkipReason::None) {
      detail = to_string_view(stage.skip_reason);
    }
    if (stage.fail_fast_triggered) {
      detail += detail.empty() ? "fail_fast" : " (fail_fast)";
    }
    stages.print_row({stage.name,
                      fmt::colorize_state(to_string_view(stage.status)),
                      detail.empty() ? "-" : detail});
  }

  std::println("");
  fmt::Table jobs({{"JOB", 32}, {"STATUS", 10}, {"TIME", 8, true},
                   {"MESSAGE", 40}});
  jobs.print_header();
  for (const auto &job : result.jobs) {
    jobs.print_row({job.id.str(),
                    fmt::colorize_state(to_string_view(job.status)),
                    fmt::format_duration(job.started_at, job.finished_at),
                    job.message.empty() ? "-" : job.message});
  }

  if (!result.artifacts.empty()) {
    std::println("");
    fmt::Table artifacts({{"ARTIFACT", 40}, {"JOB", 28}, {"SIZE", 10, true}});
    artifacts.print_header();
    for (const auto &entry : result.artifacts) {
      artifacts.print_row(
          {std::format("{}", entry.key), entry.producer.str(),
           entry.retained ? std::to_string(entry.size)
                          : fmt::ansi::dim("disposed")});
    }
  }
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto config = load_config_or_print(opts);
  if (!config) {
    return kExitInvalid;
  }
  if (!setup_logging(*config, opts.log_level)) {
    return kExitInvalid;
  }
  auto spec = load_pipeline_or_print(opts.pipeline_file);
  if (!spec) {
    return kExitInvalid;
  }
  auto ctx = make_context_or_print(opts.event);
  if (!ctx) {
    return kExitInvalid;
  }

  auto options = config->scheduler_options();
  if (opts.max_parallel) {
    options.max_parallel_jobs = *opts.max_parallel;
  }

  log::start();
  Runtime runtime(static_cast<unsigned>(config->scheduler.workers));
  if (auto r = runtime.start(); !r) {
    std::println(stderr, "Error: cannot start runtime: {}",
                 r.error().message());
    log::stop();
    return kExitRunFailed;
  }
  auto executor = create_default_executor(runtime);
  InMemoryArtifactStore store;
  RunController controller(runtime, *executor, store, std::move(options));

  boost::asio::signal_set signals(runtime.executor_for(0), SIGINT, SIGTERM);
  signals.async_wait(
      [&controller](const boost::system::error_code &ec, int signo) {
        if (ec) {
          return;
        }
        log::warn("received signal {}, cancelling the run", signo);
        controller.cancel();
      });

  std::string diagnostic;
  auto result = controller.run(*spec, *ctx, &diagnostic);
  runtime.post_to(0, [&signals] { signals.cancel(); });

  int exit_code = kExitOk;
  if (!result) {
    print_invalid(opts.pipeline_file, diagnostic, result.error(), opts.json);
    exit_code = kExitInvalid;
  } else {
    if (opts.artifacts_out) {
      if (auto r = write_artifacts(*result, *opts.artifacts_out); !r) {
        std::println(stderr, "Error: cannot write artifacts to {}: {}",
                     *opts.artifacts_out, r.error().message());
        exit_code = kExitRunFailed;
      }
    }
    if (opts.json) {
      std::println("{}", render_json(*result));
    } else {
      print_result(*result);
    }
    if (result->status == RunStatus::Failed ||
        result->status == RunStatus::Cancelled) {
      exit_code = kExitRunFailed;
    }
  }

  runtime.stop();
  log::stop();
  return exit_code;
}

} // namespace pipeforge::cli
