#include "pipeforge/executor/composite_executor.hpp"

#include "pipeforge/util/log.hpp"

#include <format>

namespace pipeforge {

auto CompositeStepExecutor::register_executor(
    std::string id, std::unique_ptr<IStepExecutor> executor) -> void {
  executors_.insert_or_assign(std::move(id), std::move(executor));
}

auto CompositeStepExecutor::find(std::string_view id) const
    -> IStepExecutor * {
  auto it = executors_.find(id);
  return it == executors_.end() ? nullptr : it->second.get();
}

auto CompositeStepExecutor::start(StepRequest req, ExecutionSink sink)
    -> Result<void> {
  auto *target = find(req.step.executor);
  if (!target) {
    log::error("no executor registered for '{}' (job {})", req.step.executor,
               req.job);
    return fail(Error::UnknownExecutor);
  }
  return target->start(std::move(req), std::move(sink));
}

auto CompositeStepExecutor::supports(std::string_view executor) const -> bool {
  return find(executor) != nullptr;
}

auto CompositeStepExecutor::validate(const StepSpec &step,
                                     std::string *diag) const -> Result<void> {
  auto *target = find(step.executor);
  if (!target) {
    if (diag) {
      *diag = std::format("step '{}': unknown executor '{}'", step.name,
                          step.executor);
    }
    return fail(Error::UnknownExecutor);
  }
  return target->validate(step, diag);
}

auto CompositeStepExecutor::registered() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(executors_.size());
  for (const auto &[id, _] : executors_) {
    out.push_back(id);
  }
  return out;
}

auto create_default_executor(Runtime &rt) -> std::unique_ptr<IStepExecutor> {
  auto composite = std::make_unique<CompositeStepExecutor>();
  composite->register_executor(std::string(kShellExecutor),
                               create_shell_executor(rt));
  return composite;
}

} // namespace pipeforge
