#pragma once

#include "pipeforge/executor/executor.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pipeforge {

/// Routes each step to the executor registered under `StepSpec::executor`.
class CompositeStepExecutor : public IStepExecutor {
public:
  CompositeStepExecutor() = default;
  ~CompositeStepExecutor() override = default;

  CompositeStepExecutor(const CompositeStepExecutor &) = delete;
  auto operator=(const CompositeStepExecutor &)
      -> CompositeStepExecutor & = delete;
  CompositeStepExecutor(CompositeStepExecutor &&) = delete;
  auto operator=(CompositeStepExecutor &&) -> CompositeStepExecutor & = delete;

  auto register_executor(std::string id,
                         std::unique_ptr<IStepExecutor> executor) -> void;

  [[nodiscard]] auto start(StepRequest req, ExecutionSink sink)
      -> Result<void> override;
  [[nodiscard]] auto supports(std::string_view executor) const
      -> bool override;
  [[nodiscard]] auto validate(const StepSpec &step, std::string *diag) const
      -> Result<void> override;

  [[nodiscard]] auto registered() const -> std::vector<std::string>;

private:
  [[nodiscard]] auto find(std::string_view id) const -> IStepExecutor *;

  // Immutable after setup; no lock needed.
  std::map<std::string, std::unique_ptr<IStepExecutor>, std::less<>>
      executors_;
};

} // namespace pipeforge
