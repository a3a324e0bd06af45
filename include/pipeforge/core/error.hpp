#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace pipeforge {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  InvalidState,
  CycleDetected,
  DanglingReference,
  EmptyMatrixAxis,
  UnknownVariable,
  InvalidCondition,
  UnknownExecutor,
  InvalidArtifactRef,
  ConditionEvaluationFailed,
  TypeMismatch,
  MissingArtifact,
  StepFailed,
  ProcessSpawnFailed,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 23> messages = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "invalid state transition",
      "cycle detected in stage dependencies",
      "dangling stage reference",
      "empty matrix axis",
      "unknown variable",
      "invalid condition expression",
      "unknown step executor",
      "invalid artifact reference",
      "condition could not be evaluated",
      "type mismatch in condition",
      "missing artifact",
      "step failed",
      "failed to spawn process",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "pipeforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

/// Errors that reject a pipeline document before any job is scheduled.
[[nodiscard]] inline auto is_specification_error(std::error_code ec) noexcept
    -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::CycleDetected:
  case Error::DanglingReference:
  case Error::EmptyMatrixAxis:
  case Error::UnknownVariable:
  case Error::InvalidCondition:
  case Error::UnknownExecutor:
  case Error::InvalidArtifactRef:
  case Error::ParseError:
    return true;
  default:
    return false;
  }
}

} // namespace pipeforge

template <> struct std::is_error_code_enum<pipeforge::Error> : std::true_type {};
