#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace pipeforge {

enum class EventKind : std::uint8_t {
  Push,
  PullRequest,
  TagPush,
};
BOOST_DESCRIBE_ENUM(EventKind, Push, PullRequest, TagPush)
PIPEFORGE_DEFINE_ENUM_SERDE(EventKind, EventKind::Push)

enum class RefKind : std::uint8_t {
  Branch,
  Tag,
};
BOOST_DESCRIBE_ENUM(RefKind, Branch, Tag)
PIPEFORGE_DEFINE_ENUM_SERDE(RefKind, RefKind::Branch)

/// Immutable facts about the event that started a run.
struct RunContext {
  EventKind event{EventKind::Push};
  RefKind ref_kind{RefKind::Branch};
  std::string ref_name;
  /// Full ref as given when it lies outside refs/heads/ and refs/tags/, such
  /// as `refs/pull/1/merge`; empty otherwise.
  std::string other_ref;
  std::string actor;
  /// Target branch of a pull request.
  std::optional<std::string> base_ref;

  /// Accepts full refs (`refs/heads/main`, `refs/tags/v1.0.0`) or short
  /// names. A push of a tag ref becomes a tag_push. Other `refs/...` refs are
  /// treated as branches named after their last components and keep their
  /// full spelling.
  [[nodiscard]] static auto from_event(std::string_view event,
                                       std::string_view ref, std::string actor,
                                       std::optional<std::string> base_ref =
                                           std::nullopt) -> Result<RunContext>;

  [[nodiscard]] auto full_ref() const -> std::string;

  /// Value of a context variable. UnknownVariable for names outside the
  /// vocabulary, ConditionEvaluationFailed for names that exist but have no
  /// value for this event (base_ref outside a pull request).
  [[nodiscard]] auto lookup(std::string_view name) const -> Result<std::string>;

  auto operator==(const RunContext &) const -> bool = default;
};

[[nodiscard]] auto is_context_variable(std::string_view name) noexcept -> bool;
[[nodiscard]] auto context_variable_names() noexcept
    -> std::span<const std::string_view>;

} // namespace pipeforge
