#pragma once

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace pipeforge {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

struct RunTag {};
struct JobTag {};

// Phantom-typed string id; a RunId never converts to a JobId.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

/// One execution of a pipeline.
using RunId = TypedId<RunTag>;
/// One job instance, `stage` or `stage[axis=value,...]`.
using JobId = TypedId<JobTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace pipeforge

// is_avalanching lets ankerl::unordered_dense use this hash as-is.
template <typename Tag> struct std::hash<pipeforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const pipeforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<pipeforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const pipeforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace pipeforge {

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_run_id() -> RunId {
  return RunId{detail::generate_uuid_v7_like()};
}

} // namespace pipeforge
