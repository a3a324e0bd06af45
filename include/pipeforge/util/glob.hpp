#pragma once

#include "pipeforge/core/error.hpp"

#include <regex>
#include <string>
#include <string_view>

namespace pipeforge {

/// Anchored glob over ref names.
///   `*`  any run of characters except '/'
///   `**` any run of characters, '/' included
///   `?`  exactly one character except '/'
/// Everything else matches literally.
class GlobPattern {
public:
  [[nodiscard]] static auto compile(std::string_view pattern)
      -> Result<GlobPattern>;

  [[nodiscard]] auto matches(std::string_view text) const -> bool;
  [[nodiscard]] auto pattern() const noexcept -> const std::string & {
    return pattern_;
  }

private:
  GlobPattern(std::string pattern, std::regex re)
      : pattern_(std::move(pattern)), re_(std::move(re)) {}

  std::string pattern_;
  std::regex re_;
};

/// Compile-and-match; an invalid pattern never matches.
[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view text)
    -> bool;

} // namespace pipeforge
