#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

/// Returns the replacement for a `${{ name }}` token, or nullopt to leave the
/// token as written.
using TemplateLookup =
    std::function<std::optional<std::string>(std::string_view name)>;

/// Replace `${{ name }}` tokens. `\${{` yields a literal `${{`; unterminated
/// and unknown tokens are copied through unchanged.
[[nodiscard]] auto render_template(std::string_view text,
                                   const TemplateLookup &lookup) -> std::string;

/// Names of every token in `text`, in order of appearance.
[[nodiscard]] auto template_tokens(std::string_view text)
    -> std::vector<std::string>;

[[nodiscard]] inline auto has_template(std::string_view text) -> bool {
  return !template_tokens(text).empty();
}

} // namespace pipeforge
