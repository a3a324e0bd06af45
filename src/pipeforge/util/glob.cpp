#include "pipeforge/util/glob.hpp"

#include "pipeforge/util/log.hpp"

#include <string_view>

namespace pipeforge {

namespace {

constexpr std::string_view kRegexSpecials = R"(\^$.|+()[]{}*?)";

[[nodiscard]] auto glob_to_regex(std::string_view glob) -> std::string {
  std::string out;
  out.reserve(glob.size() * 2);
  for (std::size_t i = 0; i < glob.size(); ++i) {
    const char c = glob[i];
    if (c == '*') {
      if (i + 1 < glob.size() && glob[i + 1] == '*') {
        out += ".*";
        ++i;
      } else {
        out += "[^/]*";
      }
    } else if (c == '?') {
      out += "[^/]";
    } else {
      if (kRegexSpecials.find(c) != std::string_view::npos) {
        out.push_back('\\');
      }
      out.push_back(c);
    }
  }
  return out;
}

} // namespace

auto GlobPattern::compile(std::string_view pattern) -> Result<GlobPattern> {
  if (pattern.empty()) {
    return fail(Error::InvalidArgument);
  }
  try {
    std::regex re(glob_to_regex(pattern), std::regex::ECMAScript);
    return GlobPattern{std::string(pattern), std::move(re)};
  } catch (const std::regex_error &e) {
    log::warn("invalid glob '{}': {}", pattern, e.what());
    return fail(Error::InvalidArgument);
  }
}

auto GlobPattern::matches(std::string_view text) const -> bool {
  return std::regex_match(text.begin(), text.end(), re_);
}

auto glob_match(std::string_view pattern, std::string_view text) -> bool {
  auto compiled = GlobPattern::compile(pattern);
  return compiled && compiled->matches(text);
}

} // namespace pipeforge
