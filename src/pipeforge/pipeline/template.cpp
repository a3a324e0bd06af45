#include "pipeforge/pipeline/template.hpp"

#include <boost/algorithm/string/trim.hpp>

namespace pipeforge {

namespace {

constexpr std::string_view kOpen = "${{";
constexpr std::string_view kClose = "}}";

// Walks `text` once, calling on_literal for plain text and on_token for each
// well-formed token (with its raw spelling for pass-through).
template <typename OnLiteral, typename OnToken>
auto scan_template(std::string_view text, OnLiteral &&on_literal,
                   OnToken &&on_token) -> void {
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] == '\\' && text.substr(pos + 1).starts_with(kOpen)) {
      on_literal(kOpen);
      pos += 1 + kOpen.size();
      continue;
    }
    if (text.substr(pos).starts_with(kOpen)) {
      const auto close = text.find(kClose, pos + kOpen.size());
      if (close == std::string_view::npos) {
        on_literal(text.substr(pos));
        return;
      }
      const auto inner =
          text.substr(pos + kOpen.size(), close - pos - kOpen.size());
      const auto raw = text.substr(pos, close + kClose.size() - pos);
      on_token(boost::algorithm::trim_copy(std::string(inner)), raw);
      pos = close + kClose.size();
      continue;
    }
    const auto next = text.find_first_of("\\$", pos + 1);
    const auto end = next == std::string_view::npos ? text.size() : next;
    on_literal(text.substr(pos, end - pos));
    pos = end;
  }
}

} // namespace

auto render_template(std::string_view text, const TemplateLookup &lookup)
    -> std::string {
  std::string out;
  out.reserve(text.size());
  scan_template(
      text, [&](std::string_view lit) { out.append(lit); },
      [&](const std::string &name, std::string_view raw) {
        auto value = lookup ? lookup(name) : std::nullopt;
        if (value) {
          out.append(*value);
        } else {
          out.append(raw);
        }
      });
  return out;
}

auto template_tokens(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> out;
  scan_template(
      text, [](std::string_view) {},
      [&](const std::string &name, std::string_view) { out.push_back(name); });
  return out;
}

} // namespace pipeforge
