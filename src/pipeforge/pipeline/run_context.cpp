#include "pipeforge/pipeline/run_context.hpp"

#include "pipeforge/util/log.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <array>
#include <format>

namespace pipeforge {

namespace {

constexpr std::string_view kHeadsPrefix = "refs/heads/";
constexpr std::string_view kTagsPrefix = "refs/tags/";
constexpr std::string_view kRefsPrefix = "refs/";

constexpr std::array<std::string_view, 12> kVariables = {
    "event",          "ref",        "ref_name",          "ref_kind",
    "actor",          "base_ref",   "github.event_name", "github.ref",
    "github.ref_name", "github.ref_type", "github.actor", "github.base_ref",
};

} // namespace

auto is_context_variable(std::string_view name) noexcept -> bool {
  return std::ranges::find(kVariables, name) != kVariables.end();
}

auto context_variable_names() noexcept -> std::span<const std::string_view> {
  return kVariables;
}

auto RunContext::from_event(std::string_view event, std::string_view ref,
                            std::string actor,
                            std::optional<std::string> base_ref)
    -> Result<RunContext> {
  auto kind = util::try_parse_enum<EventKind>(event);
  if (!kind) {
    log::error("unknown event kind '{}'", event);
    return fail(Error::InvalidArgument);
  }

  RunContext ctx;
  ctx.event = *kind;
  ctx.actor = std::move(actor);

  if (boost::algorithm::starts_with(ref, kTagsPrefix)) {
    ctx.ref_kind = RefKind::Tag;
    ctx.ref_name = std::string(ref.substr(kTagsPrefix.size()));
  } else if (boost::algorithm::starts_with(ref, kHeadsPrefix)) {
    ctx.ref_kind = RefKind::Branch;
    ctx.ref_name = std::string(ref.substr(kHeadsPrefix.size()));
  } else if (boost::algorithm::starts_with(ref, kRefsPrefix)) {
    // refs/<namespace>/<name>, e.g. refs/pull/1/merge names "1/merge".
    const auto rest = ref.substr(kRefsPrefix.size());
    const auto slash = rest.find('/');
    ctx.ref_kind = RefKind::Branch;
    ctx.ref_name = slash == std::string_view::npos
                       ? std::string{}
                       : std::string(rest.substr(slash + 1));
    ctx.other_ref = std::string(ref);
  } else {
    ctx.ref_kind =
        ctx.event == EventKind::TagPush ? RefKind::Tag : RefKind::Branch;
    ctx.ref_name = std::string(ref);
  }

  if (ctx.ref_name.empty()) {
    log::error("event ref '{}' has no name", ref);
    return fail(Error::InvalidArgument);
  }

  if (ctx.ref_kind == RefKind::Tag) {
    if (ctx.event == EventKind::PullRequest) {
      log::error("pull request events cannot carry a tag ref '{}'", ref);
      return fail(Error::InvalidArgument);
    }
    ctx.event = EventKind::TagPush;
  } else if (ctx.event == EventKind::TagPush) {
    log::error("tag_push event with branch ref '{}'", ref);
    return fail(Error::InvalidArgument);
  }

  if (ctx.event == EventKind::PullRequest) {
    if (base_ref) {
      auto base = std::string_view(*base_ref);
      if (boost::algorithm::starts_with(base, kHeadsPrefix)) {
        base.remove_prefix(kHeadsPrefix.size());
      }
      ctx.base_ref = std::string(base);
    }
  } else if (base_ref) {
    log::warn("ignoring base ref '{}' for a {} event", *base_ref,
              to_string_view(ctx.event));
  }

  return ok(std::move(ctx));
}

auto RunContext::full_ref() const -> std::string {
  if (!other_ref.empty()) {
    return other_ref;
  }
  return std::format("{}{}",
                     ref_kind == RefKind::Tag ? kTagsPrefix : kHeadsPrefix,
                     ref_name);
}

auto RunContext::lookup(std::string_view name) const -> Result<std::string> {
  if (name == "event") {
    return ok(std::string(to_string_view(event)));
  }
  if (name == "github.event_name") {
    return ok(std::string(event == EventKind::PullRequest ? "pull_request"
                                                          : "push"));
  }
  if (name == "ref" || name == "github.ref") {
    return ok(full_ref());
  }
  if (name == "ref_name" || name == "github.ref_name") {
    return ok(ref_name);
  }
  if (name == "ref_kind" || name == "github.ref_type") {
    return ok(std::string(to_string_view(ref_kind)));
  }
  if (name == "actor" || name == "github.actor") {
    return ok(actor);
  }
  if (name == "base_ref" || name == "github.base_ref") {
    if (!base_ref) {
      return fail(Error::ConditionEvaluationFailed);
    }
    return ok(*base_ref);
  }
  return fail(Error::UnknownVariable);
}

} // namespace pipeforge
