#include "pipeforge/trigger/trigger_evaluator.hpp"
#include "pipeforge/util/glob.hpp"
#include "test_utils.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace pipeforge;
using pipeforge::test::branch_push;
using pipeforge::test::pull_request;
using pipeforge::test::tag_push;

TEST(GlobTest, SingleStarStopsAtSlash) {
  EXPECT_TRUE(glob_match("v*", "v1.2.3"));
  EXPECT_TRUE(glob_match("release/*", "release/2024"));
  EXPECT_FALSE(glob_match("release/*", "release/2024/q1"));
  EXPECT_FALSE(glob_match("v*", "x1.2.3"));
}

TEST(GlobTest, DoubleStarCrossesSlash) {
  EXPECT_TRUE(glob_match("release/**", "release/2024/q1"));
  EXPECT_TRUE(glob_match("**", "any/thing"));
}

TEST(GlobTest, QuestionMarkMatchesOneCharacter) {
  EXPECT_TRUE(glob_match("v?.0", "v1.0"));
  EXPECT_FALSE(glob_match("v?.0", "v10.0"));
  EXPECT_FALSE(glob_match("a?b", "a/b"));
}

TEST(GlobTest, RegexCharactersMatchLiterally) {
  EXPECT_TRUE(glob_match("v1.2.3+build", "v1.2.3+build"));
  EXPECT_FALSE(glob_match("v1.2.3", "v1x2x3"));
  EXPECT_TRUE(glob_match("(beta)[1]", "(beta)[1]"));
}

TEST(GlobTest, MatchIsAnchored) {
  EXPECT_FALSE(glob_match("v1", "v1.0"));
  EXPECT_FALSE(glob_match("1.0", "v1.0"));
}

TEST(GlobTest, EmptyPatternIsInvalid) {
  EXPECT_FALSE(GlobPattern::compile(""));
  EXPECT_FALSE(glob_match("", ""));
}

namespace {

struct TriggerCase {
  std::string name;
  std::vector<TriggerClause> clauses;
  RunContext ctx;
  bool expected;
};

auto push(std::vector<std::string> branches, std::vector<std::string> tags = {})
    -> TriggerClause {
  return TriggerClause{.event = EventKind::Push,
                       .branches = std::move(branches),
                       .tags = std::move(tags)};
}

auto tags(std::vector<std::string> patterns) -> TriggerClause {
  return TriggerClause{
      .event = EventKind::TagPush, .branches = {}, .tags = std::move(patterns)};
}

auto pr(std::vector<std::string> branches) -> TriggerClause {
  return TriggerClause{
      .event = EventKind::PullRequest, .branches = std::move(branches),
      .tags = {}};
}

} // namespace

class TriggerMatchTest : public testing::TestWithParam<TriggerCase> {};

TEST_P(TriggerMatchTest, ShouldRun) {
  const auto &param = GetParam();
  auto evaluator = TriggerEvaluator::create(param.clauses);
  ASSERT_TRUE(evaluator);
  EXPECT_EQ(evaluator->should_run(param.ctx), param.expected);
}

INSTANTIATE_TEST_SUITE_P(
    Clauses, TriggerMatchTest,
    testing::Values(
        TriggerCase{"NoClausesNeverRun", {}, branch_push("main"), false},
        TriggerCase{"BarePushMatchesBranch", {push({})}, branch_push("dev"),
                    true},
        TriggerCase{"BarePushMatchesTag", {push({})}, tag_push("v1"), true},
        TriggerCase{"PushBranchListed", {push({"main"})}, branch_push("main"),
                    true},
        TriggerCase{"PushBranchNotListed", {push({"main"})},
                    branch_push("dev"), false},
        TriggerCase{"PushBranchesIgnoreTags", {push({"main"})},
                    tag_push("main"), false},
        TriggerCase{"PushTagGlob", {push({}, {"v*"})}, tag_push("v1.2.3"),
                    true},
        TriggerCase{"PushTagGlobMiss", {push({}, {"v*"})}, tag_push("x1"),
                    false},
        TriggerCase{"PushTagsOnlyIgnoreBranches", {push({}, {"v*"})},
                    branch_push("main"), false},
        TriggerCase{"TagPushAnyTag", {tags({})}, tag_push("nightly"), true},
        TriggerCase{"TagPushIgnoresBranches", {tags({})}, branch_push("main"),
                    false},
        TriggerCase{"PullRequestToMain", {pr({"main"})},
                    pull_request("feature", "main"), true},
        TriggerCase{"PullRequestToOther", {pr({"main"})},
                    pull_request("feature", "develop"), false},
        TriggerCase{"PullRequestAnyTarget", {pr({})},
                    pull_request("feature", "develop"), true},
        TriggerCase{"PullRequestIgnoresPush", {pr({"main"})},
                    branch_push("main"), false},
        TriggerCase{"PushDoesNotMatchPullRequest", {push({"main"})},
                    pull_request("main", "main"), false},
        TriggerCase{"SecondClauseMatches", {push({"main"}), tags({"v*"})},
                    tag_push("v2"), true}),
    [](const testing::TestParamInfo<TriggerCase> &info) {
      return info.param.name;
    });

TEST(TriggerEvaluatorTest, MatchingClauseIsFirstMatch) {
  auto evaluator = TriggerEvaluator::create(
      {push({"main"}), tags({"v*"}), push({}, {"v1*"})});
  ASSERT_TRUE(evaluator);
  EXPECT_EQ(evaluator->matching_clause(tag_push("v1.0")), 1);
  EXPECT_EQ(evaluator->matching_clause(branch_push("main")), 0);
  EXPECT_EQ(evaluator->matching_clause(branch_push("dev")), -1);
}

TEST(TriggerEvaluatorTest, InvalidTagPatternIsRejected) {
  auto evaluator = TriggerEvaluator::create({tags({""})});
  ASSERT_FALSE(evaluator);
  EXPECT_EQ(evaluator.error(), make_error_code(Error::InvalidArgument));
}

TEST(TriggerEvaluatorTest, ClausesCompileToConditions) {
  EXPECT_EQ(trigger_condition(push({})),
            "event == 'push' || event == 'tag_push'");
  EXPECT_EQ(trigger_condition(tags({"v*"})),
            "event == 'tag_push' && (matches(ref_name, 'v*'))");
  EXPECT_EQ(trigger_condition(pr({"main", "next"})),
            "event == 'pull_request' && (base_ref == 'main' || base_ref == "
            "'next')");
  EXPECT_EQ(trigger_condition(push({"main"}, {"v*"})),
            "(event == 'push' && (ref_name == 'main')) || (event == "
            "'tag_push' && (matches(ref_name, 'v*')))");

  auto condition = Condition::parse(trigger_condition(push({"it's"})));
  ASSERT_TRUE(condition);
  EXPECT_EQ(condition->evaluate(branch_push("it's")).value(), true);
}
