#include "pipeforge/pipeline/graph.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace pipeforge;

namespace {
auto position(const std::vector<NodeIndex> &order, NodeIndex idx)
    -> std::ptrdiff_t {
  return std::ranges::find(order, idx) - order.begin();
}
} // namespace

TEST(GraphTest, AddNodeAssignsIndicesInInsertionOrder) {
  Graph g;
  EXPECT_EQ(g.add_node("lint").value(), 0U);
  EXPECT_EQ(g.add_node("test").value(), 1U);
  EXPECT_EQ(g.size(), 2U);
  EXPECT_EQ(g.index_of("test"), 1U);
  EXPECT_EQ(g.key(0), "lint");
  EXPECT_EQ(g.index_of("missing"), kInvalidNode);
}

TEST(GraphTest, DuplicateNodeIsRejected) {
  Graph g;
  ASSERT_TRUE(g.add_node("build"));
  auto again = g.add_node("build");
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), make_error_code(Error::AlreadyExists));
}

TEST(GraphTest, EdgeToUnknownNodeIsDangling) {
  Graph g;
  ASSERT_TRUE(g.add_node("build"));
  auto r = g.add_edge("build", "deploy");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::DanglingReference));
}

TEST(GraphTest, SelfEdgeIsACycle) {
  Graph g;
  ASSERT_TRUE(g.add_node("build"));
  auto r = g.add_edge("build", "build");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::CycleDetected));
}

TEST(GraphTest, DuplicateEdgeIsIgnored) {
  Graph g;
  ASSERT_TRUE(g.add_node("a"));
  ASSERT_TRUE(g.add_node("b"));
  ASSERT_TRUE(g.add_edge("a", "b"));
  ASSERT_TRUE(g.add_edge("a", "b"));
  EXPECT_EQ(g.deps(1).size(), 1U);
  EXPECT_EQ(g.dependents(0).size(), 1U);
}

TEST(GraphTest, CheckAcyclicReportsCycleMembers) {
  Graph g;
  for (const auto *name : {"a", "b", "c", "d"}) {
    ASSERT_TRUE(g.add_node(name));
  }
  ASSERT_TRUE(g.add_edge("a", "b"));
  ASSERT_TRUE(g.add_edge("b", "c"));
  ASSERT_TRUE(g.add_edge("c", "b"));
  ASSERT_TRUE(g.add_edge("c", "d"));

  std::vector<std::string> cycle;
  auto r = g.check_acyclic(&cycle);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::CycleDetected));
  ASSERT_GE(cycle.size(), 3U);
  EXPECT_EQ(cycle.front(), cycle.back());
  EXPECT_NE(std::ranges::find(cycle, "b"), cycle.end());
  EXPECT_NE(std::ranges::find(cycle, "c"), cycle.end());
  EXPECT_EQ(std::ranges::find(cycle, "a"), cycle.end());
}

TEST(GraphTest, TopologicalOrderRespectsEdgesAndInsertionOrder) {
  Graph g;
  for (const auto *name : {"deploy", "test", "build", "lint"}) {
    ASSERT_TRUE(g.add_node(name));
  }
  ASSERT_TRUE(g.add_edge("build", "deploy"));
  ASSERT_TRUE(g.add_edge("test", "deploy"));
  ASSERT_TRUE(g.add_edge("lint", "test"));
  ASSERT_TRUE(g.check_acyclic());

  const auto order = g.topological_order();
  ASSERT_EQ(order.size(), 4U);
  EXPECT_LT(position(order, g.index_of("build")),
            position(order, g.index_of("deploy")));
  EXPECT_LT(position(order, g.index_of("test")),
            position(order, g.index_of("deploy")));
  EXPECT_LT(position(order, g.index_of("lint")),
            position(order, g.index_of("test")));
  // Ready nodes go lowest index first: test(1) is not ready, build(2) is.
  EXPECT_EQ(order.front(), g.index_of("build"));
  EXPECT_EQ(order.back(), g.index_of("deploy"));
}

TEST(GraphTest, TopologicalOrderIsDeterministic) {
  auto build = [] {
    Graph g;
    for (const auto *name : {"a", "b", "c", "d", "e"}) {
      (void)g.add_node(name);
    }
    (void)g.add_edge("a", "c");
    (void)g.add_edge("b", "c");
    (void)g.add_edge("c", "e");
    (void)g.add_edge("d", "e");
    return g.topological_order();
  };
  EXPECT_EQ(build(), build());
}

TEST(GraphTest, AncestorsAreTransitive) {
  Graph g;
  for (const auto *name : {"test", "build", "package", "release", "docs"}) {
    ASSERT_TRUE(g.add_node(name));
  }
  ASSERT_TRUE(g.add_edge("test", "build"));
  ASSERT_TRUE(g.add_edge("build", "package"));
  ASSERT_TRUE(g.add_edge("package", "release"));

  auto ancestors = g.ancestors(g.index_of("release"));
  std::ranges::sort(ancestors);
  EXPECT_EQ(ancestors, (std::vector<NodeIndex>{0, 1, 2}));
  EXPECT_TRUE(g.ancestors(g.index_of("docs")).empty());
}
