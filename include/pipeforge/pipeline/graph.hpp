#pragma once

#include "pipeforge/core/error.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = std::numeric_limits<NodeIndex>::max();

/// Directed graph over string keys. An edge `from -> to` means `to` depends
/// on `from`. Node indices follow insertion order.
class Graph {
public:
  [[nodiscard]] auto add_node(std::string key) -> Result<NodeIndex>;
  [[nodiscard]] auto add_edge(std::string_view from, std::string_view to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(std::string_view key) const -> bool;

  /// CycleDetected when the graph has a cycle; `cycle` (when given) receives
  /// its members in edge order, first node repeated at the end.
  [[nodiscard]] auto check_acyclic(std::vector<std::string> *cycle = nullptr)
      const -> Result<void>;

  /// Kahn order; among ready nodes the lowest index goes first, so the
  /// result is deterministic and respects insertion order.
  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex>;

  /// Every node reachable backwards from `idx`, excluding `idx`.
  [[nodiscard]] auto ancestors(NodeIndex idx) const -> std::vector<NodeIndex>;

  [[nodiscard]] auto deps(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto index_of(std::string_view key) const -> NodeIndex;
  [[nodiscard]] auto key(NodeIndex idx) const -> const std::string &;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  struct KeyHash {
    using is_transparent = void;
    using is_avalanching = void;
    [[nodiscard]] auto operator()(std::string_view sv) const noexcept
        -> std::uint64_t {
      return ankerl::unordered_dense::hash<std::string_view>{}(sv);
    }
  };

  std::vector<Node> nodes_;
  std::vector<std::string> keys_;
  ankerl::unordered_dense::map<std::string, NodeIndex, KeyHash, std::equal_to<>>
      key_to_idx_;
};

} // namespace pipeforge
