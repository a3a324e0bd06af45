#include "pipeforge/pipeline/graph.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <ranges>
#include <utility>

namespace pipeforge {

auto Graph::add_node(std::string key) -> Result<NodeIndex> {
  if (key_to_idx_.contains(key)) {
    return fail(Error::AlreadyExists);
  }
  const auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(key);
  key_to_idx_.emplace(std::move(key), idx);
  return ok(idx);
}

auto Graph::add_edge(std::string_view from, std::string_view to)
    -> Result<void> {
  const auto from_idx = index_of(from);
  const auto to_idx = index_of(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::DanglingReference);
  }
  return add_edge(from_idx, to_idx);
}

auto Graph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::NotFound);
  }
  if (from == to) {
    return fail(Error::CycleDetected);
  }
  auto &deps = nodes_[to].deps;
  if (std::ranges::find(deps, from) != deps.end()) {
    return ok();
  }
  deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

auto Graph::has_node(std::string_view key) const -> bool {
  return key_to_idx_.contains(key);
}

auto Graph::check_acyclic(std::vector<std::string> *cycle) const
    -> Result<void> {
  enum : std::uint8_t { kUnvisited, kOnStack, kDone };
  std::vector<std::uint8_t> state(nodes_.size(), kUnvisited);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(nodes_.size());

  for (NodeIndex start = 0; start < nodes_.size(); ++start) {
    if (state[start] != kUnvisited) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = kOnStack;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &next = nodes_[node].dependents;
      if (child_idx >= next.size()) {
        state[node] = kDone;
        stack.pop_back();
        continue;
      }
      const NodeIndex child = next[child_idx++];
      if (state[child] == kOnStack) {
        if (cycle != nullptr) {
          cycle->clear();
          auto from = std::ranges::find(stack, child,
                                        &std::pair<NodeIndex, std::size_t>::first);
          for (auto it = from; it != stack.end(); ++it) {
            cycle->push_back(keys_[it->first]);
          }
          cycle->push_back(keys_[child]);
        }
        return fail(Error::CycleDetected);
      }
      if (state[child] == kUnvisited) {
        state[child] = kOnStack;
        stack.emplace_back(child, 0);
      }
    }
  }
  return ok();
}

auto Graph::topological_order() const -> std::vector<NodeIndex> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.push_back(node.deps.size());
  }

  std::priority_queue<NodeIndex, std::vector<NodeIndex>, std::greater<>> ready;
  for (auto [i, deg] : std::views::enumerate(in_degree)) {
    if (deg == 0) {
      ready.push(static_cast<NodeIndex>(i));
    }
  }

  std::vector<NodeIndex> order;
  order.reserve(nodes_.size());
  while (!ready.empty()) {
    const NodeIndex current = ready.top();
    ready.pop();
    order.push_back(current);
    for (NodeIndex dep : nodes_[current].dependents) {
      if (--in_degree[dep] == 0) {
        ready.push(dep);
      }
    }
  }
  return order;
}

auto Graph::ancestors(NodeIndex idx) const -> std::vector<NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  std::vector<bool> seen(nodes_.size(), false);
  std::vector<NodeIndex> work(nodes_[idx].deps.begin(), nodes_[idx].deps.end());
  std::vector<NodeIndex> out;
  while (!work.empty()) {
    const auto n = work.back();
    work.pop_back();
    if (seen[n]) {
      continue;
    }
    seen[n] = true;
    out.push_back(n);
    work.insert(work.end(), nodes_[n].deps.begin(), nodes_[n].deps.end());
  }
  std::ranges::sort(out);
  return out;
}

auto Graph::deps(NodeIndex idx) const noexcept -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto Graph::dependents(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto Graph::index_of(std::string_view key) const -> NodeIndex {
  auto it = key_to_idx_.find(key);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto Graph::key(NodeIndex idx) const -> const std::string & {
  static const std::string kEmpty;
  return idx < keys_.size() ? keys_[idx] : kEmpty;
}

} // namespace pipeforge
