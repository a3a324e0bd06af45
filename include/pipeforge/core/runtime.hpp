#pragma once

#include "pipeforge/core/coroutine.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/core/shard.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace pipeforge {

inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

/// A fixed set of single-threaded event loops. Job bookkeeping lives on
/// shard 0; child processes are spread over all shards.
class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(executor_for(clamp(target)), std::move(coro), detached);
  }

  template <typename T> auto spawn(task<T> coro) -> void {
    auto sid = current_shard();
    if (sid == kInvalidShard) {
      sid = 0;
    }
    spawn_on(sid, std::move(coro));
  }

  /// Round-robin placement for work that has no natural owner.
  template <typename T> auto spawn_external(task<T> coro) -> void {
    auto target = static_cast<shard_id>(
        external_rr_.fetch_add(1, std::memory_order_relaxed) % num_shards_);
    spawn_on(target, std::move(coro));
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    boost::asio::post(executor_for(clamp(target)), std::forward<F>(fn));
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }
  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto is_current_shard() const noexcept -> bool;

  [[nodiscard]] auto shard(shard_id id) noexcept -> Shard & {
    return *shards_[clamp(id)];
  }

  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type {
    return shards_[clamp(id)]->ctx().get_executor();
  }

private:
  [[nodiscard]] auto clamp(shard_id id) const noexcept -> shard_id {
    return id < num_shards_ ? id : id % num_shards_;
  }
  auto run_shard(shard_id id) -> void;

  std::atomic<bool> running_{false};
  unsigned num_shards_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  std::atomic<std::uint64_t> external_rr_{0};
};

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local Runtime *current_runtime = nullptr;
} // namespace detail

/// Suspend the calling coroutine for `duration` on its own executor.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> spawn_task {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(executor);
  timer.expires_after(duration);
  co_await timer.async_wait(use_awaitable);
}

} // namespace pipeforge
