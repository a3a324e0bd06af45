#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/util/id.hpp"

#include <chrono>
#include <compare>
#include <cstddef>
#include <format>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace pipeforge {

/// Identity of one produced artifact. `qualifier` disambiguates the
/// instances of a matrix stage and is empty otherwise.
struct ArtifactKey {
  std::string stage;
  std::string qualifier;
  std::string name;

  auto operator<=>(const ArtifactKey &) const = default;
  auto operator==(const ArtifactKey &) const -> bool = default;
};

struct Artifact {
  ArtifactKey key;
  JobId producer;
  std::string data;
  std::chrono::system_clock::time_point created_at;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return data.size();
  }
};

/// One published artifact as reported at the end of a run. `retained` is
/// false once the artifact was disposed after its last consumer finished;
/// retained artifacts are handed back with the run result.
struct ArtifactManifestEntry {
  ArtifactKey key;
  JobId producer;
  std::size_t size{0};
  bool retained{true};

  auto operator==(const ArtifactManifestEntry &) const -> bool = default;
};

/// Single writer per key, many readers. Implementations must be safe to call
/// from any thread.
class IArtifactStore {
public:
  virtual ~IArtifactStore() = default;

  /// AlreadyExists when the key was written before.
  [[nodiscard]] virtual auto put(Artifact artifact) -> Result<void> = 0;
  [[nodiscard]] virtual auto get(const ArtifactKey &key) const
      -> Result<std::shared_ptr<const Artifact>> = 0;
  /// NotFound when nothing is stored under the key.
  [[nodiscard]] virtual auto erase(const ArtifactKey &key) -> Result<void> = 0;
  [[nodiscard]] virtual auto contains(const ArtifactKey &key) const
      -> bool = 0;
  [[nodiscard]] virtual auto keys() const -> std::vector<ArtifactKey> = 0;
};

class InMemoryArtifactStore final : public IArtifactStore {
public:
  [[nodiscard]] auto put(Artifact artifact) -> Result<void> override;
  [[nodiscard]] auto get(const ArtifactKey &key) const
      -> Result<std::shared_ptr<const Artifact>> override;
  [[nodiscard]] auto erase(const ArtifactKey &key) -> Result<void> override;
  [[nodiscard]] auto contains(const ArtifactKey &key) const -> bool override;
  [[nodiscard]] auto keys() const -> std::vector<ArtifactKey> override;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto total_bytes() const -> std::size_t;

private:
  mutable std::shared_mutex mutex_;
  std::map<ArtifactKey, std::shared_ptr<const Artifact>> entries_;
};

} // namespace pipeforge

template <>
struct std::formatter<pipeforge::ArtifactKey> : std::formatter<std::string> {
  auto format(const pipeforge::ArtifactKey &key, auto &ctx) const {
    return std::formatter<std::string>::format(
        key.qualifier.empty()
            ? std::format("{}/{}", key.stage, key.name)
            : std::format("{}[{}]/{}", key.stage, key.qualifier, key.name),
        ctx);
  }
};
