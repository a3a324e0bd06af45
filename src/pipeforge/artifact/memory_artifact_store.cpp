#include "pipeforge/artifact/artifact_store.hpp"

#include "pipeforge/util/log.hpp"

#include <mutex>

namespace pipeforge {

auto InMemoryArtifactStore::put(Artifact artifact) -> Result<void> {
  std::unique_lock lock(mutex_);
  if (entries_.contains(artifact.key)) {
    log::warn("artifact {} already published", artifact.key);
    return fail(Error::AlreadyExists);
  }
  if (artifact.created_at == std::chrono::system_clock::time_point{}) {
    artifact.created_at = std::chrono::system_clock::now();
  }
  auto key = artifact.key;
  log::debug("artifact {} stored ({} bytes)", key, artifact.size());
  entries_.emplace(std::move(key),
                   std::make_shared<const Artifact>(std::move(artifact)));
  return ok();
}

auto InMemoryArtifactStore::get(const ArtifactKey &key) const
    -> Result<std::shared_ptr<const Artifact>> {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return fail(Error::NotFound);
  }
  return it->second;
}

auto InMemoryArtifactStore::erase(const ArtifactKey &key) -> Result<void> {
  std::unique_lock lock(mutex_);
  if (entries_.erase(key) == 0) {
    return fail(Error::NotFound);
  }
  log::debug("artifact {} disposed", key);
  return ok();
}

auto InMemoryArtifactStore::contains(const ArtifactKey &key) const -> bool {
  std::shared_lock lock(mutex_);
  return entries_.contains(key);
}

auto InMemoryArtifactStore::keys() const -> std::vector<ArtifactKey> {
  std::shared_lock lock(mutex_);
  std::vector<ArtifactKey> out;
  out.reserve(entries_.size());
  for (const auto &[key, _] : entries_) {
    out.push_back(key);
  }
  return out;
}

auto InMemoryArtifactStore::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

auto InMemoryArtifactStore::total_bytes() const -> std::size_t {
  std::shared_lock lock(mutex_);
  std::size_t total = 0;
  for (const auto &[_, artifact] : entries_) {
    total += artifact->size();
  }
  return total;
}

} // namespace pipeforge
