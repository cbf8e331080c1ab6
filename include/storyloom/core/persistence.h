#pragma once

#include <optional>
#include <string>
#include <utility>

#include "storyloom/core/world_state.h"

namespace storyloom {

// Where committed snapshots go. Saves must be idempotent: writing the same
// snapshot twice leaves the same result.
class PersistencePort {
 public:
  virtual ~PersistencePort() = default;

  // False (or a thrown PersistenceError) means the snapshot was not stored.
  virtual bool save(const WorldState& snapshot) = 0;

  // nullopt when there is no usable saved state.
  virtual std::optional<WorldState> load() = 0;
};

// Snapshots as a single JSON document, replaced atomically on each save.
class JsonFilePersistence : public PersistencePort {
 public:
  explicit JsonFilePersistence(std::string path) : path_(std::move(path)) {}

  bool save(const WorldState& snapshot) override;
  std::optional<WorldState> load() override;

  // Throws PersistenceError.
  void save_or_throw(const WorldState& snapshot);

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

} // namespace storyloom
