#pragma once
#include "cw/ids/BrowsingContextId.hpp"

#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

namespace cw {

// Tracks which top-level browsing contexts exist and which one is visible.
// Ids are never handed out twice, even after close().
class BrowsingContextRegistry {
public:
  explicit BrowsingContextRegistry(std::uint64_t firstId = 1);

  TopLevelBrowsingContextId create();
  bool reserve(TopLevelBrowsingContextId id);   // caller-chosen id (fails if ever used)

  bool close(TopLevelBrowsingContextId id);
  bool select(TopLevelBrowsingContextId id);

  bool isAlive(TopLevelBrowsingContextId id) const;
  bool wasClosed(TopLevelBrowsingContextId id) const;

  std::optional<TopLevelBrowsingContextId> visible() const { return visible_; }
  std::vector<TopLevelBrowsingContextId> live() const;
  std::size_t liveCount() const { return live_.size(); }

private:
  std::uint64_t next_;
  std::unordered_set<TopLevelBrowsingContextId> live_;
  std::unordered_set<TopLevelBrowsingContextId> closed_;
  std::optional<TopLevelBrowsingContextId> visible_;
};

} // namespace cw
