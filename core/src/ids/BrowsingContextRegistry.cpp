#include "cw/ids/BrowsingContextRegistry.hpp"

#include <algorithm>

namespace cw {

BrowsingContextRegistry::BrowsingContextRegistry(std::uint64_t firstId)
  : next_(firstId == 0 ? 1 : firstId) {}

TopLevelBrowsingContextId BrowsingContextRegistry::create() {
  for (;;) {
    TopLevelBrowsingContextId id{next_++};
    if (!id.isValid()) continue;
    if (live_.count(id) || closed_.count(id)) continue;
    live_.insert(id);
    if (!visible_) visible_ = id;
    return id;
  }
}

bool BrowsingContextRegistry::reserve(TopLevelBrowsingContextId id) {
  if (!id.isValid()) return false;
  if (live_.count(id) || closed_.count(id)) return false;
  live_.insert(id);
  if (!visible_) visible_ = id;
  return true;
}

bool BrowsingContextRegistry::close(TopLevelBrowsingContextId id) {
  if (live_.erase(id) == 0) return false;
  closed_.insert(id);
  if (visible_ && *visible_ == id) visible_.reset();
  return true;
}

bool BrowsingContextRegistry::select(TopLevelBrowsingContextId id) {
  if (!isAlive(id)) return false;
  visible_ = id;
  return true;
}

bool BrowsingContextRegistry::isAlive(TopLevelBrowsingContextId id) const {
  return live_.count(id) > 0;
}

bool BrowsingContextRegistry::wasClosed(TopLevelBrowsingContextId id) const {
  return closed_.count(id) > 0;
}

std::vector<TopLevelBrowsingContextId> BrowsingContextRegistry::live() const {
  std::vector<TopLevelBrowsingContextId> out(live_.begin(), live_.end());
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace cw
