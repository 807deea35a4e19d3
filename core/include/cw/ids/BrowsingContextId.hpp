#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>

namespace cw {

// Opaque id of one top-level browsing context (a tab / page).
struct TopLevelBrowsingContextId {
  std::uint64_t value{0};

  bool isValid() const { return value != 0; }
};

inline constexpr TopLevelBrowsingContextId kInvalidContextId{0};

inline bool operator==(TopLevelBrowsingContextId a, TopLevelBrowsingContextId b) {
  return a.value == b.value;
}
inline bool operator!=(TopLevelBrowsingContextId a, TopLevelBrowsingContextId b) {
  return a.value != b.value;
}
inline bool operator<(TopLevelBrowsingContextId a, TopLevelBrowsingContextId b) {
  return a.value < b.value;
}

// Accepts decimal digits only (config files, trace replays).
inline TopLevelBrowsingContextId parseBrowsingContextId(const std::string& s) {
  if (s.empty()) return kInvalidContextId;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9')
      throw std::runtime_error("TopLevelBrowsingContextId must be decimal digits");
    auto d = static_cast<std::uint64_t>(c - '0');
    if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10)
      throw std::runtime_error("TopLevelBrowsingContextId out of range");
    v = v * 10 + d;
  }
  return TopLevelBrowsingContextId{v};
}

} // namespace cw

namespace std {
template <>
struct hash<cw::TopLevelBrowsingContextId> {
  std::size_t operator()(cw::TopLevelBrowsingContextId id) const noexcept {
    return std::hash<std::uint64_t>{}(id.value);
  }
};
} // namespace std
