#pragma once
#include <cstdint>
#include <string>

namespace cw {

// Host window settings, loadable from JSON.
struct WindowConfig {
  std::string title{"CompWin"};
  std::uint32_t width{1024};         // density-independent units
  std::uint32_t height{768};
  float hidpiFactor{0.0f};           // 0 = ask the platform
  std::uint32_t screenWidth{3840};   // clamp bounds for headless backends
  std::uint32_t screenHeight{2160};
  bool fullscreen{false};
  bool supportsClipboard{true};

  int animatingPollIntervalMs{16};
  int navigationTimeoutMs{5000};
  bool allowNavigationOnTimeout{false};

  bool traceEvents{false};           // log every dispatched event as JSON
};

std::string serializeWindowConfig(const WindowConfig& cfg);

// Missing members keep their defaults. Returns false on malformed JSON.
bool deserializeWindowConfig(const std::string& json, WindowConfig& out);

bool loadWindowConfigFile(const std::string& path, WindowConfig& out);

} // namespace cw
