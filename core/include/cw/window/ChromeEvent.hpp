#pragma once
#include "cw/ids/BrowsingContextId.hpp"
#include "cw/input/InputTypes.hpp"
#include "cw/net/LoadData.hpp"
#include "cw/sync/OneShot.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cw {

// Notifications a window forwards to the embedder's browser chrome. Backends
// that cannot act on them in place queue these and return immediately.
namespace chrome {

struct TitleChanged {
  TopLevelBrowsingContextId ctx;
  std::optional<std::string> title;
};

struct StatusChanged {
  TopLevelBrowsingContextId ctx;
  std::optional<std::string> text;
};

struct LoadStarted { TopLevelBrowsingContextId ctx; };
struct LoadEnded { TopLevelBrowsingContextId ctx; };

struct LoadFailed {
  TopLevelBrowsingContextId ctx;
  NetError code{NetError::Failed};
  std::string url;
};

struct HeadParsed { TopLevelBrowsingContextId ctx; };

struct HistoryChanged {
  TopLevelBrowsingContextId ctx;
  std::vector<LoadData> entries;
  std::size_t current{0};
};

struct FaviconChanged {
  TopLevelBrowsingContextId ctx;
  Url url;
};

// The embedder answers on `reply`.
struct NavigationRequest {
  TopLevelBrowsingContextId ctx;
  Url url;
  OneShotSender<bool> reply;
};

struct KeyHandled {
  std::optional<TopLevelBrowsingContextId> ctx;
  std::optional<char32_t> ch;
  Key key{Key::Unknown};
  KeyModifiers modifiers;
};

} // namespace chrome

using ChromeEvent = std::variant<
  chrome::TitleChanged,
  chrome::StatusChanged,
  chrome::LoadStarted,
  chrome::LoadEnded,
  chrome::LoadFailed,
  chrome::HeadParsed,
  chrome::HistoryChanged,
  chrome::FaviconChanged,
  chrome::NavigationRequest,
  chrome::KeyHandled>;

} // namespace cw
