#pragma once
#include "cw/events/WindowEvent.hpp"
#include "cw/geometry/Units.hpp"
#include "cw/ids/BrowsingContextId.hpp"
#include "cw/input/InputTypes.hpp"
#include "cw/net/LoadData.hpp"
#include "cw/sync/EventLoopWaker.hpp"
#include "cw/sync/OneShot.hpp"
#include "cw/window/GlApi.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cw {

// Everything the compositor may ask of a platform window. One implementation
// per platform. Nothing here reports errors: backends degrade silently
// (clamp, ignore) and answer with last-known values. The only explicit
// decision is the allowNavigation() reply.
class WindowMethods {
public:
  virtual ~WindowMethods() = default;

  // Rendering area size in device pixels.
  virtual DeviceUintSize framebufferSize() const = 0;
  // Position and size of the window within the rendering area, device pixels.
  virtual DeviceUintRect windowRect() const = 0;
  // Window size in density-independent units.
  virtual WindowSize size() const = 0;
  // Device pixels per density-independent unit.
  virtual HiDpiFactor hidpiFactor() const = 0;

  // Publish the most recently composited frame (page flip).
  virtual void present() = 0;
  // Make the rendering context current for a width x height target.
  // false means "skip this composite pass" (minimized, context loss), not an error.
  virtual bool prepareForComposite(std::size_t width, std::size_t height) = 0;

  // Outer size (with decorations) and screen position.
  virtual std::pair<UintSize, IntPoint> clientWindow(TopLevelBrowsingContextId ctx) const = 0;
  virtual void setInnerSize(TopLevelBrowsingContextId ctx, UintSize size) = 0;
  virtual void setPosition(TopLevelBrowsingContextId ctx, IntPoint point) = 0;
  virtual void setFullscreenState(TopLevelBrowsingContextId ctx, bool state) = 0;

  // Chrome notifications. Fire-and-forget; must not block the compositor.
  virtual void setPageTitle(TopLevelBrowsingContextId ctx, std::optional<std::string> title) = 0;
  virtual void status(TopLevelBrowsingContextId ctx, std::optional<std::string> text) = 0;
  virtual void loadStart(TopLevelBrowsingContextId ctx) = 0;
  virtual void loadEnd(TopLevelBrowsingContextId ctx) = 0;
  virtual void loadError(TopLevelBrowsingContextId ctx, NetError code, std::string url) = 0;
  virtual void headParsed(TopLevelBrowsingContextId ctx) = 0;
  virtual void historyChanged(TopLevelBrowsingContextId ctx,
                              std::vector<LoadData> entries,
                              std::size_t current) = 0;
  virtual void setFavicon(TopLevelBrowsingContextId ctx, Url url) = 0;

  // Whether to follow a link. Exactly one bool must eventually go out on
  // `reply`; dropping it unanswered counts as a deny (see NavigationGate).
  virtual void allowNavigation(TopLevelBrowsingContextId ctx, Url url,
                               OneShotSender<bool> reply) = 0;

  virtual void setCursor(Cursor cursor) = 0;
  // ctx is absent for chrome-level keys not tied to a page.
  virtual void handleKey(std::optional<TopLevelBrowsingContextId> ctx,
                         std::optional<char32_t> ch, Key key, KeyModifiers mods) = 0;

  virtual bool supportsClipboard() const = 0;

  // Usable from any thread, also after the window started shutting down.
  virtual std::unique_ptr<EventLoopWaker> createEventLoopWaker() = 0;
  virtual std::shared_ptr<GlApi> gl() const = 0;

  // Optimization hint: Animating favors polling at vsync over blocking.
  virtual void setAnimationState(AnimationState /*state*/) {}
};

} // namespace cw
