#pragma once
#include "cw/geometry/Units.hpp"
#include "cw/ids/BrowsingContextId.hpp"
#include "cw/input/InputTypes.hpp"
#include "cw/net/LoadData.hpp"
#include "cw/sync/OneShot.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

namespace cw {

struct MouseWindowEvent {
  enum class Kind : std::uint8_t { Click, MouseDown, MouseUp };

  Kind kind{Kind::Click};
  MouseButton button{MouseButton::Left};
  DevicePoint point;
};

// Renderer diagnostics that can be toggled at runtime.
enum class WebRenderDebugOption : std::uint8_t {
  Profiler,
  TextureCacheDebug,
  RenderTargetDebug
};

// Whether the compositor is producing frames continuously. The host uses it
// to choose between blocking for input and polling at the refresh rate.
enum class AnimationState : std::uint8_t { Idle, Animating };

const char* mouseWindowEventKindName(MouseWindowEvent::Kind k);
const char* webRenderDebugOptionName(WebRenderDebugOption o);
const char* animationStateName(AnimationState s);

// Events the windowing system sends to the compositor.
namespace ev {

// The loop was woken but no message arrived (e.g. kicked by another subsystem).
struct Idle {};

// Part of the window needs a redraw. The host makes its rendering context
// current before compositing proceeds.
struct Refresh {};

struct Resize {
  DeviceUintSize size;
};

struct TouchpadPressure {
  DevicePoint point;
  float pressure{0.0f};  // 0..1
  TouchpadPressurePhase phase{TouchpadPressurePhase::BeforeClick};
};

struct LoadUrl {
  TopLevelBrowsingContextId ctx;
  Url url;
};

// Mouse action that needs a hit test.
struct MouseWindowEventClass {
  MouseWindowEvent event;
};

struct MouseWindowMoveEventClass {
  DevicePoint point;
};

struct Touch {
  TouchEventType type{TouchEventType::Down};
  TouchId id{0};
  DevicePoint point;
};

// `origin` tells a scroll start apart from a continuation.
struct Scroll {
  ScrollLocation location;
  DeviceIntPoint origin;
  TouchEventType type{TouchEventType::Move};
};

struct Zoom {
  float magnification{1.0f};
};

// Synthesized pinch zoom for non-touch input (ctrl + wheel).
struct PinchZoom {
  float magnification{1.0f};
};

struct ResetZoom {};

struct Navigation {
  TopLevelBrowsingContextId ctx;
  TraversalDirection direction;
};

// Terminal: nothing is enqueued after it.
struct Quit {};

struct KeyEvent {
  std::optional<char32_t> ch;  // absent for non-printable keys
  Key key{Key::Unknown};
  KeyState state{KeyState::Pressed};
  KeyModifiers modifiers;
};

struct Reload {
  TopLevelBrowsingContextId ctx;
};

// Exactly one id is delivered on `reply`.
struct NewBrowser {
  Url url;
  OneShotSender<TopLevelBrowsingContextId> reply;
};

struct CloseBrowser {
  TopLevelBrowsingContextId ctx;
};

// Shows `ctx`; the previously visible context is hidden, not destroyed.
struct SelectBrowser {
  TopLevelBrowsingContextId ctx;
};

struct ToggleWebRenderDebug {
  WebRenderDebugOption option{WebRenderDebugOption::Profiler};
};

} // namespace ev

// Move-only (NewBrowser owns its reply sender): built once by the backend,
// consumed once by the compositor loop.
using WindowEvent = std::variant<
  ev::Idle,
  ev::Refresh,
  ev::Resize,
  ev::TouchpadPressure,
  ev::LoadUrl,
  ev::MouseWindowEventClass,
  ev::MouseWindowMoveEventClass,
  ev::Touch,
  ev::Scroll,
  ev::Zoom,
  ev::PinchZoom,
  ev::ResetZoom,
  ev::Navigation,
  ev::Quit,
  ev::KeyEvent,
  ev::Reload,
  ev::NewBrowser,
  ev::CloseBrowser,
  ev::SelectBrowser,
  ev::ToggleWebRenderDebug>;

inline constexpr std::size_t kWindowEventKindCount = std::variant_size_v<WindowEvent>;

// Short diagnostic label ("Resize", "Mouse", ...). Depends on the variant
// only; payload is never read.
const char* eventLabel(const WindowEvent& e) noexcept;

// Context an event refers to, if it names one. NewBrowser names none: its id
// does not exist yet.
std::optional<TopLevelBrowsingContextId> browsingContextOf(const WindowEvent& e);

inline bool isQuit(const WindowEvent& e) {
  return std::holds_alternative<ev::Quit>(e);
}

} // namespace cw
