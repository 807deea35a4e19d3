#include "cw/events/WindowEvent.hpp"

namespace cw {

const char* mouseWindowEventKindName(MouseWindowEvent::Kind k) {
  switch (k) {
    case MouseWindowEvent::Kind::Click: return "Click";
    case MouseWindowEvent::Kind::MouseDown: return "MouseDown";
    case MouseWindowEvent::Kind::MouseUp: return "MouseUp";
  }
  return "?";
}

const char* webRenderDebugOptionName(WebRenderDebugOption o) {
  switch (o) {
    case WebRenderDebugOption::Profiler: return "Profiler";
    case WebRenderDebugOption::TextureCacheDebug: return "TextureCacheDebug";
    case WebRenderDebugOption::RenderTargetDebug: return "RenderTargetDebug";
  }
  return "?";
}

const char* animationStateName(AnimationState s) {
  switch (s) {
    case AnimationState::Idle: return "Idle";
    case AnimationState::Animating: return "Animating";
  }
  return "?";
}

namespace {

// No catch-all overload: a new variant without a label fails to compile.
struct LabelVisitor {
  const char* operator()(const ev::Idle&) const { return "Idle"; }
  const char* operator()(const ev::Refresh&) const { return "Refresh"; }
  const char* operator()(const ev::Resize&) const { return "Resize"; }
  const char* operator()(const ev::TouchpadPressure&) const { return "TouchpadPressure"; }
  const char* operator()(const ev::LoadUrl&) const { return "LoadUrl"; }
  const char* operator()(const ev::MouseWindowEventClass&) const { return "Mouse"; }
  const char* operator()(const ev::MouseWindowMoveEventClass&) const { return "MouseMove"; }
  const char* operator()(const ev::Touch&) const { return "Touch"; }
  const char* operator()(const ev::Scroll&) const { return "Scroll"; }
  const char* operator()(const ev::Zoom&) const { return "Zoom"; }
  const char* operator()(const ev::PinchZoom&) const { return "PinchZoom"; }
  const char* operator()(const ev::ResetZoom&) const { return "ResetZoom"; }
  const char* operator()(const ev::Navigation&) const { return "Navigation"; }
  const char* operator()(const ev::Quit&) const { return "Quit"; }
  const char* operator()(const ev::KeyEvent&) const { return "Key"; }
  const char* operator()(const ev::Reload&) const { return "Reload"; }
  const char* operator()(const ev::NewBrowser&) const { return "NewBrowser"; }
  const char* operator()(const ev::CloseBrowser&) const { return "CloseBrowser"; }
  const char* operator()(const ev::SelectBrowser&) const { return "SelectBrowser"; }
  const char* operator()(const ev::ToggleWebRenderDebug&) const { return "ToggleWebRenderDebug"; }
};

using CtxOpt = std::optional<TopLevelBrowsingContextId>;

struct ContextVisitor {
  CtxOpt operator()(const ev::Idle&) const { return std::nullopt; }
  CtxOpt operator()(const ev::Refresh&) const { return std::nullopt; }
  CtxOpt operator()(const ev::Resize&) const { return std::nullopt; }
  CtxOpt operator()(const ev::TouchpadPressure&) const { return std::nullopt; }
  CtxOpt operator()(const ev::LoadUrl& e) const { return e.ctx; }
  CtxOpt operator()(const ev::MouseWindowEventClass&) const { return std::nullopt; }
  CtxOpt operator()(const ev::MouseWindowMoveEventClass&) const { return std::nullopt; }
  CtxOpt operator()(const ev::Touch&) const { return std::nullopt; }
  CtxOpt operator()(const ev::Scroll&) const { return std::nullopt; }
  CtxOpt operator()(const ev::Zoom&) const { return std::nullopt; }
  CtxOpt operator()(const ev::PinchZoom&) const { return std::nullopt; }
  CtxOpt operator()(const ev::ResetZoom&) const { return std::nullopt; }
  CtxOpt operator()(const ev::Navigation& e) const { return e.ctx; }
  CtxOpt operator()(const ev::Quit&) const { return std::nullopt; }
  CtxOpt operator()(const ev::KeyEvent&) const { return std::nullopt; }
  CtxOpt operator()(const ev::Reload& e) const { return e.ctx; }
  CtxOpt operator()(const ev::NewBrowser&) const { return std::nullopt; }
  CtxOpt operator()(const ev::CloseBrowser& e) const { return e.ctx; }
  CtxOpt operator()(const ev::SelectBrowser& e) const { return e.ctx; }
  CtxOpt operator()(const ev::ToggleWebRenderDebug&) const { return std::nullopt; }
};

} // namespace

const char* eventLabel(const WindowEvent& e) noexcept {
  // valueless_by_exception can only follow a throwing move; label it anyway.
  if (e.valueless_by_exception()) return "Invalid";
  return std::visit(LabelVisitor{}, e);
}

std::optional<TopLevelBrowsingContextId> browsingContextOf(const WindowEvent& e) {
  if (e.valueless_by_exception()) return std::nullopt;
  return std::visit(ContextVisitor{}, e);
}

} // namespace cw
