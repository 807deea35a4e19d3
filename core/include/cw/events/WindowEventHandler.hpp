#pragma once
#include "cw/events/WindowEvent.hpp"

namespace cw {

// Consumer of the event taxonomy: one method per variant, no default.
// dispatchEvent() visits exhaustively, so a new variant breaks the build of
// every handler until it is handled.
class WindowEventHandler {
public:
  virtual ~WindowEventHandler() = default;

  virtual void onIdle(const ev::Idle& e) = 0;
  virtual void onRefresh(const ev::Refresh& e) = 0;
  virtual void onResize(const ev::Resize& e) = 0;
  virtual void onTouchpadPressure(const ev::TouchpadPressure& e) = 0;
  virtual void onLoadUrl(const ev::LoadUrl& e) = 0;
  virtual void onMouse(const ev::MouseWindowEventClass& e) = 0;
  virtual void onMouseMove(const ev::MouseWindowMoveEventClass& e) = 0;
  virtual void onTouch(const ev::Touch& e) = 0;
  virtual void onScroll(const ev::Scroll& e) = 0;
  virtual void onZoom(const ev::Zoom& e) = 0;
  virtual void onPinchZoom(const ev::PinchZoom& e) = 0;
  virtual void onResetZoom(const ev::ResetZoom& e) = 0;
  virtual void onNavigation(const ev::Navigation& e) = 0;
  virtual void onQuit(const ev::Quit& e) = 0;
  virtual void onKey(const ev::KeyEvent& e) = 0;
  virtual void onReload(const ev::Reload& e) = 0;
  // Mutable: a handler driving the registry itself may send on e.reply.
  virtual void onNewBrowser(ev::NewBrowser& e) = 0;
  virtual void onCloseBrowser(const ev::CloseBrowser& e) = 0;
  virtual void onSelectBrowser(const ev::SelectBrowser& e) = 0;
  virtual void onToggleWebRenderDebug(const ev::ToggleWebRenderDebug& e) = 0;
};

void dispatchEvent(WindowEvent& event, WindowEventHandler& handler);

} // namespace cw
