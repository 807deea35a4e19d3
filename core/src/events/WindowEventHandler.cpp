#include "cw/events/WindowEventHandler.hpp"

namespace cw {

namespace {

struct DispatchVisitor {
  WindowEventHandler& h;

  void operator()(ev::Idle& e) const { h.onIdle(e); }
  void operator()(ev::Refresh& e) const { h.onRefresh(e); }
  void operator()(ev::Resize& e) const { h.onResize(e); }
  void operator()(ev::TouchpadPressure& e) const { h.onTouchpadPressure(e); }
  void operator()(ev::LoadUrl& e) const { h.onLoadUrl(e); }
  void operator()(ev::MouseWindowEventClass& e) const { h.onMouse(e); }
  void operator()(ev::MouseWindowMoveEventClass& e) const { h.onMouseMove(e); }
  void operator()(ev::Touch& e) const { h.onTouch(e); }
  void operator()(ev::Scroll& e) const { h.onScroll(e); }
  void operator()(ev::Zoom& e) const { h.onZoom(e); }
  void operator()(ev::PinchZoom& e) const { h.onPinchZoom(e); }
  void operator()(ev::ResetZoom& e) const { h.onResetZoom(e); }
  void operator()(ev::Navigation& e) const { h.onNavigation(e); }
  void operator()(ev::Quit& e) const { h.onQuit(e); }
  void operator()(ev::KeyEvent& e) const { h.onKey(e); }
  void operator()(ev::Reload& e) const { h.onReload(e); }
  void operator()(ev::NewBrowser& e) const { h.onNewBrowser(e); }
  void operator()(ev::CloseBrowser& e) const { h.onCloseBrowser(e); }
  void operator()(ev::SelectBrowser& e) const { h.onSelectBrowser(e); }
  void operator()(ev::ToggleWebRenderDebug& e) const { h.onToggleWebRenderDebug(e); }
};

} // namespace

void dispatchEvent(WindowEvent& event, WindowEventHandler& handler) {
  if (event.valueless_by_exception()) return;
  std::visit(DispatchVisitor{handler}, event);
}

} // namespace cw
