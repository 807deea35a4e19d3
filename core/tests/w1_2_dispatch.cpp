// W1.2: exhaustive handler dispatch

#include "cw/events/WindowEventHandler.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

namespace {

class RecordingHandler : public cw::WindowEventHandler {
public:
  std::vector<std::string> calls;
  cw::DeviceUintSize lastResize;
  float lastZoom{0.0f};
  std::uint64_t nextId{100};

  void onIdle(const cw::ev::Idle&) override { calls.push_back("onIdle"); }
  void onRefresh(const cw::ev::Refresh&) override { calls.push_back("onRefresh"); }
  void onResize(const cw::ev::Resize& e) override {
    calls.push_back("onResize");
    lastResize = e.size;
  }
  void onTouchpadPressure(const cw::ev::TouchpadPressure&) override { calls.push_back("onTouchpadPressure"); }
  void onLoadUrl(const cw::ev::LoadUrl&) override { calls.push_back("onLoadUrl"); }
  void onMouse(const cw::ev::MouseWindowEventClass&) override { calls.push_back("onMouse"); }
  void onMouseMove(const cw::ev::MouseWindowMoveEventClass&) override { calls.push_back("onMouseMove"); }
  void onTouch(const cw::ev::Touch&) override { calls.push_back("onTouch"); }
  void onScroll(const cw::ev::Scroll&) override { calls.push_back("onScroll"); }
  void onZoom(const cw::ev::Zoom& e) override {
    calls.push_back("onZoom");
    lastZoom = e.magnification;
  }
  void onPinchZoom(const cw::ev::PinchZoom&) override { calls.push_back("onPinchZoom"); }
  void onResetZoom(const cw::ev::ResetZoom&) override { calls.push_back("onResetZoom"); }
  void onNavigation(const cw::ev::Navigation&) override { calls.push_back("onNavigation"); }
  void onQuit(const cw::ev::Quit&) override { calls.push_back("onQuit"); }
  void onKey(const cw::ev::KeyEvent&) override { calls.push_back("onKey"); }
  void onReload(const cw::ev::Reload&) override { calls.push_back("onReload"); }
  void onNewBrowser(cw::ev::NewBrowser& e) override {
    calls.push_back("onNewBrowser");
    if (!e.reply.send(cw::TopLevelBrowsingContextId{nextId++})) calls.push_back("replyRefused");
  }
  void onCloseBrowser(const cw::ev::CloseBrowser&) override { calls.push_back("onCloseBrowser"); }
  void onSelectBrowser(const cw::ev::SelectBrowser&) override { calls.push_back("onSelectBrowser"); }
  void onToggleWebRenderDebug(const cw::ev::ToggleWebRenderDebug&) override {
    calls.push_back("onToggleWebRenderDebug");
  }
};

} // namespace

int main() {
  using namespace cw;

  // ---- Test 1: every kind reaches its own method ----
  {
    RecordingHandler h;
    TopLevelBrowsingContextId ctx{1};

    std::vector<WindowEvent> events;
    events.emplace_back(ev::Idle{});
    events.emplace_back(ev::Refresh{});
    events.emplace_back(ev::Resize{{640, 480}});
    events.emplace_back(ev::TouchpadPressure{});
    events.emplace_back(ev::LoadUrl{ctx, "https://a.test/"});
    events.emplace_back(ev::MouseWindowEventClass{});
    events.emplace_back(ev::MouseWindowMoveEventClass{});
    events.emplace_back(ev::Touch{});
    events.emplace_back(ev::Scroll{});
    events.emplace_back(ev::Zoom{2.0f});
    events.emplace_back(ev::PinchZoom{});
    events.emplace_back(ev::ResetZoom{});
    events.emplace_back(ev::Navigation{ctx, {}});
    events.emplace_back(ev::Quit{});
    events.emplace_back(ev::KeyEvent{});
    events.emplace_back(ev::Reload{ctx});
    events.emplace_back(ev::NewBrowser{"about:blank", {}});
    events.emplace_back(ev::CloseBrowser{ctx});
    events.emplace_back(ev::SelectBrowser{ctx});
    events.emplace_back(ev::ToggleWebRenderDebug{});

    for (auto& e : events) dispatchEvent(e, h);

    const char* expected[] = {
      "onIdle", "onRefresh", "onResize", "onTouchpadPressure", "onLoadUrl",
      "onMouse", "onMouseMove", "onTouch", "onScroll", "onZoom", "onPinchZoom",
      "onResetZoom", "onNavigation", "onQuit", "onKey", "onReload",
      "onNewBrowser", "replyRefused", "onCloseBrowser", "onSelectBrowser",
      "onToggleWebRenderDebug"
    };
    requireTrue(h.calls.size() == sizeof(expected) / sizeof(expected[0]), "call count");
    for (std::size_t i = 0; i < h.calls.size(); ++i) {
      requireTrue(h.calls[i] == expected[i], "dispatch order and target");
    }
    requireTrue(h.lastResize.width == 640 && h.lastResize.height == 480, "payload delivered");
    requireTrue(h.lastZoom == 2.0f, "zoom payload delivered");
    std::printf("  Test 1 (exhaustive dispatch): PASS\n");
  }

  // ---- Test 2: handler may answer NewBrowser in place ----
  {
    RecordingHandler h;
    auto [tx, rx] = makeOneShot<TopLevelBrowsingContextId>();
    WindowEvent e = ev::NewBrowser{"https://b.test/", std::move(tx)};
    dispatchEvent(e, h);

    TopLevelBrowsingContextId id;
    requireTrue(rx.tryRecv(id) == RecvStatus::Ok, "reply delivered by handler");
    requireTrue(id.value == 100, "handler-chosen id");
    requireTrue(h.calls.size() == 1, "no refusal recorded");
    std::printf("  Test 2 (NewBrowser reply): PASS\n");
  }

  std::printf("\nAll W1.2 tests passed.\n");
  return 0;
}
