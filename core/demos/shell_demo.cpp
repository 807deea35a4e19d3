// Shell demo: one browser window driven by the reference compositor loop.
// GLFW: interactive window, keys go through WindowMethods::handleKey
// Headless fallback: scripted session on a producer thread (OSMesa GL if available)

#include "cw/compositor/CompositorLoop.hpp"
#include "cw/events/EventTrace.hpp"
#include "cw/platform/HeadlessWindow.hpp"
#include "cw/window/NavigationGate.hpp"
#include "cw/window/WindowConfig.hpp"

#ifdef CW_HAS_GLFW
#include "cw/platform/GlfwWindow.hpp"
#endif
#ifdef CW_HAS_OSMESA
#include "cw/platform/OsMesaGlApi.hpp"
#endif

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace {

// Logs what a compositor would act on and hands unconsumed keys back to the
// window, the way a page that ignores a key lets browser shortcuts run.
class ShellHandler : public cw::WindowEventHandler {
public:
  void attach(cw::CompositorLoop* loop) { loop_ = loop; }

  void onIdle(const cw::ev::Idle&) override {}
  void onRefresh(const cw::ev::Refresh&) override { ++frames_; }
  void onResize(const cw::ev::Resize& e) override {
    std::printf("resize %ux%u\n", e.size.width, e.size.height);
  }
  void onTouchpadPressure(const cw::ev::TouchpadPressure&) override {}
  void onLoadUrl(const cw::ev::LoadUrl& e) override {
    std::printf("ctx=%llu load %s\n", static_cast<unsigned long long>(e.ctx.value), e.url.c_str());
    if (!loop_) return;
    auto d = cw::requestNavigation(loop_->window(), e.ctx, e.url, policy_);
    std::printf("  navigation %s (%s)\n", d.allowed ? "allowed" : "denied",
                cw::navigationOutcomeName(d.outcome));
    if (!d.allowed) return;
    loop_->window().loadStart(e.ctx);
    loop_->window().setPageTitle(e.ctx, e.url);
    loop_->window().loadEnd(e.ctx);
  }
  void onMouse(const cw::ev::MouseWindowEventClass& e) override {
    std::printf("mouse %s %s (%.1f, %.1f)\n", cw::mouseWindowEventKindName(e.event.kind),
                cw::mouseButtonName(e.event.button), e.event.point.x, e.event.point.y);
  }
  void onMouseMove(const cw::ev::MouseWindowMoveEventClass&) override {}
  void onTouch(const cw::ev::Touch&) override {}
  void onScroll(const cw::ev::Scroll& e) override {
    std::printf("scroll %s\n", cw::eventToJson(e).c_str());
  }
  void onZoom(const cw::ev::Zoom& e) override { std::printf("zoom x%.2f\n", e.magnification); }
  void onPinchZoom(const cw::ev::PinchZoom& e) override {
    std::printf("pinch x%.2f\n", e.magnification);
  }
  void onResetZoom(const cw::ev::ResetZoom&) override { std::printf("zoom reset\n"); }
  void onNavigation(const cw::ev::Navigation& e) override {
    std::printf("ctx=%llu %s %zu\n", static_cast<unsigned long long>(e.ctx.value),
                cw::traversalDirectionName(e.direction.kind), e.direction.steps);
  }
  void onQuit(const cw::ev::Quit&) override { std::printf("quit after %zu frames\n", frames_); }
  void onKey(const cw::ev::KeyEvent& e) override {
    if (!loop_ || e.state == cw::KeyState::Released) return;
    loop_->window().handleKey(loop_->registry().visible(), e.ch, e.key, e.modifiers);
  }
  void onReload(const cw::ev::Reload& e) override {
    std::printf("ctx=%llu reload\n", static_cast<unsigned long long>(e.ctx.value));
  }
  void onNewBrowser(cw::ev::NewBrowser& e) override { std::printf("new browser %s\n", e.url.c_str()); }
  void onCloseBrowser(const cw::ev::CloseBrowser& e) override {
    std::printf("ctx=%llu closed\n", static_cast<unsigned long long>(e.ctx.value));
  }
  void onSelectBrowser(const cw::ev::SelectBrowser& e) override {
    std::printf("ctx=%llu selected\n", static_cast<unsigned long long>(e.ctx.value));
  }
  void onToggleWebRenderDebug(const cw::ev::ToggleWebRenderDebug& e) override {
    std::printf("debug %s\n", cw::webRenderDebugOptionName(e.option));
  }

  void setPolicy(const cw::NavigationPolicy& p) { policy_ = p; }

private:
  cw::CompositorLoop* loop_{nullptr};
  cw::NavigationPolicy policy_;
  std::size_t frames_{0};
};

constexpr const char* kHomePage = "https://servo.org/";

int runHeadless(const cw::WindowConfig& cfg, ShellHandler& handler) {
  auto queue = std::make_shared<cw::EventQueue>();
  std::shared_ptr<cw::GlApi> gl;
#ifdef CW_HAS_OSMESA
  auto mesa = std::make_shared<cw::OsMesaGlApi>();
  float scale = cfg.hidpiFactor > 0.0f ? cfg.hidpiFactor : 1.0f;
  if (mesa->init(static_cast<int>(static_cast<float>(cfg.width) * scale),
                 static_cast<int>(static_cast<float>(cfg.height) * scale))) {
    gl = mesa;
  } else {
    std::fprintf(stderr, "OSMesa unavailable, compositing without GL\n");
  }
#endif

  auto window = std::make_unique<cw::HeadlessWindow>(cfg, queue, gl);
  cw::HeadlessWindow* hw = window.get();
  hw->setNavigationFilter([](cw::TopLevelBrowsingContextId, const cw::Url& url) {
    return url.rfind("https://", 0) == 0;
  });

  cw::CompositorLoop loop(std::move(window), queue, handler, cw::compositorLoopConfigFrom(cfg));
  handler.attach(&loop);

  std::thread script([hw]() {
    auto send = [hw](cw::WindowEvent e) {
      if (!hw->injectEvent(std::move(e))) std::fprintf(stderr, "script: event refused\n");
    };

    auto rx = hw->openBrowser(kHomePage);
    cw::TopLevelBrowsingContextId ctx;
    if (rx.recvFor(ctx, std::chrono::seconds(1)) != cw::RecvStatus::Ok) {
      std::fprintf(stderr, "no browser id, giving up\n");
      send(cw::ev::Quit{});
      return;
    }
    send(cw::ev::LoadUrl{ctx, kHomePage});
    hw->resize(800, 600);
    send(cw::ev::Refresh{});
    send(cw::ev::MouseWindowEventClass{
        {cw::MouseWindowEvent::Kind::Click, cw::MouseButton::Left, {10.0f, 10.0f}}});
    send(cw::ev::Scroll{cw::ScrollLocation::byDelta(0.0f, -38.0f), {10, 10},
                        cw::TouchEventType::Move});
    send(cw::ev::LoadUrl{ctx, "http://insecure.test/"});
    send(cw::ev::KeyEvent{std::nullopt, cw::Key::F5, cw::KeyState::Pressed, {}});
    send(cw::ev::CloseBrowser{ctx});
    send(cw::ev::Quit{});
  });

  loop.run();
  script.join();

  for (const auto& c : hw->drainChromeEvents()) {
    if (const auto* t = std::get_if<cw::chrome::TitleChanged>(&c)) {
      std::printf("chrome: title %s\n", t->title ? t->title->c_str() : "(none)");
    } else if (const auto* k = std::get_if<cw::chrome::KeyHandled>(&c)) {
      std::printf("chrome: key %s\n", cw::keyName(k->key));
    }
  }

  const auto& s = loop.stats();
  std::printf("dispatched=%zu rejected=%zu composites=%zu presents=%zu\n",
              s.dispatched, s.rejected, s.composites, hw->presentCount());
  return 0;
}

#ifdef CW_HAS_GLFW
int runGlfw(const cw::WindowConfig& cfg, ShellHandler& handler) {
  auto queue = std::make_shared<cw::EventQueue>();
  auto window = std::make_unique<cw::GlfwWindow>(queue);
  if (!window->init(cfg)) return -1;
  cw::GlfwWindow* gw = window.get();

  cw::CompositorLoop loop(std::move(window), queue, handler, cw::compositorLoopConfigFrom(cfg));
  handler.attach(&loop);

  auto [tx, rx] = cw::makeOneShot<cw::TopLevelBrowsingContextId>();
  if (!queue->push(cw::ev::NewBrowser{kHomePage, std::move(tx)})) return 1;
  loop.drainPending();

  cw::TopLevelBrowsingContextId ctx;
  if (rx.tryRecv(ctx) != cw::RecvStatus::Ok || !queue->push(cw::ev::LoadUrl{ctx, kHomePage})) {
    return 1;
  }

  while (!loop.quitRequested()) {
    gw->pumpEvents();
    loop.drainPending();
  }
  return 0;
}
#endif

} // namespace

int main(int argc, char** argv) {
  cw::WindowConfig cfg;
  if (argc > 1 && !cw::loadWindowConfigFile(argv[1], cfg)) {
    return 1;
  }

  ShellHandler handler;
  handler.setPolicy(cw::NavigationPolicy{std::chrono::milliseconds(cfg.navigationTimeoutMs),
                                         cfg.allowNavigationOnTimeout});

#ifdef CW_HAS_GLFW
  int rc = runGlfw(cfg, handler);
  if (rc >= 0) return rc;
  std::fprintf(stderr, "GLFW window unavailable, running headless\n");
#endif
  return runHeadless(cfg, handler);
}
