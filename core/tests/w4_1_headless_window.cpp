// W4.1: HeadlessWindow geometry, window control, chrome notifications

#include "cw/platform/HeadlessWindow.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool approx(float a, float b, float eps = 1e-3f) {
  return std::fabs(a - b) < eps;
}

namespace {

class FailingGl : public cw::GlApi {
public:
  bool makeCurrent() override { return false; }
  void* getProcAddress(const char*) const override { return nullptr; }
  int version() const override { return 0; }
  void finish() override {}
};

// Records the target sizes asked of it and the order of calls.
class TargetGl : public cw::GlApi {
public:
  bool makeCurrent() override {
    calls.push_back("current");
    return true;
  }
  void* getProcAddress(const char*) const override { return nullptr; }
  int version() const override { return 0; }
  void finish() override {}
  bool resizeTarget(int width, int height) override {
    calls.push_back("resize " + std::to_string(width) + "x" + std::to_string(height));
    return !failResize;
  }

  std::vector<std::string> calls;
  bool failResize{false};
};

// Drains the queue, returning the last Resize seen (or 0x0).
cw::DeviceUintSize lastResize(cw::EventQueue& q, std::size_t* resizeCount = nullptr) {
  cw::DeviceUintSize out;
  std::size_t n = 0;
  for (auto& e : q.drain()) {
    if (const auto* r = std::get_if<cw::ev::Resize>(&e)) {
      out = r->size;
      ++n;
    }
  }
  if (resizeCount) *resizeCount = n;
  return out;
}

cw::WindowConfig testConfig() {
  cw::WindowConfig cfg;
  cfg.width = 400;
  cfg.height = 300;
  cfg.hidpiFactor = 2.0f;
  cfg.screenWidth = 1920;
  cfg.screenHeight = 1080;
  return cfg;
}

} // namespace

int main() {
  using namespace cw;
  TopLevelBrowsingContextId ctx{1};

  // ---- Test 1: framebuffer = size * hidpi ----
  {
    auto q = std::make_shared<EventQueue>();
    HeadlessWindow win(testConfig(), q);

    DeviceUintSize fb = win.framebufferSize();
    WindowSize s = win.size();
    requireTrue(fb.width == 800 && fb.height == 600, "framebuffer 800x600");
    requireTrue(approx(s.width, 400.0f) && approx(s.height, 300.0f), "size 400x300");
    requireTrue(approx(win.hidpiFactor().value, 2.0f), "hidpi 2");
    requireTrue(std::fabs(s.width * win.hidpiFactor().value - static_cast<float>(fb.width)) <= 1.0f,
                "width consistent");

    DeviceUintRect r = win.windowRect();
    requireTrue(r.origin.x == 0 && r.origin.y == 0, "rect at origin");
    requireTrue(r.size == fb, "rect covers framebuffer");

    WindowConfig plain;
    HeadlessWindow dflt(plain, q);
    requireTrue(approx(dflt.hidpiFactor().value, 1.0f), "hidpi 0 in config -> 1");
    std::printf("  Test 1 (geometry): PASS\n");
  }

  // ---- Test 2: setInnerSize in device pixels, clamped to screen ----
  {
    auto q = std::make_shared<EventQueue>();
    HeadlessWindow win(testConfig(), q);

    win.setInnerSize(ctx, UintSize{1000, 500});
    DeviceUintSize fb = win.framebufferSize();
    requireTrue(fb.width == 1000 && fb.height == 500, "resized to 1000x500");
    requireTrue(approx(win.size().width, 500.0f), "size follows in dip");
    DeviceUintSize pushed = lastResize(*q);
    requireTrue(pushed.width == 1000 && pushed.height == 500, "Resize event carries device size");

    win.setInnerSize(ctx, UintSize{5000, 5000});
    fb = win.framebufferSize();
    requireTrue(fb.width == 1920 && fb.height == 1080, "clamped to screen");

    auto [outer, pos] = win.clientWindow(ctx);
    requireTrue(outer.width == 1920 && outer.height == 1080, "clientWindow size");
    requireTrue(pos.x == 0 && pos.y == 0, "clientWindow position");
    std::printf("  Test 2 (setInnerSize): PASS\n");
  }

  // ---- Test 3: setPosition keeps the window on screen ----
  {
    auto q = std::make_shared<EventQueue>();
    HeadlessWindow win(testConfig(), q);
    win.setInnerSize(ctx, UintSize{1000, 500});

    win.setPosition(ctx, IntPoint{-10, 99999});
    requireTrue(win.position().x == 0, "x clamped to 0");
    requireTrue(win.position().y == 1080 - 500, "y clamped to screen bottom");

    win.setPosition(ctx, IntPoint{100, 200});
    requireTrue(win.position().x == 100 && win.position().y == 200, "in-range position kept");
    requireTrue(win.clientWindow(ctx).second.x == 100, "clientWindow reports position");
    std::printf("  Test 3 (setPosition): PASS\n");
  }

  // ---- Test 4: fullscreen restores the windowed size ----
  {
    auto q = std::make_shared<EventQueue>();
    HeadlessWindow win(testConfig(), q);
    win.setInnerSize(ctx, UintSize{800, 600});
    lastResize(*q);

    win.setFullscreenState(ctx, true);
    requireTrue(win.isFullscreen(), "fullscreen");
    DeviceUintSize fb = win.framebufferSize();
    requireTrue(fb.width == 1920 && fb.height == 1080, "fills screen");

    std::size_t resizes = 0;
    win.setInnerSize(ctx, UintSize{640, 480});
    lastResize(*q, &resizes);
    requireTrue(resizes == 1, "only the fullscreen Resize was queued");
    requireTrue(win.framebufferSize().width == 1920, "inner size deferred while fullscreen");

    win.setFullscreenState(ctx, true);
    lastResize(*q, &resizes);
    requireTrue(resizes == 0, "no-op state change pushes nothing");

    win.setFullscreenState(ctx, false);
    fb = win.framebufferSize();
    requireTrue(!win.isFullscreen(), "windowed");
    requireTrue(fb.width == 640 && fb.height == 480, "restored to the deferred size");
    DeviceUintSize pushed = lastResize(*q);
    requireTrue(pushed.width == 640 && pushed.height == 480, "Resize on restore");
    std::printf("  Test 4 (fullscreen): PASS\n");
  }

  // ---- Test 5: hidpi change keeps the dip size ----
  {
    auto q = std::make_shared<EventQueue>();
    HeadlessWindow win(testConfig(), q);
    win.setHidpiFactor(1.5f);
    requireTrue(approx(win.size().width, 400.0f), "dip width unchanged");
    DeviceUintSize fb = win.framebufferSize();
    requireTrue(fb.width == 600 && fb.height == 450, "framebuffer follows factor");
    DeviceUintSize pushed = lastResize(*q);
    requireTrue(pushed.width == 600 && pushed.height == 450, "Resize pushed");

    win.setHidpiFactor(0.0f);
    requireTrue(approx(win.hidpiFactor().value, 1.5f), "non-positive factor ignored");

    win.resize(100, 50);
    fb = win.framebufferSize();
    requireTrue(fb.width == 150 && fb.height == 75, "resize() takes dip");

    HeadlessWindow full(testConfig(), q);
    full.setFullscreenState(ctx, true);
    full.setHidpiFactor(3.0f);
    fb = full.framebufferSize();
    requireTrue(fb.width == 1920 && fb.height == 1080, "fullscreen framebuffer stays on screen");
    requireTrue(approx(full.size().width, 640.0f), "dip size shrinks to fit");
    std::printf("  Test 5 (hidpi): PASS\n");
  }

  // ---- Test 6: composite preparation ----
  {
    auto q = std::make_shared<EventQueue>();
    HeadlessWindow win(testConfig(), q);
    DeviceUintSize fb = win.framebufferSize();

    requireTrue(win.prepareForComposite(fb.width, fb.height), "ready");
    win.present();
    requireTrue(win.presentCount() == 1, "present counted");

    requireTrue(!win.prepareForComposite(0, fb.height), "zero width refused");

    win.setMinimized(true);
    requireTrue(win.isMinimized(), "minimized");
    requireTrue(!win.prepareForComposite(fb.width, fb.height), "minimized refuses");
    requireTrue(win.refusedCompositeCount() == 2, "refusals counted");

    q->drain();
    win.setMinimized(false);
    auto pending = q->drain();
    requireTrue(pending.size() == 1 && std::holds_alternative<ev::Refresh>(pending[0]),
                "restoring asks for a redraw");

    HeadlessWindow broken(testConfig(), q, std::make_shared<FailingGl>());
    requireTrue(!broken.prepareForComposite(fb.width, fb.height), "makeCurrent failure refuses");

    auto target = std::make_shared<TargetGl>();
    HeadlessWindow sized(testConfig(), q, target);
    requireTrue(sized.prepareForComposite(640, 480), "sized target ready");
    requireTrue(target->calls.size() == 2, "resize then bind");
    requireTrue(target->calls[0] == "resize 640x480", "target sized to the request");
    requireTrue(target->calls[1] == "current", "bound after resize");

    target->failResize = true;
    std::size_t refusedBefore = sized.refusedCompositeCount();
    requireTrue(!sized.prepareForComposite(800, 600), "target resize failure refuses");
    requireTrue(sized.refusedCompositeCount() == refusedBefore + 1, "resize failure counted");
    requireTrue(target->calls.back() == "resize 800x600", "no bind after failed resize");
    std::printf("  Test 6 (composite): PASS\n");
  }

  // ---- Test 7: GL handle outlives the window ----
  {
    auto q = std::make_shared<EventQueue>();
    std::shared_ptr<GlApi> gl;
    {
      auto win = std::make_unique<HeadlessWindow>(testConfig(), q);
      gl = win->gl();
      requireTrue(gl.use_count() == 2, "shared between window and holder");
      requireTrue(win->gl() == gl, "same handle every call");
    }
    requireTrue(gl.use_count() == 1, "holder keeps it alive");
    requireTrue(gl->makeCurrent(), "still usable");
    requireTrue(gl->version() == 0, "null GL reports no version");
    std::printf("  Test 7 (gl lifetime): PASS\n");
  }

  // ---- Test 8: chrome notifications keep their order ----
  {
    auto q = std::make_shared<EventQueue>();
    HeadlessWindow win(testConfig(), q);

    win.loadStart(ctx);
    win.setPageTitle(ctx, std::string("Servo"));
    win.headParsed(ctx);
    win.status(ctx, std::nullopt);
    win.historyChanged(ctx, {LoadData{"https://a.test/", "GET", std::nullopt},
                             LoadData{"https://b.test/", "GET", Url("https://a.test/")}}, 1);
    win.setFavicon(ctx, "https://b.test/favicon.ico");
    win.loadError(ctx, NetError::NameNotResolved, "https://c.test/");
    win.loadEnd(ctx);
    win.handleKey(ctx, U'x', Key::X, KeyModifiers{});

    auto events = win.drainChromeEvents();
    requireTrue(events.size() == 9, "nine notifications");
    requireTrue(std::holds_alternative<chrome::LoadStarted>(events[0]), "LoadStarted first");
    const auto* t = std::get_if<chrome::TitleChanged>(&events[1]);
    requireTrue(t && t->title && *t->title == "Servo", "title");
    requireTrue(std::holds_alternative<chrome::HeadParsed>(events[2]), "HeadParsed");
    const auto* st = std::get_if<chrome::StatusChanged>(&events[3]);
    requireTrue(st && !st->text, "status cleared");
    const auto* h = std::get_if<chrome::HistoryChanged>(&events[4]);
    requireTrue(h && h->entries.size() == 2 && h->current == 1, "history");
    requireTrue(h->entries[1].referrerUrl && *h->entries[1].referrerUrl == "https://a.test/", "referrer");
    requireTrue(std::holds_alternative<chrome::FaviconChanged>(events[5]), "favicon");
    const auto* f = std::get_if<chrome::LoadFailed>(&events[6]);
    requireTrue(f && f->code == NetError::NameNotResolved && f->url == "https://c.test/", "load error");
    requireTrue(std::holds_alternative<chrome::LoadEnded>(events[7]), "LoadEnded");
    const auto* k = std::get_if<chrome::KeyHandled>(&events[8]);
    requireTrue(k && k->key == Key::X && k->ch && *k->ch == U'x', "unconsumed key");

    ChromeEvent none;
    requireTrue(!win.pollChromeEvent(none), "queue drained");
    std::printf("  Test 8 (chrome events): PASS\n");
  }

  // ---- Test 9: cursor, clipboard, animation, waker ----
  {
    auto q = std::make_shared<EventQueue>();
    WindowConfig cfg = testConfig();
    cfg.supportsClipboard = false;
    HeadlessWindow win(cfg, q);

    requireTrue(win.cursor() == Cursor::Default, "default cursor");
    win.setCursor(Cursor::Pointer);
    requireTrue(win.cursor() == Cursor::Pointer, "cursor stored");
    requireTrue(!win.supportsClipboard(), "clipboard from config");

    win.setAnimationState(AnimationState::Animating);
    requireTrue(win.animationState() == AnimationState::Animating, "animation state stored");

    q->signal()->consume();
    auto waker = win.createEventLoopWaker();
    waker->wake();
    requireTrue(q->signal()->consume(), "window waker signals the queue's loop");
    requireTrue(q->empty(), "waking enqueues nothing");
    std::printf("  Test 9 (misc): PASS\n");
  }

  // ---- Test 10: producer helpers ----
  {
    auto q = std::make_shared<EventQueue>();
    HeadlessWindow win(testConfig(), q);

    auto rx = win.openBrowser("https://servo.org/");
    requireTrue(win.requestRefresh(), "refresh queued");
    requireTrue(win.injectEvent(ev::Zoom{1.2f}), "event injected");
    requireTrue(win.requestQuit(), "quit queued");

    auto pending = q->drain();
    requireTrue(pending.size() == 4, "four events");
    auto* nb = std::get_if<ev::NewBrowser>(&pending[0]);
    requireTrue(nb && nb->url == "https://servo.org/", "NewBrowser first");
    requireTrue(nb->reply.send(TopLevelBrowsingContextId{5}), "reply");
    TopLevelBrowsingContextId id;
    requireTrue(rx.tryRecv(id) == RecvStatus::Ok && id.value == 5, "openBrowser receiver");
    requireTrue(isQuit(pending[3]), "Quit last");

    HeadlessWindow detached(testConfig(), nullptr);
    requireTrue(!detached.requestRefresh(), "no queue, nothing pushed");
    detached.createEventLoopWaker()->wake();
    std::printf("  Test 10 (producer side): PASS\n");
  }

  std::printf("\nAll W4.1 tests passed.\n");
  return 0;
}
