// W4.3: GlfwWindow shortcut keys before a native window exists

#include "cw/platform/GlfwWindow.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  using namespace cw;
  TopLevelBrowsingContextId ctx{1};

  // ---- Test 1: F11 without a window is a no-op ----
  {
    auto q = std::make_shared<EventQueue>();
    GlfwWindow win(q);
    win.handleKey(ctx, std::nullopt, Key::F11, KeyModifiers{});
    win.handleKey(std::nullopt, std::nullopt, Key::F11, KeyModifiers{});
    requireTrue(q->empty(), "nothing pushed");
    std::printf("  Test 1 (F11 no window): PASS\n");
  }

  // ---- Test 2: other shortcuts still reach the queue ----
  {
    auto q = std::make_shared<EventQueue>();
    GlfwWindow win(q);
    win.handleKey(ctx, std::nullopt, Key::F12, KeyModifiers{});
    win.handleKey(ctx, std::nullopt, Key::Escape, KeyModifiers{});
    auto pushed = q->drain();
    requireTrue(pushed.size() == 2, "two events");
    const auto* dbg = std::get_if<ev::ToggleWebRenderDebug>(&pushed[0]);
    requireTrue(dbg && dbg->option == WebRenderDebugOption::Profiler, "F12 toggles profiler");
    requireTrue(isQuit(pushed[1]), "Escape quits");
    std::printf("  Test 2 (shortcuts): PASS\n");
  }

  std::printf("\nAll W4.3 tests passed.\n");
  return 0;
}
