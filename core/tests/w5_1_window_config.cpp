// W5.1: WindowConfig JSON round-trip and loop settings

#include "cw/compositor/CompositorLoop.hpp"
#include "cw/window/WindowConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  using namespace cw;

  // ---- Test 1: defaults ----
  {
    WindowConfig cfg;
    requireTrue(cfg.title == "CompWin", "default title");
    requireTrue(cfg.width == 1024 && cfg.height == 768, "default size");
    requireTrue(cfg.hidpiFactor == 0.0f, "platform hidpi by default");
    requireTrue(cfg.navigationTimeoutMs == 5000, "navigation timeout");
    requireTrue(!cfg.allowNavigationOnTimeout, "deny on timeout");
    requireTrue(cfg.supportsClipboard, "clipboard on");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: serialize layout ----
  {
    std::string json = serializeWindowConfig(WindowConfig{});
    requireTrue(json.find("\"title\":\"CompWin\"") != std::string::npos, "title field");
    requireTrue(json.find("\"screen\":{") != std::string::npos, "nested screen");
    requireTrue(json.find("\"navigation\":{") != std::string::npos, "nested navigation");
    std::printf("  Test 2 (layout): PASS\n");
  }

  // ---- Test 3: round-trip ----
  {
    WindowConfig original;
    original.title = "Browser \"One\"";
    original.width = 1280;
    original.height = 720;
    original.hidpiFactor = 1.5f;
    original.screenWidth = 2560;
    original.screenHeight = 1440;
    original.fullscreen = true;
    original.supportsClipboard = false;
    original.animatingPollIntervalMs = 8;
    original.navigationTimeoutMs = 250;
    original.allowNavigationOnTimeout = true;
    original.traceEvents = true;

    WindowConfig restored;
    requireTrue(deserializeWindowConfig(serializeWindowConfig(original), restored), "parse");
    requireTrue(restored.title == original.title, "title");
    requireTrue(restored.width == 1280 && restored.height == 720, "size");
    requireTrue(std::fabs(restored.hidpiFactor - 1.5f) < 1e-6f, "hidpi");
    requireTrue(restored.screenWidth == 2560 && restored.screenHeight == 1440, "screen");
    requireTrue(restored.fullscreen && !restored.supportsClipboard, "flags");
    requireTrue(restored.animatingPollIntervalMs == 8, "poll interval");
    requireTrue(restored.navigationTimeoutMs == 250 && restored.allowNavigationOnTimeout, "navigation");
    requireTrue(restored.traceEvents, "trace");
    std::printf("  Test 3 (round-trip): PASS\n");
  }

  // ---- Test 4: partial and invalid input ----
  {
    WindowConfig cfg;
    requireTrue(deserializeWindowConfig(R"({"width":640,"navigation":{"timeoutMs":100}})", cfg),
                "partial parse");
    requireTrue(cfg.width == 640 && cfg.height == 768, "missing members keep defaults");
    requireTrue(cfg.navigationTimeoutMs == 100 && !cfg.allowNavigationOnTimeout, "partial nested");

    WindowConfig wrong;
    requireTrue(deserializeWindowConfig(R"({"width":"wide","animatingPollIntervalMs":-5,"hidpiFactor":-1})", wrong),
                "wrong types tolerated");
    requireTrue(wrong.width == 1024, "string width ignored");
    requireTrue(wrong.animatingPollIntervalMs == 16, "negative interval ignored");
    requireTrue(wrong.hidpiFactor == 0.0f, "negative hidpi ignored");

    WindowConfig bad;
    requireTrue(!deserializeWindowConfig("{not json", bad), "malformed rejected");
    requireTrue(!deserializeWindowConfig("[1,2]", bad), "non-object rejected");
    std::printf("  Test 4 (partial/invalid): PASS\n");
  }

  // ---- Test 5: files ----
  {
    WindowConfig cfg;
    requireTrue(!loadWindowConfigFile("/nonexistent/compwin.json", cfg), "missing file");

    const char* path = "w5_1_window_config.json";
    {
      std::ofstream out(path);
      out << R"({"title":"From File","screen":{"width":800,"height":600}})";
    }
    requireTrue(loadWindowConfigFile(path, cfg), "load file");
    requireTrue(cfg.title == "From File", "title from file");
    requireTrue(cfg.screenWidth == 800 && cfg.screenHeight == 600, "screen from file");
    std::remove(path);
    std::printf("  Test 5 (files): PASS\n");
  }

  // ---- Test 6: loop settings derived from config ----
  {
    WindowConfig cfg;
    cfg.animatingPollIntervalMs = 33;
    cfg.traceEvents = true;
    CompositorLoopConfig lc = compositorLoopConfigFrom(cfg);
    requireTrue(lc.animatingPollInterval.count() == 33, "poll interval");
    requireTrue(lc.traceEvents, "trace flag");
    requireTrue(lc.firstContextId == 1, "ids start at 1");
    std::printf("  Test 6 (loop config): PASS\n");
  }

  std::printf("\nAll W5.1 tests passed.\n");
  return 0;
}
