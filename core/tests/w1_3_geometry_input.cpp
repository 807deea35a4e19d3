// W1.3: unit-tagged geometry, input vocabulary, context ids

#include "cw/geometry/Units.hpp"
#include "cw/ids/BrowsingContextId.hpp"
#include "cw/input/InputTypes.hpp"
#include "cw/net/LoadData.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool approx(float a, float b, float eps = 1e-4f) {
  return std::fabs(a - b) < eps;
}

static bool same(const char* a, const char* b) { return std::strcmp(a, b) == 0; }

int main() {
  using namespace cw;

  // ---- Test 1: density-independent -> device pixels ----
  {
    HiDpiFactor f{2.0f};
    WindowSize s{400.0f, 300.0f};
    auto px = f.transform(s);
    requireTrue(approx(px.width, 800.0f) && approx(px.height, 600.0f), "scale transform");

    DeviceUintSize fb = toDeviceUintSize(s, f);
    requireTrue(fb.width == 800 && fb.height == 600, "framebuffer = size * hidpi");

    DeviceUintSize rounded = toDeviceUintSize({100.3f, 100.7f}, HiDpiFactor{1.5f});
    requireTrue(rounded.width == 150 && rounded.height == 151, "rounds to nearest");

    DeviceUintSize clamped = toDeviceUintSize({-5.0f, NAN}, HiDpiFactor{1.0f});
    requireTrue(clamped.width == 0 && clamped.height == 0, "negative and NaN clamp to 0");
    requireTrue(clamped.isEmpty(), "zero size is empty");
    std::printf("  Test 1 (hidpi conversion): PASS\n");
  }

  // ---- Test 2: typed equality ----
  {
    DeviceUintSize a{10, 20}, b{10, 20}, c{20, 10};
    requireTrue(a == b, "sizes equal");
    requireTrue(a != c, "sizes differ");
    DevicePoint p{1.5f, 2.5f}, q{1.5f, 2.5f};
    requireTrue(p == q, "points equal");
    std::printf("  Test 2 (equality): PASS\n");
  }

  // ---- Test 3: modifiers ----
  {
    KeyModifiers none;
    requireTrue(none.empty(), "default modifiers empty");

    KeyModifiers m = KeyModifier::Control | KeyModifier::Shift;
    requireTrue(m.has(KeyModifier::Control), "has Control");
    requireTrue(m.has(KeyModifier::Shift), "has Shift");
    requireTrue(!m.has(KeyModifier::Alt), "no Alt");
    requireTrue((m | KeyModifier::Alt).has(KeyModifier::Alt), "or adds Alt");
    requireTrue(m == (KeyModifier::Shift | KeyModifier::Control), "order independent");
    std::printf("  Test 3 (modifiers): PASS\n");
  }

  // ---- Test 4: names ----
  {
    requireTrue(same(keyName(Key::Unknown), "Unknown"), "Unknown key");
    requireTrue(same(keyName(Key::A), "A"), "key A");
    requireTrue(same(keyName(Key::Num0), "Num0"), "key Num0");
    requireTrue(same(keyName(Key::Menu), "Menu"), "last key");
    requireTrue(same(cursorName(Cursor::Default), "default"), "default cursor");
    requireTrue(same(cursorName(Cursor::EwResize), "ew-resize"), "ew-resize cursor");
    requireTrue(same(cursorName(Cursor::ZoomOut), "zoom-out"), "last cursor");
    requireTrue(same(mouseButtonName(MouseButton::Middle), "Middle"), "mouse button");
    requireTrue(same(touchEventTypeName(TouchEventType::Cancel), "Cancel"), "touch type");
    requireTrue(same(scrollLocationKindName(ScrollLocation::end().kind), "End"), "scroll end");
    requireTrue(same(traversalDirectionName(TraversalDirection::Kind::Forward), "Forward"), "traversal");
    requireTrue(same(keyStateName(KeyState::Repeated), "Repeated"), "key state");
    requireTrue(same(netErrorName(NetError::NameNotResolved), "NAME_NOT_RESOLVED"), "net error");
    std::printf("  Test 4 (names): PASS\n");
  }

  // ---- Test 5: scroll locations ----
  {
    auto d = ScrollLocation::byDelta(3.0f, -38.0f);
    requireTrue(d.kind == ScrollLocation::Kind::Delta, "delta kind");
    requireTrue(approx(d.delta.y, -38.0f), "delta value");
    requireTrue(ScrollLocation::start().kind == ScrollLocation::Kind::Start, "start kind");
    std::printf("  Test 5 (scroll location): PASS\n");
  }

  // ---- Test 6: context ids ----
  {
    requireTrue(!kInvalidContextId.isValid(), "0 is invalid");
    requireTrue(parseBrowsingContextId("42").value == 42, "parse decimal");
    requireTrue(!parseBrowsingContextId("").isValid(), "empty parses invalid");

    bool threw = false;
    try {
      parseBrowsingContextId("4x");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    requireTrue(threw, "non-digit throws");

    requireTrue(parseBrowsingContextId("18446744073709551615").value == 18446744073709551615ull,
                "max uint64 parses");
    threw = false;
    try {
      parseBrowsingContextId("18446744073709551623");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    requireTrue(threw, "id past uint64 range throws instead of wrapping");
    threw = false;
    try {
      parseBrowsingContextId("100000000000000000000");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    requireTrue(threw, "21-digit id throws");

    std::unordered_set<TopLevelBrowsingContextId> set;
    set.insert(TopLevelBrowsingContextId{1});
    set.insert(TopLevelBrowsingContextId{1});
    set.insert(TopLevelBrowsingContextId{2});
    requireTrue(set.size() == 2, "hashable ids");
    requireTrue(TopLevelBrowsingContextId{1} < TopLevelBrowsingContextId{2}, "ordered ids");
    std::printf("  Test 6 (context ids): PASS\n");
  }

  // ---- Test 7: history entries ----
  {
    LoadData d;
    d.url = "https://a.test/";
    requireTrue(d.method == "GET", "GET by default");
    requireTrue(!d.referrerUrl, "no referrer by default");
    std::printf("  Test 7 (load data): PASS\n");
  }

  std::printf("\nAll W1.3 tests passed.\n");
  return 0;
}
