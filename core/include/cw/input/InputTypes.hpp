#pragma once
#include "cw/geometry/Units.hpp"

#include <cstddef>
#include <cstdint>

namespace cw {

enum class MouseButton : std::uint8_t { Left, Middle, Right };

enum class TouchEventType : std::uint8_t { Down, Move, Up, Cancel };

// Stable for one touch point across its Down -> Move* -> Up/Cancel sequence.
using TouchId = std::int32_t;

enum class TouchpadPressurePhase : std::uint8_t {
  BeforeClick,
  AfterFirstClick,
  AfterSecondClick
};

struct ScrollLocation {
  enum class Kind : std::uint8_t { Delta, Start, End };

  Kind kind{Kind::Delta};
  LayoutVector2D delta;  // only meaningful for Kind::Delta

  static ScrollLocation byDelta(float dx, float dy) { return {Kind::Delta, {dx, dy}}; }
  static ScrollLocation start() { return {Kind::Start, {}}; }
  static ScrollLocation end() { return {Kind::End, {}}; }
};

struct TraversalDirection {
  enum class Kind : std::uint8_t { Forward, Back };

  Kind kind{Kind::Back};
  std::size_t steps{1};
};

enum class KeyState : std::uint8_t { Pressed, Released, Repeated };

enum class Key : std::uint16_t {
  Unknown = 0,
  Space, Apostrophe, Comma, Minus, Period, Slash, Semicolon, Equal,
  LeftBracket, Backslash, RightBracket, GraveAccent,
  Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9,
  A, B, C, D, E, F, G, H, I, J, K, L, M,
  N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
  Escape, Enter, Tab, Backspace, Insert, Delete,
  Right, Left, Down, Up, PageUp, PageDown, Home, End,
  CapsLock, ScrollLock, NumLock, PrintScreen, Pause,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  LeftShift, LeftControl, LeftAlt, LeftSuper,
  RightShift, RightControl, RightAlt, RightSuper, Menu
};

enum class KeyModifier : std::uint8_t {
  None    = 0,
  Shift   = 1 << 0,
  Control = 1 << 1,
  Alt     = 1 << 2,
  Super   = 1 << 3
};

// Bit set of KeyModifier flags.
struct KeyModifiers {
  std::uint8_t bits{0};

  KeyModifiers() = default;
  KeyModifiers(KeyModifier m) : bits(static_cast<std::uint8_t>(m)) {}

  bool has(KeyModifier m) const {
    return (bits & static_cast<std::uint8_t>(m)) != 0;
  }
  bool empty() const { return bits == 0; }
};

inline KeyModifiers operator|(KeyModifiers a, KeyModifiers b) {
  KeyModifiers out;
  out.bits = static_cast<std::uint8_t>(a.bits | b.bits);
  return out;
}
inline KeyModifiers operator|(KeyModifier a, KeyModifier b) {
  return KeyModifiers(a) | KeyModifiers(b);
}
inline bool operator==(KeyModifiers a, KeyModifiers b) { return a.bits == b.bits; }

// CSS cursor keywords.
enum class Cursor : std::uint8_t {
  None, Default, Pointer, ContextMenu, Help, Progress, Wait, Cell,
  Crosshair, Text, VerticalText, Alias, Copy, Move, NoDrop, NotAllowed,
  Grab, Grabbing, EResize, NResize, NeResize, NwResize, SResize, SeResize,
  SwResize, WResize, EwResize, NsResize, NeswResize, NwseResize,
  ColResize, RowResize, AllScroll, ZoomIn, ZoomOut
};

const char* mouseButtonName(MouseButton b);
const char* touchEventTypeName(TouchEventType t);
const char* touchpadPressurePhaseName(TouchpadPressurePhase p);
const char* scrollLocationKindName(ScrollLocation::Kind k);
const char* traversalDirectionName(TraversalDirection::Kind k);
const char* keyStateName(KeyState s);
const char* keyName(Key k);
const char* cursorName(Cursor c);

} // namespace cw
