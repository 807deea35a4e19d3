#include "cw/input/InputTypes.hpp"

namespace cw {

const char* mouseButtonName(MouseButton b) {
  switch (b) {
    case MouseButton::Left: return "Left";
    case MouseButton::Middle: return "Middle";
    case MouseButton::Right: return "Right";
  }
  return "?";
}

const char* touchEventTypeName(TouchEventType t) {
  switch (t) {
    case TouchEventType::Down: return "Down";
    case TouchEventType::Move: return "Move";
    case TouchEventType::Up: return "Up";
    case TouchEventType::Cancel: return "Cancel";
  }
  return "?";
}

const char* touchpadPressurePhaseName(TouchpadPressurePhase p) {
  switch (p) {
    case TouchpadPressurePhase::BeforeClick: return "BeforeClick";
    case TouchpadPressurePhase::AfterFirstClick: return "AfterFirstClick";
    case TouchpadPressurePhase::AfterSecondClick: return "AfterSecondClick";
  }
  return "?";
}

const char* scrollLocationKindName(ScrollLocation::Kind k) {
  switch (k) {
    case ScrollLocation::Kind::Delta: return "Delta";
    case ScrollLocation::Kind::Start: return "Start";
    case ScrollLocation::Kind::End: return "End";
  }
  return "?";
}

const char* traversalDirectionName(TraversalDirection::Kind k) {
  switch (k) {
    case TraversalDirection::Kind::Forward: return "Forward";
    case TraversalDirection::Kind::Back: return "Back";
  }
  return "?";
}

const char* keyStateName(KeyState s) {
  switch (s) {
    case KeyState::Pressed: return "Pressed";
    case KeyState::Released: return "Released";
    case KeyState::Repeated: return "Repeated";
  }
  return "?";
}

namespace {
const char* const kKeyNames[] = {
  "Unknown",
  "Space",
  "Apostrophe",
  "Comma",
  "Minus",
  "Period",
  "Slash",
  "Semicolon",
  "Equal",
  "LeftBracket",
  "Backslash",
  "RightBracket",
  "GraveAccent",
  "Num0",
  "Num1",
  "Num2",
  "Num3",
  "Num4",
  "Num5",
  "Num6",
  "Num7",
  "Num8",
  "Num9",
  "A",
  "B",
  "C",
  "D",
  "E",
  "F",
  "G",
  "H",
  "I",
  "J",
  "K",
  "L",
  "M",
  "N",
  "O",
  "P",
  "Q",
  "R",
  "S",
  "T",
  "U",
  "V",
  "W",
  "X",
  "Y",
  "Z",
  "Escape",
  "Enter",
  "Tab",
  "Backspace",
  "Insert",
  "Delete",
  "Right",
  "Left",
  "Down",
  "Up",
  "PageUp",
  "PageDown",
  "Home",
  "End",
  "CapsLock",
  "ScrollLock",
  "NumLock",
  "PrintScreen",
  "Pause",
  "F1",
  "F2",
  "F3",
  "F4",
  "F5",
  "F6",
  "F7",
  "F8",
  "F9",
  "F10",
  "F11",
  "F12",
  "LeftShift",
  "LeftControl",
  "LeftAlt",
  "LeftSuper",
  "RightShift",
  "RightControl",
  "RightAlt",
  "RightSuper",
  "Menu",
};

const char* const kCursorNames[] = {
  "none",
  "default",
  "pointer",
  "context-menu",
  "help",
  "progress",
  "wait",
  "cell",
  "crosshair",
  "text",
  "vertical-text",
  "alias",
  "copy",
  "move",
  "no-drop",
  "not-allowed",
  "grab",
  "grabbing",
  "e-resize",
  "n-resize",
  "ne-resize",
  "nw-resize",
  "s-resize",
  "se-resize",
  "sw-resize",
  "w-resize",
  "ew-resize",
  "ns-resize",
  "nesw-resize",
  "nwse-resize",
  "col-resize",
  "row-resize",
  "all-scroll",
  "zoom-in",
  "zoom-out",
};

static_assert(sizeof(kKeyNames) / sizeof(kKeyNames[0]) ==
                  static_cast<std::size_t>(Key::Menu) + 1,
              "kKeyNames out of sync with Key");
static_assert(sizeof(kCursorNames) / sizeof(kCursorNames[0]) ==
                  static_cast<std::size_t>(Cursor::ZoomOut) + 1,
              "kCursorNames out of sync with Cursor");

} // namespace

const char* keyName(Key k) {
  auto i = static_cast<std::size_t>(k);
  if (i >= sizeof(kKeyNames) / sizeof(kKeyNames[0])) return "Unknown";
  return kKeyNames[i];
}

// Matches the CSS keyword spelling ("ne-resize", "zoom-in", ...).
const char* cursorName(Cursor c) {
  auto i = static_cast<std::size_t>(c);
  if (i >= sizeof(kCursorNames) / sizeof(kCursorNames[0])) return "default";
  return kCursorNames[i];
}

} // namespace cw
