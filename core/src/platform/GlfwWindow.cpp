#ifdef CW_HAS_GLFW

#include "cw/platform/GlfwWindow.hpp"

#include <glad/gl.h>
#include <GLFW/glfw3.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <mutex>
#include <utility>

namespace cw {

// Guards glfwPostEmptyEvent against a terminated GLFW.
struct GlfwLiveness {
  std::mutex mtx;
  bool alive{true};
};

class GlfwGlApi : public GlApi {
public:
  GlfwGlApi(GLFWwindow* window, int version) : window_(window), version_(version) {}

  bool makeCurrent() override {
    if (!window_) return false;
    glfwMakeContextCurrent(window_);
    return true;
  }
  void* getProcAddress(const char* name) const override {
    return reinterpret_cast<void*>(glfwGetProcAddress(name));
  }
  int version() const override { return version_; }
  void finish() override {
    if (window_) glFinish();
  }

  // Called when the window goes away; holders keep a harmless handle.
  void detach() { window_ = nullptr; }

private:
  GLFWwindow* window_;
  int version_;
};

namespace {

// Scroll wheel notch in device pixels.
constexpr float kLineHeight = 38.0f;
// Press/release farther apart than this is a drag, not a click.
constexpr float kClickSlop = 4.0f;

class GlfwWaker : public EventLoopWaker {
public:
  GlfwWaker(std::weak_ptr<LoopSignal> signal, std::shared_ptr<GlfwLiveness> liveness)
    : signal_(std::move(signal)), liveness_(std::move(liveness)) {}

  void wake() override {
    if (auto s = signal_.lock()) s->notify();
    std::lock_guard<std::mutex> lock(liveness_->mtx);
    if (liveness_->alive) glfwPostEmptyEvent();
  }

  std::unique_ptr<EventLoopWaker> clone() const override {
    return std::make_unique<GlfwWaker>(signal_, liveness_);
  }

private:
  std::weak_ptr<LoopSignal> signal_;
  std::shared_ptr<GlfwLiveness> liveness_;
};

KeyModifiers toModifiers(int mods) {
  KeyModifiers m;
  if (mods & GLFW_MOD_SHIFT) m = m | KeyModifier::Shift;
  if (mods & GLFW_MOD_CONTROL) m = m | KeyModifier::Control;
  if (mods & GLFW_MOD_ALT) m = m | KeyModifier::Alt;
  if (mods & GLFW_MOD_SUPER) m = m | KeyModifier::Super;
  return m;
}

Key toKey(int key) {
  if (key >= GLFW_KEY_A && key <= GLFW_KEY_Z)
    return static_cast<Key>(static_cast<int>(Key::A) + (key - GLFW_KEY_A));
  if (key >= GLFW_KEY_0 && key <= GLFW_KEY_9)
    return static_cast<Key>(static_cast<int>(Key::Num0) + (key - GLFW_KEY_0));
  if (key >= GLFW_KEY_F1 && key <= GLFW_KEY_F12)
    return static_cast<Key>(static_cast<int>(Key::F1) + (key - GLFW_KEY_F1));

  switch (key) {
    case GLFW_KEY_SPACE: return Key::Space;
    case GLFW_KEY_APOSTROPHE: return Key::Apostrophe;
    case GLFW_KEY_COMMA: return Key::Comma;
    case GLFW_KEY_MINUS: return Key::Minus;
    case GLFW_KEY_PERIOD: return Key::Period;
    case GLFW_KEY_SLASH: return Key::Slash;
    case GLFW_KEY_SEMICOLON: return Key::Semicolon;
    case GLFW_KEY_EQUAL: return Key::Equal;
    case GLFW_KEY_LEFT_BRACKET: return Key::LeftBracket;
    case GLFW_KEY_BACKSLASH: return Key::Backslash;
    case GLFW_KEY_RIGHT_BRACKET: return Key::RightBracket;
    case GLFW_KEY_GRAVE_ACCENT: return Key::GraveAccent;
    case GLFW_KEY_ESCAPE: return Key::Escape;
    case GLFW_KEY_ENTER: return Key::Enter;
    case GLFW_KEY_TAB: return Key::Tab;
    case GLFW_KEY_BACKSPACE: return Key::Backspace;
    case GLFW_KEY_INSERT: return Key::Insert;
    case GLFW_KEY_DELETE: return Key::Delete;
    case GLFW_KEY_RIGHT: return Key::Right;
    case GLFW_KEY_LEFT: return Key::Left;
    case GLFW_KEY_DOWN: return Key::Down;
    case GLFW_KEY_UP: return Key::Up;
    case GLFW_KEY_PAGE_UP: return Key::PageUp;
    case GLFW_KEY_PAGE_DOWN: return Key::PageDown;
    case GLFW_KEY_HOME: return Key::Home;
    case GLFW_KEY_END: return Key::End;
    case GLFW_KEY_CAPS_LOCK: return Key::CapsLock;
    case GLFW_KEY_SCROLL_LOCK: return Key::ScrollLock;
    case GLFW_KEY_NUM_LOCK: return Key::NumLock;
    case GLFW_KEY_PRINT_SCREEN: return Key::PrintScreen;
    case GLFW_KEY_PAUSE: return Key::Pause;
    case GLFW_KEY_LEFT_SHIFT: return Key::LeftShift;
    case GLFW_KEY_LEFT_CONTROL: return Key::LeftControl;
    case GLFW_KEY_LEFT_ALT: return Key::LeftAlt;
    case GLFW_KEY_LEFT_SUPER: return Key::LeftSuper;
    case GLFW_KEY_RIGHT_SHIFT: return Key::RightShift;
    case GLFW_KEY_RIGHT_CONTROL: return Key::RightControl;
    case GLFW_KEY_RIGHT_ALT: return Key::RightAlt;
    case GLFW_KEY_RIGHT_SUPER: return Key::RightSuper;
    case GLFW_KEY_MENU: return Key::Menu;
    default: return Key::Unknown;
  }
}

// Keys that normally produce a character callback right after the key event.
bool isPrintable(int key) {
  return key >= GLFW_KEY_SPACE && key <= GLFW_KEY_GRAVE_ACCENT;
}

std::optional<MouseButton> toMouseButton(int button) {
  switch (button) {
    case GLFW_MOUSE_BUTTON_LEFT: return MouseButton::Left;
    case GLFW_MOUSE_BUTTON_MIDDLE: return MouseButton::Middle;
    case GLFW_MOUSE_BUTTON_RIGHT: return MouseButton::Right;
    default: return std::nullopt;
  }
}

// Index into the standard-cursor cache, -1 for "hide".
int standardCursorIndex(Cursor c) {
  switch (c) {
    case Cursor::None: return -1;
    case Cursor::Text:
    case Cursor::VerticalText: return 1;
    case Cursor::Crosshair:
    case Cursor::Cell: return 2;
    case Cursor::Pointer:
    case Cursor::Grab:
    case Cursor::Grabbing: return 3;
    case Cursor::EResize:
    case Cursor::WResize:
    case Cursor::EwResize:
    case Cursor::ColResize: return 4;
    case Cursor::NResize:
    case Cursor::SResize:
    case Cursor::NsResize:
    case Cursor::RowResize: return 5;
    default: return 0;
  }
}

constexpr int kStandardShapes[] = {
  GLFW_ARROW_CURSOR, GLFW_IBEAM_CURSOR, GLFW_CROSSHAIR_CURSOR,
  GLFW_HAND_CURSOR, GLFW_HRESIZE_CURSOR, GLFW_VRESIZE_CURSOR
};

GlfwWindow* self(GLFWwindow* w) {
  return static_cast<GlfwWindow*>(glfwGetWindowUserPointer(w));
}

} // namespace

GlfwWindow::GlfwWindow(std::shared_ptr<EventQueue> queue)
  : queue_(std::move(queue)), liveness_(std::make_shared<GlfwLiveness>()) {}

GlfwWindow::~GlfwWindow() {
  {
    std::lock_guard<std::mutex> lock(liveness_->mtx);
    liveness_->alive = false;
  }
  if (gl_) gl_->detach();
  for (auto* c : cursors_) {
    if (c) glfwDestroyCursor(c);
  }
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwWindow::init(const WindowConfig& config) {
  config_ = config;
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwWindow: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_SCALE_TO_MONITOR, GLFW_TRUE);

  GLFWmonitor* monitor = config.fullscreen ? glfwGetPrimaryMonitor() : nullptr;
  window_ = glfwCreateWindow(static_cast<int>(config.width), static_cast<int>(config.height),
                             config.title.c_str(), monitor, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwWindow: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);

  int version = gladLoadGL((GLADloadfunc)glfwGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "GlfwWindow: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }
  gl_ = std::make_shared<GlfwGlApi>(window_, version);

  // Install callbacks
  glfwSetWindowUserPointer(window_, this);
  glfwSetFramebufferSizeCallback(window_, framebufferSizeCallback);
  glfwSetWindowContentScaleCallback(window_, contentScaleCallback);
  glfwSetWindowRefreshCallback(window_, refreshCallback);
  glfwSetWindowCloseCallback(window_, closeCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetScrollCallback(window_, scrollCallback);
  glfwSetKeyCallback(window_, keyCallback);
  glfwSetCharCallback(window_, charCallback);

  refreshGeometry();
  glfwGetWindowPos(window_, &windowedX_, &windowedY_);
  glfwGetWindowSize(window_, &windowedW_, &windowedH_);
  return true;
}

void GlfwWindow::refreshGeometry() {
  if (!window_) return;
  glfwGetFramebufferSize(window_, &fbWidth_, &fbHeight_);
  if (config_.hidpiFactor > 0.0f) {
    hidpi_ = config_.hidpiFactor;
  } else {
    float xs = 1.0f, ys = 1.0f;
    glfwGetWindowContentScale(window_, &xs, &ys);
    hidpi_ = xs > 0.0f ? xs : 1.0f;
  }
}

void GlfwWindow::push(WindowEvent event) {
  if (queue_ && queue_->push(std::move(event))) ++pushedThisPump_;
}

void GlfwWindow::pumpEvents() {
  pushedThisPump_ = 0;
  if (animation_ == AnimationState::Animating) {
    glfwWaitEventsTimeout(static_cast<double>(config_.animatingPollIntervalMs) / 1000.0);
  } else {
    glfwWaitEvents();
  }
  flushPendingKey();
  if (pushedThisPump_ == 0) push(ev::Idle{});
}

bool GlfwWindow::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

// ---- geometry ----

DeviceUintSize GlfwWindow::framebufferSize() const {
  return {static_cast<std::uint32_t>(std::max(fbWidth_, 0)),
          static_cast<std::uint32_t>(std::max(fbHeight_, 0))};
}

DeviceUintRect GlfwWindow::windowRect() const {
  return {{0, 0}, framebufferSize()};
}

WindowSize GlfwWindow::size() const {
  return {static_cast<float>(fbWidth_) / hidpi_, static_cast<float>(fbHeight_) / hidpi_};
}

HiDpiFactor GlfwWindow::hidpiFactor() const {
  return {hidpi_};
}

// ---- presentation ----

void GlfwWindow::present() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

bool GlfwWindow::prepareForComposite(std::size_t width, std::size_t height) {
  if (!window_ || width == 0 || height == 0) return false;
  if (glfwGetWindowAttrib(window_, GLFW_ICONIFIED)) return false;
  glfwMakeContextCurrent(window_);
  glViewport(0, 0, static_cast<GLsizei>(width), static_cast<GLsizei>(height));
  return true;
}

// ---- window control ----

std::pair<UintSize, IntPoint> GlfwWindow::clientWindow(TopLevelBrowsingContextId) const {
  if (!window_) return {UintSize{}, IntPoint{}};
  int left = 0, top = 0, right = 0, bottom = 0;
  glfwGetWindowFrameSize(window_, &left, &top, &right, &bottom);
  int w = 0, h = 0, x = 0, y = 0;
  glfwGetWindowSize(window_, &w, &h);
  glfwGetWindowPos(window_, &x, &y);
  UintSize outer{static_cast<std::uint32_t>(std::max(0, w + left + right)),
                 static_cast<std::uint32_t>(std::max(0, h + top + bottom))};
  return {outer, IntPoint{x - left, y - top}};
}

void GlfwWindow::setInnerSize(TopLevelBrowsingContextId, UintSize size) {
  if (!window_ || size.isEmpty()) return;
  glfwSetWindowSize(window_, static_cast<int>(size.width), static_cast<int>(size.height));
}

void GlfwWindow::setPosition(TopLevelBrowsingContextId, IntPoint point) {
  if (!window_) return;
  glfwSetWindowPos(window_, point.x, point.y);
}

void GlfwWindow::setFullscreenState(TopLevelBrowsingContextId, bool state) {
  if (!window_) return;
  bool isFullscreen = glfwGetWindowMonitor(window_) != nullptr;
  if (state == isFullscreen) return;

  if (state) {
    glfwGetWindowPos(window_, &windowedX_, &windowedY_);
    glfwGetWindowSize(window_, &windowedW_, &windowedH_);
    GLFWmonitor* monitor = glfwGetPrimaryMonitor();
    const GLFWvidmode* mode = monitor ? glfwGetVideoMode(monitor) : nullptr;
    if (!mode) return;
    glfwSetWindowMonitor(window_, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
  } else {
    glfwSetWindowMonitor(window_, nullptr, windowedX_, windowedY_,
                         windowedW_, windowedH_, GLFW_DONT_CARE);
  }
}

// ---- chrome notifications ----

void GlfwWindow::setPageTitle(TopLevelBrowsingContextId, std::optional<std::string> title) {
  if (!window_) return;
  std::string t = title ? *title + " - " + config_.title : config_.title;
  glfwSetWindowTitle(window_, t.c_str());
}

void GlfwWindow::status(TopLevelBrowsingContextId ctx, std::optional<std::string> text) {
  if (text) {
    std::fprintf(stderr, "[GlfwWindow] ctx=%llu status: %s\n",
                 static_cast<unsigned long long>(ctx.value), text->c_str());
  }
}

void GlfwWindow::loadStart(TopLevelBrowsingContextId) {}

void GlfwWindow::loadEnd(TopLevelBrowsingContextId) {}

void GlfwWindow::loadError(TopLevelBrowsingContextId ctx, NetError code, std::string url) {
  std::fprintf(stderr, "[GlfwWindow] ctx=%llu failed to load %s: %s\n",
               static_cast<unsigned long long>(ctx.value), url.c_str(), netErrorName(code));
}

void GlfwWindow::headParsed(TopLevelBrowsingContextId) {}

void GlfwWindow::historyChanged(TopLevelBrowsingContextId, std::vector<LoadData>, std::size_t) {}

void GlfwWindow::setFavicon(TopLevelBrowsingContextId, Url) {}

// No chrome UI to ask: every navigation is allowed.
void GlfwWindow::allowNavigation(TopLevelBrowsingContextId ctx, Url url,
                                 OneShotSender<bool> reply) {
  if (!reply.send(true)) {
    std::fprintf(stderr, "[GlfwWindow] ctx=%llu navigation reply to %s not delivered\n",
                 static_cast<unsigned long long>(ctx.value), url.c_str());
  }
}

// ---- input / cursor ----

void GlfwWindow::setCursor(Cursor cursor) {
  if (!window_) return;
  int idx = standardCursorIndex(cursor);
  if (idx < 0) {
    glfwSetInputMode(window_, GLFW_CURSOR, GLFW_CURSOR_HIDDEN);
    return;
  }
  glfwSetInputMode(window_, GLFW_CURSOR, GLFW_CURSOR_NORMAL);
  auto slot = static_cast<std::size_t>(idx);
  if (!cursors_[slot]) cursors_[slot] = glfwCreateStandardCursor(kStandardShapes[slot]);
  glfwSetCursor(window_, cursors_[slot]);
}

// Keys the page did not consume: browser-chrome shortcuts.
void GlfwWindow::handleKey(std::optional<TopLevelBrowsingContextId> ctx,
                           std::optional<char32_t>, Key key, KeyModifiers mods) {
  bool ctrl = mods.has(KeyModifier::Control) || mods.has(KeyModifier::Super);

  if (key == Key::Escape || (ctrl && key == Key::Q)) {
    push(ev::Quit{});
    return;
  }
  if (key == Key::F11) {
    if (window_) {
      setFullscreenState(ctx.value_or(kInvalidContextId), glfwGetWindowMonitor(window_) == nullptr);
    }
    return;
  }
  if (key == Key::F12) {
    push(ev::ToggleWebRenderDebug{WebRenderDebugOption::Profiler});
    return;
  }
  if (ctrl && key == Key::Equal) { push(ev::Zoom{1.1f}); return; }
  if (ctrl && key == Key::Minus) { push(ev::Zoom{1.0f / 1.1f}); return; }
  if (ctrl && key == Key::Num0) { push(ev::ResetZoom{}); return; }

  if (!ctx) return;
  if ((ctrl && key == Key::R) || key == Key::F5) {
    push(ev::Reload{*ctx});
  } else if ((mods.has(KeyModifier::Alt) && key == Key::Left) ||
             (key == Key::Backspace && !mods.has(KeyModifier::Shift))) {
    push(ev::Navigation{*ctx, {TraversalDirection::Kind::Back, 1}});
  } else if ((mods.has(KeyModifier::Alt) && key == Key::Right) ||
             (key == Key::Backspace && mods.has(KeyModifier::Shift))) {
    push(ev::Navigation{*ctx, {TraversalDirection::Kind::Forward, 1}});
  }
}

std::unique_ptr<EventLoopWaker> GlfwWindow::createEventLoopWaker() {
  std::weak_ptr<LoopSignal> signal;
  if (queue_) signal = queue_->signal();
  return std::make_unique<GlfwWaker>(signal, liveness_);
}

std::shared_ptr<GlApi> GlfwWindow::gl() const {
  if (gl_) return gl_;
  return std::make_shared<NullGlApi>();
}

void GlfwWindow::flushPendingKey() {
  if (!pendingKey_) return;
  push(ev::KeyEvent{std::nullopt, pendingKey_->key, pendingKey_->state, pendingKey_->mods});
  pendingKey_.reset();
}

// ---- callbacks ----

void GlfwWindow::framebufferSizeCallback(GLFWwindow* w, int width, int height) {
  auto* s = self(w);
  if (!s) return;
  s->refreshGeometry();
  s->push(ev::Resize{{static_cast<std::uint32_t>(std::max(width, 0)),
                      static_cast<std::uint32_t>(std::max(height, 0))}});
}

void GlfwWindow::contentScaleCallback(GLFWwindow* w, float, float) {
  auto* s = self(w);
  if (!s) return;
  s->refreshGeometry();
  s->push(ev::Resize{s->framebufferSize()});
}

void GlfwWindow::refreshCallback(GLFWwindow* w) {
  if (auto* s = self(w)) s->push(ev::Refresh{});
}

void GlfwWindow::closeCallback(GLFWwindow* w) {
  if (auto* s = self(w)) s->push(ev::Quit{});
}

void GlfwWindow::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* s = self(w);
  if (!s) return;
  // GLFW reports screen coordinates; scale into the framebuffer.
  int ww = 0, wh = 0;
  glfwGetWindowSize(w, &ww, &wh);
  float sx = ww > 0 ? static_cast<float>(s->fbWidth_) / static_cast<float>(ww) : 1.0f;
  float sy = wh > 0 ? static_cast<float>(s->fbHeight_) / static_cast<float>(wh) : 1.0f;
  s->cursor_ = {static_cast<float>(x) * sx, static_cast<float>(y) * sy};
  s->push(ev::MouseWindowMoveEventClass{s->cursor_});
}

void GlfwWindow::mouseButtonCallback(GLFWwindow* w, int button, int action, int mods) {
  auto* s = self(w);
  if (!s) return;
  s->modifiers_ = mods;
  auto mb = toMouseButton(button);
  if (!mb) return;

  if (action == GLFW_PRESS) {
    s->pressPoint_ = s->cursor_;
    s->pressedButton_ = button;
    s->push(ev::MouseWindowEventClass{{MouseWindowEvent::Kind::MouseDown, *mb, s->cursor_}});
    return;
  }

  s->push(ev::MouseWindowEventClass{{MouseWindowEvent::Kind::MouseUp, *mb, s->cursor_}});
  if (s->pressedButton_ == button) {
    float dx = s->cursor_.x - s->pressPoint_.x;
    float dy = s->cursor_.y - s->pressPoint_.y;
    if (std::sqrt(dx * dx + dy * dy) <= kClickSlop) {
      s->push(ev::MouseWindowEventClass{{MouseWindowEvent::Kind::Click, *mb, s->cursor_}});
    }
    s->pressedButton_ = -1;
  }
}

void GlfwWindow::scrollCallback(GLFWwindow* w, double xoff, double yoff) {
  auto* s = self(w);
  if (!s) return;
  DeviceIntPoint origin{static_cast<std::int32_t>(s->cursor_.x),
                        static_cast<std::int32_t>(s->cursor_.y)};
  if (s->modifiers_ & GLFW_MOD_CONTROL) {
    float factor = 1.0f + static_cast<float>(yoff) * 0.1f;
    if (factor > 0.0f) s->push(ev::PinchZoom{factor});
    return;
  }
  s->push(ev::Scroll{ScrollLocation::byDelta(static_cast<float>(xoff) * kLineHeight,
                                             static_cast<float>(yoff) * kLineHeight),
                     origin, TouchEventType::Move});
}

void GlfwWindow::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int mods) {
  auto* s = self(w);
  if (!s) return;
  s->modifiers_ = mods;
  s->flushPendingKey();

  KeyState state = action == GLFW_PRESS    ? KeyState::Pressed
                   : action == GLFW_REPEAT ? KeyState::Repeated
                                           : KeyState::Released;
  Key k = toKey(key);
  KeyModifiers m = toModifiers(mods);

  // Printable presses wait for the char callback to attach their character.
  if (state != KeyState::Released && isPrintable(key) &&
      !(mods & (GLFW_MOD_CONTROL | GLFW_MOD_SUPER))) {
    s->pendingKey_ = PendingKey{k, state, m};
    return;
  }
  s->push(ev::KeyEvent{std::nullopt, k, state, m});
}

void GlfwWindow::charCallback(GLFWwindow* w, unsigned int codepoint) {
  auto* s = self(w);
  if (!s) return;
  if (s->pendingKey_) {
    s->push(ev::KeyEvent{static_cast<char32_t>(codepoint), s->pendingKey_->key,
                         s->pendingKey_->state, s->pendingKey_->mods});
    s->pendingKey_.reset();
    return;
  }
  s->push(ev::KeyEvent{static_cast<char32_t>(codepoint), Key::Unknown, KeyState::Pressed,
                       toModifiers(s->modifiers_)});
}

} // namespace cw

#endif // CW_HAS_GLFW
