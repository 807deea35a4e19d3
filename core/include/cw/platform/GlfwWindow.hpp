#pragma once
#include "cw/events/EventQueue.hpp"
#include "cw/window/WindowConfig.hpp"
#include "cw/window/WindowMethods.hpp"

#ifdef CW_HAS_GLFW

#include <array>
#include <memory>
#include <optional>
#include <string>

struct GLFWwindow;
struct GLFWcursor;

namespace cw {

class GlfwGlApi;
struct GlfwLiveness;

// Desktop backend on GLFW + glad. Native callbacks are translated into
// WindowEvents on the thread that calls pumpEvents(), which must be the
// thread that called init().
class GlfwWindow : public WindowMethods {
public:
  explicit GlfwWindow(std::shared_ptr<EventQueue> queue);
  ~GlfwWindow() override;

  GlfwWindow(const GlfwWindow&) = delete;
  GlfwWindow& operator=(const GlfwWindow&) = delete;

  bool init(const WindowConfig& config);

  // Blocks in glfwWaitEvents while Idle, waits one poll interval while
  // Animating. Pushes Idle when nothing native arrived.
  void pumpEvents();
  bool shouldClose() const;

  DeviceUintSize framebufferSize() const override;
  DeviceUintRect windowRect() const override;
  WindowSize size() const override;
  HiDpiFactor hidpiFactor() const override;

  void present() override;
  bool prepareForComposite(std::size_t width, std::size_t height) override;

  std::pair<UintSize, IntPoint> clientWindow(TopLevelBrowsingContextId ctx) const override;
  void setInnerSize(TopLevelBrowsingContextId ctx, UintSize size) override;
  void setPosition(TopLevelBrowsingContextId ctx, IntPoint point) override;
  void setFullscreenState(TopLevelBrowsingContextId ctx, bool state) override;

  void setPageTitle(TopLevelBrowsingContextId ctx, std::optional<std::string> title) override;
  void status(TopLevelBrowsingContextId ctx, std::optional<std::string> text) override;
  void loadStart(TopLevelBrowsingContextId ctx) override;
  void loadEnd(TopLevelBrowsingContextId ctx) override;
  void loadError(TopLevelBrowsingContextId ctx, NetError code, std::string url) override;
  void headParsed(TopLevelBrowsingContextId ctx) override;
  void historyChanged(TopLevelBrowsingContextId ctx, std::vector<LoadData> entries,
                      std::size_t current) override;
  void setFavicon(TopLevelBrowsingContextId ctx, Url url) override;

  void allowNavigation(TopLevelBrowsingContextId ctx, Url url,
                       OneShotSender<bool> reply) override;

  void setCursor(Cursor cursor) override;
  void handleKey(std::optional<TopLevelBrowsingContextId> ctx, std::optional<char32_t> ch,
                 Key key, KeyModifiers mods) override;

  bool supportsClipboard() const override { return true; }

  std::unique_ptr<EventLoopWaker> createEventLoopWaker() override;
  std::shared_ptr<GlApi> gl() const override;

  void setAnimationState(AnimationState state) override { animation_ = state; }

private:
  void push(WindowEvent event);
  void flushPendingKey();
  void refreshGeometry();

  static void framebufferSizeCallback(GLFWwindow* w, int width, int height);
  static void contentScaleCallback(GLFWwindow* w, float xscale, float yscale);
  static void refreshCallback(GLFWwindow* w);
  static void closeCallback(GLFWwindow* w);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void scrollCallback(GLFWwindow* w, double xoff, double yoff);
  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
  static void charCallback(GLFWwindow* w, unsigned int codepoint);

  GLFWwindow* window_{nullptr};
  std::shared_ptr<EventQueue> queue_;
  std::shared_ptr<GlfwGlApi> gl_;
  std::shared_ptr<GlfwLiveness> liveness_;
  WindowConfig config_;
  AnimationState animation_{AnimationState::Idle};

  // Last-known geometry, valid before the window is realized.
  int fbWidth_{0};
  int fbHeight_{0};
  float hidpi_{1.0f};
  int windowedX_{0}, windowedY_{0}, windowedW_{0}, windowedH_{0};

  // Input state
  DevicePoint cursor_;
  DevicePoint pressPoint_;
  int pressedButton_{-1};
  int modifiers_{0};
  std::size_t pushedThisPump_{0};
  struct PendingKey {
    Key key;
    KeyState state;
    KeyModifiers mods;
  };
  std::optional<PendingKey> pendingKey_;

  std::array<GLFWcursor*, 6> cursors_{};  // lazily created standard shapes
};

} // namespace cw

#endif // CW_HAS_GLFW
