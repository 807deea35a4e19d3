#pragma once
#include "cw/events/EventQueue.hpp"
#include "cw/sync/ThreadSafeQueue.hpp"
#include "cw/window/ChromeEvent.hpp"
#include "cw/window/WindowConfig.hpp"
#include "cw/window/WindowMethods.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace cw {

// Window backend without a display. Keeps last-known geometry, clamps control
// requests to the configured screen, queues chrome notifications for the
// embedder and produces WindowEvents into the shared EventQueue.
class HeadlessWindow : public WindowMethods {
public:
  using NavigationFilter = std::function<bool(TopLevelBrowsingContextId, const Url&)>;

  HeadlessWindow(const WindowConfig& config,
                 std::shared_ptr<EventQueue> queue,
                 std::shared_ptr<GlApi> gl = nullptr);
  ~HeadlessWindow() override;

  HeadlessWindow(const HeadlessWindow&) = delete;
  HeadlessWindow& operator=(const HeadlessWindow&) = delete;

  // ---- WindowMethods ----
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

  bool supportsClipboard() const override { return config_.supportsClipboard; }

  std::unique_ptr<EventLoopWaker> createEventLoopWaker() override;
  std::shared_ptr<GlApi> gl() const override { return gl_; }

  void setAnimationState(AnimationState state) override;

  // ---- producer side ----
  bool injectEvent(WindowEvent event);
  void resize(std::uint32_t width, std::uint32_t height);  // density independent
  void setHidpiFactor(float factor);
  void setMinimized(bool minimized);
  bool requestRefresh();
  bool requestQuit();
  OneShotReceiver<TopLevelBrowsingContextId> openBrowser(const Url& url);

  // ---- embedder side ----
  // Answers allowNavigation() in place. Without a filter, requests are queued
  // as chrome::NavigationRequest.
  void setNavigationFilter(NavigationFilter filter);
  bool pollChromeEvent(ChromeEvent& out);
  std::vector<ChromeEvent> drainChromeEvents();

  // ---- introspection ----
  std::size_t presentCount() const;
  std::size_t refusedCompositeCount() const;
  Cursor cursor() const;
  AnimationState animationState() const;
  bool isFullscreen() const;
  bool isMinimized() const;
  IntPoint position() const;

private:
  // Callers hold mtx_.
  DeviceUintSize framebufferSizeLocked() const;
  void applyInnerSizeLocked(float width, float height);
  void pushResize();

  WindowConfig config_;
  std::shared_ptr<EventQueue> queue_;
  std::shared_ptr<GlApi> gl_;
  ThreadSafeQueue<ChromeEvent> chrome_;

  mutable std::mutex mtx_;
  WindowSize size_;
  WindowSize restoreSize_;
  HiDpiFactor hidpi_;
  IntPoint position_;
  bool fullscreen_{false};
  bool minimized_{false};
  Cursor cursor_{Cursor::Default};
  AnimationState animation_{AnimationState::Idle};
  std::size_t presents_{0};
  std::size_t refusedComposites_{0};
  NavigationFilter navFilter_;
};

} // namespace cw
