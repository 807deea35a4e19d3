#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace cw {

enum class RecvStatus { Ok, Closed, TimedOut };

namespace detail {

template <typename T>
struct OneShotState {
  std::mutex mtx;
  std::condition_variable cv;
  std::optional<T> value;
  bool sent{false};
  bool senderGone{false};
  bool receiverGone{false};
};

} // namespace detail

template <typename T> class OneShotReceiver;

// Sending half of a single-value channel. At most one send() succeeds.
// Dropping the sender without sending closes the channel.
template <typename T>
class OneShotSender {
public:
  OneShotSender() = default;
  explicit OneShotSender(std::shared_ptr<detail::OneShotState<T>> st)
      : state_(std::move(st)) {}
  ~OneShotSender() { close(); }

  OneShotSender(OneShotSender&& other) noexcept = default;
  OneShotSender& operator=(OneShotSender&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  OneShotSender(const OneShotSender&) = delete;
  OneShotSender& operator=(const OneShotSender&) = delete;

  // Returns false if a value was already sent or the receiver is gone.
  bool send(T v) {
    if (!state_) return false;
    {
      std::lock_guard<std::mutex> lock(state_->mtx);
      if (state_->sent || state_->receiverGone) return false;
      state_->value.emplace(std::move(v));
      state_->sent = true;
    }
    state_->cv.notify_all();
    return true;
  }

  bool isConnected() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mtx);
    return !state_->sent && !state_->receiverGone;
  }

  bool hasSent() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mtx);
    return state_->sent;
  }

private:
  void close() {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mtx);
      state_->senderGone = true;
    }
    state_->cv.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::OneShotState<T>> state_;
};

template <typename T>
class OneShotReceiver {
public:
  OneShotReceiver() = default;
  explicit OneShotReceiver(std::shared_ptr<detail::OneShotState<T>> st)
      : state_(std::move(st)) {}
  ~OneShotReceiver() { close(); }

  OneShotReceiver(OneShotReceiver&& other) noexcept = default;
  OneShotReceiver& operator=(OneShotReceiver&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  OneShotReceiver(const OneShotReceiver&) = delete;
  OneShotReceiver& operator=(const OneShotReceiver&) = delete;

  // Blocks until a value arrives or the sender is dropped.
  RecvStatus recv(T& out) {
    if (!state_) return RecvStatus::Closed;
    std::unique_lock<std::mutex> lock(state_->mtx);
    state_->cv.wait(lock, [this] { return state_->value.has_value() || finished(); });
    return take(out);
  }

  template <typename Rep, typename Period>
  RecvStatus recvFor(T& out, std::chrono::duration<Rep, Period> timeout) {
    if (!state_) return RecvStatus::Closed;
    std::unique_lock<std::mutex> lock(state_->mtx);
    bool ready = state_->cv.wait_for(lock, timeout, [this] {
      return state_->value.has_value() || finished();
    });
    if (!ready) return RecvStatus::TimedOut;
    return take(out);
  }

  // Non-blocking. TimedOut means "nothing yet, sender still alive".
  RecvStatus tryRecv(T& out) {
    if (!state_) return RecvStatus::Closed;
    std::lock_guard<std::mutex> lock(state_->mtx);
    if (!state_->value.has_value() && !finished()) return RecvStatus::TimedOut;
    return take(out);
  }

private:
  // Caller holds state_->mtx.
  bool finished() const { return state_->senderGone || state_->sent; }

  RecvStatus take(T& out) {
    if (!state_->value.has_value()) return RecvStatus::Closed;
    out = std::move(*state_->value);
    state_->value.reset();
    return RecvStatus::Ok;
  }

  void close() {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mtx);
      state_->receiverGone = true;
    }
    state_.reset();
  }

  std::shared_ptr<detail::OneShotState<T>> state_;
};

template <typename T>
std::pair<OneShotSender<T>, OneShotReceiver<T>> makeOneShot() {
  auto st = std::make_shared<detail::OneShotState<T>>();
  return {OneShotSender<T>(st), OneShotReceiver<T>(st)};
}

} // namespace cw
