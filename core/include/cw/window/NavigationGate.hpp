#pragma once
#include "cw/ids/BrowsingContextId.hpp"
#include "cw/net/LoadData.hpp"
#include "cw/sync/OneShot.hpp"

#include <chrono>
#include <unordered_map>
#include <vector>

namespace cw {

class WindowMethods;

// What to do when the host never answers allowNavigation().
struct NavigationPolicy {
  std::chrono::milliseconds timeout{5000};
  bool allowOnTimeout{false};
};

enum class NavigationOutcome {
  Replied,        // host sent a bool
  ChannelClosed,  // host dropped the reply sender: deny
  TimedOut        // policy default applies
};

struct NavigationDecision {
  TopLevelBrowsingContextId ctx;
  Url url;
  bool allowed{false};
  NavigationOutcome outcome{NavigationOutcome::ChannelClosed};
};

const char* navigationOutcomeName(NavigationOutcome o);

// Blocking wait on one reply, bounded by policy.timeout.
NavigationDecision awaitNavigationDecision(OneShotReceiver<bool>& rx,
                                           const NavigationPolicy& policy);

// Asks the window and waits (blocking convenience wrapper).
NavigationDecision requestNavigation(WindowMethods& window,
                                     TopLevelBrowsingContextId ctx,
                                     const Url& url,
                                     const NavigationPolicy& policy);

// Non-blocking gate: a pending navigation holds back only its own context;
// the caller keeps draining other events and polls.
class NavigationGate {
public:
  using Clock = std::chrono::steady_clock;

  NavigationGate(WindowMethods& window, NavigationPolicy policy);

  // Supersedes any navigation still pending for ctx; the old one is dropped
  // without a decision.
  void request(TopLevelBrowsingContextId ctx, const Url& url);

  // Decisions resolved since the last poll.
  std::vector<NavigationDecision> poll(Clock::time_point now = Clock::now());

  bool isPending(TopLevelBrowsingContextId ctx) const;
  std::size_t pendingCount() const { return pending_.size(); }

  const NavigationPolicy& policy() const { return policy_; }

private:
  struct Pending {
    Url url;
    OneShotReceiver<bool> rx;
    Clock::time_point deadline;
  };

  WindowMethods& window_;
  NavigationPolicy policy_;
  std::unordered_map<TopLevelBrowsingContextId, Pending> pending_;
};

} // namespace cw
