#include "cw/window/NavigationGate.hpp"
#include "cw/window/WindowMethods.hpp"

#include <cstdio>
#include <utility>

namespace cw {

const char* navigationOutcomeName(NavigationOutcome o) {
  switch (o) {
    case NavigationOutcome::Replied: return "Replied";
    case NavigationOutcome::ChannelClosed: return "ChannelClosed";
    case NavigationOutcome::TimedOut: return "TimedOut";
  }
  return "?";
}

namespace {

NavigationDecision decide(RecvStatus st, bool value, const NavigationPolicy& policy) {
  NavigationDecision d;
  switch (st) {
    case RecvStatus::Ok:
      d.allowed = value;
      d.outcome = NavigationOutcome::Replied;
      break;
    case RecvStatus::Closed:
      d.allowed = false;
      d.outcome = NavigationOutcome::ChannelClosed;
      break;
    case RecvStatus::TimedOut:
      d.allowed = policy.allowOnTimeout;
      d.outcome = NavigationOutcome::TimedOut;
      break;
  }
  return d;
}

} // namespace

NavigationDecision awaitNavigationDecision(OneShotReceiver<bool>& rx,
                                           const NavigationPolicy& policy) {
  bool value = false;
  RecvStatus st = rx.recvFor(value, policy.timeout);
  return decide(st, value, policy);
}

NavigationDecision requestNavigation(WindowMethods& window,
                                     TopLevelBrowsingContextId ctx,
                                     const Url& url,
                                     const NavigationPolicy& policy) {
  auto [tx, rx] = makeOneShot<bool>();
  window.allowNavigation(ctx, url, std::move(tx));
  NavigationDecision d = awaitNavigationDecision(rx, policy);
  d.ctx = ctx;
  d.url = url;
  if (d.outcome != NavigationOutcome::Replied) {
    std::fprintf(stderr, "[NavigationGate] ctx=%llu %s: %s -> %s\n",
                 static_cast<unsigned long long>(ctx.value), url.c_str(),
                 navigationOutcomeName(d.outcome), d.allowed ? "allow" : "deny");
  }
  return d;
}

NavigationGate::NavigationGate(WindowMethods& window, NavigationPolicy policy)
  : window_(window), policy_(policy) {}

void NavigationGate::request(TopLevelBrowsingContextId ctx, const Url& url) {
  auto [tx, rx] = makeOneShot<bool>();
  Pending p{url, std::move(rx), Clock::now() + policy_.timeout};
  // Overwriting drops the previous receiver; a late reply to it is refused.
  pending_[ctx] = std::move(p);
  window_.allowNavigation(ctx, url, std::move(tx));
}

std::vector<NavigationDecision> NavigationGate::poll(Clock::time_point now) {
  std::vector<NavigationDecision> out;
  for (auto it = pending_.begin(); it != pending_.end();) {
    bool value = false;
    RecvStatus st = it->second.rx.tryRecv(value);
    if (st == RecvStatus::TimedOut && now < it->second.deadline) {
      ++it;
      continue;
    }
    NavigationDecision d = decide(st, value, policy_);
    d.ctx = it->first;
    d.url = it->second.url;
    if (d.outcome != NavigationOutcome::Replied) {
      std::fprintf(stderr, "[NavigationGate] ctx=%llu %s: %s -> %s\n",
                   static_cast<unsigned long long>(d.ctx.value), d.url.c_str(),
                   navigationOutcomeName(d.outcome), d.allowed ? "allow" : "deny");
    }
    out.push_back(std::move(d));
    it = pending_.erase(it);
  }
  return out;
}

bool NavigationGate::isPending(TopLevelBrowsingContextId ctx) const {
  return pending_.count(ctx) > 0;
}

} // namespace cw
