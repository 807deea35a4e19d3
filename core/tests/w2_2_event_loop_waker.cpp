// W2.2: loop signal and wakers

#include "cw/events/EventQueue.hpp"
#include "cw/sync/EventLoopWaker.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <thread>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  using namespace cw;
  using namespace std::chrono_literals;

  // ---- Test 1: wakes collapse ----
  {
    LoopSignal sig;
    sig.notify();
    sig.notify();
    sig.notify();
    requireTrue(sig.notifyCount() == 3, "three notifies counted");
    requireTrue(sig.consume(), "one pending wake");
    requireTrue(!sig.consume(), "collapsed into one");
    requireTrue(!sig.waitFor(5ms), "nothing pending after consume");
    std::printf("  Test 1 (idempotent wake): PASS\n");
  }

  // ---- Test 2: wake from another thread unblocks wait ----
  {
    auto sig = std::make_shared<LoopSignal>();
    SignalWaker waker(sig);
    std::unique_ptr<EventLoopWaker> copy = waker.clone();

    std::thread t([&copy]() {
      std::this_thread::sleep_for(20ms);
      copy->wake();
    });
    bool woke = sig->wait();
    t.join();
    requireTrue(woke, "wait consumed the wake");
    std::printf("  Test 2 (cross-thread wake): PASS\n");
  }

  // ---- Test 3: many wakers, many threads ----
  {
    auto sig = std::make_shared<LoopSignal>();
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
      threads.emplace_back([w = std::make_unique<SignalWaker>(sig)]() {
        for (int k = 0; k < 100; ++k) w->wake();
      });
    }
    for (auto& t : threads) t.join();
    requireTrue(sig->notifyCount() == 400, "all wakes delivered");
    requireTrue(sig->consume(), "pending once");
    requireTrue(!sig->consume(), "only once");
    std::printf("  Test 3 (concurrent wakers): PASS\n");
  }

  // ---- Test 4: waking a loop that no longer exists ----
  {
    std::unique_ptr<EventLoopWaker> waker;
    {
      auto queue = std::make_shared<EventQueue>();
      waker = queue->createWaker();
      waker->wake();
    }
    waker->wake();
    auto clone = waker->clone();
    clone->wake();
    std::printf("  Test 4 (dead loop is a no-op): PASS\n");
  }

  // ---- Test 5: shutdown releases waiters ----
  {
    LoopSignal sig;
    std::thread t([&sig]() {
      std::this_thread::sleep_for(10ms);
      sig.shutdown();
    });
    bool woke = sig.wait();
    t.join();
    requireTrue(!woke, "shutdown is not a wake");
    requireTrue(sig.isShutdown(), "isShutdown");
    sig.notify();
    requireTrue(sig.notifyCount() == 0, "notify after shutdown ignored");
    requireTrue(!sig.waitFor(1s), "wait returns immediately after shutdown");
    std::printf("  Test 5 (shutdown): PASS\n");
  }

  // ---- Test 6: timed wait ----
  {
    LoopSignal sig;
    auto start = std::chrono::steady_clock::now();
    requireTrue(!sig.waitFor(20ms), "no wake");
    requireTrue(std::chrono::steady_clock::now() - start >= 15ms, "waited");
    std::printf("  Test 6 (timed wait): PASS\n");
  }

  std::printf("\nAll W2.2 tests passed.\n");
  return 0;
}
