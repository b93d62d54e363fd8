#include "orchestration/cancellation_token.hpp"
#include "orchestration/health_poller.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <thread>

using ranops::orchestration::CancellationToken;
using ranops::orchestration::HealthPoller;
using ranops::orchestration::PollStatus;

TEST_CASE("HealthPoller returns ready on the first true evaluation", "[orchestration][poller]") {
  CancellationToken token;
  const HealthPoller poller(token);
  std::uint32_t calls = 0;
  const auto result = poller.Poll(
      [&calls]() { return ++calls >= 3U; }, std::chrono::milliseconds(5),
      std::chrono::milliseconds(1'000));
  REQUIRE(result.status == PollStatus::kReady);
  REQUIRE(result.evaluations == 3U);
  REQUIRE(calls == 3U);
}

TEST_CASE("HealthPoller evaluates immediately before sleeping", "[orchestration][poller]") {
  CancellationToken token;
  const HealthPoller poller(token);
  const auto started = std::chrono::steady_clock::now();
  const auto result =
      poller.Poll([]() { return true; }, std::chrono::seconds(10), std::chrono::seconds(30));
  REQUIRE(result.status == PollStatus::kReady);
  REQUIRE(result.evaluations == 1U);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));
}

TEST_CASE("HealthPoller timeout is bounded by timeout plus one interval", "[orchestration][poller]") {
  CancellationToken token;
  const HealthPoller poller(token);
  const auto timeout = std::chrono::milliseconds(150);
  const auto interval = std::chrono::milliseconds(40);
  const auto started = std::chrono::steady_clock::now();
  const auto result = poller.Poll([]() { return false; }, interval, timeout);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE(result.status == PollStatus::kTimeout);
  REQUIRE(result.evaluations >= 2U);
  REQUIRE(elapsed >= timeout);
  // Scheduler slack on loaded CI machines.
  REQUIRE(elapsed <= timeout + interval + std::chrono::milliseconds(250));
}

TEST_CASE("HealthPoller stops promptly when the token is cancelled", "[orchestration][poller]") {
  CancellationToken token;
  const HealthPoller poller(token);
  auto canceller = std::async(std::launch::async, [&token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    token.Cancel("test interrupt");
  });

  const auto started = std::chrono::steady_clock::now();
  const auto result =
      poller.Poll([]() { return false; }, std::chrono::seconds(5), std::chrono::seconds(60));
  canceller.get();

  REQUIRE(result.status == PollStatus::kCancelled);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
}

TEST_CASE("Child token observes parent cancellation", "[orchestration][cancellation]") {
  CancellationToken parent;
  CancellationToken child(&parent);
  REQUIRE_FALSE(child.IsCancelled());
  parent.Cancel("sigint");
  REQUIRE(child.IsCancelled());

  // Cancelling a child never reaches the parent.
  CancellationToken other_parent;
  CancellationToken other_child(&other_parent);
  other_child.Cancel("sibling failed");
  REQUIRE(other_child.IsCancelled());
  REQUIRE_FALSE(other_parent.IsCancelled());
  REQUIRE(other_child.Reason() == "sibling failed");
}

TEST_CASE("SleepFor observes a bound signal flag within a wake slice",
          "[orchestration][cancellation]") {
  std::atomic<int> flag{0};
  CancellationToken token;
  token.BindSignalFlag(&flag);
  auto setter = std::async(std::launch::async, [&flag]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    flag.store(15);
  });

  const auto started = std::chrono::steady_clock::now();
  const bool completed = token.SleepFor(std::chrono::seconds(30));
  setter.get();
  REQUIRE_FALSE(completed);
  REQUIRE(token.IsCancelled());
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));
  token.BindSignalFlag(nullptr);
}
