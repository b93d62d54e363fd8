#include "core/logging/logger.hpp"
#include "orchestration/cancellation_token.hpp"
#include "orchestration/retry_executor.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <cstdint>
#include <sstream>
#include <vector>

using ranops::core::errors::ErrorKind;
using ranops::core::errors::MakeError;
using ranops::core::errors::OrchestrationError;
using ranops::core::logging::Logger;
using ranops::core::logging::LogLevel;
using ranops::orchestration::BackoffMode;
using ranops::orchestration::CancellationToken;
using ranops::orchestration::RetryExecutor;
using ranops::orchestration::RetryPolicy;

namespace {

RetryPolicy Policy(std::uint32_t attempts, std::chrono::milliseconds delay, BackoffMode mode) {
  RetryPolicy policy;
  policy.max_attempts = attempts;
  policy.initial_delay = delay;
  policy.backoff = mode;
  return policy;
}

} // namespace

TEST_CASE("RetryExecutor stops at the first success", "[orchestration][retry]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kDebug, sink);
  CancellationToken token;
  const RetryExecutor retry(token, logger);

  std::uint32_t calls = 0;
  const auto outcome = retry.Execute(
      "start core", Policy(3U, std::chrono::milliseconds(1), BackoffMode::kExponential),
      [&calls](std::uint32_t attempt, OrchestrationError& error) {
        ++calls;
        if (attempt < 2U) {
          error = MakeError(ErrorKind::kStartFailure, "compose up failed");
          return false;
        }
        return true;
      });

  REQUIRE(outcome.succeeded);
  REQUIRE(outcome.attempts == 2U);
  REQUIRE(calls == 2U);
  REQUIRE(outcome.last_error.ok());
  REQUIRE(outcome.delays.size() == 1U);
}

TEST_CASE("RetryExecutor doubles the delay after every failure", "[orchestration][retry]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kDebug, sink);
  CancellationToken token;
  const RetryExecutor retry(token, logger);

  std::uint32_t calls = 0;
  std::uint32_t hook_calls = 0;
  const auto outcome = retry.Execute(
      "start radio", Policy(4U, std::chrono::milliseconds(5), BackoffMode::kExponential),
      [&calls](std::uint32_t, OrchestrationError& error) {
        ++calls;
        error = MakeError(ErrorKind::kTimeout, "not attached");
        return false;
      },
      [&hook_calls](std::uint32_t, const OrchestrationError&) { ++hook_calls; });

  REQUIRE_FALSE(outcome.succeeded);
  REQUIRE(calls == 4U);
  REQUIRE(outcome.attempts == 4U);
  // No hook or sleep after the final attempt.
  REQUIRE(hook_calls == 3U);
  REQUIRE(outcome.delays == std::vector<std::chrono::milliseconds>{
                                std::chrono::milliseconds(5), std::chrono::milliseconds(10),
                                std::chrono::milliseconds(20)});
  REQUIRE(outcome.last_error.kind == ErrorKind::kTimeout);
  REQUIRE(outcome.last_error.message == "not attached");
}

TEST_CASE("RetryExecutor keeps the delay constant in fixed mode", "[orchestration][retry]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kDebug, sink);
  CancellationToken token;
  const RetryExecutor retry(token, logger);

  const auto outcome = retry.Execute(
      "trial tr0/exp1", Policy(4U, std::chrono::milliseconds(3), BackoffMode::kFixed),
      [](std::uint32_t, OrchestrationError& error) {
        error = MakeError(ErrorKind::kValidationFailure, "only header");
        return false;
      });

  REQUIRE(outcome.attempts == 4U);
  REQUIRE(outcome.delays == std::vector<std::chrono::milliseconds>(3U, std::chrono::milliseconds(3)));
}

TEST_CASE("RetryExecutor fills in a reason when an attempt gives none", "[orchestration][retry]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kDebug, sink);
  CancellationToken token;
  const RetryExecutor retry(token, logger);

  const auto outcome = retry.Execute(
      "silent", Policy(1U, std::chrono::milliseconds(1), BackoffMode::kFixed),
      [](std::uint32_t, OrchestrationError&) { return false; });
  REQUIRE(outcome.last_error.kind == ErrorKind::kStartFailure);
  REQUIRE_FALSE(outcome.last_error.message.empty());
}

TEST_CASE("RetryExecutor ends the loop when cancelled during backoff", "[orchestration][retry]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kDebug, sink);
  CancellationToken token;
  const RetryExecutor retry(token, logger);

  std::uint32_t calls = 0;
  const auto started = std::chrono::steady_clock::now();
  const auto outcome = retry.Execute(
      "start control plane", Policy(3U, std::chrono::seconds(30), BackoffMode::kExponential),
      [&calls](std::uint32_t, OrchestrationError& error) {
        ++calls;
        error = MakeError(ErrorKind::kStartFailure, "compose up failed");
        return false;
      },
      [&token](std::uint32_t, const OrchestrationError&) { token.Cancel("sigterm"); });

  REQUIRE(calls == 1U);
  REQUIRE(outcome.last_error.kind == ErrorKind::kCancelled);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
}

TEST_CASE("RetryExecutor does not retry a cancelled attempt", "[orchestration][retry]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kDebug, sink);
  CancellationToken token;
  const RetryExecutor retry(token, logger);

  std::uint32_t calls = 0;
  const auto outcome = retry.Execute(
      "wait clients", Policy(3U, std::chrono::milliseconds(1), BackoffMode::kExponential),
      [&calls](std::uint32_t, OrchestrationError& error) {
        ++calls;
        error = MakeError(ErrorKind::kCancelled, "poll cancelled");
        return false;
      });
  REQUIRE(calls == 1U);
  REQUIRE(outcome.last_error.kind == ErrorKind::kCancelled);
}
