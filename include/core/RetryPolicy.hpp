#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <string>

#include "common/Logger.hpp"

namespace gitbridge::core {

/// Bounded retry with exponential backoff (base, 2*base, 4*base, ...).
/// Sleep and the retryable predicate are injected so the policy can be
/// exercised without real delays.
/// Class abbreviation: rp
class RetryPolicy {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;
  using RetryablePredicate = std::function<bool(const std::exception&)>;

  RetryPolicy(int iMaxAttempts, std::chrono::milliseconds durBaseDelay,
              SleepFn fnSleep = defaultSleep,
              RetryablePredicate fnRetryable = isTransientFailure);
  ~RetryPolicy();

  /// Invoke fnOp until it returns, a non-retryable exception escapes, or
  /// attempts are exhausted; the last failure is rethrown unchanged.
  template <typename F>
  auto run(const std::string& sOperation, F&& fnOp) const -> decltype(fnOp());

  /// Delay slept after the given failed attempt (1-based).
  std::chrono::milliseconds delayAfter(int iAttempt) const;

  int maxAttempts() const { return _iMaxAttempts; }

  /// Lock timeouts, integration conflicts, push failures and other git
  /// command failures are transient; caller and filesystem errors are not.
  static bool isTransientFailure(const std::exception& ex);

  static void defaultSleep(std::chrono::milliseconds durDelay);

 private:
  int _iMaxAttempts;
  std::chrono::milliseconds _durBaseDelay;
  SleepFn _fnSleep;
  RetryablePredicate _fnRetryable;
};

template <typename F>
auto RetryPolicy::run(const std::string& sOperation, F&& fnOp) const -> decltype(fnOp()) {
  for (int iAttempt = 1;; ++iAttempt) {
    try {
      return fnOp();
    } catch (const std::exception& ex) {
      auto spLog = common::Logger::get();
      if (!_fnRetryable(ex)) {
        throw;
      }
      if (iAttempt >= _iMaxAttempts) {
        spLog->error("{}: attempt {}/{} failed: {}; giving up", sOperation, iAttempt,
                     _iMaxAttempts, ex.what());
        throw;
      }
      const auto durDelay = delayAfter(iAttempt);
      spLog->warn("{}: attempt {}/{} failed: {}; retrying in {}ms", sOperation, iAttempt,
                  _iMaxAttempts, ex.what(), durDelay.count());
      _fnSleep(durDelay);
    }
  }
}

}  // namespace gitbridge::core
