#include "core/RetryPolicy.hpp"

#include "common/Errors.hpp"

#include <stdexcept>
#include <thread>

namespace gitbridge::core {

RetryPolicy::RetryPolicy(int iMaxAttempts, std::chrono::milliseconds durBaseDelay,
                         SleepFn fnSleep, RetryablePredicate fnRetryable)
    : _iMaxAttempts(iMaxAttempts),
      _durBaseDelay(durBaseDelay),
      _fnSleep(std::move(fnSleep)),
      _fnRetryable(std::move(fnRetryable)) {
  if (_iMaxAttempts < 1) {
    throw std::invalid_argument("RetryPolicy requires at least one attempt");
  }
}

RetryPolicy::~RetryPolicy() = default;

std::chrono::milliseconds RetryPolicy::delayAfter(int iAttempt) const {
  auto durDelay = _durBaseDelay;
  for (int i = 1; i < iAttempt; ++i) {
    durDelay *= 2;
  }
  return durDelay;
}

bool RetryPolicy::isTransientFailure(const std::exception& ex) {
  return dynamic_cast<const common::GitLockTimeoutError*>(&ex) != nullptr ||
         dynamic_cast<const common::GitIntegrationError*>(&ex) != nullptr ||
         dynamic_cast<const common::GitPublishError*>(&ex) != nullptr ||
         dynamic_cast<const common::GitCommandError*>(&ex) != nullptr;
}

void RetryPolicy::defaultSleep(std::chrono::milliseconds durDelay) {
  std::this_thread::sleep_for(durDelay);
}

}  // namespace gitbridge::core
