#pragma once

#include <chrono>
#include <string>

#include "common/Types.hpp"

namespace gitbridge::gitops {

class IGitClient;
class RepositoryLock;

/// Serializes publish cycles: lock → inspect → stage/commit → integrate → push.
/// At most one cycle runs at a time across threads and processes; the lock is
/// released on every exit path. Retries are the caller's concern (RetryPolicy).
/// Class abbreviation: rs
class RepositorySynchronizer {
 public:
  RepositorySynchronizer(IGitClient& gcClient, RepositoryLock& rlLock,
                         std::chrono::milliseconds durLockTimeout);
  ~RepositorySynchronizer();

  /// Run one publish cycle labelled sMessage.
  /// Returns NoChanges when neither the working tree nor unpublished commits
  /// differ from upstream. An integration conflict is logged and the push is
  /// still attempted.
  /// Throws GitLockTimeoutError, GitPublishError, GitCommandError.
  common::PublishOutcome publish(const std::string& sMessage);

 private:
  IGitClient& _gcClient;
  RepositoryLock& _rlLock;
  std::chrono::milliseconds _durLockTimeout;
};

}  // namespace gitbridge::gitops
