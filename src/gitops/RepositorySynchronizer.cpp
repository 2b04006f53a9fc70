#include "gitops/RepositorySynchronizer.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "gitops/IGitClient.hpp"
#include "gitops/RepositoryLock.hpp"

namespace gitbridge::gitops {

RepositorySynchronizer::RepositorySynchronizer(IGitClient& gcClient, RepositoryLock& rlLock,
                                               std::chrono::milliseconds durLockTimeout)
    : _gcClient(gcClient), _rlLock(rlLock), _durLockTimeout(durLockTimeout) {}

RepositorySynchronizer::~RepositorySynchronizer() = default;

common::PublishOutcome RepositorySynchronizer::publish(const std::string& sMessage) {
  auto spLog = common::Logger::get();
  auto state = common::SyncState::LockAcquiring;
  auto enter = [&](common::SyncState stNext) {
    spLog->debug("Publish '{}': {} -> {}", sMessage, common::toString(state),
                 common::toString(stNext));
    state = stNext;
  };

  try {
    auto lgGuard = _rlLock.acquire(_durLockTimeout);

    enter(common::SyncState::Staging);
    const bool bDirty = _gcClient.hasLocalChanges();
    if (!bDirty && !_gcClient.hasUnpublishedCommits()) {
      spLog->info("No changes to commit for '{}'", sMessage);
      enter(common::SyncState::Idle);
      return common::PublishOutcome::NoChanges;
    }

    if (bDirty) {
      _gcClient.stageAll();
      enter(common::SyncState::Committing);
      _gcClient.commit(sMessage);
    } else {
      // A previous cycle committed but failed to push
      spLog->info("Re-publishing existing local commits for '{}'", sMessage);
    }

    enter(common::SyncState::Integrating);
    try {
      _gcClient.integrateUpstream();
    } catch (const common::GitIntegrationError& ex) {
      spLog->warn("Upstream integration failed, continuing with push: {}", ex.what());
    }

    enter(common::SyncState::Publishing);
    _gcClient.push();
    spLog->info("Committed and pushed: {}", sMessage);
    enter(common::SyncState::Idle);
    return common::PublishOutcome::Published;
  } catch (const common::AppError& ex) {
    spLog->error("Publish '{}' failed in state {}: {}", sMessage, common::toString(state),
                 ex.what());
    throw;
  }
}

}  // namespace gitbridge::gitops
