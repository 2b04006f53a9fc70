#pragma once

#include <string>

#include "common/Types.hpp"

namespace gitbridge::gitops {

/// Version-control operations needed by the synchronizer and bootstrapper.
/// All calls operate on the single working copy the client was built for.
class IGitClient {
 public:
  virtual ~IGitClient() = default;

  /// True if the working tree has uncommitted changes (tracked or untracked).
  virtual bool hasLocalChanges() = 0;

  /// True if HEAD carries commits the upstream branch does not have.
  virtual bool hasUnpublishedCommits() = 0;

  virtual void stageAll() = 0;
  virtual void commit(const std::string& sMessage) = 0;

  /// Replay local commits on top of new upstream history.
  /// Throws GitIntegrationError; the working copy is left on the local commit.
  virtual void integrateUpstream() = 0;

  /// Publish HEAD to the upstream branch. Throws GitPublishError.
  virtual void push() = 0;

  /// Clone the upstream into the working-copy root. Throws BootstrapError.
  virtual void clone() = 0;
  virtual void checkoutBranch() = 0;
  virtual void pullFastForward() = 0;

  /// Keep temporary write artifacts out of the version-controlled content.
  virtual void installExcludes() = 0;

  virtual common::RemoteStatus probeRemote() = 0;
};

}  // namespace gitbridge::gitops
