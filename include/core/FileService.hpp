#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace gitbridge::gitops {
class IGitClient;
class MutationExecutor;
class PathValidator;
class RepositorySynchronizer;
}  // namespace gitbridge::gitops

namespace gitbridge::core {

class RetryPolicy;

/// Request-level operations behind the HTTP routes.
/// Each mutation runs validate → execute → publish (with retries) and only
/// returns once the change is pushed or known to need no commit.
/// Class abbreviation: fs
class FileService {
 public:
  FileService(const gitops::PathValidator& pvValidator,
              const gitops::MutationExecutor& meExecutor,
              gitops::RepositorySynchronizer& rsSynchronizer,
              const RetryPolicy& rpRetry,
              gitops::IGitClient& gcClient,
              common::BootstrapStatus bsBootstrap);
  ~FileService();

  /// Throws ValidationError, ForbiddenError, NotFoundError, IoError, or the
  /// final GitError once retries are exhausted.
  common::OperationResult apply(const common::OperationRequest& orRequest);

  /// Sorted repository-relative paths of regular files, hidden entries skipped.
  std::vector<std::string> listTree() const;

  common::FileInfo verify(const std::string& sPath) const;

  common::HealthReport health() const;

 private:
  common::PublishOutcome publish(const std::string& sMessage);

  const gitops::PathValidator& _pvValidator;
  const gitops::MutationExecutor& _meExecutor;
  gitops::RepositorySynchronizer& _rsSynchronizer;
  const RetryPolicy& _rpRetry;
  gitops::IGitClient& _gcClient;
  common::BootstrapStatus _bsBootstrap;
};

}  // namespace gitbridge::core
