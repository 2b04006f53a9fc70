#include "gitops/RepositoryBootstrapper.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "gitops/IGitClient.hpp"

#include <system_error>

namespace gitbridge::gitops {

RepositoryBootstrapper::RepositoryBootstrapper(IGitClient& gcClient,
                                               std::filesystem::path pathRoot)
    : _gcClient(gcClient), _pathRoot(std::move(pathRoot)) {}

RepositoryBootstrapper::~RepositoryBootstrapper() = default;

common::BootstrapStatus RepositoryBootstrapper::ensure() {
  auto spLog = common::Logger::get();
  common::BootstrapStatus bsStatus;

  try {
    std::error_code ec;
    if (!std::filesystem::exists(_pathRoot, ec)) {
      spLog->info("Cloning repository into {}", _pathRoot.string());
      _gcClient.clone();
      spLog->info("Repository cloned successfully");
    }

    if (!std::filesystem::exists(_pathRoot / ".git", ec)) {
      throw common::BootstrapError("bootstrap_failed",
                                   _pathRoot.string() + " exists but is not a git working copy");
    }

    _gcClient.installExcludes();
    _gcClient.checkoutBranch();
    _gcClient.pullFastForward();

    bsStatus.bReady = true;
    bsStatus.sDetail = "ready";
    spLog->info("Repository is ready at {}", _pathRoot.string());
  } catch (const common::AppError& ex) {
    bsStatus.bReady = false;
    bsStatus.sDetail = ex.what();
    spLog->warn("Repository bootstrap incomplete, starting degraded: {}", ex.what());
  } catch (const std::filesystem::filesystem_error& ex) {
    bsStatus.bReady = false;
    bsStatus.sDetail = ex.what();
    spLog->warn("OS error during repository bootstrap, starting degraded: {}", ex.what());
  }
  return bsStatus;
}

}  // namespace gitbridge::gitops
