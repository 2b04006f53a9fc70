#include "core/FileService.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RetryPolicy.hpp"
#include "gitops/IGitClient.hpp"
#include "gitops/MutationExecutor.hpp"
#include "gitops/PathValidator.hpp"
#include "gitops/RepositorySynchronizer.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

namespace gitbridge::core {

namespace {

bool hasHiddenComponent(const std::filesystem::path& pathRelative) {
  for (const auto& part : pathRelative) {
    const auto sPart = part.string();
    if (!sPart.empty() && sPart.front() == '.') {
      return true;
    }
  }
  return false;
}

}  // namespace

FileService::FileService(const gitops::PathValidator& pvValidator,
                         const gitops::MutationExecutor& meExecutor,
                         gitops::RepositorySynchronizer& rsSynchronizer,
                         const RetryPolicy& rpRetry,
                         gitops::IGitClient& gcClient,
                         common::BootstrapStatus bsBootstrap)
    : _pvValidator(pvValidator),
      _meExecutor(meExecutor),
      _rsSynchronizer(rsSynchronizer),
      _rpRetry(rpRetry),
      _gcClient(gcClient),
      _bsBootstrap(std::move(bsBootstrap)) {}

FileService::~FileService() = default;

common::PublishOutcome FileService::publish(const std::string& sMessage) {
  return _rpRetry.run("publish '" + sMessage + "'",
                      [this, &sMessage]() { return _rsSynchronizer.publish(sMessage); });
}

common::OperationResult FileService::apply(const common::OperationRequest& orRequest) {
  common::OperationResult oresResult;
  oresResult.sPath = orRequest.sPath;

  switch (orRequest.kind) {
    case common::OperationKind::Write: {
      auto cpTarget = _pvValidator.validate(orRequest.sPath);
      _meExecutor.writeFile(cpTarget, orRequest.sContent);
      oresResult.outcome = publish("Upload " + orRequest.sPath);
      break;
    }
    case common::OperationKind::Move: {
      auto cpSource = _pvValidator.validate(orRequest.sPath);
      auto cpDestination = _pvValidator.validate(orRequest.sDestination);
      _meExecutor.moveFile(cpSource, cpDestination);
      oresResult.sDestination = orRequest.sDestination;
      oresResult.outcome = publish("Move " + orRequest.sPath + " to " + orRequest.sDestination);
      break;
    }
    case common::OperationKind::Delete: {
      // Safe mode refusal takes precedence over path validation
      _meExecutor.ensureDeletionAllowed();
      auto cpTarget = _pvValidator.validate(orRequest.sPath);
      _meExecutor.deleteFile(cpTarget);
      oresResult.outcome = publish("Delete " + orRequest.sPath);
      break;
    }
  }
  return oresResult;
}

std::vector<std::string> FileService::listTree() const {
  std::vector<std::string> vFiles;
  const auto& pathRoot = _pvValidator.root();

  std::error_code ec;
  std::filesystem::recursive_directory_iterator itEntry(pathRoot, ec);
  if (ec) {
    throw common::IoError("io_failure",
                          "Cannot list " + pathRoot.string() + ": " + ec.message());
  }
  for (; itEntry != std::filesystem::recursive_directory_iterator(); itEntry.increment(ec)) {
    if (ec) {
      throw common::IoError("io_failure", "Tree walk failed: " + ec.message());
    }
    const auto pathRelative = itEntry->path().lexically_relative(pathRoot);
    if (hasHiddenComponent(pathRelative)) {
      if (itEntry->is_directory(ec)) {
        itEntry.disable_recursion_pending();
      }
      continue;
    }
    if (itEntry->is_regular_file(ec)) {
      vFiles.push_back(pathRelative.generic_string());
    }
  }
  std::sort(vFiles.begin(), vFiles.end());
  return vFiles;
}

common::FileInfo FileService::verify(const std::string& sPath) const {
  auto cpTarget = _pvValidator.validate(sPath);

  common::FileInfo fiResult;
  fiResult.sPath = cpTarget.sRelative;

  std::error_code ec;
  fiResult.bExists = std::filesystem::exists(cpTarget.pathAbsolute, ec);
  if (!fiResult.bExists) {
    return fiResult;
  }
  if (std::filesystem::is_regular_file(cpTarget.pathAbsolute, ec)) {
    fiResult.uSize = std::filesystem::file_size(cpTarget.pathAbsolute, ec);
  }
  const auto tpWrite = std::filesystem::last_write_time(cpTarget.pathAbsolute, ec);
  if (!ec) {
    const auto tpSystem = std::chrono::file_clock::to_sys(tpWrite);
    fiResult.iModifiedEpochSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(tpSystem.time_since_epoch()).count();
  }
  return fiResult;
}

common::HealthReport FileService::health() const {
  common::HealthReport hrReport;
  const auto& pathRoot = _pvValidator.root();
  hrReport.sRepo = pathRoot.string();
  hrReport.bSafeMode = _meExecutor.safeMode();
  hrReport.bsBootstrap = _bsBootstrap;

  std::error_code ec;
  if (!std::filesystem::exists(pathRoot, ec)) {
    hrReport.sStatus = "error";
    hrReport.sMessage = "Repo not found";
    return hrReport;
  }

  try {
    hrReport.oClean = !_gcClient.hasLocalChanges();
  } catch (const common::GitError& ex) {
    hrReport.sStatus = "warning";
    hrReport.sGitError = ex.what();
  }

  hrReport.oRemote = _gcClient.probeRemote();
  if (*hrReport.oRemote != common::RemoteStatus::Connected) {
    hrReport.sStatus = "warning";
  }
  return hrReport;
}

}  // namespace gitbridge::core
