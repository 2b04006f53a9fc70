#include "gitops/MutationExecutor.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "gitops/AtomicFileWriter.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>

namespace gitbridge::gitops {

MutationExecutor::MutationExecutor(bool bSafeMode) : _bSafeMode(bSafeMode) {}

MutationExecutor::~MutationExecutor() = default;

void MutationExecutor::writeFile(const common::CanonicalPath& cpTarget,
                                 const std::string& sContent) const {
  AtomicFileWriter afwWriter(cpTarget.pathAbsolute);
  afwWriter.write(sContent);
  afwWriter.commit();
  common::Logger::get()->info("File written: {} ({} bytes)", cpTarget.sRelative, sContent.size());
}

void MutationExecutor::moveFile(const common::CanonicalPath& cpSource,
                                const common::CanonicalPath& cpDestination) const {
  std::error_code ec;
  if (!std::filesystem::exists(std::filesystem::symlink_status(cpSource.pathAbsolute, ec))) {
    throw common::NotFoundError("source_not_found", "Source not found: " + cpSource.sRelative);
  }

  // An existing directory destination receives the source under its own name
  std::filesystem::path pathTarget = cpDestination.pathAbsolute;
  std::string sTarget = cpDestination.sRelative;
  if (std::filesystem::is_directory(pathTarget, ec)) {
    pathTarget /= cpSource.pathAbsolute.filename();
    sTarget += "/" + cpSource.pathAbsolute.filename().string();
  }
  ec.clear();

  const auto itSrc = std::mismatch(cpSource.pathAbsolute.begin(), cpSource.pathAbsolute.end(),
                                   pathTarget.begin(), pathTarget.end())
                         .first;
  if (itSrc == cpSource.pathAbsolute.end() &&
      std::filesystem::is_directory(cpSource.pathAbsolute, ec)) {
    throw common::ValidationError("invalid_destination",
                                  "Cannot move " + cpSource.sRelative + " into itself");
  }

  std::filesystem::create_directories(pathTarget.parent_path(), ec);
  if (ec) {
    throw common::IoError("io_failure",
                          "Cannot create directory for " + sTarget + ": " + ec.message());
  }

  std::filesystem::rename(cpSource.pathAbsolute, pathTarget, ec);
  if (ec == std::errc::cross_device_link) {
    // Different filesystems: copy then remove
    ec.clear();
    std::filesystem::copy(cpSource.pathAbsolute, pathTarget,
                          std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::overwrite_existing,
                          ec);
    if (!ec) {
      std::filesystem::remove_all(cpSource.pathAbsolute, ec);
    }
  }
  if (ec) {
    throw common::IoError("io_failure", "Move " + cpSource.sRelative + " to " + sTarget +
                                            " failed: " + ec.message());
  }
  common::Logger::get()->info("Moved {} to {}", cpSource.sRelative, sTarget);
}

void MutationExecutor::ensureDeletionAllowed() const {
  if (_bSafeMode) {
    throw common::ForbiddenError("safe_mode", "Deletion disabled (safe mode)");
  }
}

void MutationExecutor::deleteFile(const common::CanonicalPath& cpTarget) const {
  ensureDeletionAllowed();

  std::error_code ec;
  const auto fsStatus = std::filesystem::symlink_status(cpTarget.pathAbsolute, ec);
  if (!std::filesystem::exists(fsStatus)) {
    throw common::NotFoundError("file_not_found", "File not found: " + cpTarget.sRelative);
  }
  if (std::filesystem::is_directory(fsStatus)) {
    throw common::ValidationError("not_a_file", "Not a file: " + cpTarget.sRelative);
  }

  std::filesystem::remove(cpTarget.pathAbsolute, ec);
  if (ec) {
    throw common::IoError("io_failure",
                          "Delete " + cpTarget.sRelative + " failed: " + ec.message());
  }
  common::Logger::get()->info("Deleted {}", cpTarget.sRelative);
}

}  // namespace gitbridge::gitops
