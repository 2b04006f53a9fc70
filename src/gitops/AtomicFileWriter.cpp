#include "gitops/AtomicFileWriter.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <system_error>

namespace gitbridge::gitops {

namespace {

[[noreturn]] void throwIo(const std::string& sWhat, const std::filesystem::path& pathFile,
                          int iErr) {
  throw common::IoError("io_failure",
                        sWhat + " " + pathFile.string() + ": " + std::strerror(iErr));
}

}  // namespace

AtomicFileWriter::AtomicFileWriter(std::filesystem::path pathTarget)
    : _pathTarget(std::move(pathTarget)) {
  std::error_code ec;
  std::filesystem::create_directories(_pathTarget.parent_path(), ec);
  if (ec) {
    throw common::IoError("io_failure", "Cannot create directory " +
                                            _pathTarget.parent_path().string() + ": " +
                                            ec.message());
  }

  // As there is no high-level replacement of mkstemp(3), fall back to libc
  std::string sTemplate =
      (_pathTarget.parent_path() / ("." + _pathTarget.filename().string() + ".gbtmp-XXXXXX"))
          .string();
  _iFd = ::mkostemp(sTemplate.data(), O_CLOEXEC);
  if (_iFd < 0) {
    throwIo("Cannot create temporary file for", _pathTarget, errno);
  }
  _pathTemp = sTemplate;
}

AtomicFileWriter::~AtomicFileWriter() {
  if (_iFd >= 0) {
    ::close(_iFd);
  }
  if (!_bCommitted && !_pathTemp.empty()) {
    std::error_code ec;
    std::filesystem::remove(_pathTemp, ec);
    if (ec) {
      common::Logger::get()->warn("Could not remove temporary file {}: {}", _pathTemp.string(),
                                  ec.message());
    }
  }
}

void AtomicFileWriter::write(std::string_view svData) {
  if (_iFd < 0) {
    throw common::IoError("io_failure", "Write after commit to " + _pathTarget.string());
  }
  const char* pData = svData.data();
  size_t uLeft = svData.size();
  while (uLeft > 0) {
    const ssize_t iWritten = ::write(_iFd, pData, uLeft);
    if (iWritten < 0) {
      if (errno == EINTR) continue;
      throwIo("Cannot write temporary file for", _pathTarget, errno);
    }
    pData += iWritten;
    uLeft -= static_cast<size_t>(iWritten);
  }
}

void AtomicFileWriter::commit() {
  if (_iFd < 0) {
    throw common::IoError("io_failure", "Commit without open file for " + _pathTarget.string());
  }
  if (::fsync(_iFd) != 0) {
    throwIo("Cannot flush temporary file for", _pathTarget, errno);
  }
  const int iFd = _iFd;
  _iFd = -1;
  if (::close(iFd) != 0) {
    throwIo("Cannot close temporary file for", _pathTarget, errno);
  }
  // Temporary files are created 0600; published content uses the usual mode
  if (::chmod(_pathTemp.c_str(), 0644) != 0) {
    common::Logger::get()->warn("Could not set mode on {}: {}", _pathTemp.string(),
                                std::strerror(errno));
  }
  if (std::rename(_pathTemp.c_str(), _pathTarget.c_str()) != 0) {
    throwIo("Cannot rename temporary file onto", _pathTarget, errno);
  }
  _bCommitted = true;
}

}  // namespace gitbridge::gitops
