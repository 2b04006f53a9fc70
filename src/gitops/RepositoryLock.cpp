#include "gitops/RepositoryLock.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <thread>

namespace gitbridge::gitops {

// ── RepositoryLockGuard ────────────────────────────────────────────────────

RepositoryLockGuard::RepositoryLockGuard(int iFd) : _iFd(iFd) {}

RepositoryLockGuard::~RepositoryLockGuard() { release(); }

RepositoryLockGuard::RepositoryLockGuard(RepositoryLockGuard&& other) noexcept
    : _iFd(other._iFd) {
  other._iFd = -1;
}

RepositoryLockGuard& RepositoryLockGuard::operator=(RepositoryLockGuard&& other) noexcept {
  if (this != &other) {
    release();
    _iFd = other._iFd;
    other._iFd = -1;
  }
  return *this;
}

void RepositoryLockGuard::release() noexcept {
  if (_iFd < 0) {
    return;
  }
  // Closing the descriptor drops the flock even if LOCK_UN fails
  ::flock(_iFd, LOCK_UN);
  ::close(_iFd);
  _iFd = -1;
  common::Logger::get()->info("Released repository lock");
}

// ── RepositoryLock ─────────────────────────────────────────────────────────

RepositoryLock::RepositoryLock(std::filesystem::path pathLockFile,
                               std::chrono::milliseconds durPollInterval)
    : _pathLockFile(std::move(pathLockFile)), _durPollInterval(durPollInterval) {}

RepositoryLock::~RepositoryLock() = default;

RepositoryLockGuard RepositoryLock::acquire(std::chrono::milliseconds durTimeout) {
  const int iFd = ::open(_pathLockFile.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
  if (iFd < 0) {
    throw common::GitCommandError("git_command_failed",
                                  "Cannot open lock file " + _pathLockFile.string() + ": " +
                                      std::strerror(errno));
  }

  const auto tpDeadline = std::chrono::steady_clock::now() + durTimeout;
  for (;;) {
    if (::flock(iFd, LOCK_EX | LOCK_NB) == 0) {
      common::Logger::get()->info("Acquired repository lock");
      return RepositoryLockGuard(iFd);
    }
    const int iErr = errno;
    if (iErr != EWOULDBLOCK && iErr != EINTR) {
      ::close(iFd);
      throw common::GitCommandError("git_command_failed",
                                    "flock failed on " + _pathLockFile.string() + ": " +
                                        std::strerror(iErr));
    }
    if (std::chrono::steady_clock::now() >= tpDeadline) {
      ::close(iFd);
      throw common::GitLockTimeoutError(
          "lock_timeout", "Could not acquire repository lock within " +
                              std::to_string(durTimeout.count()) + "ms");
    }
    std::this_thread::sleep_for(_durPollInterval);
  }
}

}  // namespace gitbridge::gitops
