#pragma once

#include <chrono>
#include <filesystem>

namespace gitbridge::gitops {

/// RAII guard for a held RepositoryLock.
/// Releases the flock and closes the descriptor on destruction.
/// Class abbreviation: lg
class RepositoryLockGuard {
 public:
  explicit RepositoryLockGuard(int iFd);
  ~RepositoryLockGuard();

  RepositoryLockGuard(const RepositoryLockGuard&) = delete;
  RepositoryLockGuard& operator=(const RepositoryLockGuard&) = delete;
  RepositoryLockGuard(RepositoryLockGuard&& other) noexcept;
  RepositoryLockGuard& operator=(RepositoryLockGuard&& other) noexcept;

  bool held() const { return _iFd >= 0; }

 private:
  void release() noexcept;

  int _iFd;
};

/// Exclusive mutation lock backed by flock(2) on a file under .git/.
/// Each acquire() opens its own descriptor, so the lock excludes other
/// threads of this process as well as other processes.
/// Class abbreviation: rl
class RepositoryLock {
 public:
  explicit RepositoryLock(std::filesystem::path pathLockFile,
                          std::chrono::milliseconds durPollInterval = std::chrono::milliseconds(25));
  ~RepositoryLock();

  /// Block up to durTimeout for the lock.
  /// Throws GitLockTimeoutError on timeout, GitCommandError if the lock file
  /// cannot be opened.
  RepositoryLockGuard acquire(std::chrono::milliseconds durTimeout);

  const std::filesystem::path& path() const { return _pathLockFile; }

 private:
  std::filesystem::path _pathLockFile;
  std::chrono::milliseconds _durPollInterval;
};

}  // namespace gitbridge::gitops
