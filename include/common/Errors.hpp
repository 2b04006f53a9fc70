#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace gitbridge::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: malformed request or a path rejected by PathValidator.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 403 Forbidden: refused by policy (safe mode).
struct ForbiddenError : AppError {
  explicit ForbiddenError(std::string sCode, std::string sMsg)
      : AppError(403, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: requested file or profile does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: local filesystem mutation failed.
struct IoError : AppError {
  explicit IoError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: base for all version-control failures.
struct GitError : AppError {
  explicit GitError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

/// Exclusive mutation lock not acquired within the configured timeout.
struct GitLockTimeoutError : GitError {
  explicit GitLockTimeoutError(std::string sCode, std::string sMsg)
      : GitError(std::move(sCode), std::move(sMsg)) {}
};

/// Upstream history could not be replayed onto the local commit.
/// Recovered inside the synchronizer (logged, push still attempted).
struct GitIntegrationError : GitError {
  explicit GitIntegrationError(std::string sCode, std::string sMsg)
      : GitError(std::move(sCode), std::move(sMsg)) {}
};

/// Push rejected by the remote, network failure, or push timeout.
struct GitPublishError : GitError {
  explicit GitPublishError(std::string sCode, std::string sMsg)
      : GitError(std::move(sCode), std::move(sMsg)) {}
};

/// Any other failed git invocation (status, add, commit, spawn failure).
struct GitCommandError : GitError {
  explicit GitCommandError(std::string sCode, std::string sMsg)
      : GitError(std::move(sCode), std::move(sMsg)) {}
};

/// Working copy could not be cloned or refreshed at startup (non-fatal: logged,
/// surfaced through /health).
struct BootstrapError : GitError {
  explicit BootstrapError(std::string sCode, std::string sMsg)
      : GitError(std::move(sCode), std::move(sMsg)) {}
};

}  // namespace gitbridge::common
