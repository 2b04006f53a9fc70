#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace gitbridge::common {

/// A caller path that PathValidator resolved inside the repository root.
/// Class abbreviation: cp
struct CanonicalPath {
  std::filesystem::path pathAbsolute;
  std::string sRelative;
};

/// Kind of working-copy mutation requested through the facade.
enum class OperationKind { Write, Move, Delete };

/// Validated description of one caller-intended mutation.
/// sDestination is only used by Move, sContent only by Write.
/// Class abbreviation: or
struct OperationRequest {
  OperationKind kind = OperationKind::Write;
  std::string sPath;
  std::string sDestination;
  std::string sContent;
};

/// Result of one publish cycle.
enum class PublishOutcome { Published, NoChanges };

/// Result of applying an OperationRequest.
/// Class abbreviation: ores
struct OperationResult {
  std::string sPath;
  std::string sDestination;
  PublishOutcome outcome = PublishOutcome::NoChanges;
};

/// States of a single publish cycle.
enum class SyncState { Idle, LockAcquiring, Staging, Committing, Integrating, Publishing };

inline const char* toString(SyncState state) {
  switch (state) {
    case SyncState::Idle:          return "Idle";
    case SyncState::LockAcquiring: return "LockAcquiring";
    case SyncState::Staging:       return "Staging";
    case SyncState::Committing:    return "Committing";
    case SyncState::Integrating:   return "Integrating";
    case SyncState::Publishing:    return "Publishing";
  }
  return "Unknown";
}

/// Remote branch the working copy mirrors.
/// Class abbreviation: ur
struct UpstreamReference {
  std::string sRemoteUrl;
  std::string sBranch = "main";
};

/// Outcome of RepositoryBootstrapper::ensure().
/// Class abbreviation: bs
struct BootstrapStatus {
  bool bReady = false;
  std::string sDetail;
};

/// Reachability of the upstream remote.
enum class RemoteStatus { Connected, Disconnected, Timeout };

/// File metadata reported by /verify_upload.
/// Class abbreviation: fi
struct FileInfo {
  bool bExists = false;
  std::string sPath;
  std::uintmax_t uSize = 0;
  int64_t iModifiedEpochSeconds = 0;
};

/// Working copy health as reported by /health.
/// Class abbreviation: hr
struct HealthReport {
  std::string sStatus = "ok";  // ok | warning | error
  std::string sRepo;
  bool bSafeMode = true;
  BootstrapStatus bsBootstrap;
  std::optional<bool> oClean;
  std::optional<RemoteStatus> oRemote;
  std::string sGitError;
  std::string sMessage;
};

}  // namespace gitbridge::common
