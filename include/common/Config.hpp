#pragma once

#include <optional>
#include <string>

namespace gitbridge::common {

/// Environment + active profile loader.
/// Loads all settings into a typed struct with validation; built once at
/// startup and passed by reference to the components that need it.
/// Class abbreviation: cfg
struct Config {
  // ── Profile ───────────────────────────────────────────────────────────
  std::string sProfilePath = "profiles/active.json";
  std::string sProfileName = "unknown";
  std::string sRepo;          // owner/name
  std::string sToken;         // raw secret (zeroed after handoff to TokenCredentialProvider)
  std::string sLocalFolder = "local_repo";
  bool bSafeMode = true;
  std::optional<std::string> oProfileError;

  // ── Upstream ──────────────────────────────────────────────────────────
  std::string sRemoteUrl;
  std::string sBranch = "main";
  std::string sGitUsername = "x-access-token";
  std::string sGitAuthorName = "GitBridge";
  std::string sGitAuthorEmail = "gitbridge@localhost";

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;

  // ── Synchronization ───────────────────────────────────────────────────
  int iLockTimeoutSeconds = 30;
  int iGitTimeoutSeconds = 30;
  int iCloneTimeoutSeconds = 60;
  int iRemoteProbeTimeoutSeconds = 10;
  int iPublishAttempts = 3;
  int iRetryBaseDelayMs = 1000;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";
  std::string sLogFile = "gitbridge.log";

  /// Load and validate all config from environment variables and the active
  /// profile document. A missing or malformed profile is recorded in
  /// oProfileError instead of throwing.
  /// Throws std::runtime_error on invalid numeric constraints.
  static Config load();

 private:
  /// Read an optional secret: varName first, then the file named by varName + "_FILE".
  /// Trims trailing whitespace/newlines from file contents. Empty if neither is set.
  static std::string loadOptionalSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0/yes/no).
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace gitbridge::common
