#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "profiles/ProfileStore.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace gitbridge::common {

namespace {

void requireAtLeast(const char* pVarName, int iValue, int iMinimum) {
  if (iValue < iMinimum) {
    throw std::runtime_error(std::string(pVarName) + " must be >= " + std::to_string(iMinimum) +
                             " (got " + std::to_string(iValue) + ")");
  }
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    return std::stoi(sValue);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

std::string Config::loadOptionalSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return {};
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }
  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Profile ────────────────────────────────────────────────────────────
  const std::string sProfilePath = getEnv("GITBRIDGE_PROFILE_PATH");
  if (!sProfilePath.empty()) {
    cfg.sProfilePath = sProfilePath;
  }

  try {
    profiles::ProfileStore psStore(cfg.sProfilePath);
    auto prActive = psStore.loadActive();
    cfg.sProfileName = prActive.sName.empty() ? "unknown" : prActive.sName;
    cfg.sRepo = prActive.sRepo;
    cfg.sToken = prActive.sToken;
    cfg.sLocalFolder = prActive.sLocalFolder;
    cfg.bSafeMode = prActive.bSafeMode;
  } catch (const AppError& ex) {
    // Startup continues with defaults; bootstrap will report the degradation
    cfg.oProfileError = ex.what();
  }

  if (cfg.sToken.empty()) {
    cfg.sToken = loadOptionalSecret("GITHUB_TOKEN");
  }
  cfg.bSafeMode = getEnvBool("GITBRIDGE_SAFE_MODE", cfg.bSafeMode);

  // ── Upstream ───────────────────────────────────────────────────────────
  const std::string sBranch = getEnv("GITBRIDGE_BRANCH");
  if (!sBranch.empty()) {
    cfg.sBranch = sBranch;
  }
  cfg.sRemoteUrl = getEnv("GITBRIDGE_REMOTE_URL");
  if (cfg.sRemoteUrl.empty() && !cfg.sRepo.empty()) {
    cfg.sRemoteUrl = "https://github.com/" + cfg.sRepo + ".git";
  }
  const std::string sGitUsername = getEnv("GITBRIDGE_GIT_USERNAME");
  if (!sGitUsername.empty()) {
    cfg.sGitUsername = sGitUsername;
  }
  const std::string sAuthorName = getEnv("GITBRIDGE_GIT_AUTHOR_NAME");
  if (!sAuthorName.empty()) {
    cfg.sGitAuthorName = sAuthorName;
  }
  const std::string sAuthorEmail = getEnv("GITBRIDGE_GIT_AUTHOR_EMAIL");
  if (!sAuthorEmail.empty()) {
    cfg.sGitAuthorEmail = sAuthorEmail;
  }

  // ── HTTP ───────────────────────────────────────────────────────────────
  cfg.iHttpPort = getEnvInt("GITBRIDGE_HTTP_PORT", 8080);
  cfg.iHttpThreads = getEnvInt("GITBRIDGE_HTTP_THREADS", 4);

  // ── Synchronization ────────────────────────────────────────────────────
  cfg.iLockTimeoutSeconds = getEnvInt("GITBRIDGE_LOCK_TIMEOUT_SECONDS", 30);
  cfg.iGitTimeoutSeconds = getEnvInt("GITBRIDGE_GIT_TIMEOUT_SECONDS", 30);
  cfg.iCloneTimeoutSeconds = getEnvInt("GITBRIDGE_CLONE_TIMEOUT_SECONDS", 60);
  cfg.iRemoteProbeTimeoutSeconds = getEnvInt("GITBRIDGE_REMOTE_PROBE_TIMEOUT_SECONDS", 10);
  cfg.iPublishAttempts = getEnvInt("GITBRIDGE_PUBLISH_ATTEMPTS", 3);
  cfg.iRetryBaseDelayMs = getEnvInt("GITBRIDGE_RETRY_BASE_DELAY_MS", 1000);

  // ── Logging ────────────────────────────────────────────────────────────
  const std::string sLogLevel = getEnv("GITBRIDGE_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }
  const char* pLogFile = std::getenv("GITBRIDGE_LOG_FILE");
  if (pLogFile != nullptr) {
    cfg.sLogFile = pLogFile;  // empty disables the file sink
  }

  // ── Validation ─────────────────────────────────────────────────────────
  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error("GITBRIDGE_HTTP_PORT must be in 1..65535 (got " +
                             std::to_string(cfg.iHttpPort) + ")");
  }
  requireAtLeast("GITBRIDGE_HTTP_THREADS", cfg.iHttpThreads, 1);
  requireAtLeast("GITBRIDGE_LOCK_TIMEOUT_SECONDS", cfg.iLockTimeoutSeconds, 1);
  requireAtLeast("GITBRIDGE_GIT_TIMEOUT_SECONDS", cfg.iGitTimeoutSeconds, 1);
  requireAtLeast("GITBRIDGE_CLONE_TIMEOUT_SECONDS", cfg.iCloneTimeoutSeconds, 1);
  requireAtLeast("GITBRIDGE_REMOTE_PROBE_TIMEOUT_SECONDS", cfg.iRemoteProbeTimeoutSeconds, 1);
  requireAtLeast("GITBRIDGE_PUBLISH_ATTEMPTS", cfg.iPublishAttempts, 1);
  requireAtLeast("GITBRIDGE_RETRY_BASE_DELAY_MS", cfg.iRetryBaseDelayMs, 0);

  return cfg;
}

}  // namespace gitbridge::common
