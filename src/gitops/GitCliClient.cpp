#include "gitops/GitCliClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "gitops/AskPassHelper.hpp"
#include "gitops/ICredentialProvider.hpp"

#include <openssl/crypto.h>

#include <fstream>
#include <memory>
#include <sstream>

namespace gitbridge::gitops {

namespace {

std::string describe(const std::vector<std::string>& vArgs) {
  std::string sResult = "git";
  for (const auto& s : vArgs) {
    sResult += ' ';
    sResult += s;
  }
  return sResult;
}

std::string trimmed(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
    s.pop_back();
  }
  return s;
}

/// Human-readable failure detail for an unsuccessful command.
std::string failureDetail(const CommandResult& crResult) {
  if (crResult.bTimedOut) {
    return "timed out";
  }
  std::string sDetail = "exit " + std::to_string(crResult.iExitCode);
  const std::string sErr = trimmed(crResult.sStderr);
  if (!sErr.empty()) {
    sDetail += ": " + sErr;
  }
  return sDetail;
}

}  // namespace

GitCliClient::GitCliClient(std::filesystem::path pathRoot,
                           common::UpstreamReference urUpstream,
                           const ICredentialProvider& cpCredentials,
                           GitCliOptions gcoOptions,
                           const CommandRunner& crRunner)
    : _pathRoot(std::move(pathRoot)),
      _urUpstream(std::move(urUpstream)),
      _cpCredentials(cpCredentials),
      _gcoOptions(std::move(gcoOptions)),
      _crRunner(crRunner) {}

GitCliClient::~GitCliClient() = default;

CommandResult GitCliClient::git(const std::vector<std::string>& vArgs, bool bRemote,
                                std::chrono::milliseconds durTimeout,
                                const std::filesystem::path& pathCwd) const {
  std::vector<std::string> vArgv = {
      "git",
      "-c", "user.name=" + _gcoOptions.sAuthorName,
      "-c", "user.email=" + _gcoOptions.sAuthorEmail,
  };
  vArgv.insert(vArgv.end(), vArgs.begin(), vArgs.end());

  std::map<std::string, std::string> mEnv = {{"GIT_TERMINAL_PROMPT", "0"}};
  if (pathCwd == _pathRoot) {
    // Pin the repository so git never discovers an enclosing one
    const auto pathAbsRoot = std::filesystem::absolute(_pathRoot);
    mEnv["GIT_DIR"] = (pathAbsRoot / ".git").string();
    mEnv["GIT_WORK_TREE"] = pathAbsRoot.string();
  }
  std::unique_ptr<AskPassHelper> upHelper;
  if (bRemote) {
    // Probe once without materializing the secret anywhere
    std::string sProbe = _cpCredentials.credential();
    const bool bHasCredential = !sProbe.empty();
    OPENSSL_cleanse(sProbe.data(), sProbe.size());
    if (bHasCredential) {
      upHelper = std::make_unique<AskPassHelper>(_cpCredentials, _gcoOptions.sUsername);
      for (const auto& [sKey, sValue] : upHelper->environment()) {
        mEnv[sKey] = sValue;
      }
    }
  }

  auto spLog = common::Logger::get();
  auto crResult = _crRunner.run(vArgv, pathCwd, mEnv, durTimeout);
  if (crResult.ok()) {
    spLog->debug("Git command successful: {}", describe(vArgs));
  } else {
    spLog->error("Git command failed: {} ({})", describe(vArgs), failureDetail(crResult));
  }
  return crResult;
}

CommandResult GitCliClient::git(const std::vector<std::string>& vArgs, bool bRemote) const {
  return git(vArgs, bRemote, _gcoOptions.durCommandTimeout, _pathRoot);
}

std::string GitCliClient::gitChecked(const std::vector<std::string>& vArgs) {
  auto crResult = git(vArgs);
  if (!crResult.ok()) {
    throw common::GitCommandError("git_command_failed",
                                  describe(vArgs) + " failed: " + failureDetail(crResult));
  }
  return crResult.sStdout;
}

bool GitCliClient::hasLocalChanges() {
  // Health polls run outside the repository lock and must never take index.lock
  return !trimmed(gitChecked({"--no-optional-locks", "status", "--porcelain"})).empty();
}

bool GitCliClient::hasUnpublishedCommits() {
  const std::string sUpstreamRef = "refs/remotes/origin/" + _urUpstream.sBranch;
  if (!git({"rev-parse", "--verify", "--quiet", sUpstreamRef}).ok()) {
    // Nothing published yet: any local commit is unpublished
    return git({"rev-parse", "--verify", "--quiet", "HEAD"}).ok();
  }
  const std::string sCount = trimmed(gitChecked({"rev-list", "--count", sUpstreamRef + "..HEAD"}));
  try {
    return std::stoi(sCount) > 0;
  } catch (const std::exception&) {
    throw common::GitCommandError("git_command_failed",
                                  "Unexpected rev-list output: '" + sCount + "'");
  }
}

void GitCliClient::stageAll() { gitChecked({"add", "-A"}); }

void GitCliClient::commit(const std::string& sMessage) {
  gitChecked({"commit", "-m", sMessage});
}

void GitCliClient::integrateUpstream() {
  auto crResult = git({"pull", "--rebase", "origin", _urUpstream.sBranch}, true);
  if (crResult.ok()) {
    return;
  }

  // Never leave the working copy in the middle of a rebase
  const auto pathGitDir = _pathRoot / ".git";
  if (std::filesystem::exists(pathGitDir / "rebase-merge") ||
      std::filesystem::exists(pathGitDir / "rebase-apply")) {
    auto crAbort = git({"rebase", "--abort"});
    if (!crAbort.ok()) {
      common::Logger::get()->error("rebase --abort failed after integration conflict: {}",
                                   failureDetail(crAbort));
    }
  }
  throw common::GitIntegrationError(
      "integration_failed",
      "Upstream integration failed: " + failureDetail(crResult));
}

void GitCliClient::push() {
  auto crResult = git({"push", "origin", "HEAD:" + _urUpstream.sBranch}, true);
  if (!crResult.ok()) {
    throw common::GitPublishError("publish_failed", "Push failed: " + failureDetail(crResult));
  }
}

void GitCliClient::clone() {
  if (_urUpstream.sRemoteUrl.empty()) {
    throw common::BootstrapError("bootstrap_failed", "No upstream remote configured");
  }

  auto pathParent = _pathRoot.parent_path();
  if (pathParent.empty()) {
    pathParent = std::filesystem::current_path();
  }
  std::error_code ec;
  std::filesystem::create_directories(pathParent, ec);
  if (ec) {
    throw common::BootstrapError("bootstrap_failed",
                                 "Cannot create " + pathParent.string() + ": " + ec.message());
  }

  auto crResult = git({"clone", _urUpstream.sRemoteUrl, _pathRoot.string()}, true,
                      _gcoOptions.durCloneTimeout, pathParent);
  if (!crResult.ok()) {
    throw common::BootstrapError("bootstrap_failed", "Clone failed: " + failureDetail(crResult));
  }
}

void GitCliClient::checkoutBranch() {
  auto crResult = git({"checkout", "-B", _urUpstream.sBranch});
  if (!crResult.ok()) {
    throw common::BootstrapError("bootstrap_failed",
                                 "Checkout of " + _urUpstream.sBranch +
                                     " failed: " + failureDetail(crResult));
  }
}

void GitCliClient::pullFastForward() {
  auto crResult = git({"pull", "--ff-only", "origin", _urUpstream.sBranch}, true);
  if (!crResult.ok()) {
    throw common::BootstrapError("bootstrap_failed", "Pull failed: " + failureDetail(crResult));
  }
}

void GitCliClient::installExcludes() {
  const auto pathExclude = _pathRoot / ".git" / "info" / "exclude";

  std::string sExisting;
  {
    std::ifstream ifs(pathExclude);
    if (ifs.is_open()) {
      std::ostringstream oss;
      oss << ifs.rdbuf();
      sExisting = oss.str();
    }
  }
  std::istringstream iss(sExisting);
  for (std::string sLine; std::getline(iss, sLine);) {
    if (sLine == kTempFilePattern) {
      return;
    }
  }

  std::error_code ec;
  std::filesystem::create_directories(pathExclude.parent_path(), ec);
  std::ofstream ofs(pathExclude, std::ios::app);
  if (!ofs.is_open()) {
    throw common::BootstrapError("bootstrap_failed",
                                 "Cannot update " + pathExclude.string());
  }
  if (!sExisting.empty() && sExisting.back() != '\n') {
    ofs << '\n';
  }
  ofs << kTempFilePattern << '\n';
}

common::RemoteStatus GitCliClient::probeRemote() {
  auto crResult = git({"ls-remote", "origin"}, true, _gcoOptions.durProbeTimeout, _pathRoot);
  if (crResult.bTimedOut) {
    return common::RemoteStatus::Timeout;
  }
  return crResult.ok() ? common::RemoteStatus::Connected : common::RemoteStatus::Disconnected;
}

}  // namespace gitbridge::gitops
