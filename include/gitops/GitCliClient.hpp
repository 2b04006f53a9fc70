#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "gitops/CommandRunner.hpp"
#include "gitops/IGitClient.hpp"

namespace gitbridge::gitops {

class ICredentialProvider;

/// Tunables for GitCliClient.
/// Class abbreviation: gco
struct GitCliOptions {
  std::chrono::milliseconds durCommandTimeout{std::chrono::seconds(30)};
  std::chrono::milliseconds durCloneTimeout{std::chrono::seconds(60)};
  std::chrono::milliseconds durProbeTimeout{std::chrono::seconds(10)};
  std::string sUsername = "x-access-token";
  std::string sAuthorName = "GitBridge";
  std::string sAuthorEmail = "gitbridge@localhost";
};

/// IGitClient over the git command-line binary.
/// Remote commands authenticate through a per-command AskPassHelper.
/// Class abbreviation: gc
class GitCliClient : public IGitClient {
 public:
  GitCliClient(std::filesystem::path pathRoot,
               common::UpstreamReference urUpstream,
               const ICredentialProvider& cpCredentials,
               GitCliOptions gcoOptions,
               const CommandRunner& crRunner);
  ~GitCliClient() override;

  bool hasLocalChanges() override;
  bool hasUnpublishedCommits() override;
  void stageAll() override;
  void commit(const std::string& sMessage) override;
  void integrateUpstream() override;
  void push() override;
  void clone() override;
  void checkoutBranch() override;
  void pullFastForward() override;
  void installExcludes() override;
  common::RemoteStatus probeRemote() override;

  /// Pattern appended to .git/info/exclude by installExcludes().
  static constexpr const char* kTempFilePattern = ".*.gbtmp-*";

 private:
  /// Run `git <vArgs>` in the working copy. bRemote wraps the call in an AskPassHelper.
  CommandResult git(const std::vector<std::string>& vArgs, bool bRemote,
                    std::chrono::milliseconds durTimeout,
                    const std::filesystem::path& pathCwd) const;
  CommandResult git(const std::vector<std::string>& vArgs, bool bRemote = false) const;

  /// Like git() but throws GitCommandError on a non-zero exit.
  std::string gitChecked(const std::vector<std::string>& vArgs);

  std::filesystem::path _pathRoot;
  common::UpstreamReference _urUpstream;
  const ICredentialProvider& _cpCredentials;
  GitCliOptions _gcoOptions;
  const CommandRunner& _crRunner;
};

}  // namespace gitbridge::gitops
