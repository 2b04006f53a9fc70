#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "TestSupport.hpp"
#include "common/Types.hpp"
#include "gitops/CommandRunner.hpp"
#include "gitops/GitCliClient.hpp"
#include "gitops/ICredentialProvider.hpp"

namespace gitbridge::test {

/// Bare upstream repository seeded with one commit on main, plus a
/// GitCliClient pointed at a not-yet-cloned working copy.
/// Skips the test when no git binary is installed.
class GitFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!gitAvailable()) {
      GTEST_SKIP() << "git binary not available";
    }
    _pathUpstream = _tdDir.path() / "upstream.git";
    _pathRoot = _tdDir.path() / "local_repo";

    sh("git init --bare -q upstream.git && "
       "git --git-dir=upstream.git symbolic-ref HEAD refs/heads/main && "
       "git init -q seed && cd seed && "
       "git checkout -q -b main && "
       "echo seed > README.md && git add README.md && "
       "git -c user.name=Seed -c user.email=seed@example.com commit -q -m 'Initial commit' && "
       "git push -q ../upstream.git main");

    common::UpstreamReference urUpstream{_pathUpstream.string(), "main"};
    gitops::GitCliOptions gcoOptions;
    gcoOptions.durCommandTimeout = std::chrono::seconds(30);
    _upClient = std::make_unique<gitops::GitCliClient>(_pathRoot, urUpstream, _tcpCredentials,
                                                       gcoOptions, _crRunner);
  }

  /// Run a shell snippet in the scratch directory; fails the test on error.
  std::string sh(const std::string& sScript) {
    auto cr = _crRunner.run({"sh", "-c", sScript}, _tdDir.path(), {}, std::chrono::seconds(30));
    EXPECT_TRUE(cr.ok()) << sScript << "\n" << cr.sStderr;
    return cr.sStdout;
  }

  /// Commit subjects on the upstream main branch, newest first.
  std::string upstreamLog() {
    return sh("git --git-dir=upstream.git log --format=%s main");
  }

  /// Push a commit to upstream from a separate clone.
  void pushFromOtherClone(const std::string& sFile, const std::string& sContent) {
    sh("rm -rf other && git clone -q upstream.git other && cd other && "
       "printf '%s' '" + sContent + "' > " + sFile + " && git add -A && "
       "git -c user.name=Other -c user.email=other@example.com commit -q -m 'Other " + sFile +
       "' && git push -q origin HEAD:main");
  }

  TempDir _tdDir{"gitbridge-itest"};
  std::filesystem::path _pathUpstream;
  std::filesystem::path _pathRoot;
  gitops::CommandRunner _crRunner;
  gitops::TokenCredentialProvider _tcpCredentials{""};
  std::unique_ptr<gitops::GitCliClient> _upClient;
};

}  // namespace gitbridge::test
