#include "core/FileService.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

#include "FakeGitClient.hpp"
#include "TestSupport.hpp"
#include "common/Errors.hpp"
#include "core/RetryPolicy.hpp"
#include "gitops/MutationExecutor.hpp"
#include "gitops/PathValidator.hpp"
#include "gitops/RepositoryLock.hpp"
#include "gitops/RepositorySynchronizer.hpp"

using namespace std::chrono_literals;
using namespace gitbridge;
using gitbridge::test::FakeGitClient;
using gitbridge::test::readText;
using gitbridge::test::TempDir;
using gitbridge::test::writeText;

class FileServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _pathRoot = _tdDir.path() / "repo";
    std::filesystem::create_directories(_pathRoot / ".git");
    _upGit = std::make_unique<FakeGitClient>(_pathRoot);
    _upLock = std::make_unique<gitops::RepositoryLock>(_pathRoot / ".git" / "gitbridge.lock");
    _upSync = std::make_unique<gitops::RepositorySynchronizer>(*_upGit, *_upLock, 2s);
    _upValidator = std::make_unique<gitops::PathValidator>(_pathRoot);
    _upRetry = std::make_unique<core::RetryPolicy>(
        3, 1000ms, [this](std::chrono::milliseconds dur) { _vDelays.push_back(dur); });
    build(true);
  }

  void build(bool bSafeMode, common::BootstrapStatus bs = {true, "ready"}) {
    _upExecutor = std::make_unique<gitops::MutationExecutor>(bSafeMode);
    _upService = std::make_unique<core::FileService>(*_upValidator, *_upExecutor, *_upSync,
                                                     *_upRetry, *_upGit, bs);
  }

  common::OperationRequest write(const std::string& sPath, const std::string& sContent) {
    common::OperationRequest orReq;
    orReq.kind = common::OperationKind::Write;
    orReq.sPath = sPath;
    orReq.sContent = sContent;
    return orReq;
  }

  TempDir _tdDir;
  std::filesystem::path _pathRoot;
  std::vector<std::chrono::milliseconds> _vDelays;
  std::unique_ptr<FakeGitClient> _upGit;
  std::unique_ptr<gitops::RepositoryLock> _upLock;
  std::unique_ptr<gitops::RepositorySynchronizer> _upSync;
  std::unique_ptr<gitops::PathValidator> _upValidator;
  std::unique_ptr<core::RetryPolicy> _upRetry;
  std::unique_ptr<gitops::MutationExecutor> _upExecutor;
  std::unique_ptr<core::FileService> _upService;
};

TEST_F(FileServiceTest, UploadWritesAndPublishesWithMessage) {
  _upGit->bDirty = true;
  auto ores = _upService->apply(write("docs/a.txt", "hello"));

  EXPECT_EQ(ores.outcome, common::PublishOutcome::Published);
  EXPECT_EQ(readText(_pathRoot / "docs/a.txt"), "hello");
  ASSERT_EQ(_upGit->vPushedCommits.size(), 1u);
  EXPECT_EQ(_upGit->vPushedCommits[0], "Upload docs/a.txt");
}

TEST_F(FileServiceTest, UploadOfIdenticalContentIsNoChanges) {
  auto ores = _upService->apply(write("a.txt", "same"));
  EXPECT_EQ(ores.outcome, common::PublishOutcome::NoChanges);
  EXPECT_TRUE(_upGit->vCommits.empty());
}

TEST_F(FileServiceTest, MoveUsesMoveMessage) {
  writeText(_pathRoot / "a.txt", "x");
  _upGit->bDirty = true;
  common::OperationRequest orReq;
  orReq.kind = common::OperationKind::Move;
  orReq.sPath = "a.txt";
  orReq.sDestination = "b/c.txt";

  auto ores = _upService->apply(orReq);
  EXPECT_EQ(ores.sDestination, "b/c.txt");
  EXPECT_TRUE(std::filesystem::exists(_pathRoot / "b/c.txt"));
  ASSERT_EQ(_upGit->vCommits.size(), 1u);
  EXPECT_EQ(_upGit->vCommits[0], "Move a.txt to b/c.txt");
}

TEST_F(FileServiceTest, DeleteUsesDeleteMessage) {
  build(false);
  writeText(_pathRoot / "old.txt", "x");
  _upGit->bDirty = true;
  common::OperationRequest orReq;
  orReq.kind = common::OperationKind::Delete;
  orReq.sPath = "old.txt";

  _upService->apply(orReq);
  EXPECT_FALSE(std::filesystem::exists(_pathRoot / "old.txt"));
  ASSERT_EQ(_upGit->vCommits.size(), 1u);
  EXPECT_EQ(_upGit->vCommits[0], "Delete old.txt");
}

TEST_F(FileServiceTest, SafeModeRefusalWinsOverBadPath) {
  common::OperationRequest orReq;
  orReq.kind = common::OperationKind::Delete;
  orReq.sPath = "../../etc/passwd";
  EXPECT_THROW(_upService->apply(orReq), common::ForbiddenError);
  EXPECT_EQ(_upGit->count("status"), 0);
}

TEST_F(FileServiceTest, InvalidPathNeverReachesGit) {
  EXPECT_THROW(_upService->apply(write("../escape.txt", "x")), common::ValidationError);
  EXPECT_TRUE(_upGit->calls().empty());
}

TEST_F(FileServiceTest, TransientPushFailuresAreRetried) {
  _upGit->bDirty = true;
  _upGit->iPushFailures = 2;
  auto ores = _upService->apply(write("a.txt", "x"));
  EXPECT_EQ(ores.outcome, common::PublishOutcome::Published);
  EXPECT_EQ(_upGit->iPushAttempts, 3);
  ASSERT_EQ(_vDelays.size(), 2u);
  EXPECT_EQ(_vDelays[0], 1000ms);
  EXPECT_EQ(_vDelays[1], 2000ms);
}

TEST_F(FileServiceTest, ExhaustedRetriesSurfaceFailureButKeepFile) {
  _upGit->bDirty = true;
  _upGit->iPushFailures = 5;
  EXPECT_THROW(_upService->apply(write("a.txt", "kept")), common::GitPublishError);
  EXPECT_EQ(_upGit->iPushAttempts, 3);
  EXPECT_EQ(readText(_pathRoot / "a.txt"), "kept");
}

TEST_F(FileServiceTest, TreeIsSortedAndHidesDotEntries) {
  writeText(_pathRoot / "b.txt", "");
  writeText(_pathRoot / "a/z.txt", "");
  writeText(_pathRoot / ".hidden", "");
  writeText(_pathRoot / ".github/ci.yml", "");
  writeText(_pathRoot / "a/.a.txt.gbtmp-XXXX", "");
  writeText(_pathRoot / ".git/HEAD", "ref: refs/heads/main\n");

  const std::vector<std::string> vExpected = {"a/z.txt", "b.txt"};
  EXPECT_EQ(_upService->listTree(), vExpected);
}

TEST_F(FileServiceTest, VerifyReportsSizeAndExistence) {
  writeText(_pathRoot / "data/report.csv", "1,2,3\n");
  auto fi = _upService->verify("data/report.csv");
  EXPECT_TRUE(fi.bExists);
  EXPECT_EQ(fi.sPath, "data/report.csv");
  EXPECT_EQ(fi.uSize, 6u);
  EXPECT_GT(fi.iModifiedEpochSeconds, 0);

  auto fiMissing = _upService->verify("data/none.csv");
  EXPECT_FALSE(fiMissing.bExists);
  EXPECT_THROW(_upService->verify("../x"), common::ValidationError);
}

TEST_F(FileServiceTest, HealthOkWhenCleanAndConnected) {
  auto hr = _upService->health();
  EXPECT_EQ(hr.sStatus, "ok");
  ASSERT_TRUE(hr.oClean.has_value());
  EXPECT_TRUE(*hr.oClean);
  ASSERT_TRUE(hr.oRemote.has_value());
  EXPECT_EQ(*hr.oRemote, common::RemoteStatus::Connected);
  EXPECT_TRUE(hr.bSafeMode);
}

TEST_F(FileServiceTest, HealthWarnsWhenRemoteUnreachable) {
  _upGit->remoteStatus = common::RemoteStatus::Timeout;
  _upGit->bDirty = true;
  auto hr = _upService->health();
  EXPECT_EQ(hr.sStatus, "warning");
  EXPECT_FALSE(*hr.oClean);
}

TEST_F(FileServiceTest, HealthWarnsWhenStatusFails) {
  _upGit->bStatusFails = true;
  auto hr = _upService->health();
  EXPECT_EQ(hr.sStatus, "warning");
  EXPECT_FALSE(hr.sGitError.empty());
}

TEST_F(FileServiceTest, HealthErrorWhenRootMissing) {
  std::filesystem::remove_all(_pathRoot);
  auto hr = _upService->health();
  EXPECT_EQ(hr.sStatus, "error");
  EXPECT_FALSE(hr.oRemote.has_value());
}

TEST_F(FileServiceTest, HealthCarriesBootstrapStatus) {
  build(true, {false, "clone failed"});
  auto hr = _upService->health();
  EXPECT_FALSE(hr.bsBootstrap.bReady);
  EXPECT_EQ(hr.bsBootstrap.sDetail, "clone failed");
}
