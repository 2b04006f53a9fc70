#include "gitops/MutationExecutor.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "TestSupport.hpp"
#include "common/Errors.hpp"
#include "gitops/PathValidator.hpp"

using namespace gitbridge;
using gitbridge::test::readText;
using gitbridge::test::TempDir;
using gitbridge::test::writeText;

class MutationExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _pathRoot = _tdDir.path();
    _upValidator = std::make_unique<gitops::PathValidator>(_pathRoot);
  }

  common::CanonicalPath cp(const std::string& sPath) { return _upValidator->validate(sPath); }

  TempDir _tdDir;
  std::filesystem::path _pathRoot;
  std::unique_ptr<gitops::PathValidator> _upValidator;
};

TEST_F(MutationExecutorTest, WriteCreatesParentsAndContent) {
  gitops::MutationExecutor me(true);
  me.writeFile(cp("docs/guide/intro.md"), "# Intro\n");
  EXPECT_EQ(readText(_pathRoot / "docs/guide/intro.md"), "# Intro\n");
}

TEST_F(MutationExecutorTest, WriteOverwritesExisting) {
  writeText(_pathRoot / "a.txt", "one");
  gitops::MutationExecutor me(true);
  me.writeFile(cp("a.txt"), "two");
  EXPECT_EQ(readText(_pathRoot / "a.txt"), "two");
}

TEST_F(MutationExecutorTest, WriteLeavesNoTemporaryFiles) {
  gitops::MutationExecutor me(true);
  me.writeFile(cp("dir/file.txt"), "payload");
  int iEntries = 0;
  for (const auto& deEntry : std::filesystem::directory_iterator(_pathRoot / "dir")) {
    (void)deEntry;
    ++iEntries;
  }
  EXPECT_EQ(iEntries, 1);
}

TEST_F(MutationExecutorTest, MoveRenamesIntoNewDirectory) {
  writeText(_pathRoot / "src.txt", "data");
  gitops::MutationExecutor me(true);
  me.moveFile(cp("src.txt"), cp("archive/2024/dst.txt"));
  EXPECT_FALSE(std::filesystem::exists(_pathRoot / "src.txt"));
  EXPECT_EQ(readText(_pathRoot / "archive/2024/dst.txt"), "data");
}

TEST_F(MutationExecutorTest, MoveMissingSourceIsNotFound) {
  gitops::MutationExecutor me(true);
  try {
    me.moveFile(cp("nope.txt"), cp("dst.txt"));
    FAIL() << "expected NotFoundError";
  } catch (const common::NotFoundError& e) {
    EXPECT_EQ(e._sErrorCode, "source_not_found");
  }
}

TEST_F(MutationExecutorTest, MoveOntoExistingDirectoryPlacesSourceInside) {
  writeText(_pathRoot / "note.txt", "memo");
  std::filesystem::create_directories(_pathRoot / "inbox");
  gitops::MutationExecutor me(true);
  me.moveFile(cp("note.txt"), cp("inbox"));
  EXPECT_FALSE(std::filesystem::exists(_pathRoot / "note.txt"));
  ASSERT_TRUE(std::filesystem::is_directory(_pathRoot / "inbox"));
  EXPECT_EQ(readText(_pathRoot / "inbox/note.txt"), "memo");
}

TEST_F(MutationExecutorTest, MoveDirectoryIntoItselfIsRejected) {
  writeText(_pathRoot / "folder/a.txt", "x");
  gitops::MutationExecutor me(true);
  try {
    me.moveFile(cp("folder"), cp("folder/nested"));
    FAIL() << "expected ValidationError";
  } catch (const common::ValidationError& e) {
    EXPECT_EQ(e._sErrorCode, "invalid_destination");
  }
  EXPECT_EQ(readText(_pathRoot / "folder/a.txt"), "x");
}

TEST_F(MutationExecutorTest, DeleteInSafeModeIsForbiddenAndKeepsFile) {
  writeText(_pathRoot / "keep.txt", "precious");
  gitops::MutationExecutor me(true);
  try {
    me.deleteFile(cp("keep.txt"));
    FAIL() << "expected ForbiddenError";
  } catch (const common::ForbiddenError& e) {
    EXPECT_EQ(e._iHttpStatus, 403);
    EXPECT_EQ(e._sErrorCode, "safe_mode");
  }
  EXPECT_TRUE(std::filesystem::exists(_pathRoot / "keep.txt"));
}

TEST_F(MutationExecutorTest, DeleteRemovesFile) {
  writeText(_pathRoot / "gone.txt", "bye");
  gitops::MutationExecutor me(false);
  me.deleteFile(cp("gone.txt"));
  EXPECT_FALSE(std::filesystem::exists(_pathRoot / "gone.txt"));
}

TEST_F(MutationExecutorTest, DeleteMissingIsNotFound) {
  gitops::MutationExecutor me(false);
  EXPECT_THROW(me.deleteFile(cp("missing.txt")), common::NotFoundError);
}

TEST_F(MutationExecutorTest, DeleteDirectoryIsRejected) {
  std::filesystem::create_directories(_pathRoot / "folder");
  gitops::MutationExecutor me(false);
  EXPECT_THROW(me.deleteFile(cp("folder")), common::ValidationError);
  EXPECT_TRUE(std::filesystem::is_directory(_pathRoot / "folder"));
}

TEST_F(MutationExecutorTest, EnsureDeletionAllowedFollowsSafeMode) {
  EXPECT_THROW(gitops::MutationExecutor(true).ensureDeletionAllowed(), common::ForbiddenError);
  EXPECT_NO_THROW(gitops::MutationExecutor(false).ensureDeletionAllowed());
}
