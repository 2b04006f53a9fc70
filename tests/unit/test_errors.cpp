#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace gitbridge::common;

TEST(ErrorsTest, AppErrorCarriesStatusAndCode) {
  AppError err(500, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ValidationErrorIs400) {
  ValidationError err("invalid_path", "Path escapes repository");
  EXPECT_EQ(err._iHttpStatus, 400);
  EXPECT_EQ(err._sErrorCode, "invalid_path");
}

TEST(ErrorsTest, ForbiddenErrorIs403) {
  ForbiddenError err("safe_mode", "Deletion disabled in safe mode");
  EXPECT_EQ(err._iHttpStatus, 403);
  EXPECT_EQ(err._sErrorCode, "safe_mode");
}

TEST(ErrorsTest, NotFoundErrorIs404) {
  NotFoundError err("file_not_found", "No such file");
  EXPECT_EQ(err._iHttpStatus, 404);
}

TEST(ErrorsTest, IoErrorIs500) {
  IoError err("io_failure", "Disk full");
  EXPECT_EQ(err._iHttpStatus, 500);
}

TEST(ErrorsTest, GitErrorsAre500AndShareBase) {
  GitLockTimeoutError errLock("lock_timeout", "busy");
  GitPublishError errPush("push_failed", "rejected");
  BootstrapError errBoot("bootstrap_failed", "clone failed");
  EXPECT_EQ(errLock._iHttpStatus, 500);
  EXPECT_EQ(errPush._iHttpStatus, 500);
  EXPECT_NE(dynamic_cast<const GitError*>(static_cast<const AppError*>(&errLock)), nullptr);
  EXPECT_NE(dynamic_cast<const GitError*>(static_cast<const AppError*>(&errBoot)), nullptr);
}

TEST(ErrorsTest, ErrorsCatchableAsAppError) {
  try {
    throw GitIntegrationError("integration_failed", "conflict in a.txt");
  } catch (const AppError& e) {
    EXPECT_EQ(e._iHttpStatus, 500);
    EXPECT_EQ(e._sErrorCode, "integration_failed");
    return;
  }
  FAIL() << "GitIntegrationError not caught as AppError";
}

TEST(ErrorsTest, ErrorsCatchableAsStdException) {
  try {
    throw ForbiddenError("safe_mode", "Deletion disabled");
  } catch (const std::exception& e) {
    EXPECT_STREQ(e.what(), "Deletion disabled");
    return;
  }
  FAIL() << "ForbiddenError not caught as std::exception";
}
