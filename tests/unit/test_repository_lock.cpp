#include "gitops/RepositoryLock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include "TestSupport.hpp"
#include "common/Errors.hpp"

using namespace std::chrono_literals;
using gitbridge::common::GitLockTimeoutError;
using gitbridge::gitops::RepositoryLock;
using gitbridge::test::TempDir;

TEST(RepositoryLockTest, AcquireCreatesLockFile) {
  TempDir td;
  RepositoryLock rl(td.path() / "gitbridge.lock");
  auto lg = rl.acquire(1s);
  EXPECT_TRUE(lg.held());
  EXPECT_TRUE(std::filesystem::exists(rl.path()));
}

TEST(RepositoryLockTest, SecondAcquireTimesOutWhileHeld) {
  TempDir td;
  RepositoryLock rl(td.path() / "gitbridge.lock");
  auto lgFirst = rl.acquire(1s);

  const auto tpStart = std::chrono::steady_clock::now();
  EXPECT_THROW(rl.acquire(100ms), GitLockTimeoutError);
  EXPECT_GE(std::chrono::steady_clock::now() - tpStart, 100ms);
}

TEST(RepositoryLockTest, ReleasedWhenGuardLeavesScope) {
  TempDir td;
  RepositoryLock rl(td.path() / "gitbridge.lock");
  { auto lg = rl.acquire(1s); }
  auto lgAgain = rl.acquire(100ms);
  EXPECT_TRUE(lgAgain.held());
}

TEST(RepositoryLockTest, MovedGuardKeepsLock) {
  TempDir td;
  RepositoryLock rl(td.path() / "gitbridge.lock");
  auto lgFirst = rl.acquire(1s);
  auto lgMoved = std::move(lgFirst);
  EXPECT_FALSE(lgFirst.held());
  EXPECT_TRUE(lgMoved.held());
  EXPECT_THROW(rl.acquire(50ms), GitLockTimeoutError);
}

TEST(RepositoryLockTest, ThreadsNeverOverlap) {
  TempDir td;
  RepositoryLock rl(td.path() / "gitbridge.lock", 1ms);
  std::atomic<int> iInside{0};
  std::atomic<bool> bOverlap{false};
  std::atomic<int> iEntered{0};

  std::vector<std::thread> vThreads;
  for (int i = 0; i < 4; ++i) {
    vThreads.emplace_back([&]() {
      for (int j = 0; j < 5; ++j) {
        auto lg = rl.acquire(10s);
        if (iInside.fetch_add(1) > 0) {
          bOverlap = true;
        }
        std::this_thread::sleep_for(2ms);
        iInside.fetch_sub(1);
        ++iEntered;
      }
    });
  }
  for (auto& t : vThreads) t.join();

  EXPECT_FALSE(bOverlap.load());
  EXPECT_EQ(iEntered.load(), 20);
}

TEST(RepositoryLockTest, ExcludesOtherProcesses) {
  TempDir td;
  const auto pathLock = td.path() / "gitbridge.lock";
  int aPipe[2];
  ASSERT_EQ(::pipe(aPipe), 0);

  const pid_t pid = ::fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    ::close(aPipe[0]);
    RepositoryLock rlChild(pathLock);
    auto lg = rlChild.acquire(5s);
    char c = 'L';
    if (::write(aPipe[1], &c, 1) != 1) {
      _exit(2);
    }
    ::usleep(300 * 1000);
    _exit(0);
  }

  ::close(aPipe[1]);
  char c = 0;
  ASSERT_EQ(::read(aPipe[0], &c, 1), 1);
  ::close(aPipe[0]);

  RepositoryLock rlParent(pathLock);
  EXPECT_THROW(rlParent.acquire(50ms), GitLockTimeoutError);
  // The child exits after ~300ms, which releases its lock
  auto lg = rlParent.acquire(5s);
  EXPECT_TRUE(lg.held());

  int iStatus = 0;
  ::waitpid(pid, &iStatus, 0);
  EXPECT_TRUE(WIFEXITED(iStatus));
  EXPECT_EQ(WEXITSTATUS(iStatus), 0);
}

TEST(RepositoryLockTest, UnopenableLockFileIsCommandError) {
  TempDir td;
  RepositoryLock rl(td.path() / "missing-dir" / "gitbridge.lock");
  EXPECT_THROW(rl.acquire(50ms), gitbridge::common::GitCommandError);
}
