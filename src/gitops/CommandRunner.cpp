#include "gitops/CommandRunner.hpp"

#include "common/Errors.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace gitbridge::gitops {

namespace {

/// Owns a file descriptor; closes it on scope exit.
class FdGuard {
 public:
  FdGuard() = default;
  explicit FdGuard(int iFd) : _iFd(iFd) {}
  ~FdGuard() { reset(); }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const { return _iFd; }
  void reset(int iFd = -1) {
    if (_iFd >= 0) {
      ::close(_iFd);
    }
    _iFd = iFd;
  }

 private:
  int _iFd = -1;
};

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& mOverrides) {
  std::map<std::string, std::string> mMerged;
  for (char** pp = environ; pp != nullptr && *pp != nullptr; ++pp) {
    std::string sEntry(*pp);
    auto iEq = sEntry.find('=');
    if (iEq == std::string::npos) continue;
    mMerged[sEntry.substr(0, iEq)] = sEntry.substr(iEq + 1);
  }
  for (const auto& [sKey, sValue] : mOverrides) {
    mMerged[sKey] = sValue;
  }

  std::vector<std::string> vResult;
  vResult.reserve(mMerged.size());
  for (const auto& [sKey, sValue] : mMerged) {
    vResult.push_back(sKey + "=" + sValue);
  }
  return vResult;
}

std::vector<char*> unwrapStrings(std::vector<std::string>& vStrings) {
  std::vector<char*> vRaw;
  vRaw.reserve(vStrings.size() + 1);
  for (auto& s : vStrings) {
    vRaw.push_back(s.data());
  }
  vRaw.push_back(nullptr);
  return vRaw;
}

std::string joinArgv(const std::vector<std::string>& vArgv) {
  std::string sResult;
  for (const auto& s : vArgv) {
    if (!sResult.empty()) sResult += ' ';
    sResult += s;
  }
  return sResult;
}

}  // namespace

CommandRunner::CommandRunner() = default;
CommandRunner::~CommandRunner() = default;

CommandResult CommandRunner::run(const std::vector<std::string>& vArgv,
                                 const std::filesystem::path& pathCwd,
                                 const std::map<std::string, std::string>& mEnv,
                                 std::chrono::milliseconds durTimeout) const {
  if (vArgv.empty()) {
    throw common::GitCommandError("git_command_failed", "Command cannot be empty");
  }

  // Everything the child touches is prepared before fork()
  std::vector<std::string> vArgs = vArgv;
  std::vector<char*> vArgPtrs = unwrapStrings(vArgs);
  std::vector<std::string> vEnv = buildEnvironment(mEnv);
  std::vector<char*> vEnvPtrs = unwrapStrings(vEnv);
  const std::string sCwd = pathCwd.string();

  std::array<int, 2> aOut{-1, -1};
  std::array<int, 2> aErr{-1, -1};
  if (::pipe2(aOut.data(), O_CLOEXEC) != 0) {
    throw common::GitCommandError("git_command_failed",
                                  std::string("pipe() failed: ") + std::strerror(errno));
  }
  FdGuard fgOutRead(aOut[0]);
  FdGuard fgOutWrite(aOut[1]);
  if (::pipe2(aErr.data(), O_CLOEXEC) != 0) {
    throw common::GitCommandError("git_command_failed",
                                  std::string("pipe() failed: ") + std::strerror(errno));
  }
  FdGuard fgErrRead(aErr[0]);
  FdGuard fgErrWrite(aErr[1]);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw common::GitCommandError(
        "git_command_failed",
        "Failed to execute '" + joinArgv(vArgv) + "': cannot fork a child process");
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on
    if (!sCwd.empty() && ::chdir(sCwd.c_str()) != 0) {
      ::_exit(127);
    }
    int iNull = ::open("/dev/null", O_RDONLY);
    if (iNull >= 0) {
      ::dup2(iNull, STDIN_FILENO);
      ::close(iNull);
    }
    ::dup2(aOut[1], STDOUT_FILENO);
    ::dup2(aErr[1], STDERR_FILENO);
    ::execvpe(vArgPtrs[0], vArgPtrs.data(), vEnvPtrs.data());
    ::_exit(127);
  }

  fgOutWrite.reset();
  fgErrWrite.reset();

  CommandResult crResult;
  const auto tpDeadline = std::chrono::steady_clock::now() + durTimeout;
  std::array<pollfd, 2> aPoll{pollfd{fgOutRead.get(), POLLIN, 0},
                              pollfd{fgErrRead.get(), POLLIN, 0}};
  std::array<std::string*, 2> aSinks{&crResult.sStdout, &crResult.sStderr};
  int iOpen = 2;
  std::array<char, 4096> aBuf{};

  while (iOpen > 0) {
    const auto durLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
        tpDeadline - std::chrono::steady_clock::now());
    if (durLeft.count() <= 0) {
      crResult.bTimedOut = true;
      break;
    }
    const int iReady = ::poll(aPoll.data(), aPoll.size(), static_cast<int>(durLeft.count()));
    if (iReady < 0) {
      if (errno == EINTR) continue;
      crResult.sStderr += std::string("poll() failed: ") + std::strerror(errno);
      ::kill(pid, SIGKILL);
      break;
    }
    for (size_t i = 0; i < aPoll.size(); ++i) {
      if (aPoll[i].fd < 0 || aPoll[i].revents == 0) continue;
      const ssize_t iRead = ::read(aPoll[i].fd, aBuf.data(), aBuf.size());
      if (iRead > 0) {
        aSinks[i]->append(aBuf.data(), static_cast<size_t>(iRead));
      } else if (iRead == 0 || errno != EINTR) {
        aPoll[i].fd = -1;
        --iOpen;
      }
    }
  }

  if (crResult.bTimedOut) {
    ::kill(pid, SIGKILL);
  }

  // The child may close its pipes and keep running, so reaping honours the deadline too
  int iStatus = 0;
  for (;;) {
    const pid_t iDone = ::waitpid(pid, &iStatus, WNOHANG);
    if (iDone == pid) {
      break;
    }
    if (iDone < 0) {
      if (errno == EINTR) continue;
      throw common::GitCommandError(
          "git_command_failed",
          std::string("Waiting for child failed with: ") + std::strerror(errno));
    }
    if (std::chrono::steady_clock::now() >= tpDeadline && !crResult.bTimedOut) {
      crResult.bTimedOut = true;
      ::kill(pid, SIGKILL);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  if (WIFEXITED(iStatus)) {
    crResult.iExitCode = WEXITSTATUS(iStatus);
  } else if (WIFSIGNALED(iStatus)) {
    constexpr int kSignalBit = 128;
    crResult.iExitCode = kSignalBit + WTERMSIG(iStatus);
  }
  return crResult;
}

}  // namespace gitbridge::gitops
