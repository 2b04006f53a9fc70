#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace gitbridge::gitops {

/// Captured outcome of one child process.
/// Class abbreviation: cr
struct CommandResult {
  int iExitCode = -1;
  std::string sStdout;
  std::string sStderr;
  bool bTimedOut = false;

  bool ok() const { return !bTimedOut && iExitCode == 0; }
};

/// Runs external programs with captured output and a hard timeout.
/// The child inherits the parent environment merged with mEnv; stdin is /dev/null.
/// Stateless and safe to share between threads.
/// Class abbreviation: run
class CommandRunner {
 public:
  CommandRunner();
  ~CommandRunner();

  /// Execute vArgv (vArgv[0] looked up in PATH) in pathCwd.
  /// A child still running at the deadline is killed and reported as bTimedOut.
  /// Throws GitCommandError if the process cannot be spawned.
  CommandResult run(const std::vector<std::string>& vArgv,
                    const std::filesystem::path& pathCwd,
                    const std::map<std::string, std::string>& mEnv,
                    std::chrono::milliseconds durTimeout) const;
};

}  // namespace gitbridge::gitops
