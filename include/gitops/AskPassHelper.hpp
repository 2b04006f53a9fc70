#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace gitbridge::gitops {

class ICredentialProvider;

/// Short-lived GIT_ASKPASS helper for one remote git command.
///
/// Materializes a private 0700 directory holding a 0600 secret file and a
/// helper script that prints it on password prompts. Git finds the script via
/// GIT_ASKPASS, so the secret never appears in argv, the environment, or logs.
/// The directory is removed on destruction.
/// Class abbreviation: aph
class AskPassHelper {
 public:
  /// Throws GitCommandError if the helper files cannot be created.
  AskPassHelper(const ICredentialProvider& cpProvider, const std::string& sUsername);
  ~AskPassHelper();

  AskPassHelper(const AskPassHelper&) = delete;
  AskPassHelper& operator=(const AskPassHelper&) = delete;

  /// Environment overrides to pass to the git child process.
  std::map<std::string, std::string> environment() const;

  const std::filesystem::path& scriptPath() const { return _pathScript; }

 private:
  std::filesystem::path _pathDir;
  std::filesystem::path _pathScript;
};

}  // namespace gitbridge::gitops
