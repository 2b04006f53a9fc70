#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gitbridge::profiles {

/// One connection profile document.
/// Class abbreviation: pr
struct Profile {
  std::string sName;
  std::string sRepo;
  std::string sToken;
  std::string sLocalFolder;
  bool bSafeMode = true;
};

/// Reads the active profile and the sibling profile catalogue.
/// Profiles are plain JSON files in the directory that holds active.json.
/// Class abbreviation: ps
class ProfileStore {
 public:
  explicit ProfileStore(std::filesystem::path pathActive);
  ~ProfileStore();

  /// Load the active profile.
  /// Throws NotFoundError if the file is absent, ValidationError if it is not
  /// valid JSON or lacks repo/token/local_folder.
  Profile loadActive() const;

  /// Sorted names of every parseable profile in the directory.
  std::vector<std::string> listNames() const;

  /// Replace the active profile with the profile called sName.
  /// The previous active profile is kept as active.bak.
  /// Throws NotFoundError when no profile has that name.
  void activate(const std::string& sName);

  /// Build a Profile from a parsed document (no required-key checks).
  static Profile fromJson(const nlohmann::json& jDoc);

  const std::filesystem::path& activePath() const { return _pathActive; }

 private:
  std::filesystem::path _pathActive;
};

}  // namespace gitbridge::profiles
