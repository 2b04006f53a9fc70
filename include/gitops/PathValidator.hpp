#pragma once

#include <filesystem>
#include <string>

#include "common/Types.hpp"

namespace gitbridge::gitops {

/// Confirms caller-supplied relative paths resolve inside the repository root.
/// Read-only: resolves symlinks that exist at call time, never mutates.
/// Class abbreviation: pv
class PathValidator {
 public:
  explicit PathValidator(std::filesystem::path pathRoot);
  ~PathValidator();

  /// Throws ValidationError("invalid_path") on empty input, traversal or shell
  /// tokens, absolute paths, .git metadata, or any escape from the root.
  common::CanonicalPath validate(const std::string& sRawPath) const;

  const std::filesystem::path& root() const { return _pathRoot; }

 private:
  std::filesystem::path _pathRoot;
};

}  // namespace gitbridge::gitops
