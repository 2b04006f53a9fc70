#pragma once

#include <string>

#include "common/Types.hpp"

namespace gitbridge::gitops {

/// Applies one filesystem mutation to the working copy.
/// Touches only local disk; publishing is RepositorySynchronizer's job.
/// Class abbreviation: me
class MutationExecutor {
 public:
  explicit MutationExecutor(bool bSafeMode);
  ~MutationExecutor();

  /// Atomic write (temporary sibling + rename). Overwrites existing files.
  /// Throws IoError.
  void writeFile(const common::CanonicalPath& cpTarget, const std::string& sContent) const;

  /// Moving onto an existing directory places the source inside it.
  /// Throws NotFoundError if the source is absent, ValidationError when a
  /// directory would move into itself, IoError otherwise.
  void moveFile(const common::CanonicalPath& cpSource,
                const common::CanonicalPath& cpDestination) const;

  /// Throws ForbiddenError in safe mode, NotFoundError if absent,
  /// ValidationError for directories, IoError otherwise.
  void deleteFile(const common::CanonicalPath& cpTarget) const;

  /// Throws ForbiddenError in safe mode.
  void ensureDeletionAllowed() const;

  bool safeMode() const { return _bSafeMode; }

 private:
  bool _bSafeMode;
};

}  // namespace gitbridge::gitops
