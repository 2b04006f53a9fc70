#pragma once

#include <filesystem>
#include <string_view>

namespace gitbridge::gitops {

/// Writes a file through a temporary sibling and renames it into place.
/// Readers never observe a partially written target: until commit() the
/// content lives only in a hidden ".<name>.gbtmp-XXXXXX" file, which the
/// destructor removes if commit() was never reached.
/// Class abbreviation: afw
class AtomicFileWriter {
 public:
  /// Creates missing parent directories and the temporary file.
  /// Throws IoError on failure.
  explicit AtomicFileWriter(std::filesystem::path pathTarget);
  ~AtomicFileWriter();

  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

  /// Append bytes to the temporary file. Throws IoError.
  void write(std::string_view svData);

  /// Flush, close and rename onto the target. Throws IoError.
  void commit();

  const std::filesystem::path& tempPath() const { return _pathTemp; }
  const std::filesystem::path& targetPath() const { return _pathTarget; }

 private:
  std::filesystem::path _pathTarget;
  std::filesystem::path _pathTemp;
  int _iFd = -1;
  bool _bCommitted = false;
};

}  // namespace gitbridge::gitops
