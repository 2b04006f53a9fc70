#pragma once

#include <crow.h>

namespace gitbridge::core {
class FileService;
}

namespace gitbridge::api::routes {

/// Handlers for /upload, /move, /delete, /tree, /verify_upload
/// Class abbreviation: fr
class FileRoutes {
 public:
  explicit FileRoutes(core::FileService& fsService);
  ~FileRoutes();

  /// Register file routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

 private:
  core::FileService& _fsService;
};

}  // namespace gitbridge::api::routes
