#pragma once

#include <crow.h>

namespace gitbridge::profiles {
class ProfileStore;
}

namespace gitbridge::api::routes {

/// Handlers for /profiles and /profiles/activate
/// Class abbreviation: prr
class ProfileRoutes {
 public:
  explicit ProfileRoutes(profiles::ProfileStore& psStore);
  ~ProfileRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  profiles::ProfileStore& _psStore;
};

}  // namespace gitbridge::api::routes
