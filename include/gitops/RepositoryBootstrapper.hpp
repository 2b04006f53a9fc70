#pragma once

#include <filesystem>

#include "common/Types.hpp"

namespace gitbridge::gitops {

class IGitClient;

/// Establishes the working copy at startup: clone if absent, force the
/// expected branch, fast-forward to upstream, install temp-file excludes.
/// Failures never abort startup; they are logged and returned as a degraded
/// status for /health.
/// Class abbreviation: rb
class RepositoryBootstrapper {
 public:
  RepositoryBootstrapper(IGitClient& gcClient, std::filesystem::path pathRoot);
  ~RepositoryBootstrapper();

  common::BootstrapStatus ensure();

 private:
  IGitClient& _gcClient;
  std::filesystem::path _pathRoot;
};

}  // namespace gitbridge::gitops
