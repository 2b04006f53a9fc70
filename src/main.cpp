#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/Types.hpp"
#include "core/FileService.hpp"
#include "core/RetryPolicy.hpp"
#include "gitops/CommandRunner.hpp"
#include "gitops/GitCliClient.hpp"
#include "gitops/ICredentialProvider.hpp"
#include "gitops/MutationExecutor.hpp"
#include "gitops/PathValidator.hpp"
#include "gitops/RepositoryBootstrapper.hpp"
#include "gitops/RepositoryLock.hpp"
#include "gitops/RepositorySynchronizer.hpp"
#include "profiles/ProfileStore.hpp"

#include <openssl/crypto.h>

int main() {
  using namespace gitbridge;
  try {
    // ── Step 1: Load configuration and the active profile ────────────────
    auto cfgApp = common::Config::load();

    common::Logger::init(cfgApp.sLogLevel, cfgApp.sLogFile);
    auto spLog = common::Logger::get();
    if (cfgApp.oProfileError) {
      spLog->critical("Active profile unusable, continuing with defaults: {}",
                      *cfgApp.oProfileError);
    }
    spLog->info("Step 1: Configuration loaded (profile={}, repo={}, safe_mode={})",
                cfgApp.sProfileName, cfgApp.sRepo, cfgApp.bSafeMode);

    // ── Step 2: Hand the access token to the credential provider ─────────
    auto upCredentials = std::make_unique<gitops::TokenCredentialProvider>(cfgApp.sToken);
    OPENSSL_cleanse(cfgApp.sToken.data(), cfgApp.sToken.size());
    cfgApp.sToken.clear();
    spLog->info("Step 2: Credential provider initialized");

    // ── Step 3: Git client ───────────────────────────────────────────────
    const std::filesystem::path pathRoot = std::filesystem::absolute(cfgApp.sLocalFolder);
    common::UpstreamReference urUpstream{cfgApp.sRemoteUrl, cfgApp.sBranch};

    gitops::GitCliOptions gcoOptions;
    gcoOptions.durCommandTimeout = std::chrono::seconds(cfgApp.iGitTimeoutSeconds);
    gcoOptions.durCloneTimeout = std::chrono::seconds(cfgApp.iCloneTimeoutSeconds);
    gcoOptions.durProbeTimeout = std::chrono::seconds(cfgApp.iRemoteProbeTimeoutSeconds);
    gcoOptions.sUsername = cfgApp.sGitUsername;
    gcoOptions.sAuthorName = cfgApp.sGitAuthorName;
    gcoOptions.sAuthorEmail = cfgApp.sGitAuthorEmail;

    auto upRunner = std::make_unique<gitops::CommandRunner>();
    auto upGitClient = std::make_unique<gitops::GitCliClient>(
        pathRoot, urUpstream, *upCredentials, gcoOptions, *upRunner);
    spLog->info("Step 3: Git client ready (branch={})", urUpstream.sBranch);

    // ── Step 4: Bootstrap the working copy (never fatal) ─────────────────
    gitops::RepositoryBootstrapper rbBootstrapper(*upGitClient, pathRoot);
    auto bsBootstrap = rbBootstrapper.ensure();
    if (bsBootstrap.bReady) {
      spLog->info("Step 4: Working copy ready at {}", pathRoot.string());
    } else {
      spLog->warn("Step 4: Working copy degraded: {}", bsBootstrap.sDetail);
    }

    // ── Step 5: Synchronization and mutation components ──────────────────
    auto upLock = std::make_unique<gitops::RepositoryLock>(pathRoot / ".git" / "gitbridge.lock");
    auto upSynchronizer = std::make_unique<gitops::RepositorySynchronizer>(
        *upGitClient, *upLock, std::chrono::seconds(cfgApp.iLockTimeoutSeconds));
    auto upValidator = std::make_unique<gitops::PathValidator>(pathRoot);
    auto upExecutor = std::make_unique<gitops::MutationExecutor>(cfgApp.bSafeMode);
    auto upRetry = std::make_unique<core::RetryPolicy>(
        cfgApp.iPublishAttempts, std::chrono::milliseconds(cfgApp.iRetryBaseDelayMs));
    spLog->info("Step 5: Synchronizer ready (lock timeout {}s, {} publish attempts)",
                cfgApp.iLockTimeoutSeconds, cfgApp.iPublishAttempts);

    // ── Step 6: Services ─────────────────────────────────────────────────
    auto upFileService = std::make_unique<core::FileService>(
        *upValidator, *upExecutor, *upSynchronizer, *upRetry, *upGitClient, bsBootstrap);
    auto upProfileStore = std::make_unique<profiles::ProfileStore>(cfgApp.sProfilePath);
    spLog->info("Step 6: Services constructed");

    // ── Step 7: HTTP server ──────────────────────────────────────────────
    api::ApiServer apiServer(*upFileService, *upProfileStore, cfgApp.sProfileName);
    apiServer.registerRoutes();
    spLog->info("Step 7: Routes registered; GitBridge ready");

    apiServer.start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    spLog->info("GitBridge shut down");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
