#include "gitops/AskPassHelper.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "gitops/ICredentialProvider.hpp"

#include <openssl/crypto.h>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

namespace gitbridge::gitops {

namespace {

/// Single-quote a path for /bin/sh.
std::string shellQuote(const std::string& s) {
  std::string sResult = "'";
  for (char c : s) {
    if (c == '\'') {
      sResult += "'\\''";
    } else {
      sResult += c;
    }
  }
  sResult += "'";
  return sResult;
}

void writeExclusive(const std::filesystem::path& pathFile, const std::string& sContent,
                    mode_t mode) {
  int iFd = ::open(pathFile.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
  if (iFd < 0) {
    throw common::GitCommandError("git_command_failed",
                                  "Cannot create credential helper file: " +
                                      std::string(std::strerror(errno)));
  }
  const char* pData = sContent.data();
  size_t uLeft = sContent.size();
  while (uLeft > 0) {
    const ssize_t iWritten = ::write(iFd, pData, uLeft);
    if (iWritten < 0) {
      if (errno == EINTR) continue;
      const int iErr = errno;
      ::close(iFd);
      throw common::GitCommandError("git_command_failed",
                                    "Cannot write credential helper file: " +
                                        std::string(std::strerror(iErr)));
    }
    pData += iWritten;
    uLeft -= static_cast<size_t>(iWritten);
  }
  ::close(iFd);
}

}  // namespace

// ── TokenCredentialProvider ────────────────────────────────────────────────

TokenCredentialProvider::TokenCredentialProvider(std::string sToken)
    : _sToken(std::move(sToken)) {}

TokenCredentialProvider::~TokenCredentialProvider() {
  OPENSSL_cleanse(_sToken.data(), _sToken.size());
}

std::string TokenCredentialProvider::credential() const { return _sToken; }

// ── AskPassHelper ──────────────────────────────────────────────────────────

AskPassHelper::AskPassHelper(const ICredentialProvider& cpProvider, const std::string& sUsername) {
  std::string sTemplate = (std::filesystem::temp_directory_path() / "gitbridge-askpass-XXXXXX").string();
  if (::mkdtemp(sTemplate.data()) == nullptr) {
    throw common::GitCommandError("git_command_failed",
                                  "Cannot create credential helper directory: " +
                                      std::string(std::strerror(errno)));
  }
  _pathDir = sTemplate;  // mkdtemp creates it 0700

  std::string sSecret = cpProvider.credential();
  try {
    const auto pathSecret = _pathDir / "secret";
    _pathScript = _pathDir / "askpass.sh";

    writeExclusive(pathSecret, sSecret, 0600);
    OPENSSL_cleanse(sSecret.data(), sSecret.size());

    const std::string sScript =
        "#!/bin/sh\n"
        "case \"$1\" in\n"
        "  Username*|username*) printf '%s\\n' " + shellQuote(sUsername) + " ;;\n"
        "  *) cat " + shellQuote(pathSecret.string()) + " ;;\n"
        "esac\n";
    writeExclusive(_pathScript, sScript, 0700);
  } catch (...) {
    OPENSSL_cleanse(sSecret.data(), sSecret.size());
    std::error_code ec;
    std::filesystem::remove_all(_pathDir, ec);
    throw;
  }
}

AskPassHelper::~AskPassHelper() {
  std::error_code ec;
  std::filesystem::remove_all(_pathDir, ec);
  if (ec) {
    common::Logger::get()->warn("Could not remove credential helper directory {}: {}",
                                _pathDir.string(), ec.message());
  }
}

std::map<std::string, std::string> AskPassHelper::environment() const {
  return {
      {"GIT_ASKPASS", _pathScript.string()},
      {"GIT_TERMINAL_PROMPT", "0"},
  };
}

}  // namespace gitbridge::gitops
