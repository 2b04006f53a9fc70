#include "gitops/PathValidator.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace gitbridge::gitops {

namespace {

constexpr std::array<std::string_view, 10> kDangerousTokens = {
    "..", "~", "$", "`", "|", ";", "&", std::string_view("\0", 1), "\n", "\r"};

[[noreturn]] void reject(const std::string& sReason) {
  throw common::ValidationError("invalid_path", sReason);
}

/// True if pathChild equals pathParent or lies below it (both lexically normal).
bool isWithin(const std::filesystem::path& pathChild, const std::filesystem::path& pathParent) {
  auto itChild = pathChild.begin();
  for (auto itParent = pathParent.begin(); itParent != pathParent.end(); ++itParent) {
    if (itParent->empty()) continue;  // trailing separator
    if (itChild == pathChild.end() || *itChild != *itParent) {
      return false;
    }
    ++itChild;
  }
  return true;
}

}  // namespace

PathValidator::PathValidator(std::filesystem::path pathRoot) : _pathRoot(std::move(pathRoot)) {}

PathValidator::~PathValidator() = default;

common::CanonicalPath PathValidator::validate(const std::string& sRawPath) const {
  if (sRawPath.empty()) {
    reject("Path cannot be empty");
  }
  for (const auto& svToken : kDangerousTokens) {
    if (sRawPath.find(svToken) != std::string::npos) {
      reject("Path contains a forbidden token");
    }
  }
  if (sRawPath.front() == '/' || sRawPath.front() == '\\' ||
      (sRawPath.size() > 1 && sRawPath[1] == ':')) {
    reject("Absolute paths not allowed");
  }

  const std::filesystem::path pathRelative = std::filesystem::path(sRawPath).lexically_normal();
  if (!pathRelative.empty() && *pathRelative.begin() == ".git") {
    reject("Repository metadata is not accessible");
  }

  std::error_code ec;
  const auto pathRootResolved = std::filesystem::weakly_canonical(_pathRoot, ec);
  if (ec) {
    reject("Repository root cannot be resolved");
  }
  const auto pathResolved = std::filesystem::weakly_canonical(_pathRoot / pathRelative, ec);
  if (ec) {
    reject("Path cannot be resolved");
  }
  if (!isWithin(pathResolved, pathRootResolved)) {
    reject("Path outside repository boundaries");
  }

  common::CanonicalPath cpResult;
  cpResult.pathAbsolute = pathResolved;
  const auto pathRelativeResolved = pathResolved.lexically_relative(pathRootResolved);
  if (pathRelativeResolved.empty() || pathRelativeResolved == ".") {
    reject("Path must name an entry below the repository root");
  }
  if (!pathRelativeResolved.empty() && *pathRelativeResolved.begin() == ".git") {
    reject("Repository metadata is not accessible");  // reached through a symlink
  }
  cpResult.sRelative = pathRelativeResolved.generic_string();
  return cpResult;
}

}  // namespace gitbridge::gitops
