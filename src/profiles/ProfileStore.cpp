#include "profiles/ProfileStore.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <fstream>
#include <optional>

namespace gitbridge::profiles {

namespace {

std::optional<nlohmann::json> readJson(const std::filesystem::path& pathFile) {
  std::ifstream ifs(pathFile);
  if (!ifs.is_open()) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

}  // namespace

ProfileStore::ProfileStore(std::filesystem::path pathActive)
    : _pathActive(std::move(pathActive)) {}

ProfileStore::~ProfileStore() = default;

Profile ProfileStore::fromJson(const nlohmann::json& jDoc) {
  Profile prResult;
  prResult.sName = jDoc.value("name", "");
  prResult.sRepo = jDoc.value("repo", "");
  prResult.sToken = jDoc.value("token", "");
  prResult.sLocalFolder = jDoc.value("local_folder", "");
  prResult.bSafeMode = jDoc.value("safe_mode", true);
  return prResult;
}

Profile ProfileStore::loadActive() const {
  if (!std::filesystem::exists(_pathActive)) {
    throw common::NotFoundError("profile_not_found",
                                "Missing profile: " + _pathActive.string());
  }

  std::ifstream ifs(_pathActive);
  nlohmann::json jDoc;
  try {
    jDoc = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::exception& ex) {
    throw common::ValidationError("invalid_profile",
                                  std::string("Invalid JSON in profile: ") + ex.what());
  }
  if (!jDoc.is_object()) {
    throw common::ValidationError("invalid_profile", "Profile must be a JSON object");
  }

  std::vector<std::string> vMissing;
  for (const char* pKey : {"repo", "token", "local_folder"}) {
    if (!jDoc.contains(pKey)) {
      vMissing.emplace_back(pKey);
    }
  }
  if (!vMissing.empty()) {
    std::string sList;
    for (const auto& sKey : vMissing) {
      sList += sList.empty() ? sKey : ", " + sKey;
    }
    throw common::ValidationError("invalid_profile", "Profile missing required keys: " + sList);
  }

  try {
    return fromJson(jDoc);
  } catch (const nlohmann::json::exception& ex) {
    throw common::ValidationError("invalid_profile",
                                  std::string("Profile has wrongly typed keys: ") + ex.what());
  }
}

std::vector<std::string> ProfileStore::listNames() const {
  std::vector<std::string> vNames;
  const auto pathDir = _pathActive.parent_path().empty() ? std::filesystem::path(".")
                                                         : _pathActive.parent_path();
  std::error_code ec;
  for (const auto& deEntry : std::filesystem::directory_iterator(pathDir, ec)) {
    if (!deEntry.is_regular_file() || deEntry.path().extension() != ".json") {
      continue;
    }
    auto oDoc = readJson(deEntry.path());
    if (oDoc && oDoc->is_object() && oDoc->contains("name") && (*oDoc)["name"].is_string()) {
      vNames.push_back((*oDoc)["name"].get<std::string>());
    }
  }
  std::sort(vNames.begin(), vNames.end());
  vNames.erase(std::unique(vNames.begin(), vNames.end()), vNames.end());
  return vNames;
}

void ProfileStore::activate(const std::string& sName) {
  const auto pathDir = _pathActive.parent_path().empty() ? std::filesystem::path(".")
                                                         : _pathActive.parent_path();
  std::optional<std::filesystem::path> oTarget;
  std::error_code ec;
  for (const auto& deEntry : std::filesystem::directory_iterator(pathDir, ec)) {
    if (!deEntry.is_regular_file() || deEntry.path().extension() != ".json") {
      continue;
    }
    auto oDoc = readJson(deEntry.path());
    if (oDoc && oDoc->is_object() && oDoc->value("name", "") == sName) {
      oTarget = deEntry.path();
      break;
    }
  }
  if (!oTarget) {
    throw common::NotFoundError("profile_not_found", "Profile not found: " + sName);
  }

  try {
    if (std::filesystem::exists(_pathActive)) {
      auto pathBackup = _pathActive;
      pathBackup.replace_extension(".bak");
      std::filesystem::copy_file(_pathActive, pathBackup,
                                 std::filesystem::copy_options::overwrite_existing);
    }
    if (!std::filesystem::equivalent(*oTarget, _pathActive, ec)) {
      std::filesystem::copy_file(*oTarget, _pathActive,
                                 std::filesystem::copy_options::overwrite_existing);
    }
  } catch (const std::filesystem::filesystem_error& ex) {
    throw common::IoError("io_failure", std::string("Profile activation failed: ") + ex.what());
  }

  common::Logger::get()->info("Profile '{}' activated (restart required)", sName);
}

}  // namespace gitbridge::profiles
