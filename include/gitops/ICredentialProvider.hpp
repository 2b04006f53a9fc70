#pragma once

#include <string>

namespace gitbridge::gitops {

/// Supplies the upstream secret on demand.
/// Implementations must never log the returned value.
class ICredentialProvider {
 public:
  virtual ~ICredentialProvider() = default;

  /// Returns the secret, or an empty string when no credential is configured.
  virtual std::string credential() const = 0;
};

/// Holds a static access token in memory; wiped with OPENSSL_cleanse on destruction.
/// Class abbreviation: tcp
class TokenCredentialProvider : public ICredentialProvider {
 public:
  explicit TokenCredentialProvider(std::string sToken);
  ~TokenCredentialProvider() override;

  TokenCredentialProvider(const TokenCredentialProvider&) = delete;
  TokenCredentialProvider& operator=(const TokenCredentialProvider&) = delete;

  std::string credential() const override;

 private:
  std::string _sToken;
};

}  // namespace gitbridge::gitops
