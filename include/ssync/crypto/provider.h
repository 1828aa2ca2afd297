#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace ssync::crypto {

inline constexpr size_t kSha256DigestSize = 32;
using Sha256Digest = std::array<uint8_t, kSha256DigestSize>;

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual Sha256Digest SHA256(std::span<const uint8_t> data) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  Sha256Digest SHA256(std::span<const uint8_t> data) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized(); // runs the digest known-answer test once
void ResetCryptoProviderForTesting();

}  // namespace ssync::crypto
