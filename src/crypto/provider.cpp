#include "ssync/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "ssync/error.h"
#include "ssync/errors.h"

namespace ssync::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(std::string_view context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

void ThrowCryptoError(const std::string& message, int code = errors::crypto::kDigestFailed) {
  throw ssync::Error(ssync::ErrorDomain::Crypto, code, message);
}

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  // Leaked on purpose: exit-time stream flushes still hash their payloads.
  static auto* state = new RuntimeState{};
  return *state;
}

std::mutex& ProviderMutex() {
  static auto* mutex = new std::mutex();
  return *mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static auto* instance = new std::shared_ptr<CryptoProvider>();
  return *instance;
}

void RunSHA256KnownAnswerTest() {
  // FIPS 180-2 appendix B.1, message "abc".
  static constexpr std::array<uint8_t, 3> kMessage{'a', 'b', 'c'};
  static constexpr Sha256Digest kExpected{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea,
      0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
      0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c,
      0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};

  OpenSSLCryptoProvider provider;
  const auto digest = provider.SHA256(std::span<const uint8_t>(kMessage.data(), kMessage.size()));
  if (!std::equal(digest.begin(), digest.end(), kExpected.begin())) {
    ThrowCryptoError(std::string(errors::msg::kDigestSelfTestFailed),
                     errors::crypto::kSelfTestFailed);
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    RunSHA256KnownAnswerTest();
    state.kat_passed = true;
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

Sha256Digest OpenSSLCryptoProvider::SHA256(std::span<const uint8_t> data) {
  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError(std::string(errors::msg::kDigestLengthUnexpected));
  }
  return out;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace ssync::crypto
