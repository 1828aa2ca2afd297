#pragma once
#include <span>
#include <string>
#include <string_view>
#include <cstdint>

#include "ssync/crypto/provider.h"

namespace ssync::crypto {
Sha256Digest SHA256_Hash(std::span<const uint8_t> data);
Sha256Digest SHA256_Hash(std::string_view text);
std::string DigestToHex(const Sha256Digest& digest);
} // namespace ssync::crypto
