#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "ssync/crypto/provider.h"

namespace ssync::redact {

inline constexpr size_t kRedactionCacheCapacity = 1000;

// LRU map from SHA-256(input) to the fully redacted output. Raw input never
// becomes a key, so a heap dump of the cache holds only redacted text.
class RedactionCache {
 public:
  explicit RedactionCache(size_t capacity = kRedactionCacheCapacity);

  std::optional<std::string> Get(const crypto::Sha256Digest& digest);

  void Put(const crypto::Sha256Digest& digest, std::string redacted);

  void Clear();

  size_t Size() const;

  size_t Capacity() const noexcept { return capacity_; }

 private:
  struct DigestHash {
    size_t operator()(const crypto::Sha256Digest& digest) const noexcept {
      size_t value = 0;
      std::memcpy(&value, digest.data(), sizeof(value));
      return value;
    }
  };

  struct LruNode {
    crypto::Sha256Digest digest{};
    std::string redacted;
  };

  using LruList = std::list<LruNode>;

  void EvictLRULocked();

  size_t capacity_;
  LruList lru_list_;  // front = most recently used
  std::unordered_map<crypto::Sha256Digest, LruList::iterator, DigestHash> index_;
  mutable std::mutex mutex_;
};

// Process-wide cache used by RedactText. Never destroyed so exit-time flushes
// keep working.
RedactionCache& SharedRedactionCache();

void ClearCache();

size_t CacheSize();

// Clears the shared cache when the enclosing run scope ends, whether it ends
// normally or by exception.
class ScopedCacheClear {
 public:
  ScopedCacheClear() = default;
  ScopedCacheClear(const ScopedCacheClear&) = delete;
  ScopedCacheClear& operator=(const ScopedCacheClear&) = delete;
  ~ScopedCacheClear() { ClearCache(); }
};

}  // namespace ssync::redact
