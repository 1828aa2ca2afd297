#include "ssync/redact/redaction_cache.h"

#include <utility>

namespace ssync::redact {

RedactionCache::RedactionCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

std::optional<std::string> RedactionCache::Get(const crypto::Sha256Digest& digest) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(digest);
  if (it == index_.end()) {
    return std::nullopt;
  }
  lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
  return it->second->redacted;
}

void RedactionCache::Put(const crypto::Sha256Digest& digest, std::string redacted) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = index_.find(digest); it != index_.end()) {
    it->second->redacted = std::move(redacted);
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return;
  }
  while (index_.size() >= capacity_) {
    EvictLRULocked();
  }
  lru_list_.push_front(LruNode{digest, std::move(redacted)});
  index_.emplace(digest, lru_list_.begin());
}

void RedactionCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  index_.clear();
  lru_list_.clear();
}

size_t RedactionCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.size();
}

void RedactionCache::EvictLRULocked() {
  if (lru_list_.empty()) {
    return;
  }
  index_.erase(lru_list_.back().digest);
  lru_list_.pop_back();
}

RedactionCache& SharedRedactionCache() {
  static auto* cache = new RedactionCache(kRedactionCacheCapacity);
  return *cache;
}

void ClearCache() {
  SharedRedactionCache().Clear();
}

size_t CacheSize() {
  return SharedRedactionCache().Size();
}

}  // namespace ssync::redact
