#pragma once

#include <string_view>
#include <unordered_set>

#include "ssync/redact/value.h"

namespace ssync::redact {

inline constexpr std::string_view kCircularMarker{"[CIRCULAR]"};

// Identity set of the containers on the active recursion path. Scoped to one
// top-level RedactValue call; an entry is removed when its container has been
// processed, so siblings sharing a sub-object are each redacted in full.
class RecursionGuard {
 public:
  class Entry {
   public:
    Entry(RecursionGuard& guard, const void* identity) : guard_(guard), identity_(identity) {
      guard_.active_.insert(identity_);
    }
    Entry(const Entry&) = delete;
    Entry& operator=(const Entry&) = delete;
    ~Entry() { guard_.active_.erase(identity_); }

   private:
    RecursionGuard& guard_;
    const void* identity_;
  };

  bool IsActive(const void* identity) const { return active_.count(identity) != 0; }
  size_t Depth() const noexcept { return active_.size(); }

 private:
  std::unordered_set<const void*> active_;
};

// Closed allow-list of opaque built-ins returned unchanged. Records and
// sequences, including user-defined types, are never exempt.
bool IsOpaqueBuiltin(ValueKind kind) noexcept;

// Returns a redacted copy of `value`:
//   strings go through RedactText, sequences element-wise, records field by
//   field with secret-named fields replaced by "[REDACTED]" unread, values
//   already on the active path by "[CIRCULAR]", containers nested past
//   kMaxNestingDepth by "[DEPTH_LIMIT]". Primitives and opaque
//   built-ins come back unchanged. Never throws.
Value RedactValue(const Value& value) noexcept;

Value RedactValue(const Value& value, RecursionGuard& guard) noexcept;

}  // namespace ssync::redact
