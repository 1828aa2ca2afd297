#include "ssync/redact/value_scrubber.h"

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "ssync/redact/key_classifier.h"
#include "ssync/redact/pattern_matcher.h"

namespace ssync::redact {

namespace {

Value RedactRecursive(const Value& value, RecursionGuard& guard);

Value RedactSequence(const std::shared_ptr<Sequence>& sequence, RecursionGuard& guard) {
  if (!sequence) {
    return Value(sequence);
  }
  if (guard.IsActive(sequence.get())) {
    return Value(kCircularMarker);
  }
  if (guard.Depth() >= kMaxNestingDepth) {
    return Value(kDepthLimitMarker);
  }
  RecursionGuard::Entry entry(guard, sequence.get());
  auto result = std::make_shared<Sequence>();
  result->items.reserve(sequence->items.size());
  for (const auto& item : sequence->items) {
    result->items.push_back(RedactRecursive(item, guard));
  }
  return Value(std::move(result));
}

Value RedactRecord(const std::shared_ptr<Record>& record, RecursionGuard& guard) {
  if (!record) {
    return Value(record);
  }
  if (guard.IsActive(record.get())) {
    return Value(kCircularMarker);
  }
  if (guard.Depth() >= kMaxNestingDepth) {
    return Value(kDepthLimitMarker);
  }
  RecursionGuard::Entry entry(guard, record.get());
  const auto& classifier = KeyClassifier::Instance();
  auto result = MakeRecord(record->type_name);
  result->fields.reserve(record->fields.size());
  for (const auto& [key, field] : record->fields) {
    if (classifier.ShouldRedact(key)) {
      // Secrecy follows the field name; the value is never inspected.
      result->fields.emplace_back(key, Value(kRedactedPlaceholder));
    } else {
      result->fields.emplace_back(key, RedactRecursive(field, guard));
    }
  }
  return Value(std::move(result));
}

Value RedactRecursive(const Value& value, RecursionGuard& guard) {
  const auto kind = value.kind();
  if (IsOpaqueBuiltin(kind)) {
    return value;
  }
  switch (kind) {
  case ValueKind::kString:
    return Value(RedactText(value.as_string()));
  case ValueKind::kSequence:
    return RedactSequence(value.as_sequence(), guard);
  case ValueKind::kRecord:
    return RedactRecord(value.as_record(), guard);
  default:
    return value;
  }
}

}  // namespace

bool IsOpaqueBuiltin(ValueKind kind) noexcept {
  switch (kind) {
  case ValueKind::kTimestamp:
  case ValueKind::kBytes:
  case ValueKind::kHashSet:
  case ValueKind::kHashMap:
  case ValueKind::kWeakReference:
  case ValueKind::kPending:
  case ValueKind::kPattern:
  case ValueKind::kError:
    return true;
  case ValueKind::kNull:
  case ValueKind::kBool:
  case ValueKind::kInteger:
  case ValueKind::kNumber:
  case ValueKind::kString:
  case ValueKind::kSequence:
  case ValueKind::kRecord:
    return false;
  }
  return false;
}

Value RedactValue(const Value& value, RecursionGuard& guard) noexcept {
  try {
    return RedactRecursive(value, guard);
  } catch (const std::exception&) {
    return Value(kScrubbingFailedSentinel);
  }
}

Value RedactValue(const Value& value) noexcept {
  RecursionGuard guard;
  return RedactValue(value, guard);
}

}  // namespace ssync::redact
