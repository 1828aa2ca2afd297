#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <initializer_list>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace ssync::redact {

struct Sequence;
struct Record;
struct HashMap;
struct PendingComputation;

using Timestamp = std::chrono::system_clock::time_point;

struct ByteBuffer {
  std::vector<uint8_t> bytes;
};

struct HashSet {
  std::unordered_set<std::string> items;
};

struct WeakReference {
  std::weak_ptr<Record> target;
};

struct PatternObject {
  std::string source;
  std::regex compiled;
};

// Order matches the alternatives of Value::Storage.
enum class ValueKind : uint8_t {
  kNull,
  kBool,
  kInteger,
  kNumber,
  kString,
  kSequence,
  kRecord,
  kTimestamp,
  kBytes,
  kHashSet,
  kHashMap,
  kWeakReference,
  kPending,
  kPattern,
  kError
};

// Heterogeneous value flowing into log calls and formatted errors. Sequences
// and records are shared and identity-bearing, so graphs may contain shared
// sub-objects and cycles.
class Value {
 public:
  using Storage = std::variant<std::monostate,
                               bool,
                               int64_t,
                               double,
                               std::string,
                               std::shared_ptr<Sequence>,
                               std::shared_ptr<Record>,
                               Timestamp,
                               std::shared_ptr<const ByteBuffer>,
                               std::shared_ptr<const HashSet>,
                               std::shared_ptr<const HashMap>,
                               std::shared_ptr<const WeakReference>,
                               std::shared_ptr<const PendingComputation>,
                               std::shared_ptr<const PatternObject>,
                               std::exception_ptr>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool flag) : storage_(flag) {}
  template <typename T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
  Value(T number) : storage_(static_cast<int64_t>(number)) {}
  Value(double number) : storage_(number) {}
  Value(const char* text) : storage_(std::string(text ? text : "")) {}
  Value(std::string text) : storage_(std::move(text)) {}
  Value(std::string_view text) : storage_(std::string(text)) {}
  Value(std::shared_ptr<Sequence> sequence) : storage_(std::move(sequence)) {}
  Value(std::shared_ptr<Record> record) : storage_(std::move(record)) {}
  Value(Timestamp timestamp) : storage_(timestamp) {}
  Value(std::shared_ptr<const ByteBuffer> bytes) : storage_(std::move(bytes)) {}
  Value(std::shared_ptr<const HashSet> set) : storage_(std::move(set)) {}
  Value(std::shared_ptr<const HashMap> map) : storage_(std::move(map)) {}
  Value(std::shared_ptr<const WeakReference> ref) : storage_(std::move(ref)) {}
  Value(std::shared_ptr<const PendingComputation> pending) : storage_(std::move(pending)) {}
  Value(std::shared_ptr<const PatternObject> pattern) : storage_(std::move(pattern)) {}
  Value(std::exception_ptr error) : storage_(std::move(error)) {}

  ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }

  bool is_null() const noexcept { return kind() == ValueKind::kNull; }
  bool is_string() const noexcept { return kind() == ValueKind::kString; }
  bool is_sequence() const noexcept { return kind() == ValueKind::kSequence; }
  bool is_record() const noexcept { return kind() == ValueKind::kRecord; }

  bool as_bool() const { return std::get<bool>(storage_); }
  int64_t as_integer() const { return std::get<int64_t>(storage_); }
  double as_number() const { return std::get<double>(storage_); }
  const std::string& as_string() const { return std::get<std::string>(storage_); }
  const std::shared_ptr<Sequence>& as_sequence() const { return std::get<std::shared_ptr<Sequence>>(storage_); }
  const std::shared_ptr<Record>& as_record() const { return std::get<std::shared_ptr<Record>>(storage_); }

  // Address of the shared payload for reference kinds, nullptr otherwise.
  const void* identity() const noexcept;

  const Storage& storage() const noexcept { return storage_; }

 private:
  Storage storage_;
};

struct Sequence {
  std::vector<Value> items;
};

// Plain record or user-defined instance. `type_name` is empty for plain
// records; user-defined types carry their name and are scrubbed the same way.
struct Record {
  std::string type_name;
  std::vector<std::pair<std::string, Value>> fields;

  void Set(std::string key, Value value);
  const Value* Find(std::string_view key) const;
};

struct HashMap {
  std::unordered_map<std::string, Value> entries;
};

struct PendingComputation {
  std::shared_future<Value> future;
};

std::shared_ptr<Record> MakeRecord(std::string type_name = {});

std::shared_ptr<Sequence> MakeSequence(std::initializer_list<Value> items = {});

// ISO-8601 UTC with millisecond precision, e.g. 2026-01-02T03:04:05.006Z.
std::string FormatIsoTimestamp(Timestamp timestamp);

// Containers nested deeper than this are replaced by kDepthLimitMarker when
// values are scrubbed or rendered.
inline constexpr size_t kMaxNestingDepth = 256;
inline constexpr std::string_view kDepthLimitMarker{"[DEPTH_LIMIT]"};

// JSON text for display. Cycles render as "[CIRCULAR]"; containers past
// kMaxNestingDepth as "[DEPTH_LIMIT]"; opaque kinds as descriptive strings.
// `indent` > 0 pretty-prints.
std::string RenderJson(const Value& value, int indent = 0);

// Plain display form: strings unquoted, everything else as compact JSON.
std::string RenderDisplay(const Value& value);

}  // namespace ssync::redact
