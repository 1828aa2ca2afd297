#include "ssync/redact/value.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <unordered_set>

namespace ssync::redact {

namespace {

constexpr std::string_view kCircularText{"[CIRCULAR]"};

void AppendEscaped(std::string& out, std::string_view text) {
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out.append("\\\\");
      break;
    case '"':
      out.append("\\\"");
      break;
    case '\b':
      out.append("\\b");
      break;
    case '\f':
      out.append("\\f");
      break;
    case '\n':
      out.append("\\n");
      break;
    case '\r':
      out.append("\\r");
      break;
    case '\t':
      out.append("\\t");
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
        out.append(buf);
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
}

void AppendQuoted(std::string& out, std::string_view text) {
  out.push_back('"');
  AppendEscaped(out, text);
  out.push_back('"');
}

std::string FormatTimestampImpl(Timestamp tp) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  const auto tt = static_cast<std::time_t>(millis / 1000);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(((millis % 1000) + 1000) % 1000));
  return buf;
}

std::string DescribeError(const std::exception_ptr& error) {
  if (!error) {
    return "[Error]";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& ex) {
    return std::string("[Error: ") + ex.what() + "]";
  } catch (...) {
    return "[Error]";
  }
}

class JsonRenderer {
 public:
  explicit JsonRenderer(int indent) : indent_(indent) {}

  void Render(std::string& out, const Value& value, int depth) {
    switch (value.kind()) {
    case ValueKind::kNull:
      out.append("null");
      return;
    case ValueKind::kBool:
      out.append(value.as_bool() ? "true" : "false");
      return;
    case ValueKind::kInteger:
      out.append(std::to_string(value.as_integer()));
      return;
    case ValueKind::kNumber:
      AppendNumber(out, value.as_number());
      return;
    case ValueKind::kString:
      AppendQuoted(out, value.as_string());
      return;
    case ValueKind::kSequence:
      RenderSequence(out, value.as_sequence(), depth);
      return;
    case ValueKind::kRecord:
      RenderRecord(out, value.as_record(), depth);
      return;
    case ValueKind::kTimestamp:
      AppendQuoted(out, FormatTimestampImpl(std::get<Timestamp>(value.storage())));
      return;
    case ValueKind::kBytes: {
      const auto& bytes = std::get<std::shared_ptr<const ByteBuffer>>(value.storage());
      AppendQuoted(out, "[Buffer " + std::to_string(bytes ? bytes->bytes.size() : 0) + " bytes]");
      return;
    }
    case ValueKind::kHashSet: {
      const auto& set = std::get<std::shared_ptr<const HashSet>>(value.storage());
      AppendQuoted(out, "[HashSet size=" + std::to_string(set ? set->items.size() : 0) + "]");
      return;
    }
    case ValueKind::kHashMap: {
      const auto& map = std::get<std::shared_ptr<const HashMap>>(value.storage());
      AppendQuoted(out, "[HashMap size=" + std::to_string(map ? map->entries.size() : 0) + "]");
      return;
    }
    case ValueKind::kWeakReference:
      AppendQuoted(out, "[WeakReference]");
      return;
    case ValueKind::kPending:
      AppendQuoted(out, "[Pending]");
      return;
    case ValueKind::kPattern: {
      const auto& pattern = std::get<std::shared_ptr<const PatternObject>>(value.storage());
      AppendQuoted(out, "/" + (pattern ? pattern->source : std::string()) + "/");
      return;
    }
    case ValueKind::kError:
      AppendQuoted(out, DescribeError(std::get<std::exception_ptr>(value.storage())));
      return;
    }
  }

 private:
  void AppendNumber(std::string& out, double number) {
    if (!std::isfinite(number)) {
      out.append("null");
      return;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), number);
    if (ec != std::errc()) {
      out.append("null");
      return;
    }
    out.append(buf, ptr);
  }

  void NewLine(std::string& out, int depth) {
    if (indent_ <= 0) {
      return;
    }
    out.push_back('\n');
    out.append(static_cast<size_t>(indent_ * depth), ' ');
  }

  void RenderSequence(std::string& out, const std::shared_ptr<Sequence>& sequence, int depth) {
    if (!sequence || sequence->items.empty()) {
      out.append("[]");
      return;
    }
    if (active_.size() >= kMaxNestingDepth) {
      AppendQuoted(out, kDepthLimitMarker);
      return;
    }
    if (!active_.insert(sequence.get()).second) {
      AppendQuoted(out, kCircularText);
      return;
    }
    out.push_back('[');
    bool first = true;
    for (const auto& item : sequence->items) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      NewLine(out, depth + 1);
      Render(out, item, depth + 1);
    }
    NewLine(out, depth);
    out.push_back(']');
    active_.erase(sequence.get());
  }

  void RenderRecord(std::string& out, const std::shared_ptr<Record>& record, int depth) {
    if (!record || record->fields.empty()) {
      out.append("{}");
      return;
    }
    if (active_.size() >= kMaxNestingDepth) {
      AppendQuoted(out, kDepthLimitMarker);
      return;
    }
    if (!active_.insert(record.get()).second) {
      AppendQuoted(out, kCircularText);
      return;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, field] : record->fields) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      NewLine(out, depth + 1);
      AppendQuoted(out, key);
      out.append(indent_ > 0 ? ": " : ":");
      Render(out, field, depth + 1);
    }
    NewLine(out, depth);
    out.push_back('}');
    active_.erase(record.get());
  }

  int indent_;
  std::unordered_set<const void*> active_;
};

}  // namespace

const void* Value::identity() const noexcept {
  switch (kind()) {
  case ValueKind::kSequence:
    return as_sequence().get();
  case ValueKind::kRecord:
    return as_record().get();
  case ValueKind::kBytes:
    return std::get<std::shared_ptr<const ByteBuffer>>(storage_).get();
  case ValueKind::kHashSet:
    return std::get<std::shared_ptr<const HashSet>>(storage_).get();
  case ValueKind::kHashMap:
    return std::get<std::shared_ptr<const HashMap>>(storage_).get();
  case ValueKind::kWeakReference:
    return std::get<std::shared_ptr<const WeakReference>>(storage_).get();
  case ValueKind::kPending:
    return std::get<std::shared_ptr<const PendingComputation>>(storage_).get();
  case ValueKind::kPattern:
    return std::get<std::shared_ptr<const PatternObject>>(storage_).get();
  default:
    return nullptr;
  }
}

void Record::Set(std::string key, Value value) {
  for (auto& [existing, slot] : fields) {
    if (existing == key) {
      slot = std::move(value);
      return;
    }
  }
  fields.emplace_back(std::move(key), std::move(value));
}

const Value* Record::Find(std::string_view key) const {
  for (const auto& [existing, slot] : fields) {
    if (existing == key) {
      return &slot;
    }
  }
  return nullptr;
}

std::shared_ptr<Record> MakeRecord(std::string type_name) {
  auto record = std::make_shared<Record>();
  record->type_name = std::move(type_name);
  return record;
}

std::shared_ptr<Sequence> MakeSequence(std::initializer_list<Value> items) {
  auto sequence = std::make_shared<Sequence>();
  sequence->items.assign(items.begin(), items.end());
  return sequence;
}

std::string FormatIsoTimestamp(Timestamp timestamp) {
  return FormatTimestampImpl(timestamp);
}

std::string RenderJson(const Value& value, int indent) {
  std::string out;
  JsonRenderer renderer(indent);
  renderer.Render(out, value, 0);
  return out;
}

std::string RenderDisplay(const Value& value) {
  if (value.is_string()) {
    return value.as_string();
  }
  return RenderJson(value, 0);
}

}  // namespace ssync::redact
