#include "ssync/diagnostics/error_messages.h"

#include <array>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

#include "ssync/errors.h"
#include "ssync/redact/redactor.h"

namespace ssync::diagnostics {

namespace {

constexpr std::string_view kRed{"\x1b[31m"};
constexpr std::string_view kYellow{"\x1b[33m"};
constexpr std::string_view kCyan{"\x1b[36m"};
constexpr std::string_view kReset{"\x1b[0m"};
constexpr std::string_view kFailureMark{"\xE2\x9D\x8C"};  // U+274C
constexpr std::string_view kIndent{"   "};

struct CatalogEntry {
  std::string_view code;
  std::string_view what;
  std::string_view why;
  std::string_view how_to_fix;
};

constexpr std::array<CatalogEntry, 5> kCatalog{{
    {kDependencyMissingCode,
     "Required dependency '{{dependency}}' is not installed",
     "This command needs {{dependency}} but it was not found on PATH.",
     "Install {{dependency}} from {{installUrl}}{{#installCommand}}\nOr run: {{installCommand}}{{/installCommand}}"},
    {kPermissionReadCode,
     "Cannot read {{path}}",
     "The current user does not have permission to read {{path}}.",
     "Grant read access and retry:\n{{fixCommand}}"},
    {kPermissionWriteCode,
     "Cannot write {{path}}",
     "The current user does not have permission to write {{path}}.",
     "Grant write access and retry:\n{{fixCommand}}"},
    {kTimeoutCode,
     "{{operation}} timed out after {{timeoutSeconds}}s",
     "The operation did not finish within the configured time limit.",
     "Check your internet connection. Try again.\nTo allow more time set SECRETS_SYNC_TIMEOUT={{suggestedTimeout}}"},
    {kConfigInvalidCode,
     "Configuration file {{path}} is invalid",
     "{{reason}}{{#line}} (line {{line}}){{/line}}",
     "Fix the YAML in {{path}} or remove it to use the built-in rules."},
}};

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Length of the `{{word}}` tag starting at `pos` with `sigil` ('#', '/' or
// 0 for none) and the word inside it; zero when the text is not such a tag.
size_t MatchTag(std::string_view text, size_t pos, char sigil, std::string_view& word) {
  if (text.compare(pos, 2, "{{") != 0) {
    return 0;
  }
  size_t cursor = pos + 2;
  if (sigil != 0) {
    if (cursor >= text.size() || text[cursor] != sigil) {
      return 0;
    }
    ++cursor;
  }
  const size_t word_begin = cursor;
  while (cursor < text.size() && IsWordChar(text[cursor])) {
    ++cursor;
  }
  if (cursor == word_begin || text.compare(cursor, 2, "}}") != 0) {
    return 0;
  }
  word = text.substr(word_begin, cursor - word_begin);
  return cursor + 2 - pos;
}

bool IsTruthy(const redact::Value* value) {
  if (!value) {
    return false;
  }
  switch (value->kind()) {
  case redact::ValueKind::kNull:
    return false;
  case redact::ValueKind::kBool:
    return value->as_bool();
  case redact::ValueKind::kInteger:
    return value->as_integer() != 0;
  case redact::ValueKind::kNumber:
    return value->as_number() != 0.0 && !std::isnan(value->as_number());
  case redact::ValueKind::kString:
    return !value->as_string().empty();
  default:
    return true;
  }
}

const CatalogEntry* FindEntry(std::string_view code) {
  for (const auto& entry : kCatalog) {
    if (entry.code == code) {
      return &entry;
    }
  }
  return nullptr;
}

std::string RedactLine(std::string_view text) {
  return redact::GetRedactorShared()->RedactText(text);
}

}  // namespace

std::string Interpolate(std::string_view text, const redact::Record& context) {
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    std::string_view word;
    if (size_t open = MatchTag(text, pos, '#', word)) {
      const std::string closing = "{{/" + std::string(word) + "}}";
      const size_t body_begin = pos + open;
      const size_t close = text.find(closing, body_begin);
      if (close != std::string_view::npos) {
        if (IsTruthy(context.Find(word))) {
          out += Interpolate(text.substr(body_begin, close - body_begin), context);
        }
        pos = close + closing.size();
        continue;
      }
    } else if (size_t length = MatchTag(text, pos, 0, word)) {
      if (const auto* value = context.Find(word); value && !value->is_null()) {
        out += redact::RenderDisplay(*value);
      }
      pos += length;
      continue;
    }
    out.push_back(text[pos]);
    ++pos;
  }
  return out;
}

ErrorMessage GetMessage(std::string_view code, const redact::Record& context) {
  const auto* entry = FindEntry(code);
  if (!entry) {
    throw Error(ErrorDomain::Redaction,
                errors::redaction::kUnknownMessageCode,
                std::string(errors::msg::kUnknownMessageCode),
                std::nullopt,
                {std::string(code)});
  }
  return ErrorMessage{Interpolate(entry->what, context),
                      Interpolate(entry->why, context),
                      Interpolate(entry->how_to_fix, context)};
}

std::string BuildErrorMessage(const ErrorMessage& message) {
  std::string out;
  out.append(kRed).append(kFailureMark).append(" ").append(RedactLine(message.what)).append(kReset);
  out.append("\n").append(kIndent).append(RedactLine(message.why));
  out.append("\n").append(kIndent).append(kCyan).append(RedactLine(message.how_to_fix)).append(kReset);
  return out;
}

std::string FormatContext(const redact::Record& context) {
  if (context.fields.empty()) {
    return {};
  }
  auto copy = std::make_shared<redact::Record>(context);
  const auto redactor = redact::GetRedactorShared();
  const redact::Value scrubbed = redactor->RedactValue(redact::Value(std::move(copy)));

  std::istringstream rendered(redact::RenderJson(scrubbed, 2));
  std::string out;
  out.append("\n").append(kIndent).append(kYellow).append("Context:").append(kReset).append(" ");
  std::string line;
  bool first = true;
  while (std::getline(rendered, line)) {
    if (!first) {
      out.append("\n").append(kIndent);
    }
    out.append(line);
    first = false;
  }
  return out;
}

DependencyError::DependencyError(std::string dep, std::string url, std::optional<std::string> command)
    : Error(ErrorDomain::Config,
            errors::config::kDependencyMissing,
            std::string(errors::msg::kDependencyMissing),
            std::nullopt,
            {dep}),
      dependency(std::move(dep)),
      install_url(std::move(url)),
      install_command(std::move(command)) {}

PermissionError::PermissionError(std::string target, FileOperation op, std::string fix)
    : Error(ErrorDomain::IO,
            errors::io::kPermissionDenied,
            std::string(errors::msg::kPermissionDenied),
            std::nullopt,
            {op == FileOperation::kRead ? "read" : "write", target}),
      path(std::move(target)),
      operation(op),
      fix_command(std::move(fix)) {}

TimeoutError::TimeoutError(std::string op, std::chrono::milliseconds limit)
    : Error(ErrorDomain::IO,
            errors::io::kTimedOut,
            std::string(errors::msg::kTimedOut),
            std::nullopt,
            {op}),
      operation(std::move(op)),
      timeout(limit) {}

std::string FormatDependencyError(const DependencyError& error) {
  redact::Record context;
  context.Set("dependency", redact::Value(error.dependency));
  context.Set("installUrl", redact::Value(error.install_url));
  if (error.install_command) {
    context.Set("installCommand", redact::Value(*error.install_command));
  }
  return BuildErrorMessage(GetMessage(kDependencyMissingCode, context));
}

std::string FormatPermissionError(const PermissionError& error) {
  redact::Record context;
  context.Set("path", redact::Value(error.path));
  context.Set("fixCommand", redact::Value(error.fix_command));
  const auto code = error.operation == FileOperation::kRead ? kPermissionReadCode : kPermissionWriteCode;
  return BuildErrorMessage(GetMessage(code, context));
}

std::string FormatTimeoutError(const TimeoutError& error) {
  const auto millis = error.timeout.count();
  redact::Record context;
  context.Set("operation", redact::Value(error.operation));
  context.Set("timeoutSeconds", redact::Value(static_cast<int64_t>(std::llround(static_cast<double>(millis) / 1000.0))));
  context.Set("suggestedTimeout", redact::Value(static_cast<int64_t>(millis * 2)));
  return BuildErrorMessage(GetMessage(kTimeoutCode, context));
}

}  // namespace ssync::diagnostics
