#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ssync/error.h"
#include "ssync/redact/value.h"

namespace ssync::diagnostics {

// User-facing description of a failure: what happened, why, and the fix.
struct ErrorMessage {
  std::string what;
  std::string why;
  std::string how_to_fix;
};

// Catalog codes as they appear in tooling, e.g. "ERR_TIMEOUT".
inline constexpr std::string_view kDependencyMissingCode{"ERR_DEPENDENCY_MISSING"};
inline constexpr std::string_view kPermissionReadCode{"ERR_PERMISSION_READ"};
inline constexpr std::string_view kPermissionWriteCode{"ERR_PERMISSION_WRITE"};
inline constexpr std::string_view kTimeoutCode{"ERR_TIMEOUT"};
inline constexpr std::string_view kConfigInvalidCode{"ERR_CONFIG_INVALID"};

// Expands `{{key}}` with the field's display form (absent -> empty) and
// `{{#key}}...{{/key}}` with its body when the field is present and truthy.
// Unterminated markers are copied literally.
std::string Interpolate(std::string_view text, const redact::Record& context);

// Throws ssync::Error (Redaction domain) for codes outside the catalog.
ErrorMessage GetMessage(std::string_view code, const redact::Record& context);

// Three display lines; every field is passed through the active redactor.
std::string BuildErrorMessage(const ErrorMessage& message);

// "\n   Context: {...}" with the record scrubbed and pretty-printed; empty
// when the record has no fields.
std::string FormatContext(const redact::Record& context);

struct DependencyError : public ssync::Error {
  std::string dependency;
  std::string install_url;
  std::optional<std::string> install_command;

  DependencyError(std::string dep, std::string url, std::optional<std::string> command = std::nullopt);
};

enum class FileOperation { kRead, kWrite };

struct PermissionError : public ssync::Error {
  std::string path;
  FileOperation operation;
  std::string fix_command;

  PermissionError(std::string target, FileOperation op, std::string fix);
};

struct TimeoutError : public ssync::Error {
  std::string operation;
  std::chrono::milliseconds timeout;

  TimeoutError(std::string op, std::chrono::milliseconds limit);
};

std::string FormatDependencyError(const DependencyError& error);
std::string FormatPermissionError(const PermissionError& error);
std::string FormatTimeoutError(const TimeoutError& error);

}  // namespace ssync::diagnostics
