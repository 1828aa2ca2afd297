#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace ssync::guard {

// Stream buffers accumulate at most this much before they start flushing at
// safe split points instead of waiting for an explicit flush.
inline constexpr size_t kPendingFlushThreshold = 32 * 1024;

// Buffer size given to the replaced C stdout and stderr FILEs.
inline constexpr size_t kStdoutFileBufferSize = 64 * 1024;

// One-time, idempotent installation of output redaction for the process:
//   loads the optional scrubbing configuration into the key classifier,
//   redirects std::cout/std::cerr/std::clog and the C stdout/stderr FILEs
//   through redacting writers, and installs the logger argument filter.
// Failures while loading configuration leave the built-in rules in place.
// Any other failure writes a fixed notice to fd 2 and leaves the guard
// uninstalled; a later call retries.
void InstallOutputGuard() noexcept;

bool IsOutputGuardInstalled() noexcept;

// True when `payload` is well-formed UTF-8 (no overlongs, surrogates or code
// points above U+10FFFF), i.e. decoding and re-encoding it is lossless.
bool IsLosslessUtf8(std::span<const uint8_t> payload) noexcept;

// Guarded write primitives. Text payloads are redacted as one unit, binary
// payloads are written unchanged. Return false when the descriptor rejected
// the write.
bool WriteStdout(std::span<const uint8_t> payload) noexcept;
bool WriteStdout(std::string_view text) noexcept;
bool WriteStderr(std::span<const uint8_t> payload) noexcept;
bool WriteStderr(std::string_view text) noexcept;

// Largest prefix of `pending` that may be redacted on its own: it ends after
// the last whitespace character within the first `limit` bytes and leaves any
// unterminated "-----BEGIN" block in the remainder. Zero when no such prefix
// exists.
size_t FindSafeSplit(std::string_view pending, size_t limit = kPendingFlushThreshold) noexcept;

// Like FindSafeSplit, but the prefix ends after the last newline.
size_t FindLineSplit(std::string_view pending) noexcept;

// Makes the next InstallOutputGuard call fail before it changes any stream.
void FailNextInstallForTesting() noexcept;

}  // namespace ssync::guard
