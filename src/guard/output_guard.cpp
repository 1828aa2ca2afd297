#include "ssync/guard/output_guard.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <new>
#include <streambuf>
#include <string>
#include <system_error>

#if !defined(_WIN32)
#include <sys/types.h>
#include <unistd.h>
#endif

#include "ssync/config/config_loader.h"
#include "ssync/logging/logger.h"
#include "ssync/redact/key_classifier.h"
#include "ssync/redact/pattern_matcher.h"
#include "ssync/redact/redactor.h"
#include "ssync/security/zeroizer.h"

namespace ssync::guard {

namespace {

constexpr std::string_view kBlockBegin{"-----BEGIN"};
constexpr std::string_view kBlockEnd{"-----END"};
constexpr std::string_view kBlockFence{"-----"};
constexpr std::string_view kInstallFailedNotice{"ssync: output guard installation failed\n"};

#if defined(_WIN32)
constexpr int kStdoutDescriptor = 1;
constexpr int kStderrDescriptor = 2;
#else
constexpr int kStdoutDescriptor = STDOUT_FILENO;
constexpr int kStderrDescriptor = STDERR_FILENO;
#endif

std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

std::string_view AsText(std::span<const uint8_t> bytes) noexcept {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

bool IsSplitWhitespace(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\v';
}

bool WriteAll(int fd, std::span<const uint8_t> payload) noexcept {
#if defined(_WIN32)
  (void)fd;
  (void)payload;
  return false;
#else
  size_t written = 0;
  while (written < payload.size()) {
    const ssize_t chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    if (chunk == 0) {
      return false;
    }
    written += static_cast<size_t>(chunk);
  }
  return true;
#endif
}

// Funnel for every guarded write to one descriptor. Writes issued while a
// payload is being redacted (for example by a redactor that itself prints)
// are queued and go through the same redaction once the outer write is done.
class GuardedDescriptor {
 public:
  explicit GuardedDescriptor(int fd) : fd_(fd) {}

  GuardedDescriptor(const GuardedDescriptor&) = delete;
  GuardedDescriptor& operator=(const GuardedDescriptor&) = delete;

  bool Write(std::span<const uint8_t> payload) noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (busy_) {
      try {
        deferred_.append(AsText(payload));
      } catch (const std::bad_alloc&) {
        return false;
      }
      return true;
    }
    busy_ = true;
    bool ok = Emit(payload);
    while (!deferred_.empty()) {
      std::string next;
      next.swap(deferred_);
      security::Zeroizer::ScopeWiper wiper(next);
      ok = Emit(AsBytes(next)) && ok;
    }
    busy_ = false;
    return ok;
  }

 private:
  bool Emit(std::span<const uint8_t> payload) noexcept {
    if (payload.empty()) {
      return true;
    }
    if (!IsLosslessUtf8(payload)) {
      return WriteAll(fd_, payload);
    }
    std::shared_ptr<redact::Redactor> redactor;
    try {
      redactor = redact::GetRedactorShared();
    } catch (const std::exception&) {
      return WriteAll(fd_, AsBytes(redact::kScrubbingFailedSentinel));
    }
    // Payloads above the matcher ceiling go out in whitespace-delimited
    // pieces; a piece that cannot be split fails closed in RedactText.
    std::string_view text = AsText(payload);
    bool ok = true;
    while (text.size() > redact::kMaxInputLength) {
      const size_t split = FindSafeSplit(text, redact::kMaxInputLength);
      if (split == 0) {
        break;
      }
      ok = WriteRedacted(*redactor, text.substr(0, split)) && ok;
      text.remove_prefix(split);
    }
    return WriteRedacted(*redactor, text) && ok;
  }

  bool WriteRedacted(redact::Redactor& redactor, std::string_view text) noexcept {
    std::string redacted;
    try {
      redacted = redactor.RedactText(text);
    } catch (const std::exception&) {
      return WriteAll(fd_, AsBytes(redact::kScrubbingFailedSentinel));
    }
    return WriteAll(fd_, AsBytes(redacted));
  }

  const int fd_;
  std::recursive_mutex mutex_;
  std::string deferred_;
  bool busy_{false};
};

// Never destroyed: exit-time flushes of std::cout and stdout still land here.
GuardedDescriptor& StdoutDescriptor() {
  static auto* descriptor = new GuardedDescriptor(kStdoutDescriptor);
  return *descriptor;
}

GuardedDescriptor& StderrDescriptor() {
  static auto* descriptor = new GuardedDescriptor(kStderrDescriptor);
  return *descriptor;
}

// Holds stream output until the stream is flushed, so a value written in
// several insertions is redacted as one unit. With kOnNewline complete lines
// are also emitted as soon as they are written.
class RedactingStreamBuf : public std::streambuf {
 public:
  enum class EmitPolicy { kOnFlush, kOnNewline };

  RedactingStreamBuf(GuardedDescriptor& target, EmitPolicy policy) : target_(target), policy_(policy) {}

 protected:
  int_type overflow(int_type ch) override {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
      return traits_type::not_eof(ch);
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char c = traits_type::to_char_type(ch);
    pending_.push_back(c);
    const bool lines_ok = c != '\n' || FlushCompleteLines();
    if (!FlushOversize() || !lines_ok) {
      return traits_type::eof();
    }
    return ch;
  }

  std::streamsize xsputn(const char* data, std::streamsize count) override {
    if (count <= 0) {
      return 0;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    pending_.append(data, static_cast<size_t>(count));
    const bool has_newline = std::string_view(data, static_cast<size_t>(count)).find('\n') != std::string_view::npos;
    const bool lines_ok = !has_newline || FlushCompleteLines();
    if (!FlushOversize() || !lines_ok) {
      return 0;
    }
    return count;
  }

  int sync() override {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const bool oversize_ok = FlushOversize();
    return FlushPrefix(pending_.size()) && oversize_ok ? 0 : -1;
  }

 private:
  bool FlushPrefix(size_t length) {
    if (length == 0) {
      return true;
    }
    std::string chunk = pending_.substr(0, length);
    security::Zeroizer::ScopeWiper wiper(chunk);
    security::Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(pending_.data()), length));
    pending_.erase(0, length);
    return target_.Write(AsBytes(chunk));
  }

  bool FlushCompleteLines() {
    if (policy_ != EmitPolicy::kOnNewline) {
      return true;
    }
    return FlushPrefix(FindLineSplit(pending_));
  }

  bool FlushOversize() {
    while (pending_.size() > kPendingFlushThreshold) {
      const size_t split = FindSafeSplit(pending_);
      if (split == 0) {
        return true;
      }
      if (!FlushPrefix(split)) {
        return false;
      }
    }
    return true;
  }

  GuardedDescriptor& target_;
  const EmitPolicy policy_;
  std::recursive_mutex mutex_;
  std::string pending_;
};

#if defined(__GLIBC__)
ssize_t CookieWrite(void* cookie, const char* data, size_t size) {
  auto* target = static_cast<GuardedDescriptor*>(cookie);
  if (!target->Write({reinterpret_cast<const uint8_t*>(data), size})) {
    return 0;
  }
  return static_cast<ssize_t>(size);
}
#elif defined(__APPLE__) || defined(__FreeBSD__)
int FunopenWrite(void* cookie, const char* data, int size) {
  if (size < 0) {
    return -1;
  }
  auto* target = static_cast<GuardedDescriptor*>(cookie);
  if (!target->Write({reinterpret_cast<const uint8_t*>(data), static_cast<size_t>(size)})) {
    return -1;
  }
  return size;
}
#endif

FILE* OpenGuardedFile(GuardedDescriptor& target) {
#if defined(__GLIBC__)
  cookie_io_functions_t functions{};
  functions.write = &CookieWrite;
  return ::fopencookie(&target, "w", functions);
#elif defined(__APPLE__) || defined(__FreeBSD__)
  return ::funopen(&target, nullptr, &FunopenWrite, nullptr, nullptr);
#else
  (void)target;
  return nullptr;
#endif
}

std::atomic<bool>& FailNextInstallFlag() {
  static std::atomic<bool> fail{false};
  return fail;
}

std::atomic<bool>& InstalledFlag() {
  static std::atomic<bool> installed{false};
  return installed;
}

void LoadClassifierConfig() {
  std::error_code ec;
  auto directory = std::filesystem::current_path(ec);
  if (ec) {
    directory = ".";
  }
  if (auto config = config::LoadOptionalScrubbingConfig(directory)) {
    redact::KeyClassifier::Instance().LoadUserConfig(*config);
  }
}

void InstallStreamBuffers() {
  // Held for the process lifetime: the standard streams must exist when this
  // runs from an early static constructor, and must not be re-initialised
  // (dropping the buffers set below) when the last Init object goes away.
  static auto* streams_init = new std::ios_base::Init();
  (void)streams_init;
  static auto* stdout_buffer =
      new RedactingStreamBuf(StdoutDescriptor(), RedactingStreamBuf::EmitPolicy::kOnFlush);
  static auto* stderr_buffer =
      new RedactingStreamBuf(StderrDescriptor(), RedactingStreamBuf::EmitPolicy::kOnNewline);
  std::cout.flush();
  std::cerr.flush();
  std::clog.flush();
  std::cout.rdbuf(stdout_buffer);
  std::cerr.rdbuf(stderr_buffer);
  std::clog.rdbuf(stderr_buffer);
  // The stderr buffer emits complete lines; unitbuf would hand it each
  // insertion of `cerr << name << value` separately.
  std::cerr.unsetf(std::ios_base::unitbuf);
  // The leaked Init above never runs the library's exit-time flush.
  std::atexit([] {
    std::cout.flush();
    std::cerr.flush();
    std::clog.flush();
  });
}

void InstallCFiles() {
  std::fflush(stdout);
  std::fflush(stderr);
  if (FILE* guarded = OpenGuardedFile(StdoutDescriptor())) {
    std::setvbuf(guarded, nullptr, _IOLBF, kStdoutFileBufferSize);
    stdout = guarded;
  }
  if (FILE* guarded = OpenGuardedFile(StderrDescriptor())) {
    std::setvbuf(guarded, nullptr, _IOLBF, kStdoutFileBufferSize);
    stderr = guarded;
  }
}

void InstallLoggerFilter() {
  logging::Logger::Instance().SetArgumentFilter(
      [](const redact::Value& argument) { return redact::GetRedactorShared()->RedactArgument(argument); });
}

}  // namespace

void InstallOutputGuard() noexcept {
  static std::mutex install_mutex;
  try {
    std::lock_guard<std::mutex> lock(install_mutex);
    if (InstalledFlag().load(std::memory_order_acquire)) {
      return;
    }
    if (FailNextInstallFlag().exchange(false)) {
      throw std::bad_alloc();
    }
    LoadClassifierConfig();
    InstallStreamBuffers();
    InstallCFiles();
    InstallLoggerFilter();
    InstalledFlag().store(true, std::memory_order_release);
  } catch (const std::exception&) {
    // The flag stays unset, so the next call retries.
    (void)WriteAll(kStderrDescriptor, AsBytes(kInstallFailedNotice));
  }
}

void FailNextInstallForTesting() noexcept {
  FailNextInstallFlag().store(true);
}

bool IsOutputGuardInstalled() noexcept {
  return InstalledFlag().load(std::memory_order_acquire);
}

bool IsLosslessUtf8(std::span<const uint8_t> payload) noexcept {
  size_t i = 0;
  const size_t n = payload.size();
  while (i < n) {
    const uint8_t lead = payload[i];
    if (lead < 0x80) {
      ++i;
      continue;
    }
    size_t length = 0;
    uint32_t min_code_point = 0;
    uint32_t code_point = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      min_code_point = 0x80;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      min_code_point = 0x800;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      min_code_point = 0x10000;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (n - i < length) {
      return false;
    }
    for (size_t k = 1; k < length; ++k) {
      const uint8_t continuation = payload[i + k];
      if ((continuation & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (continuation & 0x3F);
    }
    if (code_point < min_code_point || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

bool WriteStdout(std::span<const uint8_t> payload) noexcept {
  return StdoutDescriptor().Write(payload);
}

bool WriteStdout(std::string_view text) noexcept {
  return WriteStdout(AsBytes(text));
}

bool WriteStderr(std::span<const uint8_t> payload) noexcept {
  return StderrDescriptor().Write(payload);
}

bool WriteStderr(std::string_view text) noexcept {
  return WriteStderr(AsBytes(text));
}

namespace {

// Returns cut, or an earlier cut that keeps an unterminated PEM block whole.
size_t KeepOpenBlockWhole(std::string_view pending, size_t cut) noexcept {
  const std::string_view prefix = pending.substr(0, cut);
  const size_t begin = prefix.rfind(kBlockBegin);
  if (begin == std::string_view::npos) {
    return cut;
  }
  const size_t end = prefix.find(kBlockEnd, begin + kBlockBegin.size());
  if (end != std::string_view::npos &&
      prefix.find(kBlockFence, end + kBlockEnd.size()) != std::string_view::npos) {
    return cut;
  }
  // Open block: cut before the whitespace that precedes its header.
  for (size_t i = begin; i > 0; --i) {
    if (IsSplitWhitespace(pending[i - 1])) {
      return i;
    }
  }
  return 0;
}

}  // namespace

size_t FindSafeSplit(std::string_view pending, size_t limit) noexcept {
  const size_t window = std::min(pending.size(), limit);
  for (size_t i = window; i > 0; --i) {
    if (IsSplitWhitespace(pending[i - 1])) {
      return KeepOpenBlockWhole(pending, i);
    }
  }
  return 0;
}

size_t FindLineSplit(std::string_view pending) noexcept {
  const size_t newline = pending.rfind('\n');
  if (newline == std::string_view::npos) {
    return 0;
  }
  return KeepOpenBlockWhole(pending, newline + 1);
}

}  // namespace ssync::guard
