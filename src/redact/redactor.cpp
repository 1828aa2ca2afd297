#include "ssync/redact/redactor.h"

#include <exception>
#include <mutex>
#include <utility>

#include "ssync/redact/pattern_matcher.h"
#include "ssync/redact/value_scrubber.h"

namespace ssync::redact {

namespace {

std::mutex& RedactorMutex() {
  static auto* mutex = new std::mutex();
  return *mutex;
}

std::shared_ptr<Redactor>& RedactorInstance() {
  // Never destroyed: stream buffers flushed during exit still need it.
  static auto* instance = new std::shared_ptr<Redactor>();
  return *instance;
}

}  // namespace

Value Redactor::RedactArgument(const Value& argument) noexcept {
  if (argument.is_string()) {
    try {
      return Value(RedactText(argument.as_string()));
    } catch (const std::exception&) {
      return Value(kScrubbingFailedSentinel);
    }
  }
  return RedactValue(argument);
}

std::string DefaultRedactor::RedactText(std::string_view text) noexcept {
  return ssync::redact::RedactText(text);
}

Value DefaultRedactor::RedactValue(const Value& value) noexcept {
  return ssync::redact::RedactValue(value);
}

std::shared_ptr<Redactor> GetRedactorShared() {
  std::lock_guard<std::mutex> lock(RedactorMutex());
  auto& redactor = RedactorInstance();
  if (!redactor) {
    redactor = std::make_shared<DefaultRedactor>();
  }
  return redactor;
}

void SetRedactor(std::shared_ptr<Redactor> redactor) {
  std::lock_guard<std::mutex> lock(RedactorMutex());
  RedactorInstance() = std::move(redactor);
}

void ResetRedactorForTesting() {
  std::lock_guard<std::mutex> lock(RedactorMutex());
  RedactorInstance().reset();
}

}  // namespace ssync::redact
