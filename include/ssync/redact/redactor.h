#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "ssync/redact/value.h"

namespace ssync::redact {

// Seam between the redaction core and the layers that emit output (output
// guard, logger filter, error formatting). They resolve the active redactor
// at call time, so tests can swap in a no-op or recording implementation.
class Redactor {
public:
  virtual ~Redactor() = default;

  virtual std::string RedactText(std::string_view text) noexcept = 0;

  virtual Value RedactValue(const Value& value) noexcept = 0;

  // Positional log argument: strings via RedactText, everything else via
  // RedactValue.
  Value RedactArgument(const Value& argument) noexcept;
};

class DefaultRedactor : public Redactor {
public:
  std::string RedactText(std::string_view text) noexcept override;
  Value RedactValue(const Value& value) noexcept override;
};

// Callers keep the returned pointer for the whole redaction so a concurrent
// SetRedactor cannot free the instance under them.
std::shared_ptr<Redactor> GetRedactorShared();
void SetRedactor(std::shared_ptr<Redactor> redactor);
void ResetRedactorForTesting();

}  // namespace ssync::redact
