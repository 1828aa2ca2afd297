#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ssync {
  enum class ErrorDomain : std::uint16_t {
    Config = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Redaction = 0x04,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated platform error numbers
  // never collide with framework codes. Codes inside the span are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Config:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Redaction:
      return 0x0400;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace config {
      inline constexpr int kUnreadable = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kMalformed = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kDependencyMissing = Make(ErrorDomain::Config, 0x03);
    } // namespace config

    namespace io {
      inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kInputUnreadable = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kPermissionDenied = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kTimedOut = Make(ErrorDomain::IO, 0x04);
    } // namespace io

    namespace crypto {
      inline constexpr int kDigestFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kSelfTestFailed = Make(ErrorDomain::Crypto, 0x02);
    } // namespace crypto

    namespace redaction {
      inline constexpr int kUnknownMessageCode = Make(ErrorDomain::Redaction, 0x01);
    } // namespace redaction

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          context(std::move(ctx)) {}
  };
} // namespace ssync
