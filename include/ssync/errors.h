#pragma once

#include <string_view>

namespace ssync::errors::msg {
// Centralized message catalog for internal failures. None of these strings may
// embed caller data; callers attach details through Error::context.
inline constexpr std::string_view kConfigUnreadable{"Unable to read scrubbing configuration"};
inline constexpr std::string_view kConfigMalformed{"Scrubbing configuration is not valid YAML"};
inline constexpr std::string_view kConfigRootNotMapping{"Scrubbing configuration root must be a mapping"};
inline constexpr std::string_view kDigestFailed{"SHA-256 digest failed"};
inline constexpr std::string_view kDigestLengthUnexpected{"Unexpected SHA-256 length"};
inline constexpr std::string_view kDigestSelfTestFailed{"SHA-256 known-answer test failed"};
inline constexpr std::string_view kWriteFailed{"Write to output descriptor failed"};
inline constexpr std::string_view kInputUnreadable{"Unable to open input"};
inline constexpr std::string_view kDependencyMissing{"Missing dependency"};
inline constexpr std::string_view kPermissionDenied{"Permission denied"};
inline constexpr std::string_view kTimedOut{"Operation timed out"};
inline constexpr std::string_view kUnknownMessageCode{"Unknown diagnostic message code"};
}  // namespace ssync::errors::msg
