#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string_view>

#include "ssync/redact/key_classifier.h"

namespace ssync::config {

// Conventional document names, tried in order inside the working directory.
inline constexpr std::array<std::string_view, 2> kConfigFileNames{"env-config.yml", "env-config.yaml"};

// Environment variable naming an explicit configuration document.
inline constexpr std::string_view kConfigPathEnv{"SSYNC_ENV_CONFIG"};

// Parses the `scrubbing` section of a configuration document:
//
//   scrubbing:
//     scrubPatterns: [CUSTOM_*]
//     whitelistPatterns: ["*_VALUE"]
//
// Missing sections or lists yield empty lists; entries that are not scalars
// are ignored. Throws ssync::Error (Config domain) when the file cannot be
// read or is not valid YAML.
redact::ScrubbingConfig LoadScrubbingConfig(const std::filesystem::path& path);

// Returns the first conventional document found in `directory`, or the one
// named by SSYNC_ENV_CONFIG when set.
std::optional<std::filesystem::path> LocateConfigFile(const std::filesystem::path& directory);

// LocateConfigFile + LoadScrubbingConfig. Absent or malformed documents give
// std::nullopt; never throws.
std::optional<redact::ScrubbingConfig> LoadOptionalScrubbingConfig(
    const std::filesystem::path& directory) noexcept;

}  // namespace ssync::config
