#include "ssync/config/config_loader.h"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "ssync/error.h"
#include "ssync/errors.h"

namespace ssync::config {

namespace {

constexpr std::string_view kSectionKey{"scrubbing"};
constexpr std::string_view kScrubPatternsKey{"scrubPatterns"};
constexpr std::string_view kWhitelistPatternsKey{"whitelistPatterns"};

std::vector<std::string> ReadPatternList(const YAML::Node& section, std::string_view key) {
  std::vector<std::string> patterns;
  const YAML::Node list = section[std::string(key)];
  if (!list || !list.IsSequence()) {
    return patterns;
  }
  for (const auto& entry : list) {
    if (!entry.IsScalar()) {
      continue;
    }
    auto pattern = entry.as<std::string>();
    if (!pattern.empty()) {
      patterns.push_back(std::move(pattern));
    }
  }
  return patterns;
}

bool IsRegularFile(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

}  // namespace

redact::ScrubbingConfig LoadScrubbingConfig(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ssync::Error(ssync::ErrorDomain::Config, errors::config::kUnreadable,
                       std::string(errors::msg::kConfigUnreadable), errno,
                       {path.filename().string()});
  }

  YAML::Node root;
  try {
    root = YAML::Load(in);
  } catch (const YAML::Exception& ex) {
    throw ssync::Error(ssync::ErrorDomain::Config, errors::config::kMalformed,
                       std::string(errors::msg::kConfigMalformed), std::nullopt,
                       {path.filename().string(), "line " + std::to_string(ex.mark.line + 1)});
  }

  redact::ScrubbingConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ssync::Error(ssync::ErrorDomain::Config, errors::config::kMalformed,
                       std::string(errors::msg::kConfigRootNotMapping), std::nullopt,
                       {path.filename().string()});
  }
  const YAML::Node section = root[std::string(kSectionKey)];
  if (!section || !section.IsMap()) {
    return config;
  }
  config.scrub_patterns = ReadPatternList(section, kScrubPatternsKey);
  config.whitelist_patterns = ReadPatternList(section, kWhitelistPatternsKey);
  return config;
}

std::optional<std::filesystem::path> LocateConfigFile(const std::filesystem::path& directory) {
  if (const char* env = std::getenv(std::string(kConfigPathEnv).c_str()); env && *env) {
    std::filesystem::path explicit_path(env);
    if (IsRegularFile(explicit_path)) {
      return explicit_path;
    }
    return std::nullopt;
  }
  for (const auto name : kConfigFileNames) {
    auto candidate = directory / std::string(name);
    if (IsRegularFile(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::optional<redact::ScrubbingConfig> LoadOptionalScrubbingConfig(
    const std::filesystem::path& directory) noexcept {
  try {
    auto path = LocateConfigFile(directory);
    if (!path) {
      return std::nullopt;
    }
    return LoadScrubbingConfig(*path);
  } catch (const std::exception&) {
    // Optional document: built-in rules stay active.
    return std::nullopt;
  }
}

}  // namespace ssync::config
