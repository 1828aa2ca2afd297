#include "ssync/config/config_loader.h"
#include "ssync/error.h"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

class TempDir {
public:
  TempDir() {
    auto base = std::filesystem::temp_directory_path();
    auto name = std::string{"ssync_config_"} +
                std::to_string(static_cast<unsigned long long>(
                    std::chrono::steady_clock::now().time_since_epoch().count()));
    path_ = base / name;
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_{};
};

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

void TestParsesSection() {
  TempDir dir;
  const auto path = dir.path() / "env-config.yml";
  WriteFile(path,
            "other: 1\n"
            "scrubbing:\n"
            "  scrubPatterns:\n"
            "    - CUSTOM_*\n"
            "    - '*_PASS'\n"
            "    - {nested: map}\n"
            "  whitelistPatterns: [\"*_VALUE\"]\n");
  const auto config = ssync::config::LoadScrubbingConfig(path);
  assert(config.scrub_patterns.size() == 2);
  assert(config.scrub_patterns[0] == "CUSTOM_*");
  assert(config.scrub_patterns[1] == "*_PASS");
  assert(config.whitelist_patterns.size() == 1);
  assert(config.whitelist_patterns[0] == "*_VALUE");
}

void TestMissingSectionsAreEmpty() {
  TempDir dir;
  const auto path = dir.path() / "env-config.yml";
  WriteFile(path, "scrubbing:\n  scrubPatterns: not-a-list\n");
  const auto config = ssync::config::LoadScrubbingConfig(path);
  assert(config.scrub_patterns.empty());
  assert(config.whitelist_patterns.empty());

  WriteFile(path, "");
  assert(ssync::config::LoadScrubbingConfig(path).scrub_patterns.empty());
}

void TestErrors() {
  TempDir dir;
  bool threw = false;
  try {
    (void)ssync::config::LoadScrubbingConfig(dir.path() / "absent.yml");
  } catch (const ssync::Error& err) {
    threw = err.domain == ssync::ErrorDomain::Config && err.code == ssync::errors::config::kUnreadable;
  }
  assert(threw);

  const auto bad = dir.path() / "env-config.yml";
  WriteFile(bad, "scrubbing: [unclosed\n");
  threw = false;
  try {
    (void)ssync::config::LoadScrubbingConfig(bad);
  } catch (const ssync::Error& err) {
    threw = err.code == ssync::errors::config::kMalformed;
  }
  assert(threw);

  WriteFile(bad, "- just\n- a list\n");
  threw = false;
  try {
    (void)ssync::config::LoadScrubbingConfig(bad);
  } catch (const ssync::Error& err) {
    threw = err.code == ssync::errors::config::kMalformed;
  }
  assert(threw);

  // The optional loader degrades silently.
  assert(!ssync::config::LoadOptionalScrubbingConfig(dir.path()).has_value());
}

void TestDiscovery() {
  TempDir dir;
  assert(!ssync::config::LocateConfigFile(dir.path()).has_value());
  assert(!ssync::config::LoadOptionalScrubbingConfig(dir.path()).has_value());

  WriteFile(dir.path() / "env-config.yaml", "scrubbing:\n  scrubPatterns: [FROM_YAML]\n");
  auto located = ssync::config::LocateConfigFile(dir.path());
  assert(located && located->filename() == "env-config.yaml");

  WriteFile(dir.path() / "env-config.yml", "scrubbing:\n  scrubPatterns: [FROM_YML]\n");
  located = ssync::config::LocateConfigFile(dir.path());
  assert(located && located->filename() == "env-config.yml");
  auto config = ssync::config::LoadOptionalScrubbingConfig(dir.path());
  assert(config && config->scrub_patterns.at(0) == "FROM_YML");

  const auto explicit_path = dir.path() / "custom.yml";
  WriteFile(explicit_path, "scrubbing:\n  whitelistPatterns: [EXPLICIT]\n");
  ::setenv(std::string(ssync::config::kConfigPathEnv).c_str(), explicit_path.c_str(), 1);
  config = ssync::config::LoadOptionalScrubbingConfig(dir.path());
  assert(config && config->whitelist_patterns.at(0) == "EXPLICIT");
  ::unsetenv(std::string(ssync::config::kConfigPathEnv).c_str());
}

} // namespace

int main() {
  ::unsetenv(std::string(ssync::config::kConfigPathEnv).c_str());
  TestParsesSection();
  TestMissingSectionsAreEmpty();
  TestErrors();
  TestDiscovery();
  std::cout << "config loader tests ok\n";
  return 0;
}
