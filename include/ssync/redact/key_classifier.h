#pragma once

#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ssync::redact {

// User additions to the built-in name sets, as read from the optional
// configuration document. Entries are globs: '*' matches any run, '?' one
// character, everything else is literal. Matching ignores ASCII case.
struct ScrubbingConfig {
  std::vector<std::string> scrub_patterns;
  std::vector<std::string> whitelist_patterns;
};

enum class KeyClass { kSecret, kWhitelisted, kUnclassified };

class KeyClassifier {
 public:
  static KeyClassifier& Instance();

  // Startup-only: installs the user globs and drops every cached redaction so
  // nothing computed under the previous policy survives.
  void LoadUserConfig(const ScrubbingConfig& config);

  bool IsSecretKey(std::string_view name) const;
  bool IsWhitelisted(std::string_view name) const;

  // Whitelist always wins over secret classification.
  bool ShouldRedact(std::string_view name) const {
    return IsSecretKey(name) && !IsWhitelisted(name);
  }

  KeyClass Classify(std::string_view name) const;

  ScrubbingConfig UserConfig() const;

  void ResetForTesting();

 private:
  KeyClassifier() = default;

  std::vector<std::string> scrub_patterns_;
  std::vector<std::string> whitelist_patterns_;
  mutable std::shared_mutex mutex_;
};

bool MatchesGlob(std::string_view text, std::string_view pattern) noexcept;

bool IsSecretKey(std::string_view name);

bool IsWhitelisted(std::string_view name);

}  // namespace ssync::redact
