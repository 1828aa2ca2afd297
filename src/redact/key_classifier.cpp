#include "ssync/redact/key_classifier.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>

#include "ssync/redact/redaction_cache.h"

namespace ssync::redact {

namespace {

constexpr std::array<std::string_view, 25> kBuiltinSecretKeys{
    "password",       "passwd",          "pwd",
    "secret",         "api_key",         "apikey",
    "api_secret",     "token",           "auth",
    "authorization",  "auth_token",      "private_key",
    "access_key",     "secret_key",      "database_url",
    "db_url",         "db_password",     "client_secret",
    "client_id",      "aws_secret_access_key", "aws_access_key_id",
    "github_token",   "gh_token",        "stripe_secret_key",
    "stripe_api_key"};

constexpr std::array<std::string_view, 9> kBuiltinWhitelistKeys{
    "debug", "node_env", "port", "host", "hostname", "path",
    "log_level", "verbose", "secrets_sync_timeout"};

constexpr std::array<std::string_view, 4> kSecretSubstrings{"password", "secret", "token", "key"};

char FoldCase(char ch) noexcept {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

std::string ToLower(std::string_view value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (char ch : value) {
    lowered.push_back(FoldCase(ch));
  }
  return lowered;
}

template <size_t N>
bool Contains(const std::array<std::string_view, N>& set, std::string_view lowered) {
  return std::find(set.begin(), set.end(), lowered) != set.end();
}

bool MatchesAny(const std::vector<std::string>& patterns, std::string_view name) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [name](const std::string& pattern) { return MatchesGlob(name, pattern); });
}

}  // namespace

bool MatchesGlob(std::string_view text, std::string_view pattern) noexcept {
  // Greedy matcher with a single backtrack point per '*': O(text * pattern)
  // in the worst case, never exponential.
  size_t t = 0;
  size_t p = 0;
  size_t star = std::string_view::npos;
  size_t star_text = 0;
  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      star_text = t;
    } else if (p < pattern.size() &&
               (pattern[p] == '?' || FoldCase(pattern[p]) == FoldCase(text[t]))) {
      ++p;
      ++t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++star_text;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

KeyClassifier& KeyClassifier::Instance() {
  // Lives until process exit; the output guard consults it from exit-time
  // flushes.
  static auto* instance = new KeyClassifier();
  return *instance;
}

void KeyClassifier::LoadUserConfig(const ScrubbingConfig& config) {
  {
    std::unique_lock lock(mutex_);
    scrub_patterns_ = config.scrub_patterns;
    whitelist_patterns_ = config.whitelist_patterns;
  }
  ClearCache();
}

bool KeyClassifier::IsSecretKey(std::string_view name) const {
  if (name.empty()) {
    return false;
  }
  const auto lowered = ToLower(name);
  if (Contains(kBuiltinSecretKeys, lowered)) {
    return true;
  }
  {
    std::shared_lock lock(mutex_);
    if (MatchesAny(scrub_patterns_, name)) {
      return true;
    }
  }
  return std::any_of(kSecretSubstrings.begin(), kSecretSubstrings.end(),
                     [&lowered](std::string_view needle) {
                       return lowered.find(needle) != std::string::npos;
                     });
}

bool KeyClassifier::IsWhitelisted(std::string_view name) const {
  if (name.empty()) {
    return false;
  }
  if (Contains(kBuiltinWhitelistKeys, ToLower(name))) {
    return true;
  }
  std::shared_lock lock(mutex_);
  return MatchesAny(whitelist_patterns_, name);
}

KeyClass KeyClassifier::Classify(std::string_view name) const {
  if (IsWhitelisted(name)) {
    return KeyClass::kWhitelisted;
  }
  if (IsSecretKey(name)) {
    return KeyClass::kSecret;
  }
  return KeyClass::kUnclassified;
}

ScrubbingConfig KeyClassifier::UserConfig() const {
  std::shared_lock lock(mutex_);
  return ScrubbingConfig{scrub_patterns_, whitelist_patterns_};
}

void KeyClassifier::ResetForTesting() {
  LoadUserConfig(ScrubbingConfig{});
}

bool IsSecretKey(std::string_view name) {
  return KeyClassifier::Instance().IsSecretKey(name);
}

bool IsWhitelisted(std::string_view name) {
  return KeyClassifier::Instance().IsWhitelisted(name);
}

}  // namespace ssync::redact
