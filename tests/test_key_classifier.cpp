#include "ssync/redact/key_classifier.h"
#include "ssync/redact/pattern_matcher.h"

#include <cassert>
#include <iostream>
#include <string>

using ssync::redact::KeyClass;
using ssync::redact::KeyClassifier;
using ssync::redact::MatchesGlob;
using ssync::redact::ScrubbingConfig;

namespace {

void TestBuiltins() {
  auto& classifier = KeyClassifier::Instance();
  assert(classifier.IsSecretKey("password"));
  assert(classifier.IsSecretKey("AWS_SECRET_ACCESS_KEY"));
  assert(classifier.IsSecretKey("Client_Id"));
  assert(classifier.IsSecretKey("auth"));
  // Substring rule.
  assert(classifier.IsSecretKey("MY_SERVICE_TOKEN_V2"));
  assert(classifier.IsSecretKey("sshKeyPath"));
  assert(!classifier.IsSecretKey("USERNAME"));
  assert(!classifier.IsSecretKey(""));

  assert(classifier.IsWhitelisted("NODE_ENV"));
  assert(classifier.IsWhitelisted("secrets_sync_timeout"));
  assert(!classifier.IsWhitelisted("HOST_NAME"));

  assert(classifier.Classify("LOG_LEVEL") == KeyClass::kWhitelisted);
  assert(classifier.Classify("DB_URL") == KeyClass::kSecret);
  assert(classifier.Classify("REGION") == KeyClass::kUnclassified);
  assert(!classifier.ShouldRedact("PORT"));
}

void TestGlobs() {
  assert(MatchesGlob("MY_VALUE", "*_VALUE"));
  assert(MatchesGlob("my_value", "*_VALUE"));
  assert(!MatchesGlob("MY_VALUES", "*_VALUE"));
  assert(MatchesGlob("CUSTOM_A", "CUSTOM_?"));
  assert(!MatchesGlob("CUSTOM_AB", "CUSTOM_?"));
  assert(MatchesGlob("anything", "*"));
  assert(MatchesGlob("", "*"));
  assert(!MatchesGlob("", "?"));
  assert(MatchesGlob("a.b", "a.b"));
  assert(!MatchesGlob("axb", "a.b"));
  assert(MatchesGlob("A_B_C_D", "*_*_*_D"));
  // Long pathological input stays linear.
  const std::string long_name(5000, 'a');
  assert(!MatchesGlob(long_name, "*a*a*a*a*a*b"));
}

void TestUserConfig() {
  auto& classifier = KeyClassifier::Instance();

  assert(ssync::redact::RedactText("MY_KEY_VALUE=123") == "MY_KEY_VALUE=[REDACTED]");

  ScrubbingConfig config;
  config.scrub_patterns = {"CUSTOM_*"};
  config.whitelist_patterns = {"*_VALUE"};
  classifier.LoadUserConfig(config);

  assert(classifier.IsSecretKey("custom_thing"));
  assert(classifier.IsWhitelisted("MY_KEY_VALUE"));
  assert(!classifier.ShouldRedact("MY_KEY_VALUE"));
  assert(classifier.ShouldRedact("CUSTOM_ENDPOINT"));

  // Loading dropped the cached result computed under the old policy.
  assert(ssync::redact::RedactText("MY_VALUE=123") == "MY_VALUE=123");
  assert(ssync::redact::RedactText("MY_KEY_VALUE=123") == "MY_KEY_VALUE=123");
  assert(ssync::redact::RedactText("CUSTOM_ENDPOINT=x") == "CUSTOM_ENDPOINT=[REDACTED]");

  const auto loaded = classifier.UserConfig();
  assert(loaded.scrub_patterns.size() == 1 && loaded.whitelist_patterns.size() == 1);

  classifier.ResetForTesting();
  assert(!classifier.IsSecretKey("CUSTOM_ENDPOINT"));
  assert(ssync::redact::RedactText("MY_KEY_VALUE=123") == "MY_KEY_VALUE=[REDACTED]");
}

} // namespace

int main() {
  KeyClassifier::Instance().ResetForTesting();
  TestBuiltins();
  TestGlobs();
  TestUserConfig();
  std::cout << "key classifier tests ok\n";
  return 0;
}
