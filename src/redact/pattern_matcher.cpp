#include "ssync/redact/pattern_matcher.h"

#include <cctype>
#include <exception>
#include <optional>
#include <utility>

#include "ssync/crypto/sha256.h"
#include "ssync/redact/redaction_cache.h"

namespace ssync::redact {

namespace {

constexpr std::string_view kSchemeSeparator{"://"};
constexpr std::string_view kJwtPrefix{"eyJ"};
constexpr std::string_view kBlockBegin{"-----BEGIN "};
constexpr std::string_view kBlockEnd{"-----END "};
constexpr std::string_view kBlockDashes{"-----"};

bool IsAsciiAlpha(char ch) noexcept {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

bool IsIdentifierStart(char ch) noexcept {
  return IsAsciiAlpha(ch) || ch == '_';
}

bool IsIdentifierChar(char ch) noexcept {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool IsWhitespace(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool IsTokenChar(char ch) noexcept {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '_';
}

bool IsBlockLabelChar(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') || ch == ' ';
}

// End of the run of `pred` characters starting at `pos`.
template <typename Pred>
size_t RunEnd(std::string_view text, size_t pos, Pred pred) {
  while (pos < text.size() && pred(text[pos])) {
    ++pos;
  }
  return pos;
}

// Matches "<dashes>LABEL-----" where LABEL is [A-Z ]+ starting at `label_begin`.
// Returns the offset just past the closing dashes.
std::optional<size_t> MatchBlockLabel(std::string_view text, size_t label_begin) {
  const size_t label_end = RunEnd(text, label_begin, IsBlockLabelChar);
  if (label_end == label_begin || text.compare(label_end, kBlockDashes.size(), kBlockDashes) != 0) {
    return std::nullopt;
  }
  return label_end + kBlockDashes.size();
}

std::string RewriteAssignments(std::string_view text, const KeyClassifier& classifier) {
  std::string out;
  out.reserve(text.size());
  size_t copied = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (!IsIdentifierChar(text[i])) {
      ++i;
      continue;
    }
    const size_t run_end = RunEnd(text, i, IsIdentifierChar);
    size_t name_begin = i;
    while (name_begin < run_end && !IsIdentifierStart(text[name_begin])) {
      ++name_begin;
    }
    if (name_begin == run_end || run_end >= text.size() || text[run_end] != '=') {
      i = run_end;
      continue;
    }
    const size_t value_begin = run_end + 1;
    const size_t value_end = RunEnd(text, value_begin, [](char ch) { return !IsWhitespace(ch); });
    if (value_end == value_begin) {
      // Empty value: nothing to leak.
      i = value_begin;
      continue;
    }
    const auto name = text.substr(name_begin, run_end - name_begin);
    if (classifier.ShouldRedact(name)) {
      out.append(text.substr(copied, value_begin - copied));
      out.append(kRedactedPlaceholder);
      copied = value_end;
      i = value_end;
    } else {
      // The value of a public name can still carry a nested NAME=value.
      i = value_begin;
    }
  }
  out.append(text.substr(copied));
  return out;
}

std::string RewriteCredentialUrls(std::string_view text, const KeyClassifier&) {
  std::string out;
  out.reserve(text.size());
  size_t copied = 0;
  size_t search = 0;
  while (search < text.size()) {
    const size_t separator = text.find(kSchemeSeparator, search);
    if (separator == std::string_view::npos) {
      break;
    }
    size_t scheme_begin = separator;
    while (scheme_begin > search && IsAsciiAlpha(text[scheme_begin - 1])) {
      --scheme_begin;
    }
    const size_t user_begin = separator + kSchemeSeparator.size();
    const size_t colon = text.find(':', user_begin);
    if (colon == std::string_view::npos) {
      break;
    }
    const size_t at = text.find('@', colon + 1);
    if (at == std::string_view::npos) {
      break;
    }
    if (scheme_begin == separator || colon == user_begin || at == colon + 1) {
      search = separator + 1;
      continue;
    }
    out.append(text.substr(copied, colon + 1 - copied));
    out.append(kRedactedPlaceholder);
    out.push_back('@');
    copied = at + 1;
    search = at + 1;
  }
  out.append(text.substr(copied));
  return out;
}

std::string RewriteCompactTokens(std::string_view text, const KeyClassifier&) {
  std::string out;
  out.reserve(text.size());
  size_t copied = 0;
  size_t search = 0;
  while (search < text.size()) {
    const size_t begin = text.find(kJwtPrefix, search);
    if (begin == std::string_view::npos) {
      break;
    }
    size_t cursor = begin + kJwtPrefix.size();
    bool matched = true;
    for (int segment = 0; segment < 3; ++segment) {
      const size_t segment_end = RunEnd(text, cursor, IsTokenChar);
      if (segment_end == cursor) {
        matched = false;
        break;
      }
      cursor = segment_end;
      if (segment < 2) {
        if (cursor >= text.size() || text[cursor] != '.') {
          matched = false;
          break;
        }
        ++cursor;
      }
    }
    if (!matched) {
      search = begin + 1;
      continue;
    }
    out.append(text.substr(copied, begin - copied));
    out.append(kJwtPlaceholder);
    copied = cursor;
    search = cursor;
  }
  out.append(text.substr(copied));
  return out;
}

std::string RewriteDelimitedBlocks(std::string_view text, const KeyClassifier&) {
  std::string out;
  out.reserve(text.size());
  size_t copied = 0;
  size_t search = 0;
  while (search < text.size()) {
    const size_t begin = text.find(kBlockBegin, search);
    if (begin == std::string_view::npos) {
      break;
    }
    const auto body_begin = MatchBlockLabel(text, begin + kBlockBegin.size());
    if (!body_begin) {
      search = begin + 1;
      continue;
    }
    // Shortest body of at least one character.
    std::optional<size_t> block_end;
    size_t end_search = *body_begin + 1;
    while (end_search < text.size()) {
      const size_t end_marker = text.find(kBlockEnd, end_search);
      if (end_marker == std::string_view::npos) {
        break;
      }
      block_end = MatchBlockLabel(text, end_marker + kBlockEnd.size());
      if (block_end) {
        break;
      }
      end_search = end_marker + 1;
    }
    if (!block_end) {
      search = begin + 1;
      continue;
    }
    out.append(text.substr(copied, begin - copied));
    out.append(kPrivateKeyPlaceholder);
    copied = *block_end;
    search = *block_end;
  }
  out.append(text.substr(copied));
  return out;
}

}  // namespace

const std::array<SecretPattern, 4>& BuiltinSecretPatterns() {
  static constexpr std::array<SecretPattern, 4> kPatterns{{
      {PatternKind::kAssignment, "assignment", &RewriteAssignments},
      {PatternKind::kCredentialUrl, "credential_url", &RewriteCredentialUrls},
      {PatternKind::kCompactToken, "jwt", &RewriteCompactTokens},
      {PatternKind::kDelimitedBlock, "private_key_block", &RewriteDelimitedBlocks},
  }};
  return kPatterns;
}

std::string ApplySecretPatterns(std::string_view text, const KeyClassifier& classifier) {
  std::string current(text);
  for (const auto& pattern : BuiltinSecretPatterns()) {
    current = pattern.rewrite(current, classifier);
  }
  return current;
}

std::string RedactText(std::string_view text) noexcept {
  if (text.empty()) {
    return std::string();
  }
  try {
    const auto digest = crypto::SHA256_Hash(text);
    auto& cache = SharedRedactionCache();
    if (auto cached = cache.Get(digest)) {
      return std::move(*cached);
    }

    std::string result;
    if (text.size() > kMaxInputLength) {
      result.assign(kInputTooLargeSentinel);
    } else {
      result = ApplySecretPatterns(text, KeyClassifier::Instance());
    }
    cache.Put(digest, result);
    return result;
  } catch (const std::exception&) {
    return std::string(kScrubbingFailedSentinel);
  }
}

}  // namespace ssync::redact
