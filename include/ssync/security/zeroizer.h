#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace ssync::security {

class Zeroizer {
public:
  static void Wipe(std::span<uint8_t> data) noexcept;

  // Clears the characters in place and leaves the string empty. Capacity is
  // kept so the wiped storage is reused instead of returned to the allocator.
  static void WipeString(std::string& text) noexcept {
    if (text.empty()) {
      return;
    }
    Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
    text.clear();
  }

  class ScopeWiper {
  public:
    explicit ScopeWiper(std::string& text) noexcept : text_(text) {}

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

    ~ScopeWiper() noexcept { Zeroizer::WipeString(text_); }

  private:
    std::string& text_;
  };
};

} // namespace ssync::security
