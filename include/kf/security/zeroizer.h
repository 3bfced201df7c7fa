#pragma once
#include <cstdint>
#include <span>
#include <string>

namespace kf::security {

// Overwrites `bytes` with zeros; the stores survive optimization.
void SecureWipe(std::span<uint8_t> bytes) noexcept;

// Wipes the whole capacity, so text left behind by earlier, longer contents
// is cleared as well, then empties the string.
void SecureWipe(std::string& text) noexcept;

// Pins the pages under `bytes` in RAM. False when the platform refused or
// cannot lock; the first refusal is published as `key_buffer_unlocked`.
bool LockKeyPages(std::span<uint8_t> bytes) noexcept;
void UnlockKeyPages(std::span<uint8_t> bytes) noexcept;

// Wipes a stack array or string when the enclosing scope exits, whichever
// way it exits.
class WipeOnExit {
public:
  explicit WipeOnExit(std::span<uint8_t> bytes) noexcept : bytes_(bytes) {}
  explicit WipeOnExit(std::string& text) noexcept : text_(&text) {}
  WipeOnExit(const WipeOnExit&) = delete;
  WipeOnExit& operator=(const WipeOnExit&) = delete;
  ~WipeOnExit() {
    if (text_ != nullptr) {
      SecureWipe(*text_);
    } else {
      SecureWipe(bytes_);
    }
  }

private:
  std::span<uint8_t> bytes_;
  std::string* text_{nullptr};
};

} // namespace kf::security
