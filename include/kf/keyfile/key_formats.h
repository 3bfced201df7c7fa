#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>

#include "kf/security/secure_buffer.h"

namespace kf::keyfile {

enum class KeyFileFormat { kXml, kBinary32, kHex64, kHashed };

const char* KeyFileFormatName(KeyFileFormat format) noexcept;

inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kHexKeyTextSize = 2 * kKeySize;

enum class ParseStatus { kMatched, kNotThisFormat, kHardError };

// Result of one format parser. `key` is populated only for kMatched and
// `error` only for kHardError.
struct ParseOutcome {
  ParseStatus status{ParseStatus::kNotThisFormat};
  kf::security::SecureBuffer key;
  std::string error;

  static ParseOutcome Matched(kf::security::SecureBuffer key) {
    ParseOutcome outcome;
    outcome.status = ParseStatus::kMatched;
    outcome.key = std::move(key);
    return outcome;
  }

  static ParseOutcome NotThisFormat() { return ParseOutcome{}; }

  static ParseOutcome HardError(std::string message) {
    ParseOutcome outcome;
    outcome.status = ParseStatus::kHardError;
    outcome.error = std::move(message);
    return outcome;
  }
};

using FormatParser = ParseOutcome (*)(std::span<const uint8_t>);

// Exactly 32 bytes: the buffer is the key.
ParseOutcome ParseBinaryKey32(std::span<const uint8_t> data);

// Exactly 64 bytes of hex digits (either case): decoded to 32 bytes.
ParseOutcome ParseHexKey64(std::span<const uint8_t> data);

}  // namespace kf::keyfile
