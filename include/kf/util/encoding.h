#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "kf/security/secure_buffer.h"

namespace kf::util {

// Standard alphabet with '=' padding.
std::string Base64Encode(std::span<const uint8_t> data);

constexpr std::size_t Base64EncodedSize(std::size_t byte_count) noexcept {
  return (byte_count + 2) / 3 * 4;
}

// Encodes into caller-owned storage of exactly Base64EncodedSize bytes, so
// key text can be produced straight into a SecureBuffer.
void Base64EncodeInto(std::span<const uint8_t> data, std::span<char> out) noexcept;

// Whitespace anywhere in the input is ignored. Returns nullopt when the
// remaining text is not a padded multiple of four characters from the
// standard alphabet. An empty (or all-whitespace) input decodes to an empty
// buffer.
std::optional<kf::security::SecureBuffer> Base64Decode(std::string_view input);

std::string HexEncode(std::span<const uint8_t> data);

// True when every character is a hex digit in either case. The empty string
// qualifies.
bool IsHexString(std::string_view text) noexcept;

std::optional<kf::security::SecureBuffer> HexDecode(std::string_view hex);

}  // namespace kf::util
