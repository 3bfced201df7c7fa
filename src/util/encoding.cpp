#include "kf/util/encoding.h"

#include <array>
#include <cctype>

#include "kf/security/zeroizer.h"

namespace kf::util {

namespace {

constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr uint8_t kInvalid = 0xFF;

constexpr std::array<uint8_t, 256> kBase64Reverse = [] {
  std::array<uint8_t, 256> map{};
  map.fill(kInvalid);
  for (size_t i = 0; i < 64; ++i) {
    map[static_cast<uint8_t>(kBase64Alphabet[i])] = static_cast<uint8_t>(i);
  }
  return map;
}();

int HexValue(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

}  // namespace

void Base64EncodeInto(std::span<const uint8_t> data, std::span<char> out) noexcept {
  std::size_t o = 0;
  for (std::size_t i = 0; i < data.size(); i += 3) {
    const std::size_t left = data.size() - i;
    uint32_t group = static_cast<uint32_t>(data[i]) << 16;
    if (left > 1) {
      group |= static_cast<uint32_t>(data[i + 1]) << 8;
    }
    if (left > 2) {
      group |= data[i + 2];
    }
    out[o++] = kBase64Alphabet[(group >> 18) & 0x3F];
    out[o++] = kBase64Alphabet[(group >> 12) & 0x3F];
    out[o++] = left > 1 ? kBase64Alphabet[(group >> 6) & 0x3F] : '=';
    out[o++] = left > 2 ? kBase64Alphabet[group & 0x3F] : '=';
  }
}

std::string Base64Encode(std::span<const uint8_t> data) {
  std::string encoded(Base64EncodedSize(data.size()), '\0');
  Base64EncodeInto(data, encoded);
  return encoded;
}

std::optional<kf::security::SecureBuffer> Base64Decode(std::string_view input) {
  std::string filtered;
  filtered.reserve(input.size());
  for (char ch : input) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      filtered.push_back(ch);
    }
  }
  kf::security::WipeOnExit wipe_filtered(filtered);

  if (filtered.size() % 4 != 0) {
    return std::nullopt;
  }
  if (filtered.empty()) {
    return kf::security::SecureBuffer();
  }

  size_t padding = 0;
  if (filtered.back() == '=') {
    ++padding;
    if (filtered[filtered.size() - 2] == '=') {
      ++padding;
    }
  }
  const size_t data_chars = filtered.size() - padding;
  for (size_t i = 0; i < data_chars; ++i) {
    if (kBase64Reverse[static_cast<uint8_t>(filtered[i])] == kInvalid) {
      return std::nullopt;
    }
  }

  kf::security::SecureBuffer decoded((filtered.size() / 4) * 3 - padding);
  size_t out_index = 0;
  uint32_t accumulator = 0;
  int bits = 0;
  for (size_t i = 0; i < data_chars; ++i) {
    accumulator = (accumulator << 6) | kBase64Reverse[static_cast<uint8_t>(filtered[i])];
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      decoded.data()[out_index++] = static_cast<uint8_t>((accumulator >> bits) & 0xFF);
    }
  }
  return decoded;
}

std::string HexEncode(std::span<const uint8_t> data) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string encoded(data.size() * 2, '\0');
  for (size_t i = 0; i < data.size(); ++i) {
    encoded[2 * i] = kHexDigits[(data[i] >> 4) & 0x0F];
    encoded[2 * i + 1] = kHexDigits[data[i] & 0x0F];
  }
  return encoded;
}

bool IsHexString(std::string_view text) noexcept {
  for (char ch : text) {
    if (HexValue(ch) < 0) {
      return false;
    }
  }
  return true;
}

std::optional<kf::security::SecureBuffer> HexDecode(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  kf::security::SecureBuffer decoded(hex.size() / 2);
  for (size_t i = 0; i < decoded.size(); ++i) {
    const int hi = HexValue(hex[2 * i]);
    const int lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    decoded.data()[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return decoded;
}

}  // namespace kf::util
