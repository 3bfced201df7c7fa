#pragma once
#include <array>
#include <cstdint>
#include <span>

namespace kf::crypto {

// SHA-256 through the active CryptoProvider.
std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data);

} // namespace kf::crypto
