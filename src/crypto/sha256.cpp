#include "kf/crypto/sha256.h"

#include "kf/crypto/provider.h"

namespace kf::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  return GetCryptoProviderShared()->SHA256(data);
}

}  // namespace kf::crypto
