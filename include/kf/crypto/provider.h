#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace kf::crypto {

// Digest and randomness primitives. The process-wide instance is replaceable
// so tests can install a deterministic random source.
class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  // Fills `out` completely or throws kf::Error (kRandomSourceFailure).
  virtual void RandomBytes(std::span<uint8_t> out) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  void RandomBytes(std::span<uint8_t> out) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void ResetCryptoProviderForTesting();

}  // namespace kf::crypto
