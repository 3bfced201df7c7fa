#pragma once

#include <cstdint>
#include <span>

namespace kf::crypto {

// Operating system CSPRNG. Throws kf::Error with
// errors::crypto::kRandomSourceFailure when the source cannot deliver.
void SystemRandomBytes(std::span<uint8_t> out);

// Random bytes from the active CryptoProvider.
void RandomBytes(std::span<uint8_t> out);

}  // namespace kf::crypto
