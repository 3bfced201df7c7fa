#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

#include "kf/security/secure_buffer.h"

namespace kf::keyfile {

inline constexpr std::size_t kGeneratedKeySize = 32;

// Generates a fresh key and returns the canonical XML document carrying it.
// With non-empty additional entropy the key is SHA-256(entropy || random).
// RNG failures surface as errors::crypto::kRandomSourceFailure.
kf::security::SecureBuffer CreateKeyFileDocument(
    std::optional<std::span<const uint8_t>> additional_entropy = std::nullopt);

// Writes a freshly generated key file to `output`, replacing any existing
// file atomically.
void CreateKeyFile(const std::filesystem::path& output,
                   std::optional<std::span<const uint8_t>> additional_entropy = std::nullopt);

}  // namespace kf::keyfile
