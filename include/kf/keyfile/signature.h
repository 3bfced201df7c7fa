#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace kf::keyfile {

// Database container generations whose magic numbers are recognized so a
// container is never mistaken for a key file.
enum class ContainerSignature { kCurrent, kPreRelease, kLegacy };

struct ContainerMagic {
  std::uint32_t first;
  std::uint32_t second;
  ContainerSignature kind;
};

inline constexpr std::size_t kContainerSignatureSize = 8;

inline constexpr std::array<ContainerMagic, 3> kKnownContainerSignatures{{
    {0x9AA2D903u, 0xB54BFB67u, ContainerSignature::kCurrent},
    {0x9AA2D903u, 0xB54BFB66u, ContainerSignature::kPreRelease},
    {0x9AA2D903u, 0xB54BFB65u, ContainerSignature::kLegacy},
}};

// Compares the two little-endian words at offsets 0 and 4 with the known
// signatures. Buffers shorter than 8 bytes never match.
std::optional<ContainerSignature> MatchContainerSignature(std::span<const uint8_t> data) noexcept;

inline bool LooksLikeContainerFile(std::span<const uint8_t> data) noexcept {
  return MatchContainerSignature(data).has_value();
}

const char* ContainerSignatureName(ContainerSignature signature) noexcept;

}  // namespace kf::keyfile
