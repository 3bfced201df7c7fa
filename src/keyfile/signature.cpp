#include "kf/keyfile/signature.h"

#include "kf/common.h"

namespace kf::keyfile {

std::optional<ContainerSignature> MatchContainerSignature(std::span<const uint8_t> data) noexcept {
  if (data.size() < kContainerSignatureSize) {
    return std::nullopt;
  }
  const std::uint32_t first = kf::LoadLittleEndian32(data.subspan(0, 4));
  const std::uint32_t second = kf::LoadLittleEndian32(data.subspan(4, 4));
  for (const auto& magic : kKnownContainerSignatures) {
    if (magic.first == first && magic.second == second) {
      return magic.kind;
    }
  }
  return std::nullopt;
}

const char* ContainerSignatureName(ContainerSignature signature) noexcept {
  switch (signature) {
  case ContainerSignature::kCurrent:
    return "current";
  case ContainerSignature::kPreRelease:
    return "pre-release";
  case ContainerSignature::kLegacy:
    return "legacy";
  }
  return "unknown";
}

}  // namespace kf::keyfile
