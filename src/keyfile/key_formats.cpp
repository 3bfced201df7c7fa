#include "kf/keyfile/key_formats.h"

#include <string_view>

#include "kf/util/encoding.h"

namespace kf::keyfile {

const char* KeyFileFormatName(KeyFileFormat format) noexcept {
  switch (format) {
  case KeyFileFormat::kXml:
    return "xml";
  case KeyFileFormat::kBinary32:
    return "binary32";
  case KeyFileFormat::kHex64:
    return "hex64";
  case KeyFileFormat::kHashed:
    return "hashed";
  }
  return "unknown";
}

ParseOutcome ParseBinaryKey32(std::span<const uint8_t> data) {
  if (data.size() != kKeySize) {
    return ParseOutcome::NotThisFormat();
  }
  return ParseOutcome::Matched(kf::security::SecureBuffer::CopyOf(data));
}

ParseOutcome ParseHexKey64(std::span<const uint8_t> data) {
  if (data.size() != kHexKeyTextSize) {
    return ParseOutcome::NotThisFormat();
  }
  // Every accepted byte is ASCII, so the UTF-8 text view and the raw bytes
  // coincide; anything non-ASCII fails the digit check.
  const std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
  if (!kf::util::IsHexString(text)) {
    return ParseOutcome::NotThisFormat();
  }
  auto decoded = kf::util::HexDecode(text);
  if (!decoded || decoded->size() != kKeySize) {
    return ParseOutcome::NotThisFormat();
  }
  return ParseOutcome::Matched(std::move(*decoded));
}

}  // namespace kf::keyfile
