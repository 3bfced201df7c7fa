#pragma once

#include <cstdint>
#include <span>

#include "kf/keyfile/key_formats.h"
#include "kf/security/secure_buffer.h"

namespace kf::keyfile {

struct ResolvedKey {
  kf::security::SecureBuffer data;
  KeyFileFormat format{KeyFileFormat::kHashed};
};

// Turns the raw contents of a key file into key material. Structured
// formats are tried in order (XML, 32-byte binary, 64-character hex); any
// other non-empty buffer resolves to its SHA-256 digest.
//
// Throws kf::Error:
//   errors::validation::kEmptyInput             raw is empty
//   errors::validation::kAmbiguousContainerFile refuse_if_container_file is
//                                               set and raw starts with a
//                                               database signature
//   errors::internal::kFormatParserFailure      a parser reported a hard error
ResolvedKey ResolveKey(std::span<const uint8_t> raw, bool refuse_if_container_file);

}  // namespace kf::keyfile
