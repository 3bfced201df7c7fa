#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "kf/security/secure_buffer.h"

namespace kf::io {

// Reads a whole regular file into locked, wipe-on-destroy memory without an
// intermediate stream buffer. Files larger than `max_size` bytes are refused
// before any content is read (0 = no ceiling). Directories and other
// non-regular files fail with errors::io::kNotARegularFile.
kf::security::SecureBuffer ReadFileBytes(const std::filesystem::path& path,
                                         std::uint64_t max_size);

// Writes `payload` to a 0600 staging file next to `target`, flushes it, and
// renames it over `target`. On failure the staging file is removed and any
// existing target is left untouched.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload);

}  // namespace kf::io
