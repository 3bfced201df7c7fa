#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

#include "kf/keyfile/key_formats.h"
#include "kf/security/secure_buffer.h"

namespace kf::keyfile {

inline constexpr std::uint64_t kDefaultMaxKeyFileSize = 64ull * 1024 * 1024;

// KF_KEYFILE_MAX_SIZE when set to a valid number, kDefaultMaxKeyFileSize
// otherwise. 0 disables the ceiling.
std::uint64_t DefaultMaxKeyFileSize();

struct LoadOptions {
  std::uint64_t max_file_size{DefaultMaxKeyFileSize()};
};

// One factor of a composite master key.
class UserKey {
public:
  virtual ~UserKey() = default;
  virtual std::span<const uint8_t> KeyData() const = 0;
};

class KeyFileKey final : public UserKey {
public:
  explicit KeyFileKey(const std::filesystem::path& path, bool refuse_if_container_file = false,
                      const LoadOptions& options = {});

  // For key sources that do not live on the local filesystem.
  static KeyFileKey FromBytes(std::string source_path, std::span<const uint8_t> raw,
                              bool refuse_if_container_file = false);

  KeyFileKey(KeyFileKey&&) noexcept = default;
  KeyFileKey& operator=(KeyFileKey&&) noexcept = default;
  KeyFileKey(const KeyFileKey&) = delete;
  KeyFileKey& operator=(const KeyFileKey&) = delete;

  const std::string& Path() const noexcept { return path_; }
  std::span<const uint8_t> KeyData() const override { return key_.AsSpan(); }
  KeyFileFormat Format() const noexcept { return format_; }

private:
  KeyFileKey(std::string path, kf::security::SecureBuffer key, KeyFileFormat format);

  std::string path_;
  kf::security::SecureBuffer key_;
  KeyFileFormat format_{KeyFileFormat::kHashed};
};

}  // namespace kf::keyfile
