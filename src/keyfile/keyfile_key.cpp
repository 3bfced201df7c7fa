#include "kf/keyfile/keyfile_key.h"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <utility>

#include "kf/common.h"
#include "kf/diagnostics/event_bus.h"
#include "kf/io/file_io.h"
#include "kf/keyfile/resolver.h"

namespace kf::keyfile {

namespace {

void PublishLoaded(const std::string& path, KeyFileFormat format) {
  kf::diagnostics::Event loaded;
  loaded.category = kf::diagnostics::EventCategory::kSecurity;
  loaded.severity = kf::diagnostics::EventSeverity::kInfo;
  loaded.event_id = "keyfile_loaded";
  loaded.message = "Key file loaded";
  loaded.fields.emplace_back("path", path, kf::diagnostics::FieldPrivacy::kHash);
  loaded.fields.emplace_back("format", KeyFileFormatName(format));
  kf::diagnostics::EventBus::Instance().Publish(loaded);
}

}  // namespace

std::uint64_t DefaultMaxKeyFileSize() {
  const char* env = std::getenv("KF_KEYFILE_MAX_SIZE");
  if (env == nullptr || *env == '\0') {
    return kDefaultMaxKeyFileSize;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(env, &end, 10);
  if (errno != 0 || end == env || *end != '\0' || *env == '-') {
    std::clog << "[config] ignoring invalid KF_KEYFILE_MAX_SIZE value\n";
    return kDefaultMaxKeyFileSize;
  }
  return static_cast<std::uint64_t>(parsed);
}

KeyFileKey::KeyFileKey(std::string path, kf::security::SecureBuffer key,
                       KeyFileFormat format)
    : path_(std::move(path)), key_(std::move(key)), format_(format) {}

KeyFileKey::KeyFileKey(const std::filesystem::path& path, bool refuse_if_container_file,
                       const LoadOptions& options)
    : path_(kf::PathToUtf8String(path)) {
  // The raw buffer is a SecureBuffer and is wiped when it leaves scope.
  auto raw = kf::io::ReadFileBytes(path, options.max_file_size);
  auto resolved = ResolveKey(raw.AsSpan(), refuse_if_container_file);
  key_ = std::move(resolved.data);
  format_ = resolved.format;
  PublishLoaded(path_, format_);
}

KeyFileKey KeyFileKey::FromBytes(std::string source_path, std::span<const uint8_t> raw,
                                 bool refuse_if_container_file) {
  auto resolved = ResolveKey(raw, refuse_if_container_file);
  KeyFileKey key(std::move(source_path), std::move(resolved.data), resolved.format);
  PublishLoaded(key.path_, key.format_);
  return key;
}

}  // namespace kf::keyfile
