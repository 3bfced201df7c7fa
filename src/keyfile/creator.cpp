#include "kf/keyfile/creator.h"

#include <algorithm>
#include <array>
#include <string>

#include "kf/common.h"
#include "kf/crypto/random.h"
#include "kf/crypto/sha256.h"
#include "kf/diagnostics/event_bus.h"
#include "kf/error.h"
#include "kf/errors.h"
#include "kf/io/file_io.h"
#include "kf/keyfile/xml_key_file.h"
#include "kf/security/zeroizer.h"

namespace kf::keyfile {

namespace {

using kf::diagnostics::EventBus;
using kf::diagnostics::EventCategory;
using kf::diagnostics::EventSeverity;
using kf::diagnostics::FieldPrivacy;

kf::security::SecureBuffer GenerateRandomKey() {
  kf::security::SecureBuffer random(kGeneratedKeySize);
  try {
    kf::crypto::RandomBytes(random.AsSpan());
  } catch (const kf::Error& err) {
    if (err.domain == kf::ErrorDomain::Crypto &&
        err.code == kf::errors::crypto::kRandomSourceFailure) {
      throw;
    }
    throw kf::Error(kf::ErrorDomain::Crypto, kf::errors::crypto::kRandomSourceFailure,
                    std::string(kf::errors::msg::kRandomSourceFailed) + ": " + err.what(),
                    err.native_code);
  }
  return random;
}

kf::security::SecureBuffer MixEntropy(std::span<const uint8_t> entropy,
                                                std::span<const uint8_t> random) {
  kf::security::SecureBuffer combined(entropy.size() + random.size());
  std::copy(entropy.begin(), entropy.end(), combined.data());
  std::copy(random.begin(), random.end(), combined.data() + entropy.size());

  auto digest = kf::crypto::SHA256_Hash(combined.AsSpan());
  kf::security::WipeOnExit wipe_digest(digest);
  return kf::security::SecureBuffer::CopyOf(digest);
}

}  // namespace

kf::security::SecureBuffer CreateKeyFileDocument(
    std::optional<std::span<const uint8_t>> additional_entropy) {
  auto random = GenerateRandomKey();

  const bool mixed = additional_entropy.has_value() && !additional_entropy->empty();
  kf::security::SecureBuffer key =
      mixed ? MixEntropy(*additional_entropy, random.AsSpan()) : std::move(random);

  auto document = SerializeXmlKeyFile(key.AsSpan());

  kf::diagnostics::Event created;
  created.category = EventCategory::kLifecycle;
  created.severity = EventSeverity::kDebug;
  created.event_id = "keyfile_generated";
  created.message = "Key file document generated";
  created.fields.emplace_back("entropy_mixed", mixed ? "true" : "false");
  created.fields.emplace_back("key_size", std::to_string(key.size()), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(created);

  return document;
}

void CreateKeyFile(const std::filesystem::path& output,
                   std::optional<std::span<const uint8_t>> additional_entropy) {
  auto document = CreateKeyFileDocument(additional_entropy);
  kf::io::AtomicReplace(output, document.AsSpan());

  kf::diagnostics::Event written;
  written.category = EventCategory::kLifecycle;
  written.severity = EventSeverity::kInfo;
  written.event_id = "keyfile_created";
  written.message = "Key file written";
  written.fields.emplace_back("path", kf::PathToUtf8String(output), FieldPrivacy::kHash);
  EventBus::Instance().Publish(written);
}

}  // namespace kf::keyfile
