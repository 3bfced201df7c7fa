#include "kf/keyfile/resolver.h"

#include <array>
#include <string>

#include "kf/crypto/sha256.h"
#include "kf/diagnostics/event_bus.h"
#include "kf/error.h"
#include "kf/errors.h"
#include "kf/keyfile/signature.h"
#include "kf/keyfile/xml_key_file.h"
#include "kf/security/zeroizer.h"

namespace kf::keyfile {

namespace {

using kf::diagnostics::EventBus;
using kf::diagnostics::EventCategory;
using kf::diagnostics::EventSeverity;
using kf::diagnostics::FieldPrivacy;

struct FormatStep {
  KeyFileFormat format;
  FormatParser parse;
};

// Priority order matters: an XML document of exactly 32 or 64 bytes must
// still be read as XML.
constexpr std::array<FormatStep, 3> kResolutionChain{{
    {KeyFileFormat::kXml, &ParseXmlKeyFile},
    {KeyFileFormat::kBinary32, &ParseBinaryKey32},
    {KeyFileFormat::kHex64, &ParseHexKey64},
}};

void PublishContainerRefused(ContainerSignature signature) {
  kf::diagnostics::Event refused;
  refused.category = EventCategory::kSecurity;
  refused.severity = EventSeverity::kWarning;
  refused.event_id = "keyfile_container_refused";
  refused.message = "Database container offered as key file";
  refused.fields.emplace_back("signature", ContainerSignatureName(signature));
  EventBus::Instance().Publish(refused);
}

void PublishResolved(const ResolvedKey& key, std::size_t input_size) {
  kf::diagnostics::Event resolved;
  resolved.category = EventCategory::kDiagnostics;
  resolved.severity = EventSeverity::kDebug;
  resolved.event_id = "keyfile_resolved";
  resolved.message = "Key file resolved";
  resolved.fields.emplace_back("format", KeyFileFormatName(key.format));
  resolved.fields.emplace_back("input_size", std::to_string(input_size), FieldPrivacy::kPublic,
                               true);
  resolved.fields.emplace_back("key_size", std::to_string(key.data.size()),
                               FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(resolved);
}

ResolvedKey HashWholeBuffer(std::span<const uint8_t> raw) {
  auto digest = kf::crypto::SHA256_Hash(raw);
  kf::security::WipeOnExit wipe_digest(digest);
  ResolvedKey resolved;
  resolved.data = kf::security::SecureBuffer::CopyOf(digest);
  resolved.format = KeyFileFormat::kHashed;
  return resolved;
}

}  // namespace

ResolvedKey ResolveKey(std::span<const uint8_t> raw, bool refuse_if_container_file) {
  if (raw.empty()) {
    throw kf::Error(kf::ErrorDomain::Validation, kf::errors::validation::kEmptyInput,
                    std::string(kf::errors::msg::kEmptyKeyFile));
  }

  if (refuse_if_container_file) {
    if (auto signature = MatchContainerSignature(raw)) {
      PublishContainerRefused(*signature);
      throw kf::Error(kf::ErrorDomain::Validation,
                      kf::errors::validation::kAmbiguousContainerFile,
                      std::string(kf::errors::msg::kKeyFileIsDatabase));
    }
  }

  for (const auto& step : kResolutionChain) {
    ParseOutcome outcome = step.parse(raw);
    switch (outcome.status) {
    case ParseStatus::kMatched: {
      ResolvedKey resolved;
      resolved.data = std::move(outcome.key);
      resolved.format = step.format;
      PublishResolved(resolved, raw.size());
      return resolved;
    }
    case ParseStatus::kHardError:
      throw kf::Error(kf::ErrorDomain::Internal, kf::errors::internal::kFormatParserFailure,
                      std::string(KeyFileFormatName(step.format)) + " parser failed: " +
                          outcome.error);
    case ParseStatus::kNotThisFormat:
      break;
    }
  }

  ResolvedKey resolved = HashWholeBuffer(raw);
  PublishResolved(resolved, raw.size());
  return resolved;
}

}  // namespace kf::keyfile
