#include "kf/crypto/provider.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <atomic>
#include <mutex>
#include <string>
#include <utility>

#include "kf/crypto/random.h"
#include "kf/diagnostics/event_bus.h"
#include "kf/error.h"

namespace kf::crypto {

namespace {

[[noreturn]] void ThrowOpenSSLFailure(const char* operation, int code) {
  std::string message(operation);
  const unsigned long queued = ERR_get_error();
  if (queued != 0) {
    std::array<char, 256> reason{};
    ERR_error_string_n(queued, reason.data(), reason.size());
    message += ": ";
    message += reason.data();
  }
  ERR_clear_error();
  throw kf::Error(kf::ErrorDomain::Crypto, code, message);
}

struct ProviderSlot {
  std::mutex mutex;
  std::shared_ptr<CryptoProvider> active;
};

ProviderSlot& Slot() {
  static ProviderSlot slot;
  return slot;
}

// FIPS 180-2 "abc". Checks the linked OpenSSL before any key is derived.
// The pass event goes out after call_once returns, so a subscriber that
// hashes cannot re-enter the once block.
void VerifyDigestOnce() {
  static std::once_flag verified;
  static std::atomic<bool> announce{false};
  std::call_once(verified, [] {
    static constexpr std::array<uint8_t, 3> kInput{'a', 'b', 'c'};
    static constexpr std::array<uint8_t, 32> kDigest{
        0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40,
        0xde, 0x5d, 0xae, 0x22, 0x23, 0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17,
        0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
    OpenSSLCryptoProvider reference;
    const auto actual = reference.SHA256(kInput);
    if (CRYPTO_memcmp(actual.data(), kDigest.data(), kDigest.size()) != 0) {
      throw kf::Error(kf::ErrorDomain::Crypto, kf::errors::crypto::kSelfTestFailure,
                      "SHA-256 known-answer test produced a wrong digest");
    }
    announce.store(true);
  });

  if (announce.exchange(false)) {
    kf::diagnostics::Event passed;
    passed.category = kf::diagnostics::EventCategory::kDiagnostics;
    passed.severity = kf::diagnostics::EventSeverity::kDebug;
    passed.event_id = "crypto_self_test_passed";
    passed.message = "SHA-256 known-answer test passed";
    passed.fields.emplace_back("openssl", OpenSSL_version(OPENSSL_VERSION));
    kf::diagnostics::EventBus::Instance().Publish(passed);
  }
}

}  // namespace

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> digest{};
  unsigned int written = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &written, EVP_sha256(), nullptr) != 1) {
    ThrowOpenSSLFailure("EVP_Digest(SHA-256)", kf::errors::crypto::kDigestFailure);
  }
  if (written != digest.size()) {
    ThrowOpenSSLFailure("EVP_Digest(SHA-256) returned a short digest",
                        kf::errors::crypto::kDigestFailure);
  }
  return digest;
}

void OpenSSLCryptoProvider::RandomBytes(std::span<uint8_t> out) { SystemRandomBytes(out); }

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  VerifyDigestOnce();
  auto& slot = Slot();
  std::lock_guard<std::mutex> lock(slot.mutex);
  if (!slot.active) {
    slot.active = std::make_shared<OpenSSLCryptoProvider>();
  }
  return slot.active;
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  auto& slot = Slot();
  std::lock_guard<std::mutex> lock(slot.mutex);
  slot.active = std::move(provider);
}

void ResetCryptoProviderForTesting() { SetCryptoProvider(nullptr); }

}  // namespace kf::crypto
