#include "kf/keyfile/creator.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "kf/common.h"
#include "kf/crypto/provider.h"
#include "kf/crypto/sha256.h"
#include "kf/error.h"
#include "kf/keyfile/resolver.h"
#include "kf/keyfile/xml_key_file.h"

#if !defined(_WIN32)
#include <sys/stat.h>
#endif

namespace {

// Hands out a fixed byte pattern instead of OS randomness.
class FixedRandomProvider : public kf::crypto::OpenSSLCryptoProvider {
public:
  explicit FixedRandomProvider(uint8_t fill) : fill_(fill) {}

  void RandomBytes(std::span<uint8_t> out) override {
    std::fill(out.begin(), out.end(), fill_);
    ++calls_;
  }

  int Calls() const noexcept { return calls_; }

private:
  uint8_t fill_;
  int calls_{0};
};

class FailingRandomProvider : public kf::crypto::OpenSSLCryptoProvider {
public:
  void RandomBytes(std::span<uint8_t>) override {
    throw kf::Error(kf::ErrorDomain::Crypto, kf::errors::crypto::kRandomSourceFailure,
                    "entropy pool unavailable", EIO);
  }
};

class BrokenProvider : public kf::crypto::OpenSSLCryptoProvider {
public:
  void RandomBytes(std::span<uint8_t>) override {
    throw kf::Error(kf::ErrorDomain::Internal, 0, "provider misconfigured");
  }
};

std::string AsText(const kf::security::SecureBuffer& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer.data()), buffer.size());
}

class TempDir {
public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() /
            ("kf_creator_" + std::to_string(static_cast<unsigned long long>(
                                 std::chrono::steady_clock::now().time_since_epoch().count())));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

void TestCreateThenResolveYieldsRandomValue() {
  auto provider = std::make_shared<FixedRandomProvider>(0x5A);
  kf::crypto::SetCryptoProvider(provider);

  auto document = kf::keyfile::CreateKeyFileDocument();
  assert(provider->Calls() == 1);
  assert(AsText(document).find("<Data>WlpaWlpaWlpaWlpaWlpaWlpaWlpaWlpaWlpaWlpaWlo=</Data>") !=
         std::string::npos);

  auto resolved = kf::keyfile::ResolveKey(document.AsSpan(), true);
  assert(resolved.format == kf::keyfile::KeyFileFormat::kXml);
  assert(resolved.data.size() == kf::keyfile::kGeneratedKeySize);
  assert(std::all_of(resolved.data.data(), resolved.data.data() + resolved.data.size(),
                     [](uint8_t b) { return b == 0x5A; }));

  kf::crypto::ResetCryptoProviderForTesting();
}

void TestEntropyIsMixedByHashing() {
  kf::crypto::SetCryptoProvider(std::make_shared<FixedRandomProvider>(0x5A));

  const std::string_view entropy = "user entropy";
  auto first = kf::keyfile::CreateKeyFileDocument(kf::AsByteSpan(entropy));
  auto second = kf::keyfile::CreateKeyFileDocument(kf::AsByteSpan(entropy));
  auto plain = kf::keyfile::CreateKeyFileDocument(std::nullopt);
  assert(AsText(first) == AsText(second));
  assert(AsText(first) != AsText(plain));

  std::vector<uint8_t> concatenated(entropy.begin(), entropy.end());
  concatenated.insert(concatenated.end(), 32, 0x5A);
  auto expected = kf::crypto::SHA256_Hash(concatenated);
  auto resolved = kf::keyfile::ResolveKey(first.AsSpan(), false);
  assert(resolved.data.size() == expected.size());
  assert(std::equal(expected.begin(), expected.end(), resolved.data.data()));

  // Present but empty entropy behaves like no entropy.
  auto empty_entropy = kf::keyfile::CreateKeyFileDocument(std::span<const uint8_t>{});
  assert(AsText(empty_entropy) == AsText(plain));

  kf::crypto::ResetCryptoProviderForTesting();
}

void TestRandomSourceFailure() {
  kf::crypto::SetCryptoProvider(std::make_shared<FailingRandomProvider>());
  bool threw = false;
  try {
    (void)kf::keyfile::CreateKeyFileDocument();
  } catch (const kf::Error& err) {
    threw = err.domain == kf::ErrorDomain::Crypto &&
            err.code == kf::errors::crypto::kRandomSourceFailure && err.native_code == EIO;
  }
  assert(threw);

  kf::crypto::SetCryptoProvider(std::make_shared<BrokenProvider>());
  threw = false;
  try {
    (void)kf::keyfile::CreateKeyFileDocument();
  } catch (const kf::Error& err) {
    threw = err.domain == kf::ErrorDomain::Crypto &&
            err.code == kf::errors::crypto::kRandomSourceFailure;
  }
  assert(threw);

  kf::crypto::ResetCryptoProviderForTesting();
}

void TestCreateKeyFileWritesAndOverwrites() {
  TempDir dir;
  auto target = dir.path() / "vault.keyx";
  {
    std::ofstream seed(target, std::ios::binary);
    seed << "stale contents";
  }

  kf::crypto::SetCryptoProvider(std::make_shared<FixedRandomProvider>(0x33));
  kf::keyfile::CreateKeyFile(target);
  kf::crypto::ResetCryptoProviderForTesting();

  std::ifstream in(target, std::ios::binary);
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto resolved = kf::keyfile::ResolveKey(bytes, true);
  assert(resolved.format == kf::keyfile::KeyFileFormat::kXml);
  assert(std::all_of(resolved.data.data(), resolved.data.data() + resolved.data.size(),
                     [](uint8_t b) { return b == 0x33; }));

#if !defined(_WIN32)
  struct stat st {};
  assert(::stat(target.c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);
#endif

  // Only the target remains; the staging file was renamed away.
  size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
    (void)entry;
    ++entries;
  }
  assert(entries == 1);

  // Real OS randomness: two documents differ and both resolve to 32 bytes.
  auto a = kf::keyfile::CreateKeyFileDocument();
  auto b = kf::keyfile::CreateKeyFileDocument();
  assert(AsText(a) != AsText(b));
  assert(kf::keyfile::ResolveKey(a.AsSpan(), true).data.size() == 32);
}

void TestMissingTargetPath() {
  bool threw = false;
  try {
    kf::keyfile::CreateKeyFile(std::filesystem::path{});
  } catch (const kf::Error& err) {
    threw = err.domain == kf::ErrorDomain::Validation &&
            err.code == kf::errors::validation::kTargetPathRequired;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestCreateThenResolveYieldsRandomValue();
  TestEntropyIsMixedByHashing();
  TestRandomSourceFailure();
  TestCreateKeyFileWritesAndOverwrites();
  TestMissingTargetPath();
  std::cout << "key creator tests ok\n";
  return 0;
}
