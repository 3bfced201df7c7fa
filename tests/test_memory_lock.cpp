#include "kf/platform/memory_lock.h"
#include "kf/security/secure_buffer.h"
#include "kf/security/zeroizer.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

void TestPlatformLock() {
  std::array<std::uint8_t, 64> buffer{};
  auto result = kf::platform::LockMemory(buffer.data(), buffer.size());
  if (result.status == kf::platform::MemoryLockStatus::kUnsupported) {
    return;  // Accept unsupported platforms without failure
  }
  if (result.status == kf::platform::MemoryLockStatus::kLocked) {
    assert(result.native_error == 0);
    kf::platform::UnlockMemory(buffer.data(), buffer.size());
  } else {
    assert(result.status == kf::platform::MemoryLockStatus::kBestEffort);
    assert(result.native_error != 0);
  }
}

void TestWipeHelpers() {
  std::vector<std::uint8_t> bytes(48, 0xAB);
  kf::security::SecureWipe(bytes);
  assert(std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; }));

  std::string secret(40, 'k');
  secret.resize(8);
  kf::security::SecureWipe(secret);
  assert(secret.empty());

  std::array<std::uint8_t, 16> scoped{};
  scoped.fill(0x5C);
  {
    kf::security::WipeOnExit wiper(scoped);
  }
  assert(std::all_of(scoped.begin(), scoped.end(), [](std::uint8_t b) { return b == 0; }));

  std::string text(64, 'z');
  {
    kf::security::WipeOnExit wiper(text);
  }
  assert(text.empty());
}

void TestSecureBuffer() {
  kf::security::SecureBuffer empty;
  assert(empty.empty() && empty.data() == nullptr);

  kf::security::SecureBuffer buffer(32);
  assert(buffer.size() == 32);
  assert(std::all_of(buffer.data(), buffer.data() + buffer.size(),
                     [](std::uint8_t b) { return b == 0; }));
  if (!kf::platform::MemoryLockSupported()) {
    assert(!buffer.IsLocked());
  }

  const std::array<std::uint8_t, 3> source{1, 2, 3};
  auto copy = kf::security::SecureBuffer::CopyOf(source);
  assert(copy.size() == 3 && copy.data()[2] == 3);

  auto moved = std::move(copy);
  assert(moved.size() == 3 && moved.data()[0] == 1);
  assert(copy.empty() && copy.data() == nullptr);
}

}  // namespace

int main() {
  TestPlatformLock();
  TestWipeHelpers();
  TestSecureBuffer();
  std::cout << "memory lock tests ok\n";
  return 0;
}
