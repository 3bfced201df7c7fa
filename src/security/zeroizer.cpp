#include "kf/security/zeroizer.h"

#include "kf/diagnostics/event_bus.h"
#include "kf/platform/memory_lock.h"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <strings.h>
#endif

namespace kf::security {

namespace {

void ReportLockRefused(const char* event_id, const char* message, int native_error) noexcept {
  try {
    kf::diagnostics::Event event;
    event.category = kf::diagnostics::EventCategory::kSecurity;
    event.severity = kf::diagnostics::EventSeverity::kWarning;
    event.event_id = event_id;
    event.message = message;
    event.fields.emplace_back("errno", std::to_string(native_error),
                              kf::diagnostics::FieldPrivacy::kPublic, true);
    kf::diagnostics::EventBus::Instance().Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "[security] " << message << " (errno " << native_error << "): " << ex.what()
              << '\n';
  }
}

// KF_USE_MLOCKALL=1 pins the whole process once, before the first key page.
void ApplyProcessLockingPolicy() noexcept {
  static std::once_flag once;
  std::call_once(once, [] {
    const char* env = std::getenv("KF_USE_MLOCKALL");
    if (env == nullptr || *env == '\0' || std::strcmp(env, "0") == 0) {
      return;
    }
    if (const int err = kf::platform::LockAllProcessMemory(); err != 0) {
      ReportLockRefused("memory_lock_failure",
                        "Process-wide memory locking failed; sensitive pages may swap", err);
    }
  });
}

}  // namespace

void SecureWipe(std::span<uint8_t> bytes) noexcept {
  if (bytes.empty()) {
    return;
  }
#if defined(_WIN32)
  ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(__GLIBC__) || defined(__OpenBSD__) || defined(__FreeBSD__)
  ::explicit_bzero(bytes.data(), bytes.size());
#else
  volatile uint8_t* out = bytes.data();
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[i] = 0;
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

void SecureWipe(std::string& text) noexcept {
  if (text.capacity() != 0) {
    text.resize(text.capacity());
    SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
  }
  text.clear();
}

bool LockKeyPages(std::span<uint8_t> bytes) noexcept {
  if (bytes.empty()) {
    return false;
  }
  ApplyProcessLockingPolicy();
  const auto result = kf::platform::LockMemory(bytes.data(), bytes.size());
  if (result.status == kf::platform::MemoryLockStatus::kBestEffort) {
    static std::atomic<bool> reported{false};
    if (!reported.exchange(true)) {
      ReportLockRefused("key_buffer_unlocked", "Key buffer could not be locked into RAM",
                        result.native_error);
    }
  }
  return result.status == kf::platform::MemoryLockStatus::kLocked;
}

void UnlockKeyPages(std::span<uint8_t> bytes) noexcept {
  kf::platform::UnlockMemory(bytes.data(), bytes.size());
}

}  // namespace kf::security
