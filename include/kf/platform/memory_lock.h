#pragma once
// Page locking for key material.

#include <cstddef>

namespace kf::platform {

enum class MemoryLockStatus {
  kLocked,
  kBestEffort, // call failed (limit reached, no privilege); pages may swap
  kUnsupported,
};

struct MemoryLockResult {
  MemoryLockStatus status{MemoryLockStatus::kUnsupported};
  int native_error{0};
};

MemoryLockResult LockMemory(void* ptr, std::size_t length) noexcept;
void UnlockMemory(void* ptr, std::size_t length) noexcept;
bool MemoryLockSupported() noexcept;

// mlockall(MCL_CURRENT | MCL_FUTURE). Returns the errno on failure, 0 on
// success and ENOSYS where the platform has no such call.
int LockAllProcessMemory() noexcept;

}  // namespace kf::platform
