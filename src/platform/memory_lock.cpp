#include "kf/platform/memory_lock.h"

#include <cerrno>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#if defined(_POSIX_VERSION) || defined(__APPLE__)
#include <sys/mman.h>
#define KF_PLATFORM_MLOCK 1
#endif
#endif

namespace kf::platform {

MemoryLockResult LockMemory(void* ptr, std::size_t length) noexcept {
  MemoryLockResult result;
  if (!ptr || length == 0) {
    result.status = MemoryLockStatus::kBestEffort;
    return result;
  }
#if defined(_WIN32)
  if (::VirtualLock(ptr, length) != 0) {
    result.status = MemoryLockStatus::kLocked;
    return result;
  }
  result.native_error = static_cast<int>(::GetLastError());
  result.status = result.native_error == ERROR_NOT_SUPPORTED ? MemoryLockStatus::kUnsupported
                                                             : MemoryLockStatus::kBestEffort;
#elif defined(KF_PLATFORM_MLOCK)
  if (::mlock(ptr, length) == 0) {
    result.status = MemoryLockStatus::kLocked;
    return result;
  }
  result.native_error = errno;
  result.status = result.native_error == ENOSYS ? MemoryLockStatus::kUnsupported
                                                : MemoryLockStatus::kBestEffort;
#else
  result.native_error = ENOSYS;
#endif
  return result;
}

void UnlockMemory(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return;
  }
#if defined(_WIN32)
  ::VirtualUnlock(ptr, length);
#elif defined(KF_PLATFORM_MLOCK)
  ::munlock(ptr, length);
#endif
}

bool MemoryLockSupported() noexcept {
#if defined(_WIN32) || defined(KF_PLATFORM_MLOCK)
  return true;
#else
  return false;
#endif
}

int LockAllProcessMemory() noexcept {
#if (defined(__linux__) || defined(__FreeBSD__)) && defined(MCL_CURRENT) && defined(MCL_FUTURE)
  return ::mlockall(MCL_CURRENT | MCL_FUTURE) == 0 ? 0 : errno;
#else
  return ENOSYS;
#endif
}

}  // namespace kf::platform
