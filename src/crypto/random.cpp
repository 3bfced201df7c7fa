#include "kf/crypto/random.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#include <bcrypt.h>
#if defined(_MSC_VER)
#pragma comment(lib, "bcrypt.lib")
#endif
#if !defined(BCRYPT_SUCCESS)
#define BCRYPT_SUCCESS(status) ((status) >= 0)
#endif
#else
#include <fcntl.h>
#include <unistd.h>
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#endif
#endif

#include "kf/crypto/provider.h"
#include "kf/error.h"
#include "kf/errors.h"

namespace {

[[noreturn]] void ThrowRandomFailure(const std::string& detail, int native) {
  throw kf::Error(kf::ErrorDomain::Crypto, kf::errors::crypto::kRandomSourceFailure,
                  std::string(kf::errors::msg::kRandomSourceFailed) + ": " + detail, native);
}

#if !defined(_WIN32)
// Raw descriptor reads: a stream buffer would keep a copy of the key bytes.
[[maybe_unused]] void ReadFromUrandom(std::span<uint8_t> out) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    ThrowRandomFailure("failed to open /dev/urandom", errno);
  }
  std::size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t got = ::read(fd, out.data() + filled, out.size() - filled);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      const int native = got < 0 ? errno : EIO;
      ::close(fd);
      ThrowRandomFailure("short read from /dev/urandom", native);
    }
    filled += static_cast<std::size_t>(got);
  }
  ::close(fd);
}
#endif

#if defined(__linux__) || defined(__ANDROID__)
// Returns how many bytes getrandom produced. Stops early when the syscall is
// missing so the caller can finish from /dev/urandom.
std::size_t FillFromGetrandom(std::span<uint8_t> out) {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t got = ::getrandom(out.data() + filled, out.size() - filled, 0);
    if (got > 0) {
      filled += static_cast<std::size_t>(got);
    } else if (got == 0) {
      break;
    } else if (errno == EINTR) {
      continue;
    } else if (errno == ENOSYS) {
      break;
    } else {
      ThrowRandomFailure("getrandom failed", errno);
    }
  }
  return filled;
}
#endif

}  // namespace

namespace kf::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(_WIN32)
  NTSTATUS status = BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out.data()),
                                    static_cast<ULONG>(out.size()),
                                    BCRYPT_USE_SYSTEM_PREFERRED_RNG);
  if (!BCRYPT_SUCCESS(status)) {
    ThrowRandomFailure("BCryptGenRandom failed", static_cast<int>(status));
  }
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  const std::size_t filled = FillFromGetrandom(out);
  if (filled < out.size()) {
    ReadFromUrandom(out.subspan(filled));
  }
#else
  ReadFromUrandom(out);
#endif
}

void RandomBytes(std::span<uint8_t> out) {
  GetCryptoProviderShared()->RandomBytes(out);
}

}  // namespace kf::crypto
