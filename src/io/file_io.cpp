#include "kf/io/file_io.h"

#include <array>
#include <cerrno>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "kf/common.h"
#include "kf/crypto/random.h"
#include "kf/error.h"
#include "kf/errors.h"
#include "kf/util/encoding.h"

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#include <sys/types.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace kf::io {

namespace {

#if defined(_WIN32)
using StatBuffer = struct _stat64;

int OpenForRead(const std::filesystem::path& path) {
  return ::_wopen(path.c_str(), _O_RDONLY | _O_BINARY);
}
int OpenExclusive(const std::filesystem::path& path) {
  return ::_wopen(path.c_str(), _O_CREAT | _O_EXCL | _O_WRONLY | _O_BINARY, _S_IREAD | _S_IWRITE);
}
int StatDescriptor(int fd, StatBuffer* info) { return ::_fstat64(fd, info); }
bool IsRegular(const StatBuffer& info) { return (info.st_mode & _S_IFMT) == _S_IFREG; }
long long ReadSome(int fd, uint8_t* out, std::size_t n) {
  constexpr std::size_t kMaxChunk = 1U << 30;
  return ::_read(fd, out, static_cast<unsigned int>(n < kMaxChunk ? n : kMaxChunk));
}
long long WriteSome(int fd, const uint8_t* in, std::size_t n) {
  constexpr std::size_t kMaxChunk = 1U << 30;
  return ::_write(fd, in, static_cast<unsigned int>(n < kMaxChunk ? n : kMaxChunk));
}
int FlushDescriptor(int fd) { return ::_commit(fd); }
int CloseDescriptor(int fd) { return ::_close(fd); }
int RenameOver(const std::filesystem::path& from, const std::filesystem::path& to) {
  if (::MoveFileExW(from.c_str(), to.c_str(),
                    MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) != 0) {
    return 0;
  }
  return static_cast<int>(::GetLastError());
}
int FlushDirectory(const std::filesystem::path&) { return 0; } // MOVEFILE_WRITE_THROUGH
#else
using StatBuffer = struct stat;

int OpenForRead(const std::filesystem::path& path) {
  return ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
}
int OpenExclusive(const std::filesystem::path& path) {
  return ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, S_IRUSR | S_IWUSR);
}
int StatDescriptor(int fd, StatBuffer* info) { return ::fstat(fd, info); }
bool IsRegular(const StatBuffer& info) { return S_ISREG(info.st_mode); }
long long ReadSome(int fd, uint8_t* out, std::size_t n) { return ::read(fd, out, n); }
long long WriteSome(int fd, const uint8_t* in, std::size_t n) { return ::write(fd, in, n); }
int FlushDescriptor(int fd) { return ::fsync(fd); }
int CloseDescriptor(int fd) { return ::close(fd); }
int RenameOver(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::rename(from.c_str(), to.c_str()) == 0 ? 0 : errno;
}
int FlushDirectory(const std::filesystem::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return errno;
  }
  const int rc = ::fsync(fd) == 0 ? 0 : errno;
  ::close(fd);
  return rc;
}
#endif

[[noreturn]] void ThrowIo(int code, std::string_view message, const std::filesystem::path& path,
                          std::optional<int> native = std::nullopt) {
  std::string text(message);
  text += " (";
  text += kf::PathToUtf8String(path);
  text += ')';
  throw kf::Error(kf::ErrorDomain::IO, code, text, native);
}

[[noreturn]] void ThrowWriteFailure(std::string_view stage, const std::filesystem::path& path,
                                    std::optional<int> native) {
  std::string message(kf::errors::msg::kKeyFileWriteFailed);
  message += ": ";
  message += stage;
  ThrowIo(kf::errors::io::kKeyFileWriteFailed, message, path, native);
}

// Closes the descriptor on scope exit unless Close() already did.
class Descriptor {
public:
  explicit Descriptor(int fd) noexcept : fd_(fd) {}
  Descriptor(const Descriptor&) = delete;
  Descriptor& operator=(const Descriptor&) = delete;
  ~Descriptor() {
    if (fd_ >= 0) {
      CloseDescriptor(fd_);
    }
  }

  int get() const noexcept { return fd_; }

  // Returns 0 or the errno of a failed close.
  int Close() noexcept {
    const int fd = std::exchange(fd_, -1);
    return CloseDescriptor(fd) == 0 ? 0 : errno;
  }

private:
  int fd_;
};

// Staging file that is unlinked unless the rename into place succeeded.
class StagingFile {
public:
  explicit StagingFile(std::filesystem::path path) : path_(std::move(path)) {}
  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;
  ~StagingFile() {
    if (!committed_) {
      std::error_code ignored;
      std::filesystem::remove(path_, ignored);
    }
  }

  const std::filesystem::path& path() const noexcept { return path_; }
  void Commit() noexcept { committed_ = true; }

private:
  std::filesystem::path path_;
  bool committed_{false};
};

std::filesystem::path StagingPathFor(const std::filesystem::path& dir,
                                     const std::filesystem::path& target) {
  std::array<uint8_t, 12> token{};
  kf::crypto::SystemRandomBytes(token);
  std::filesystem::path name = target.filename();
  name += ".tmp.";
  name += kf::util::HexEncode(token);
  return dir / name;
}

}  // namespace

kf::security::SecureBuffer ReadFileBytes(const std::filesystem::path& path,
                                         std::uint64_t max_size) {
  Descriptor file(OpenForRead(path));
  if (file.get() < 0) {
    ThrowIo(kf::errors::io::kKeyFileOpenFailed, kf::errors::msg::kKeyFileOpenFailed, path, errno);
  }

  StatBuffer info{};
  if (StatDescriptor(file.get(), &info) != 0) {
    ThrowIo(kf::errors::io::kKeyFileReadFailed, kf::errors::msg::kKeyFileReadFailed, path, errno);
  }
  if (!IsRegular(info)) {
    ThrowIo(kf::errors::io::kNotARegularFile, kf::errors::msg::kKeyFileNotRegular, path);
  }

  const auto size = static_cast<std::uint64_t>(info.st_size);
  if (max_size != 0 && size > max_size) {
    throw kf::Error(kf::ErrorDomain::Validation, kf::errors::validation::kKeyFileTooLarge,
                    std::string(kf::errors::msg::kKeyFileTooLarge));
  }
  if (size > static_cast<std::uint64_t>(SIZE_MAX)) {
    ThrowIo(kf::errors::io::kKeyFileReadFailed, kf::errors::msg::kKeyFileTooLarge, path);
  }

  kf::security::SecureBuffer contents(static_cast<std::size_t>(size));
  std::size_t filled = 0;
  while (filled < contents.size()) {
    const long long got = ReadSome(file.get(), contents.data() + filled, contents.size() - filled);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got < 0) {
      ThrowIo(kf::errors::io::kKeyFileReadFailed, kf::errors::msg::kKeyFileReadFailed, path,
              errno);
    }
    if (got == 0) {
      // Shrunk underneath us.
      ThrowIo(kf::errors::io::kKeyFileReadFailed, kf::errors::msg::kKeyFileReadFailed, path);
    }
    filled += static_cast<std::size_t>(got);
  }
  return contents;
}

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload) {
  if (target.empty()) {
    throw kf::Error(kf::ErrorDomain::Validation, kf::errors::validation::kTargetPathRequired,
                    std::string(kf::errors::msg::kTargetPathRequired));
  }
  std::filesystem::path dir = target.parent_path();
  if (dir.empty()) {
    dir = ".";
  }

  StagingFile staging(StagingPathFor(dir, target));
  Descriptor out(OpenExclusive(staging.path()));
  if (out.get() < 0) {
    ThrowWriteFailure("open failed", staging.path(), errno);
  }

  std::size_t written = 0;
  while (written < payload.size()) {
    const long long put = WriteSome(out.get(), payload.data() + written, payload.size() - written);
    if (put < 0 && errno == EINTR) {
      continue;
    }
    if (put <= 0) {
      ThrowWriteFailure("write failed", staging.path(),
                        put < 0 ? std::optional<int>(errno) : std::nullopt);
    }
    written += static_cast<std::size_t>(put);
  }

  if (FlushDescriptor(out.get()) != 0) {
    ThrowWriteFailure("fsync failed", staging.path(), errno);
  }
  if (const int err = out.Close(); err != 0) {
    ThrowWriteFailure("close failed", staging.path(), err);
  }
  if (const int err = RenameOver(staging.path(), target); err != 0) {
    ThrowWriteFailure("rename failed", target, err);
  }
  staging.Commit();

  if (const int err = FlushDirectory(dir); err != 0) {
    ThrowWriteFailure("directory flush failed", dir, err);
  }
}

}  // namespace kf::io
