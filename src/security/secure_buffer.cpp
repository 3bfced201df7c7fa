#include "kf/security/secure_buffer.h"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <new>
#include <utility>

#if defined(_WIN32)
#include <malloc.h>
#endif

#include "kf/security/zeroizer.h"

namespace kf::security {

namespace {

// One cache line; also a valid aligned_alloc alignment everywhere.
constexpr std::size_t kAlignment = 64;

uint8_t* AllocateAligned(std::size_t capacity) {
#if defined(_WIN32)
  void* raw = _aligned_malloc(capacity, kAlignment);
#else
  void* raw = std::aligned_alloc(kAlignment, capacity);
#endif
  if (raw == nullptr) {
    throw std::bad_alloc{};
  }
  return static_cast<uint8_t*>(raw);
}

void FreeAligned(uint8_t* bytes) noexcept {
#if defined(_WIN32)
  _aligned_free(bytes);
#else
  std::free(bytes);
#endif
}

}  // namespace

SecureBuffer::SecureBuffer(std::size_t size) : size_(size) {
  if (size == 0) {
    return;
  }
  if (size > std::numeric_limits<std::size_t>::max() - (kAlignment - 1)) {
    throw std::bad_array_new_length{};
  }
  capacity_ = (size + kAlignment - 1) / kAlignment * kAlignment;
  bytes_ = AllocateAligned(capacity_);
  SecureWipe(std::span<uint8_t>(bytes_, capacity_));
  locked_ = LockKeyPages(std::span<uint8_t>(bytes_, capacity_));
}

SecureBuffer::~SecureBuffer() { Destroy(); }

SecureBuffer::SecureBuffer(SecureBuffer&& other) noexcept
    : bytes_(std::exchange(other.bytes_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      capacity_(std::exchange(other.capacity_, 0)),
      locked_(std::exchange(other.locked_, false)) {}

SecureBuffer& SecureBuffer::operator=(SecureBuffer&& other) noexcept {
  if (this != &other) {
    Destroy();
    bytes_ = std::exchange(other.bytes_, nullptr);
    size_ = std::exchange(other.size_, 0);
    capacity_ = std::exchange(other.capacity_, 0);
    locked_ = std::exchange(other.locked_, false);
  }
  return *this;
}

SecureBuffer SecureBuffer::CopyOf(std::span<const uint8_t> source) {
  SecureBuffer copy(source.size());
  std::copy(source.begin(), source.end(), copy.bytes_);
  return copy;
}

void SecureBuffer::Destroy() noexcept {
  if (bytes_ != nullptr) {
    const std::span<uint8_t> storage(bytes_, capacity_);
    SecureWipe(storage);
    if (locked_) {
      UnlockKeyPages(storage);
    }
    FreeAligned(bytes_);
  }
  bytes_ = nullptr;
  size_ = 0;
  capacity_ = 0;
  locked_ = false;
}

}  // namespace kf::security
