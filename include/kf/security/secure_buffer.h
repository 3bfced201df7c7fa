#pragma once
#include <cstddef>
#include <cstdint>
#include <span>

namespace kf::security {

// Owning byte buffer for key material, decoded payloads and digests. Storage
// starts zeroed, is pinned in RAM where the platform allows, and is wiped
// before it goes back to the allocator. Move-only.
class SecureBuffer {
public:
  SecureBuffer() noexcept = default;
  explicit SecureBuffer(std::size_t size);
  ~SecureBuffer();

  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;
  SecureBuffer(SecureBuffer&& other) noexcept;
  SecureBuffer& operator=(SecureBuffer&& other) noexcept;

  static SecureBuffer CopyOf(std::span<const uint8_t> source);

  uint8_t* data() noexcept { return bytes_; }
  const uint8_t* data() const noexcept { return bytes_; }
  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  std::span<uint8_t> AsSpan() noexcept { return {bytes_, size_}; }
  std::span<const uint8_t> AsSpan() const noexcept { return {bytes_, size_}; }

  bool IsLocked() const noexcept { return locked_; }

private:
  void Destroy() noexcept;

  uint8_t* bytes_{nullptr};
  std::size_t size_{0};
  std::size_t capacity_{0}; // allocation size, a multiple of the alignment
  bool locked_{false};
};

} // namespace kf::security
