#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace kf {

enum class ErrorDomain : std::uint8_t { IO = 2, Crypto = 3, Validation = 4, Internal = 0x7F };

namespace errors {

// Stable codes: domain in the high byte, case in the low byte. Platform
// errno values travel separately in Error::native_code.
constexpr int Code(ErrorDomain domain, int ordinal) {
  return (static_cast<int>(domain) << 8) | ordinal;
}

namespace io {
inline constexpr int kKeyFileOpenFailed = Code(ErrorDomain::IO, 1);
inline constexpr int kKeyFileReadFailed = Code(ErrorDomain::IO, 2);
inline constexpr int kKeyFileWriteFailed = Code(ErrorDomain::IO, 3);
inline constexpr int kNotARegularFile = Code(ErrorDomain::IO, 4);
} // namespace io

namespace validation {
inline constexpr int kEmptyInput = Code(ErrorDomain::Validation, 1);
inline constexpr int kAmbiguousContainerFile = Code(ErrorDomain::Validation, 2);
inline constexpr int kKeyFileTooLarge = Code(ErrorDomain::Validation, 3);
inline constexpr int kTargetPathRequired = Code(ErrorDomain::Validation, 4);
} // namespace validation

namespace crypto {
inline constexpr int kRandomSourceFailure = Code(ErrorDomain::Crypto, 1);
inline constexpr int kDigestFailure = Code(ErrorDomain::Crypto, 2);
inline constexpr int kSelfTestFailure = Code(ErrorDomain::Crypto, 3);
} // namespace crypto

namespace internal {
inline constexpr int kXmlRuntimeFailure = Code(ErrorDomain::Internal, 1);
inline constexpr int kFormatParserFailure = Code(ErrorDomain::Internal, 2);
} // namespace internal

} // namespace errors

struct Error : public std::runtime_error {
  Error(ErrorDomain error_domain, int error_code, const std::string& message,
        std::optional<int> native = std::nullopt)
      : std::runtime_error(message), domain(error_domain), code(error_code), native_code(native) {}

  ErrorDomain domain;
  int code;
  std::optional<int> native_code; // errno or GetLastError() value, when one exists
};

} // namespace kf
