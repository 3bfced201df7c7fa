#pragma once

#include <string_view>

namespace kf::errors::msg {
// Centralized user-facing message catalog.
inline constexpr std::string_view kEmptyKeyFile{"Key file contains no data"};
inline constexpr std::string_view kKeyFileIsDatabase{"Selected file is a database, not a key file"};
inline constexpr std::string_view kKeyFileTooLarge{"Key file exceeds maximum supported size"};
inline constexpr std::string_view kKeyFileOpenFailed{"Failed to open key file"};
inline constexpr std::string_view kKeyFileNotRegular{"Key file path does not name a regular file"};
inline constexpr std::string_view kKeyFileReadFailed{"Failed to read key file contents"};
inline constexpr std::string_view kKeyFileWriteFailed{"Failed to write key file"};
inline constexpr std::string_view kRandomSourceFailed{"Secure random source failed to produce key bytes"};
inline constexpr std::string_view kXmlRuntimeFailed{"XML runtime could not be initialized"};
inline constexpr std::string_view kTargetPathRequired{"Target path required"};
}  // namespace kf::errors::msg
