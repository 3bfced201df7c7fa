#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "kf/keyfile/key_formats.h"
#include "kf/security/secure_buffer.h"

namespace kf::keyfile {

// Sample document:
// <?xml version="1.0" encoding="utf-8"?>
// <KeyFile>
//     <Meta>
//         <Version>1.00</Version>
//     </Meta>
//     <Key>
//         <Data>ySFoKuCcJblw8ie6RkMBdVCnAf4EedSch7ItujK6bmI=</Data>
//     </Key>
// </KeyFile>
inline constexpr std::string_view kXmlRootElement{"KeyFile"};
inline constexpr std::string_view kXmlKeyElement{"Key"};
inline constexpr std::string_view kXmlDataElement{"Data"};

// Extracts the base64 payload of the first Key/Data element. Malformed
// markup, a foreign root, fewer than two child elements or undecodable
// base64 all yield kNotThisFormat. The decoded length is not checked.
ParseOutcome ParseXmlKeyFile(std::span<const uint8_t> data);

// Canonical CRLF/tab formatted document carrying `key` as base64, written
// straight into locked memory without passing through libxml2.
kf::security::SecureBuffer SerializeXmlKeyFile(std::span<const uint8_t> key);

// Routes every libxml2 allocation through a wrapper that wipes blocks before
// they are freed, so parser copies of key text never linger on the heap.
// Runs automatically before the first parse. A process that uses libxml2
// elsewhere must call it before its own first libxml2 call.
void InstallXmlWipingAllocator();

}  // namespace kf::keyfile
