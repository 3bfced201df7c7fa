#include "kf/keyfile/xml_key_file.h"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlmemory.h>

#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kf/error.h"
#include "kf/errors.h"
#include "kf/security/zeroizer.h"
#include "kf/util/encoding.h"

namespace kf::keyfile {

namespace {

// libxml2 copies the document into input, encoding and node buffers. Every
// block it allocates carries its size in a header so the free hook can wipe
// it before handing it back to the allocator that was installed before us.
struct XmlAllocator {
  xmlFreeFunc free{nullptr};
  xmlMallocFunc malloc{nullptr};
  xmlReallocFunc realloc{nullptr};
  xmlStrdupFunc strdup{nullptr};
};

XmlAllocator g_underlying;

struct alignas(std::max_align_t) BlockHeader {
  std::size_t size;
};

void* WipingMalloc(std::size_t size) {
  if (size > SIZE_MAX - sizeof(BlockHeader)) {
    return nullptr;
  }
  auto* header = static_cast<BlockHeader*>(g_underlying.malloc(sizeof(BlockHeader) + size));
  if (header == nullptr) {
    return nullptr;
  }
  header->size = size;
  return header + 1;
}

void WipingFree(void* block) {
  if (block == nullptr) {
    return;
  }
  auto* header = static_cast<BlockHeader*>(block) - 1;
  kf::security::SecureWipe(std::span<uint8_t>(static_cast<uint8_t*>(block), header->size));
  g_underlying.free(header);
}

// Never grows in place: the old block is copied out and wiped.
void* WipingRealloc(void* block, std::size_t size) {
  if (block == nullptr) {
    return WipingMalloc(size);
  }
  void* grown = WipingMalloc(size);
  if (grown == nullptr) {
    return nullptr;
  }
  const std::size_t old_size = (static_cast<BlockHeader*>(block) - 1)->size;
  std::memcpy(grown, block, std::min(old_size, size));
  WipingFree(block);
  return grown;
}

char* WipingStrdup(const char* text) {
  const std::size_t length = std::strlen(text) + 1;
  auto* copy = static_cast<char*>(WipingMalloc(length));
  if (copy != nullptr) {
    std::memcpy(copy, text, length);
  }
  return copy;
}

// No network access, no DTD loading, no dictionary interning, and no
// diagnostics on stderr.
constexpr int kXmlParseOptions =
    XML_PARSE_NONET | XML_PARSE_NODICT | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};
struct XmlCharDeleter {
  void operator()(xmlChar* text) const noexcept { xmlFree(text); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlTextPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

bool IsElement(const xmlNode* node, std::string_view name) noexcept {
  if (node == nullptr || node->name == nullptr) {
    return false;
  }
  if (node->ns != nullptr && node->ns->prefix != nullptr) {
    return false;
  }
  return std::string_view(reinterpret_cast<const char*>(node->name)) == name;
}

// Keeps the last parse error, which may quote document bytes, from
// outliving the parse.
struct ClearLastError {
  ~ClearLastError() { xmlResetLastError(); }
};

// Base64 text of the first Data under any Key child of `root`. Later Data
// elements are never read.
XmlTextPtr FirstDataText(xmlNode* root) {
  for (xmlNode* key = xmlFirstElementChild(root); key != nullptr;
       key = xmlNextElementSibling(key)) {
    if (!IsElement(key, kXmlKeyElement)) {
      continue; // Meta and anything unknown
    }
    for (xmlNode* data = xmlFirstElementChild(key); data != nullptr;
         data = xmlNextElementSibling(data)) {
      if (IsElement(data, kXmlDataElement)) {
        XmlTextPtr text(xmlNodeGetContent(data));
        if (!text) {
          text.reset(xmlStrdup(reinterpret_cast<const xmlChar*>("")));
        }
        return text;
      }
    }
  }
  return nullptr;
}

constexpr std::string_view kDocumentHead =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\r\n"
    "<KeyFile>\r\n"
    "\t<Meta>\r\n"
    "\t\t<Version>1.00</Version>\r\n"
    "\t</Meta>\r\n"
    "\t<Key>\r\n"
    "\t\t<Data>";
constexpr std::string_view kDocumentTail =
    "</Data>\r\n"
    "\t</Key>\r\n"
    "</KeyFile>\r\n";

}  // namespace

void InstallXmlWipingAllocator() {
  static std::once_flag once;
  std::call_once(once, [] {
    XmlAllocator previous;
    if (xmlMemGet(&previous.free, &previous.malloc, &previous.realloc, &previous.strdup) != 0 ||
        previous.free == nullptr || previous.malloc == nullptr) {
      throw kf::Error(kf::ErrorDomain::Internal, kf::errors::internal::kXmlRuntimeFailure,
                      std::string(kf::errors::msg::kXmlRuntimeFailed));
    }
    g_underlying = previous;
    if (xmlMemSetup(&WipingFree, &WipingMalloc, &WipingRealloc, &WipingStrdup) != 0) {
      throw kf::Error(kf::ErrorDomain::Internal, kf::errors::internal::kXmlRuntimeFailure,
                      std::string(kf::errors::msg::kXmlRuntimeFailed));
    }
    xmlInitParser();
  });
}

ParseOutcome ParseXmlKeyFile(std::span<const uint8_t> data) {
  if (data.empty() || data.size() > static_cast<std::size_t>(INT_MAX)) {
    return ParseOutcome::NotThisFormat();
  }
  InstallXmlWipingAllocator();
  ClearLastError clear_last_error;

  XmlDocPtr doc(xmlReadMemory(reinterpret_cast<const char*>(data.data()),
                              static_cast<int>(data.size()), nullptr, nullptr,
                              kXmlParseOptions));
  if (!doc) {
    return ParseOutcome::NotThisFormat();
  }
  xmlNode* root = xmlDocGetRootElement(doc.get());
  if (!IsElement(root, kXmlRootElement) || xmlChildElementCount(root) < 2) {
    return ParseOutcome::NotThisFormat();
  }

  XmlTextPtr text = FirstDataText(root);
  if (!text) {
    return ParseOutcome::NotThisFormat();
  }
  auto decoded = kf::util::Base64Decode(reinterpret_cast<const char*>(text.get()));
  if (!decoded) {
    return ParseOutcome::NotThisFormat();
  }
  return ParseOutcome::Matched(std::move(*decoded));
}

kf::security::SecureBuffer SerializeXmlKeyFile(std::span<const uint8_t> key) {
  const std::size_t encoded_size = kf::util::Base64EncodedSize(key.size());
  kf::security::SecureBuffer document(kDocumentHead.size() + encoded_size + kDocumentTail.size());
  char* out = reinterpret_cast<char*>(document.data());

  std::copy(kDocumentHead.begin(), kDocumentHead.end(), out);
  out += kDocumentHead.size();
  kf::util::Base64EncodeInto(key, std::span<char>(out, encoded_size));
  out += encoded_size;
  std::copy(kDocumentTail.begin(), kDocumentTail.end(), out);
  return document;
}

}  // namespace kf::keyfile
