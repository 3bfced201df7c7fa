#include "kf/util/encoding.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

#include "kf/common.h"

namespace {

std::string AsString(const kf::security::SecureBuffer& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer.data()), buffer.size());
}

void TestBase64KnownVectors() {
  using kf::util::Base64Encode;
  assert(Base64Encode(kf::AsByteSpan("")) == "");
  assert(Base64Encode(kf::AsByteSpan("f")) == "Zg==");
  assert(Base64Encode(kf::AsByteSpan("fo")) == "Zm8=");
  assert(Base64Encode(kf::AsByteSpan("foo")) == "Zm9v");
  assert(Base64Encode(kf::AsByteSpan("foobar")) == "Zm9vYmFy");

  const std::array<uint8_t, 3> high{0xFB, 0xFF, 0xBF};
  assert(Base64Encode(high) == "+/+/");

  auto decoded = kf::util::Base64Decode("Zm9vYmE=");
  assert(decoded && AsString(*decoded) == "fooba");
}

void TestBase64DecodeToleratesWhitespace() {
  auto decoded = kf::util::Base64Decode("  Zm9v\r\n\tYmFy \n");
  assert(decoded && AsString(*decoded) == "foobar");

  auto blank = kf::util::Base64Decode(" \r\n ");
  assert(blank && blank->empty());
}

void TestBase64DecodeRejectsMalformed() {
  assert(!kf::util::Base64Decode("Zm9"));
  assert(!kf::util::Base64Decode("Zm9vY"));
  assert(!kf::util::Base64Decode("Zm=v"));
  assert(!kf::util::Base64Decode("===="));
  assert(!kf::util::Base64Decode("Zm9v-_8="));
  assert(!kf::util::Base64Decode("Zg==Zg=="));
}

void TestHex() {
  const std::array<uint8_t, 4> bytes{0x00, 0x7F, 0xA5, 0xFF};
  assert(kf::util::HexEncode(bytes) == "007fa5ff");

  assert(kf::util::IsHexString("0123456789abcdefABCDEF"));
  assert(kf::util::IsHexString(""));
  assert(!kf::util::IsHexString("12 4"));
  assert(!kf::util::IsHexString("xyz"));

  auto decoded = kf::util::HexDecode("007FA5ff");
  assert(decoded && decoded->size() == 4);
  assert(decoded->data()[1] == 0x7F && decoded->data()[2] == 0xA5);
  assert(!kf::util::HexDecode("abc"));
  assert(!kf::util::HexDecode("zz"));
}

}  // namespace

int main() {
  TestBase64KnownVectors();
  TestBase64DecodeToleratesWhitespace();
  TestBase64DecodeRejectsMalformed();
  TestHex();
  std::cout << "encoding tests ok\n";
  return 0;
}
