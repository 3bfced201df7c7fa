#include "kf/io/file_io.h"

#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

#include "kf/error.h"

namespace {

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::filesystem::path MakeScratchDir() {
  auto dir = std::filesystem::temp_directory_path() /
             ("kf_io_util_" + std::to_string(static_cast<unsigned long long>(
                                  std::chrono::steady_clock::now().time_since_epoch().count())));
  std::filesystem::create_directories(dir);
  return dir;
}

size_t CountEntries(const std::filesystem::path& dir) {
  size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++count;
  }
  return count;
}

void TestAtomicReplaceOverwrites(const std::filesystem::path& dir) {
  auto target = dir / "atomic_replace.key";
  {
    std::ofstream seed(target, std::ios::binary | std::ios::trunc);
    seed << "old contents that are longer than the update";
  }

  const std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
  kf::io::AtomicReplace(target, update);

  auto bytes = ReadFile(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xBA && bytes[1] == 0xAD && bytes[2] == 0xF0 && bytes[3] == 0x0D);
  assert(CountEntries(dir) == 1 && "staging file must not remain");

#if !defined(_WIN32)
  const auto perms = std::filesystem::status(target).permissions();
  assert((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
         std::filesystem::perms::none);
#endif

  bool threw = false;
  try {
    kf::io::AtomicReplace(std::filesystem::path{}, update);
  } catch (const kf::Error& err) {
    threw = err.domain == kf::ErrorDomain::Validation &&
            err.code == kf::errors::validation::kTargetPathRequired;
  }
  assert(threw);

  std::filesystem::remove(target);
}

void TestAtomicReplaceIntoMissingDirectory(const std::filesystem::path& dir) {
  std::array<uint8_t, 1> payload{0x01};
  bool threw = false;
  try {
    kf::io::AtomicReplace(dir / "no_such_dir" / "key.keyx", payload);
  } catch (const kf::Error& err) {
    threw = err.domain == kf::ErrorDomain::IO &&
            err.code == kf::errors::io::kKeyFileWriteFailed && err.native_code.has_value();
  }
  assert(threw);
}

void TestReadFileBytes(const std::filesystem::path& dir) {
  auto path = dir / "payload.bin";
  {
    std::ofstream out(path, std::ios::binary);
    out << "0123456789";
  }
  auto bytes = kf::io::ReadFileBytes(path, 10);
  assert(bytes.size() == 10);
  assert(bytes.data()[0] == '0' && bytes.data()[9] == '9');

  bool threw = false;
  try {
    (void)kf::io::ReadFileBytes(path, 9);
  } catch (const kf::Error& err) {
    threw = err.domain == kf::ErrorDomain::Validation &&
            err.code == kf::errors::validation::kKeyFileTooLarge;
  }
  assert(threw);

  threw = false;
  try {
    (void)kf::io::ReadFileBytes(dir / "absent.bin", 0);
  } catch (const kf::Error& err) {
    threw = err.domain == kf::ErrorDomain::IO && err.code == kf::errors::io::kKeyFileOpenFailed;
  }
  assert(threw);

  std::filesystem::remove(path);
}

void TestReadFileBytesRejectsDirectory(const std::filesystem::path& dir) {
  const auto nested = dir / "not_a_key";
  std::filesystem::create_directories(nested);
  bool threw = false;
  try {
    (void)kf::io::ReadFileBytes(nested, 0);
  } catch (const kf::Error& err) {
    // Windows refuses to open a directory at all.
    threw = err.domain == kf::ErrorDomain::IO &&
            (err.code == kf::errors::io::kNotARegularFile ||
             err.code == kf::errors::io::kKeyFileOpenFailed);
  }
  assert(threw);
  std::filesystem::remove(nested);
}

}  // namespace

int main() {
  auto dir = MakeScratchDir();
  TestAtomicReplaceOverwrites(dir);
  TestAtomicReplaceIntoMissingDirectory(dir);
  TestReadFileBytes(dir);
  TestReadFileBytesRejectsDirectory(dir);
  std::filesystem::remove_all(dir);

  std::cout << "atomic replace tests ok\n";
  return 0;
}
