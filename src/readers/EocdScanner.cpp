// src/readers/EocdScanner.cpp
#include "readers/EocdScanner.hpp"
#include <cstring>
#include <fstream>

namespace panes {

std::optional<uint16_t> declaredEntriesInTail(const std::vector<uint8_t>& tail) {
  if (tail.size() < kEocdMinSize) return std::nullopt;
  for (size_t i = tail.size() - kEocdMinSize + 1; i-- > 0;) {
    if (std::memcmp(tail.data() + i, kEocdSignature, 4) != 0) continue;
    const uint8_t* p = tail.data() + i + kEocdTotalEntriesOffset;
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
  }
  return std::nullopt;
}

std::optional<uint32_t> declaredEntryCount(const std::filesystem::path& path, uint64_t scanBytes) {
  std::error_code ec;
  uint64_t size = std::filesystem::file_size(path, ec);
  if (ec) return std::nullopt;

  uint64_t n = size < scanBytes ? size : scanBytes;
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  f.seekg(static_cast<std::streamoff>(size - n), std::ios::beg);

  std::vector<uint8_t> tail(static_cast<size_t>(n));
  f.read(reinterpret_cast<char*>(tail.data()), static_cast<std::streamsize>(tail.size()));
  if (static_cast<uint64_t>(f.gcount()) != n) return std::nullopt;

  auto declared = declaredEntriesInTail(tail);
  if (!declared || *declared == 0xFFFF) return std::nullopt;
  return *declared;
}

} // namespace panes
