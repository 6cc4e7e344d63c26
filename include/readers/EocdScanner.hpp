#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace panes {

// End-Of-Central-Directory: "PK\5\6", total-entries LE16 at +10.
constexpr uint8_t kEocdSignature[4] = {0x50, 0x4B, 0x05, 0x06};
constexpr size_t  kEocdMinSize = 22;
constexpr size_t  kEocdTotalEntriesOffset = 10;
constexpr uint64_t kEocdDefaultScanBytes = 65557;

// Entry count declared by the last EOCD record found in `tail`,
// scanning backwards. nullopt when no complete record is present.
std::optional<uint16_t> declaredEntriesInTail(const std::vector<uint8_t>& tail);

// Reads the last min(fileSize, scanBytes) bytes and scans them.
// nullopt when the file cannot be read, has no EOCD, or declares 0xFFFF
// (count lives in the ZIP64 record).
std::optional<uint32_t> declaredEntryCount(const std::filesystem::path& path,
                                           uint64_t scanBytes = kEocdDefaultScanBytes);

// Declared more entries than the library let us iterate.
inline bool hasSkippedEntries(std::optional<uint32_t> declared, uint64_t iterable) {
  return declared && *declared > iterable;
}

} // namespace panes
