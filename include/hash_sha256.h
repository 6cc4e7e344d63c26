// include/hash_sha256.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace panes {

std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_string(const std::string& str);
// Hashes at most `limit` leading bytes of the file; 0 = whole file.
// Returns "" when the file cannot be read.
std::string sha256_file(const std::filesystem::path& path, uint64_t limit = 0, size_t chunk = 1 << 20);

// "<byteSize>-<first16HexOfHash>"
std::string identityKey(uint64_t byteSize, const std::string& sha256Hex);

} // namespace panes
