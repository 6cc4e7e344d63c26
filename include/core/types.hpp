#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace panes {

class BitmapDecoder;
class ICredentialStore;

using Bytes = std::vector<uint8_t>;
using TimePoint = std::chrono::system_clock::time_point;

enum class ArchiveFamily { Zip, Rar, SevenZip };

enum class OpenError {
  None,
  CannotOpen,
  PasswordRequired,
  WrongPassword,
  UnsupportedCompression,
  NoContentFound,
  NestedArchiveOpenFailed,
};

const char* toString(OpenError e);
const char* toString(ArchiveFamily f);
// One sentence for the user; empty for None.
std::string userMessage(OpenError e);

// One record in a container, as the library reported it.
struct Entry {
  std::string path;
  bool        isDirectory = false;
  uint64_t    uncompressedSize = 0;
  std::optional<TimePoint> modifiedAt;
  bool        isEncrypted = false;
  uint64_t    libIndex = 0; // position in the library's own enumeration
};

struct PixelSize {
  uint32_t width = 0;
  uint32_t height = 0;
};

struct Bitmap {
  Bytes       bytes;
  PixelSize   size;
  std::string format;
};

struct Limits {
  uint32_t maxDepth = 2;
  uint64_t maxNestedArchiveBytes = 2ull<<30;  // 2 GiB
  uint64_t maxEntryCacheBytes = 256ull<<20;   // 256 MiB
  uint64_t eocdScanBytes = 65557;             // 22 + 65535 comment bytes
  uint64_t standaloneHashBytes = 32u<<10;     // 32 KiB
};

// Phase names reported during an open.
namespace phase {
inline constexpr const char* kOpening = "opening";
inline constexpr const char* kBuildingList = "building image list";
inline constexpr const char* kExtracting = "extracting";
} // namespace phase

using PhaseSink = std::function<void(const std::string&)>;

struct OpenOptions {
  std::optional<std::string> password;
  PhaseSink phaseSink;
  Limits limits;
  std::filesystem::path tempDir;                   // empty -> system temp
  std::shared_ptr<const BitmapDecoder> decoder;    // null -> HeaderBitmapDecoder
  std::shared_ptr<ICredentialStore> credentials;   // optional
  bool rememberPassword = false;
  uint32_t depth = 1;                              // container nesting level of this open
};

inline void reportPhase(const OpenOptions& opts, const char* name) {
  if (opts.phaseSink) opts.phaseSink(name);
}

} // namespace panes
