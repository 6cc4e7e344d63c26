#pragma once
#include "core/types.hpp"
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace panes {

// Outcome of a single-image lookup for a library shelf.
struct CoverResult {
  std::optional<Bitmap> image;
  std::optional<size_t> imageCount;   // set whenever the source opened
  OpenError error = OpenError::None;
  bool needsPassword = false;
  bool wrongPassword = false;
};

// Opens `path` with its own family reader (a folder or loose file through
// FileSystemSource) and returns the image at `coverIndex` in display order.
// Nested containers are not expanded and no credentials are consulted:
// opts.password is used as given.
CoverResult loadCoverImage(const std::filesystem::path& path, const OpenOptions& opts,
                           size_t coverIndex = 0);

// One image of a container, addressed by its entry path.
CoverResult loadArchivedImage(const std::filesystem::path& archive, const std::string& relativePath,
                              const OpenOptions& opts);

// Covers by caller-chosen id. Holds at most `limit` bitmaps, dropping the
// oldest first; image counts are kept for every id seen. Thread-safe.
class CoverCache {
public:
  explicit CoverCache(size_t limit = 200) : limit_(limit) {}

  std::optional<Bitmap> cover(const std::string& id) const;
  std::optional<size_t> imageCount(const std::string& id) const;

  // Cached cover, or loadCoverImage() remembered under `id`.
  std::optional<Bitmap> loadCover(const std::string& id, const std::filesystem::path& path,
                                  const OpenOptions& opts, size_t coverIndex = 0);

  size_t size() const;

private:
  void remember(const std::string& id, const Bitmap& bmp);

  size_t limit_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Bitmap> covers_;
  std::deque<std::string> order_;
  std::unordered_map<std::string, size_t> counts_;
};

} // namespace panes
