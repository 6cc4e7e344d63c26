#pragma once
#include "core/temp_file.hpp"
#include "core/types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace panes {

// Position of a kept entry in the merged natural order.
struct EntryRef {
  bool   isImage = true;
  size_t index = 0;   // into the image list or the nested-archive list
};

// One opened container. Not safe for concurrent use: callers serialize
// access to a single instance (lazy extraction caches are unsynchronized).
class IArchiveReader {
public:
  virtual ~IArchiveReader() = default;

  virtual ArchiveFamily family() const = 0;

  // Opens and catalogs the container. Returns false (code + err) on a hard
  // failure. A locked container returns true with needsPassword() set and
  // no entries so the caller can retry with a password.
  virtual bool open(const std::filesystem::path& path, const OpenOptions& opts,
                    OpenError& code, std::string& err) = 0;
  virtual void close() = 0;

  virtual const std::filesystem::path& path() const = 0;

  // Images, natural order by full entry path.
  virtual size_t imageCount() const = 0;
  virtual std::optional<std::string> imageName(size_t at) const = 0;
  virtual std::optional<Bytes> imageData(size_t at) = 0;
  virtual std::optional<PixelSize> imageDimensions(size_t at) = 0;
  virtual std::optional<uint64_t> imageByteSize(size_t at) const = 0;
  virtual std::optional<std::string> imageFormatLabel(size_t at) const = 0;
  virtual std::optional<TimePoint> imageModifiedAt(size_t at) const = 0;

  // Nested containers, natural order.
  virtual size_t nestedArchiveCount() const = 0;
  virtual std::optional<std::string> nestedArchiveName(size_t at) const = 0;
  // Writes the nested container to a private temp file owned by the result.
  virtual std::optional<TempFile> extractNestedArchive(size_t at) = 0;

  // Images and nested containers merged in natural order.
  virtual const std::vector<EntryRef>& mergedEntries() const = 0;
  virtual std::vector<std::string> allSortedEntryNames() const = 0;
  virtual std::optional<size_t> imageIndexForName(const std::string& name) const = 0;
  virtual std::optional<size_t> nestedArchiveIndexForName(const std::string& name) const = 0;

  virtual bool needsPassword() const = 0;
  virtual bool wrongPassword() const = 0;   // a password was tried and rejected
  virtual bool hasEncryptedEntries() const = 0;
};

std::unique_ptr<IArchiveReader> makeZipReader();
std::unique_ptr<IArchiveReader> makeRarReader();
std::unique_ptr<IArchiveReader> makeSevenZipReader();
std::unique_ptr<IArchiveReader> makeReader(ArchiveFamily family);

} // namespace panes
