#pragma once
#include "readers/IArchiveReader.hpp"
#include <deque>
#include <unordered_map>

namespace panes {

// Catalog, lookup and caching shared by the three container readers.
// Subclasses enumerate entries and implement readEntry().
class ArchiveReaderBase : public IArchiveReader {
public:
  const std::filesystem::path& path() const override { return path_; }

  size_t imageCount() const override { return images_.size(); }
  std::optional<std::string> imageName(size_t at) const override;
  std::optional<Bytes> imageData(size_t at) override;
  std::optional<PixelSize> imageDimensions(size_t at) override;
  std::optional<uint64_t> imageByteSize(size_t at) const override;
  std::optional<std::string> imageFormatLabel(size_t at) const override;
  std::optional<TimePoint> imageModifiedAt(size_t at) const override;

  size_t nestedArchiveCount() const override { return nested_.size(); }
  std::optional<std::string> nestedArchiveName(size_t at) const override;
  std::optional<TempFile> extractNestedArchive(size_t at) override;

  const std::vector<EntryRef>& mergedEntries() const override { return merged_; }
  std::vector<std::string> allSortedEntryNames() const override;
  std::optional<size_t> imageIndexForName(const std::string& name) const override;
  std::optional<size_t> nestedArchiveIndexForName(const std::string& name) const override;

  bool needsPassword() const override { return needsPassword_; }
  bool wrongPassword() const override { return wrongPassword_; }
  bool hasEncryptedEntries() const override { return hasEncrypted_; }

protected:
  // Decompresses one entry into `out`.
  virtual bool readEntry(const Entry& e, Bytes& out, std::string& err) = 0;

  void beginOpen(const std::filesystem::path& path, const OpenOptions& opts);

  // Classifies, filters and sorts. Encrypted entries are dropped unless
  // `includeEncrypted`. Returns how many entries stayed iterable.
  size_t catalog(const std::vector<Entry>& all, bool includeEncrypted);

  // Forgets every entry and flags the reader as locked.
  void lockOut(bool wrong);

  bool hasContent() const { return !images_.empty() || !nested_.empty(); }

  // First kept encrypted entry (images preferred); used to verify a password.
  const Entry* firstEncryptedEntry() const;

  void resetCatalog();

  std::filesystem::path path_;
  Limits limits_;
  std::filesystem::path tempDir_;
  std::shared_ptr<const BitmapDecoder> decoder_;
  bool useEntryCache_ = true;

  std::vector<Entry> images_;
  std::vector<Entry> nested_;
  std::vector<EntryRef> merged_;

  bool needsPassword_ = false;
  bool wrongPassword_ = false;
  bool hasEncrypted_ = false;

private:
  const Bytes* cached(const std::string& name) const;
  void remember(const std::string& name, const Bytes& data);

  std::unordered_map<std::string, size_t> imageByName_;
  std::unordered_map<std::string, size_t> nestedByName_;

  std::unordered_map<std::string, Bytes> cache_;
  std::deque<std::string> cacheOrder_;
  uint64_t cacheBytes_ = 0;
};

} // namespace panes
