#pragma once
#include "readers/ArchiveReaderBase.hpp"
#include <unordered_map>

namespace panes {

// 7z / CB7 through libarchive. libarchive only iterates a container front
// to back, so every kept entry is decompressed once during open() into an
// instance-owned map keyed by entry ordinal (7z allows duplicate paths).
// An entry that fails to decompress is dropped from the catalog and the
// walk resumes after it. Not safe for concurrent access.
class SevenZipReader : public ArchiveReaderBase {
public:
  SevenZipReader() { useEntryCache_ = false; }
  ~SevenZipReader() override { close(); }

  ArchiveFamily family() const override { return ArchiveFamily::SevenZip; }
  bool open(const std::filesystem::path& path, const OpenOptions& opts,
            OpenError& code, std::string& err) override;
  void close() override;

  // Entries dropped during open() because their data could not be read.
  const std::vector<std::string>& skippedEntries() const { return skipped_; }

protected:
  bool readEntry(const Entry& e, Bytes& out, std::string& err) override;

private:
  bool listEntries(const OpenOptions& opts, std::vector<Entry>& out,
                   OpenError& code, std::string& err);
  bool extractAll(const OpenOptions& opts, const std::vector<Entry>& all,
                  OpenError& code, std::string& err);

  std::unordered_map<uint64_t, Bytes> extracted_;
  std::vector<std::string> skipped_;
};

} // namespace panes
