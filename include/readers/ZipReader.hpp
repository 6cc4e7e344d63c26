#pragma once
#include "readers/ArchiveReaderBase.hpp"
#include <zip.h>

namespace panes {

// ZIP / CBZ through libzip. Extraction is lazy: entries are decompressed
// on demand by index while the archive handle stays open.
//
// libzip lists encrypted entries but cannot read them without a password,
// so a locked archive would look like an empty one. The EOCD scan compares
// the declared entry count with what we can iterate to tell the two apart.
class ZipReader : public ArchiveReaderBase {
public:
  ZipReader() = default;
  ~ZipReader() override { close(); }

  ArchiveFamily family() const override { return ArchiveFamily::Zip; }
  bool open(const std::filesystem::path& path, const OpenOptions& opts,
            OpenError& code, std::string& err) override;
  void close() override;

protected:
  bool readEntry(const Entry& e, Bytes& out, std::string& err) override;

private:
  // Image and nested entries whose method libzip lacks are left out of
  // `out` and counted in `undecodable`.
  bool listEntries(std::vector<Entry>& out, size_t& undecodable, std::string& err);
  // ZIP_ER_* of the last failed readEntry (ZIP_ER_OK when none).
  int lastError_ = ZIP_ER_OK;

  zip_t* z_ = nullptr;
  std::optional<std::string> password_;
};

} // namespace panes
