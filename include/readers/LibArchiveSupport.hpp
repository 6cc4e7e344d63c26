#pragma once
#include "core/types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct archive;
struct archive_entry;

namespace panes {

struct ArchiveDeleter {
  void operator()(struct archive* a) const;
};
using ArchivePtr = std::unique_ptr<struct archive, ArchiveDeleter>;

// Enables the reader formats one family needs.
using FormatSetup = void (*)(struct archive*);
void setupSevenZip(struct archive* a);

// Opens `path` for sequential reading. Null with `err` on failure.
ArchivePtr openLibArchive(const std::filesystem::path& path, FormatSetup setup,
                          const std::optional<std::string>& password, std::string& err);

std::string archiveError(struct archive* a);

// libarchive reports crypto gaps as ARCHIVE_FATAL with text only.
bool mentionsEncryption(const std::string& msg);

// Walks every header, skipping data. Entries carry their ordinal as
// libIndex. Stops early on a damaged tail (logged); false only when the
// very first header cannot be read.
bool listLibArchiveEntries(struct archive* a, const std::filesystem::path& path,
                           std::vector<Entry>& out, std::string& err);

// Reads the data of the entry whose header was just returned.
bool readLibArchiveData(struct archive* a, Bytes& out, std::string& err);

} // namespace panes
