// src/readers/LibArchiveSupport.cpp
#include "readers/LibArchiveSupport.hpp"
#include "log.h"
#include <algorithm>
#include <archive.h>
#include <archive_entry.h>
#include <cctype>
#include <chrono>

namespace panes {

void ArchiveDeleter::operator()(struct archive* a) const {
  if (a) archive_read_free(a);
}

void setupSevenZip(struct archive* a) {
  archive_read_support_format_7zip(a);
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string archiveError(struct archive* a) {
  const char* s = archive_error_string(a);
  return s ? s : "unknown libarchive error";
}

bool mentionsEncryption(const std::string& msg) {
  const std::string m = lower(msg);
  return m.find("encrypt") != std::string::npos ||
         m.find("password") != std::string::npos ||
         m.find("passphrase") != std::string::npos;
}

ArchivePtr openLibArchive(const std::filesystem::path& path, FormatSetup setup,
                          const std::optional<std::string>& password, std::string& err) {
  ArchivePtr a(archive_read_new());
  if (!a) { err = "archive_read_new failed"; return nullptr; }
  setup(a.get());
  archive_read_support_filter_all(a.get());
  if (password && archive_read_add_passphrase(a.get(), password->c_str()) != ARCHIVE_OK)
    LOGW("passphrase not accepted: " + archiveError(a.get()));
  if (archive_read_open_filename(a.get(), path.string().c_str(), 1 << 16) != ARCHIVE_OK) {
    err = "archive_read_open_filename failed: " + archiveError(a.get());
    return nullptr;
  }
  return a;
}

static std::string entryPath(struct archive_entry* ent) {
  const char* name = archive_entry_pathname_utf8(ent);
  if (!name) name = archive_entry_pathname(ent);
  return name ? name : "";
}

bool listLibArchiveEntries(struct archive* a, const std::filesystem::path& path,
                           std::vector<Entry>& out, std::string& err) {
  struct archive_entry* ent = nullptr;
  uint64_t ordinal = 0;
  int r;
  while ((r = archive_read_next_header(a, &ent)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
    Entry e;
    e.path = entryPath(ent);
    e.libIndex = ordinal++;
    e.isDirectory = archive_entry_filetype(ent) == AE_IFDIR;
    if (archive_entry_size_is_set(ent) && archive_entry_size(ent) > 0)
      e.uncompressedSize = static_cast<uint64_t>(archive_entry_size(ent));
    if (archive_entry_mtime_is_set(ent))
      e.modifiedAt = std::chrono::system_clock::from_time_t(archive_entry_mtime(ent));
    e.isEncrypted = archive_entry_is_encrypted(ent) != 0;
    out.push_back(std::move(e));
    if (archive_read_data_skip(a) == ARCHIVE_FATAL) {
      r = ARCHIVE_FATAL;
      break;
    }
  }
  if (r == ARCHIVE_EOF) return true;

  const std::string msg = archiveError(a);
  if (out.empty()) {
    err = "archive_read_next_header failed: " + msg;
    return false;
  }
  LOGW(path.filename().string() + ": listing stopped early (" + msg + ")");
  return true;
}

bool readLibArchiveData(struct archive* a, Bytes& out, std::string& err) {
  std::vector<uint8_t> buf(1 << 16);
  la_ssize_t n;
  while ((n = archive_read_data(a, buf.data(), buf.size())) > 0)
    out.insert(out.end(), buf.begin(), buf.begin() + n);
  if (n < 0) {
    err = archiveError(a);
    out.clear();
    return false;
  }
  return true;
}

} // namespace panes
