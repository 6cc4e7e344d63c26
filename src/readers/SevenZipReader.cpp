// src/readers/SevenZipReader.cpp
#include "readers/SevenZipReader.hpp"
#include "readers/LibArchiveSupport.hpp"
#include "log.h"
#include <archive.h>
#include <archive_entry.h>
#include <chrono>
#include <unordered_set>

namespace panes {

bool SevenZipReader::open(const std::filesystem::path& path, const OpenOptions& opts,
                          OpenError& code, std::string& err) {
  const auto start = std::chrono::steady_clock::now();
  close();
  beginOpen(path, opts);
  code = OpenError::None;
  const bool havePassword = opts.password.has_value();

  std::vector<Entry> all;
  if (!listEntries(opts, all, code, err)) {
    if (code == OpenError::PasswordRequired || code == OpenError::WrongPassword) {
      hasEncrypted_ = true;
      lockOut(code == OpenError::WrongPassword);
      code = OpenError::None;
      err.clear();
      return true;
    }
    return false;
  }

  bool encryptedSeen = false;
  for (const auto& e : all) encryptedSeen = encryptedSeen || e.isEncrypted;
  catalog(all, false);
  hasEncrypted_ = encryptedSeen;

  if (encryptedSeen && images_.empty() && nested_.empty()) {
    if (!havePassword) {
      lockOut(false);
      return true;
    }
    // libarchive reads 7z AES headers but cannot decrypt entry data
    err = "7z decryption is not supported by libarchive";
    code = OpenError::UnsupportedCompression;
    return false;
  }
  if (encryptedSeen) {
    LOGW(path.filename().string() + ": encrypted 7z entries skipped");
  }

  if (!hasContent()) {
    err = "no images or nested archives in " + path.filename().string();
    code = OpenError::NoContentFound;
    return false;
  }

  if (!extractAll(opts, all, code, err)) {
    resetCatalog();
    extracted_.clear();
    return false;
  }

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  LOGD("7z open " + path.filename().string() + " took " + std::to_string(ms) + "ms, " +
       std::to_string(extracted_.size()) + " entries decompressed");
  return true;
}

bool SevenZipReader::listEntries(const OpenOptions& opts, std::vector<Entry>& out,
                                 OpenError& code, std::string& err) {
  reportPhase(opts, phase::kOpening);
  ArchivePtr a = openLibArchive(path_, setupSevenZip, opts.password, err);
  if (!a) {
    if (mentionsEncryption(err))
      code = opts.password ? OpenError::UnsupportedCompression : OpenError::PasswordRequired;
    else
      code = OpenError::CannotOpen;
    return false;
  }

  reportPhase(opts, phase::kBuildingList);
  if (!listLibArchiveEntries(a.get(), path_, out, err)) {
    if (mentionsEncryption(err))
      code = opts.password ? OpenError::UnsupportedCompression : OpenError::PasswordRequired;
    else
      code = OpenError::CannotOpen;
    return false;
  }
  return true;
}

bool SevenZipReader::extractAll(const OpenOptions& opts, const std::vector<Entry>& all,
                                OpenError& code, std::string& err) {
  reportPhase(opts, phase::kExtracting);
  std::unordered_set<uint64_t> wanted;
  for (const auto& e : images_) wanted.insert(e.libIndex);
  for (const auto& e : nested_) wanted.insert(e.libIndex);

  // Listing already succeeded, so every failure from here on is a codec,
  // filter or data problem rather than an unreadable container.
  std::unordered_set<uint64_t> failed;
  uint64_t resumeAt = 0;
  for (;;) {
    ArchivePtr a = openLibArchive(path_, setupSevenZip, opts.password, err);
    if (!a) {
      code = OpenError::UnsupportedCompression;
      return false;
    }

    struct archive_entry* ent = nullptr;
    uint64_t ordinal = 0;
    bool reopen = false;
    int r;
    while ((r = archive_read_next_header(a.get(), &ent)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
      const uint64_t idx = ordinal++;
      if (idx < resumeAt || !wanted.count(idx)) {
        if (archive_read_data_skip(a.get()) == ARCHIVE_FATAL) {
          r = ARCHIVE_FATAL;
          break;
        }
        continue;
      }

      Bytes data;
      if (archive_entry_size_is_set(ent) && archive_entry_size(ent) > 0)
        data.reserve(static_cast<size_t>(archive_entry_size(ent)));
      std::string msg;
      if (!readLibArchiveData(a.get(), data, msg)) {
        const char* name = archive_entry_pathname_utf8(ent);
        if (!name) name = archive_entry_pathname(ent);
        LOGW(path_.filename().string() + ": dropped " + (name ? name : "?") + " (" + msg + ")");
        failed.insert(idx);
        // the handle may be in a fatal state; restart past this entry
        resumeAt = idx + 1;
        reopen = true;
        break;
      }
      extracted_[idx] = std::move(data);
    }
    if (reopen) continue;
    if (r != ARCHIVE_EOF) {
      err = "archive_read_next_header failed: " + archiveError(a.get());
      code = OpenError::UnsupportedCompression;
      return false;
    }
    break;
  }

  if (failed.empty()) return true;

  std::vector<Entry> kept;
  kept.reserve(all.size());
  for (const auto& e : all) {
    if (failed.count(e.libIndex)) {
      skipped_.push_back(e.path);
      continue;
    }
    kept.push_back(e);
  }
  catalog(kept, false);
  if (!hasContent()) {
    err = "no entry of " + path_.filename().string() + " could be decompressed";
    code = OpenError::UnsupportedCompression;
    return false;
  }
  return true;
}

bool SevenZipReader::readEntry(const Entry& e, Bytes& out, std::string& err) {
  auto it = extracted_.find(e.libIndex);
  if (it == extracted_.end()) {
    err = "not decompressed: " + e.path;
    return false;
  }
  out = it->second;
  return true;
}

void SevenZipReader::close() {
  extracted_.clear();
  skipped_.clear();
}

std::unique_ptr<IArchiveReader> makeSevenZipReader() {
  return std::make_unique<SevenZipReader>();
}

} // namespace panes
