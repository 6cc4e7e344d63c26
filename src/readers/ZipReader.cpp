// src/readers/ZipReader.cpp
#include "readers/ZipReader.hpp"
#include "readers/EocdScanner.hpp"
#include "core/entry_classifier.hpp"
#include "log.h"
#include <chrono>

namespace panes {

static std::string zipErrorString(int code) {
  zip_error_t ze;
  zip_error_init_with_code(&ze, code);
  std::string s = zip_error_strerror(&ze);
  zip_error_fini(&ze);
  return s;
}

static bool isPasswordError(int code) {
  return code == ZIP_ER_NOPASSWD || code == ZIP_ER_WRONGPASSWD;
}

bool ZipReader::open(const std::filesystem::path& path, const OpenOptions& opts,
                     OpenError& code, std::string& err) {
  const auto start = std::chrono::steady_clock::now();
  close();
  beginOpen(path, opts);
  password_ = opts.password;
  code = OpenError::None;

  reportPhase(opts, phase::kOpening);
  int ze = 0;
  z_ = zip_open(path.string().c_str(), ZIP_RDONLY, &ze);
  if (!z_) {
    err = "zip_open failed: " + zipErrorString(ze);
    code = OpenError::CannotOpen;
    return false;
  }

  reportPhase(opts, phase::kBuildingList);
  std::vector<Entry> all;
  size_t undecodable = 0;
  if (!listEntries(all, undecodable, err)) {
    code = OpenError::CannotOpen;
    close();
    return false;
  }

  bool encryptedSeen = false;
  for (const auto& e : all) encryptedSeen = encryptedSeen || e.isEncrypted;

  const bool havePassword = password_.has_value();
  // entries dropped for their method were still iterable
  const size_t iterable = catalog(all, havePassword) + undecodable;
  const auto declared = declaredEntryCount(path, limits_.eocdScanBytes);
  hasEncrypted_ = encryptedSeen || hasSkippedEntries(declared, iterable);
  if (hasEncrypted_) {
    LOGD(path.filename().string() + ": encrypted entries (declared " +
         (declared ? std::to_string(*declared) : std::string("?")) +
         ", iterable " + std::to_string(iterable) + ")");
  }

  if (!havePassword && hasEncrypted_ && images_.empty()) {
    lockOut(false);
    return true;
  }

  if (havePassword && encryptedSeen) {
    if (const Entry* sample = firstEncryptedEntry()) {
      Bytes scratch;
      std::string perr;
      if (!readEntry(*sample, scratch, perr)) {
        if (isPasswordError(lastError_) || lastError_ == ZIP_ER_CRC) {
          lockOut(true);
          return true;
        }
        if (lastError_ == ZIP_ER_ENCRNOTSUPP || lastError_ == ZIP_ER_COMPNOTSUPP) {
          err = perr;
          code = OpenError::UnsupportedCompression;
          close();
          return false;
        }
        LOGW("password check failed on " + sample->path + ": " + perr);
      }
    }
  }

  if (!hasContent()) {
    if (undecodable > 0) {
      err = std::to_string(undecodable) + " entries of " + path.filename().string() +
            " use a compression method libzip cannot decode";
      code = OpenError::UnsupportedCompression;
    } else {
      err = "no images or nested archives in " + path.filename().string();
      code = OpenError::NoContentFound;
    }
    close();
    return false;
  }

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  LOGD("zip open " + path.filename().string() + " took " + std::to_string(ms) + "ms");
  return true;
}

bool ZipReader::listEntries(std::vector<Entry>& out, size_t& undecodable, std::string& err) {
  undecodable = 0;
  zip_int64_t total = zip_get_num_entries(z_, 0);
  if (total < 0) { err = "zip_get_num_entries failed"; return false; }
  out.reserve(static_cast<size_t>(total));

  for (zip_int64_t i = 0; i < total; ++i) {
    zip_stat_t st; zip_stat_init(&st);
    if (zip_stat_index(z_, static_cast<zip_uint64_t>(i), 0, &st) != 0) {
      LOGW("zip_stat_index failed at " + std::to_string(i));
      continue;
    }
    Entry e;
    e.path     = st.name ? st.name : "";
    e.libIndex = static_cast<uint64_t>(i);
    e.isDirectory = (!e.path.empty() && e.path.back() == '/');
    if (st.valid & ZIP_STAT_SIZE) e.uncompressedSize = static_cast<uint64_t>(st.size);
    if (st.valid & ZIP_STAT_MTIME) e.modifiedAt = std::chrono::system_clock::from_time_t(st.mtime);
    if ((st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE)
      e.isEncrypted = true;
    // encrypted entries report COMPNOTSUPP through the password check
    if (!e.isEncrypted && (st.valid & ZIP_STAT_COMP_METHOD) &&
        !zip_compression_method_supported(st.comp_method, 0) &&
        classifyEntry(e.path, e.isDirectory) != EntryKind::Ignored) {
      LOGW("unsupported compression method " + std::to_string(st.comp_method) + ": " + e.path);
      ++undecodable;
      continue;
    }
    out.push_back(std::move(e));
  }
  return true;
}

bool ZipReader::readEntry(const Entry& e, Bytes& out, std::string& err) {
  lastError_ = ZIP_ER_OK;
  if (!z_) { err = "zip not open"; lastError_ = ZIP_ER_ZIPCLOSED; return false; }

  const zip_uint64_t idx = static_cast<zip_uint64_t>(e.libIndex);
  zip_file_t* zf = (e.isEncrypted && password_)
      ? zip_fopen_index_encrypted(z_, idx, 0, password_->c_str())
      : zip_fopen_index(z_, idx, 0);
  if (!zf) {
    lastError_ = zip_error_code_zip(zip_get_error(z_));
    err = std::string("zip_fopen_index failed: ") + zip_strerror(z_);
    zip_error_clear(z_);
    return false;
  }

  out.clear();
  out.reserve(static_cast<size_t>(e.uncompressedSize));
  std::vector<uint8_t> buf(1<<16);
  zip_int64_t n;
  while ((n = zip_fread(zf, buf.data(), buf.size())) > 0) {
    out.insert(out.end(), buf.begin(), buf.begin() + n);
  }
  if (n < 0) {
    lastError_ = zip_error_code_zip(zip_file_get_error(zf));
    err = std::string("zip_fread failed: ") + zip_file_strerror(zf);
    zip_fclose(zf);
    out.clear();
    return false;
  }
  int rc = zip_fclose(zf);
  if (rc != 0) {
    // CRC is checked on close for some methods
    lastError_ = rc;
    err = "zip_fclose failed: " + zipErrorString(rc);
    out.clear();
    return false;
  }
  return true;
}

void ZipReader::close() {
  if (z_) { zip_discard(z_); z_ = nullptr; }
}

std::unique_ptr<IArchiveReader> makeZipReader() {
  return std::make_unique<ZipReader>();
}

} // namespace panes
