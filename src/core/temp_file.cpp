// src/core/temp_file.cpp
#include "core/temp_file.hpp"
#include "log.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace panes {

static constexpr const char* kDirPrefix = "panes-";

bool makePrivateTempDir(const fs::path& base, fs::path& out, std::string& err) {
  std::error_code ec;
  fs::path root = base.empty() ? fs::temp_directory_path(ec) : base;
  if (ec) { err = "no temp directory: " + ec.message(); return false; }
  fs::create_directories(root, ec);
  if (ec) { err = "create_directories failed: " + ec.message(); return false; }

  std::string tmpl = (root / (std::string(kDirPrefix) + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    err = std::string("mkdtemp failed: ") + std::strerror(errno);
    return false;
  }
  out = fs::path(buf.data());
  return true;
}

bool writePrivateTempFile(const fs::path& base, const std::string& fileName,
                          const Bytes& data, TempFile& out, std::string& err) {
  fs::path dir;
  if (!makePrivateTempDir(base, dir, err)) return false;

  fs::path dst = dir / fs::path(fileName).filename();
  std::ofstream fo(dst, std::ios::binary | std::ios::trunc);
  if (fo) fo.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (fo) fo.close();
  if (!fo) {
    err = "write failed: " + dst.string();
    std::error_code ec; fs::remove_all(dir, ec);
    return false;
  }
  out = TempFile(dst, dir);
  return true;
}

TempFile::TempFile(fs::path file, fs::path ownedDir)
  : file_(std::move(file)), ownedDir_(std::move(ownedDir)) {}

TempFile::~TempFile() { reset(); }

TempFile::TempFile(TempFile&& other) noexcept
  : file_(std::move(other.file_)), ownedDir_(std::move(other.ownedDir_)) {
  other.file_.clear();
  other.ownedDir_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
  if (this != &other) {
    reset();
    file_ = std::move(other.file_);
    ownedDir_ = std::move(other.ownedDir_);
    other.file_.clear();
    other.ownedDir_.clear();
  }
  return *this;
}

void TempFile::reset() {
  if (file_.empty()) return;
  std::error_code ec;
  fs::remove(file_, ec);
  if (ec) LOGW("temp file not removed: " + file_.string() + " (" + ec.message() + ")");
  if (!ownedDir_.empty()) {
    ec.clear();
    fs::remove_all(ownedDir_, ec);
    if (ec) LOGW("temp dir not removed: " + ownedDir_.string() + " (" + ec.message() + ")");
  }
  LOGD("removed temp file " + file_.filename().string());
  file_.clear();
  ownedDir_.clear();
}

} // namespace panes
