// src/core/filesystem_source.cpp
#include "core/filesystem_source.hpp"
#include "core/entry_classifier.hpp"
#include "core/image_header.hpp"
#include "hash_sha256.h"
#include "log.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <system_error>

namespace fs = std::filesystem;

namespace panes {

static bool hiddenName(const fs::path& p) {
  const std::string n = p.filename().string();
  return !n.empty() && n[0] == '.';
}

static bool isImageFile(const fs::path& p) {
  return isImageExtension(extensionLower(p.filename().string()));
}

std::optional<std::string> locationKey(const fs::path& dir) {
  struct stat st;
  if (::stat(dir.c_str(), &st) != 0) return std::nullopt;
  return std::to_string(static_cast<unsigned long long>(st.st_dev)) + "-" +
         std::to_string(static_cast<unsigned long long>(st.st_ino));
}

FileSystemSource::FileSystemSource(const OpenOptions& opts)
  : decoder_(opts.decoder ? opts.decoder : defaultDecoder()),
    hashBytes_(opts.limits.standaloneHashBytes) {}

bool FileSystemSource::open(const std::vector<fs::path>& inputs, OpenError& code, std::string& err) {
  files_.clear();
  code = OpenError::None;

  for (const auto& in : inputs) {
    std::error_code ec;
    if (fs::is_directory(in, ec)) {
      fs::recursive_directory_iterator it(in, fs::directory_options::skip_permission_denied, ec), end;
      if (ec) {
        LOGW("cannot walk " + in.string() + ": " + ec.message());
        continue;
      }
      for (; it != end; it.increment(ec)) {
        if (ec) {
          LOGW("walk error under " + in.string() + ": " + ec.message());
          break;
        }
        if (hiddenName(it->path())) {
          if (it->is_directory(ec)) it.disable_recursion_pending();
          continue;
        }
        if (it->is_regular_file(ec) && isImageFile(it->path())) files_.push_back(it->path());
      }
    } else if (fs::is_regular_file(in, ec)) {
      if (isImageFile(in)) files_.push_back(in);
      else LOGD("not an image, ignored: " + in.string());
    } else {
      LOGW("missing input: " + in.string());
    }
  }

  if (files_.empty()) {
    err = "no images found";
    code = OpenError::NoContentFound;
    return false;
  }

  std::stable_sort(files_.begin(), files_.end(), [](const fs::path& a, const fs::path& b) {
    return naturalLess(a.string(), b.string());
  });

  std::error_code ec;
  folder_ = inputs.size() == 1 && fs::is_directory(inputs[0], ec);
  standalone_ = inputs.size() == 1 && !folder_;
  root_ = folder_ ? inputs[0] : files_[0].parent_path();
  if (inputs.size() == 1) {
    name_ = inputs[0].filename().string();
    if (name_.empty()) name_ = inputs[0].parent_path().filename().string(); // "dir/"
  } else {
    name_ = files_[0].parent_path().filename().string();
  }

  LOGD("filesystem source '" + name_ + "': " + std::to_string(files_.size()) + " images");
  return true;
}

std::optional<fs::path> FileSystemSource::sourceUrl() const {
  if (files_.empty()) return std::nullopt;
  return root_;
}

std::optional<Bytes> FileSystemSource::readFile(size_t at) const {
  if (at >= files_.size()) return std::nullopt;
  std::ifstream f(files_[at], std::ios::binary);
  if (!f) {
    LOGW("cannot read " + files_[at].string());
    return std::nullopt;
  }
  Bytes data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return data;
}

std::optional<Bitmap> FileSystemSource::loadImage(size_t at) {
  auto data = readFile(at);
  if (!data) return std::nullopt;
  Bitmap bmp;
  if (!makeBitmap(*decoder_, std::move(*data), formatLabel(files_[at].string()), bmp)) {
    LOGW("undecodable image: " + files_[at].string());
    return std::nullopt;
  }
  return bmp;
}

std::optional<std::string> FileSystemSource::fileName(size_t at) const {
  if (at >= files_.size()) return std::nullopt;
  return files_[at].filename().string();
}

std::optional<PixelSize> FileSystemSource::imageSize(size_t at) {
  auto data = readFile(at);
  if (!data) return std::nullopt;
  PixelSize sz;
  if (!decoder_->measure(*data, sz)) return std::nullopt;
  return sz;
}

std::optional<uint64_t> FileSystemSource::fileSize(size_t at) const {
  if (at >= files_.size()) return std::nullopt;
  std::error_code ec;
  auto n = fs::file_size(files_[at], ec);
  if (ec) return std::nullopt;
  return static_cast<uint64_t>(n);
}

std::optional<std::string> FileSystemSource::imageFormat(size_t at) const {
  if (at >= files_.size()) return std::nullopt;
  return formatLabel(files_[at].string());
}

std::optional<TimePoint> FileSystemSource::fileDate(size_t at) const {
  if (at >= files_.size()) return std::nullopt;
  struct stat st;
  if (::stat(files_[at].c_str(), &st) != 0) return std::nullopt;
  return std::chrono::system_clock::from_time_t(st.st_mtime);
}

std::optional<std::string> FileSystemSource::imageRelativePath(size_t at) const {
  if (at >= files_.size()) return std::nullopt;
  if (!folder_) return files_[at].filename().string();
  std::error_code ec;
  fs::path rel = fs::relative(files_[at], root_, ec);
  if (ec || rel.empty()) return files_[at].filename().string();
  return rel.generic_string();
}

std::optional<std::string> FileSystemSource::generateFileKey() {
  if (fileKey_) return fileKey_;
  if (files_.empty()) return std::nullopt;
  fileKey_ = standalone_ ? fileContentKey(files_[0], hashBytes_) : locationKey(root_);
  return fileKey_;
}

std::optional<std::string> FileSystemSource::generateImageFileKey(size_t at) {
  if (at >= files_.size()) return std::nullopt;
  auto it = imageKeys_.find(at);
  if (it != imageKeys_.end()) return it->second;
  auto key = fileContentKey(files_[at], hashBytes_);
  if (key) imageKeys_.emplace(at, *key);
  return key;
}

} // namespace panes
