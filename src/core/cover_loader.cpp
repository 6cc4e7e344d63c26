// src/core/cover_loader.cpp
#include "core/cover_loader.hpp"
#include "core/filesystem_source.hpp"
#include "core/source_factory.hpp"
#include "routing/router.hpp"
#include "log.h"

namespace fs = std::filesystem;

namespace panes {

namespace {

struct Opened {
  std::shared_ptr<IArchiveReader> reader;   // null for folders and loose files
  std::unique_ptr<ImageSource> source;
};

bool openDirect(const fs::path& path, const OpenOptions& opts, CoverResult& res, Opened& out) {
  std::string err;
  if (routeToHandler(path).kind == SourceKind::FileSystem) {
    auto src = std::make_unique<FileSystemSource>(opts);
    if (!src->open({path}, res.error, err)) {
      LOGD("cover: " + path.filename().string() + ": " + err);
      return false;
    }
    out.source = std::move(src);
    return true;
  }

  out.reader = openArchiveReader(path, opts, res.error, err);
  if (!out.reader) {
    LOGD("cover: " + path.filename().string() + ": " + err);
    return false;
  }
  if (out.reader->needsPassword()) {
    res.needsPassword = true;
    res.wrongPassword = out.reader->wrongPassword();
    return false;
  }
  out.source = std::make_unique<ArchiveImageSource>(out.reader, opts);
  return true;
}

} // namespace

CoverResult loadCoverImage(const fs::path& path, const OpenOptions& opts, size_t coverIndex) {
  CoverResult res;
  Opened o;
  if (!openDirect(path, opts, res, o)) return res;
  res.imageCount = o.source->imageCount();
  res.image = o.source->loadImage(coverIndex);
  if (!res.image)
    LOGD("cover: no image " + std::to_string(coverIndex) + " in " + path.filename().string());
  return res;
}

CoverResult loadArchivedImage(const fs::path& archive, const std::string& relativePath,
                              const OpenOptions& opts) {
  CoverResult res;
  Opened o;
  if (!openDirect(archive, opts, res, o)) return res;
  res.imageCount = o.source->imageCount();
  if (!o.reader) {
    res.error = OpenError::CannotOpen;
    LOGW("not a container: " + archive.filename().string());
    return res;
  }
  auto at = o.reader->imageIndexForName(relativePath);
  if (!at) {
    LOGD(archive.filename().string() + ": no image named " + relativePath);
    return res;
  }
  res.image = o.source->loadImage(*at);
  return res;
}

std::optional<Bitmap> CoverCache::cover(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = covers_.find(id);
  if (it == covers_.end()) return std::nullopt;
  return it->second;
}

std::optional<size_t> CoverCache::imageCount(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counts_.find(id);
  if (it == counts_.end()) return std::nullopt;
  return it->second;
}

size_t CoverCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return covers_.size();
}

std::optional<Bitmap> CoverCache::loadCover(const std::string& id, const fs::path& path,
                                            const OpenOptions& opts, size_t coverIndex) {
  if (auto hit = cover(id)) return hit;

  // opened outside the lock; a racing load of the same id just repeats work
  CoverResult res = loadCoverImage(path, opts, coverIndex);
  std::lock_guard<std::mutex> lk(mu_);
  if (res.imageCount) counts_[id] = *res.imageCount;
  if (!res.image) return std::nullopt;
  remember(id, *res.image);
  return res.image;
}

void CoverCache::remember(const std::string& id, const Bitmap& bmp) {
  if (limit_ == 0) return;
  if (!covers_.emplace(id, bmp).second) return;
  order_.push_back(id);
  while (order_.size() > limit_) {
    covers_.erase(order_.front());
    order_.pop_front();
  }
}

} // namespace panes
