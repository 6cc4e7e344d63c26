// src/readers/ArchiveReaderBase.cpp
#include "readers/ArchiveReaderBase.hpp"
#include "core/entry_classifier.hpp"
#include "core/image_header.hpp"
#include "core/temp_file.hpp"
#include "log.h"
#include <algorithm>

namespace fs = std::filesystem;

namespace panes {

static bool entryLess(const Entry& a, const Entry& b) {
  return naturalLess(a.path, b.path);
}

void ArchiveReaderBase::beginOpen(const fs::path& path, const OpenOptions& opts) {
  path_ = path;
  limits_ = opts.limits;
  tempDir_ = opts.tempDir;
  decoder_ = opts.decoder ? opts.decoder : defaultDecoder();
  needsPassword_ = wrongPassword_ = hasEncrypted_ = false;
  resetCatalog();
}

void ArchiveReaderBase::resetCatalog() {
  images_.clear();
  nested_.clear();
  merged_.clear();
  imageByName_.clear();
  nestedByName_.clear();
  cache_.clear();
  cacheOrder_.clear();
  cacheBytes_ = 0;
}

size_t ArchiveReaderBase::catalog(const std::vector<Entry>& all, bool includeEncrypted) {
  resetCatalog();
  size_t iterable = 0;
  for (const auto& e : all) {
    if (e.isEncrypted && !includeEncrypted) continue;
    ++iterable;
    switch (classifyEntry(e.path, e.isDirectory)) {
      case EntryKind::Image:         images_.push_back(e); break;
      case EntryKind::NestedArchive: nested_.push_back(e); break;
      case EntryKind::Ignored:       break;
    }
  }

  std::stable_sort(images_.begin(), images_.end(), entryLess);
  std::stable_sort(nested_.begin(), nested_.end(), entryLess);

  for (size_t i = 0; i < images_.size(); ++i) {
    imageByName_.emplace(images_[i].path, i);
    merged_.push_back({true, i});
  }
  for (size_t i = 0; i < nested_.size(); ++i) {
    nestedByName_.emplace(nested_[i].path, i);
    merged_.push_back({false, i});
  }
  std::stable_sort(merged_.begin(), merged_.end(), [this](const EntryRef& a, const EntryRef& b) {
    const std::string& na = a.isImage ? images_[a.index].path : nested_[a.index].path;
    const std::string& nb = b.isImage ? images_[b.index].path : nested_[b.index].path;
    return naturalLess(na, nb);
  });

  LOGD(path_.filename().string() + ": " + std::to_string(images_.size()) + " images, " +
       std::to_string(nested_.size()) + " nested archives out of " + std::to_string(all.size()) + " entries");
  return iterable;
}

void ArchiveReaderBase::lockOut(bool wrong) {
  resetCatalog();
  needsPassword_ = true;
  wrongPassword_ = wrong;
  LOGW(path_.filename().string() + (wrong ? ": wrong password" : ": password required"));
}

const Entry* ArchiveReaderBase::firstEncryptedEntry() const {
  for (const auto& e : images_) if (e.isEncrypted) return &e;
  for (const auto& e : nested_) if (e.isEncrypted) return &e;
  return nullptr;
}

std::optional<std::string> ArchiveReaderBase::imageName(size_t at) const {
  if (at >= images_.size()) return std::nullopt;
  return images_[at].path;
}

std::optional<uint64_t> ArchiveReaderBase::imageByteSize(size_t at) const {
  if (at >= images_.size()) return std::nullopt;
  return images_[at].uncompressedSize;
}

std::optional<std::string> ArchiveReaderBase::imageFormatLabel(size_t at) const {
  if (at >= images_.size()) return std::nullopt;
  return formatLabel(images_[at].path);
}

std::optional<TimePoint> ArchiveReaderBase::imageModifiedAt(size_t at) const {
  if (at >= images_.size()) return std::nullopt;
  return images_[at].modifiedAt;
}

std::optional<Bytes> ArchiveReaderBase::imageData(size_t at) {
  if (at >= images_.size()) {
    LOGW("image index out of range: " + std::to_string(at) + " (total " + std::to_string(images_.size()) + ")");
    return std::nullopt;
  }
  const Entry& e = images_[at];
  if (useEntryCache_) {
    if (const Bytes* hit = cached(e.path)) return *hit;
  }

  Bytes data;
  std::string err;
  if (!readEntry(e, data, err)) {
    LOGE("extract failed: " + e.path + " (" + err + ")");
    return std::nullopt;
  }
  if (useEntryCache_) remember(e.path, data);
  return data;
}

std::optional<PixelSize> ArchiveReaderBase::imageDimensions(size_t at) {
  auto data = imageData(at);
  if (!data) return std::nullopt;
  PixelSize sz;
  if (!decoder_->measure(*data, sz)) {
    LOGD("cannot measure " + images_[at].path);
    return std::nullopt;
  }
  return sz;
}

std::optional<std::string> ArchiveReaderBase::nestedArchiveName(size_t at) const {
  if (at >= nested_.size()) return std::nullopt;
  return nested_[at].path;
}

std::optional<TempFile> ArchiveReaderBase::extractNestedArchive(size_t at) {
  if (at >= nested_.size()) {
    LOGE("nested archive index out of range: " + std::to_string(at));
    return std::nullopt;
  }
  const Entry& e = nested_[at];
  if (e.uncompressedSize > limits_.maxNestedArchiveBytes) {
    LOGW("nested archive too large, skipped: " + e.path + " (" + std::to_string(e.uncompressedSize) + " bytes)");
    return std::nullopt;
  }

  Bytes data;
  std::string err;
  if (!readEntry(e, data, err)) {
    LOGE("nested archive extract failed: " + e.path + " (" + err + ")");
    return std::nullopt;
  }
  TempFile out;
  if (!writePrivateTempFile(tempDir_, baseName(e.path), data, out, err)) {
    LOGE("nested archive write failed: " + e.path + " (" + err + ")");
    return std::nullopt;
  }
  LOGD("extracted nested archive " + e.path + " -> " + out.path().string() + " (" + std::to_string(data.size()) + " bytes)");
  return std::optional<TempFile>(std::move(out));
}

std::vector<std::string> ArchiveReaderBase::allSortedEntryNames() const {
  std::vector<std::string> names;
  names.reserve(merged_.size());
  for (const auto& r : merged_)
    names.push_back(r.isImage ? images_[r.index].path : nested_[r.index].path);
  return names;
}

std::optional<size_t> ArchiveReaderBase::imageIndexForName(const std::string& name) const {
  auto it = imageByName_.find(name);
  if (it == imageByName_.end()) return std::nullopt;
  return it->second;
}

std::optional<size_t> ArchiveReaderBase::nestedArchiveIndexForName(const std::string& name) const {
  auto it = nestedByName_.find(name);
  if (it == nestedByName_.end()) return std::nullopt;
  return it->second;
}

const Bytes* ArchiveReaderBase::cached(const std::string& name) const {
  auto it = cache_.find(name);
  return it == cache_.end() ? nullptr : &it->second;
}

void ArchiveReaderBase::remember(const std::string& name, const Bytes& data) {
  if (data.size() > limits_.maxEntryCacheBytes) return;
  while (!cacheOrder_.empty() && cacheBytes_ + data.size() > limits_.maxEntryCacheBytes) {
    auto it = cache_.find(cacheOrder_.front());
    if (it != cache_.end()) {
      cacheBytes_ -= it->second.size();
      cache_.erase(it);
    }
    cacheOrder_.pop_front();
  }
  if (!cache_.emplace(name, data).second) return;
  cacheOrder_.push_back(name);
  cacheBytes_ += data.size();
}

std::unique_ptr<IArchiveReader> makeReader(ArchiveFamily family) {
  switch (family) {
    case ArchiveFamily::Zip: return makeZipReader();
    case ArchiveFamily::Rar: return makeRarReader();
    case ArchiveFamily::SevenZip: return makeSevenZipReader();
  }
  return nullptr;
}

} // namespace panes
