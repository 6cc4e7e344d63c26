// src/core/image_source.cpp
#include "core/image_source.hpp"
#include "core/entry_classifier.hpp"
#include "core/image_header.hpp"
#include "readers/IArchiveReader.hpp"
#include "hash_sha256.h"
#include "log.h"
#include <system_error>

namespace fs = std::filesystem;

namespace panes {

std::optional<std::string> fileContentKey(const fs::path& path, uint64_t hashBytes) {
  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  if (ec) {
    LOGW("cannot stat " + path.string() + ": " + ec.message());
    return std::nullopt;
  }
  const std::string hex = sha256_file(path, hashBytes);
  if (hex.empty()) return std::nullopt;
  return identityKey(static_cast<uint64_t>(size), hex);
}

// ---- ArchiveImageSource ----

ArchiveImageSource::ArchiveImageSource(std::shared_ptr<IArchiveReader> reader, const OpenOptions& opts)
  : reader_(std::move(reader)),
    decoder_(opts.decoder ? opts.decoder : defaultDecoder()),
    hashBytes_(opts.limits.standaloneHashBytes) {}

std::string ArchiveImageSource::sourceName() const {
  return reader_->path().filename().string();
}

size_t ArchiveImageSource::imageCount() const { return reader_->imageCount(); }

std::optional<fs::path> ArchiveImageSource::sourceUrl() const { return reader_->path(); }

std::optional<Bitmap> ArchiveImageSource::loadImage(size_t at) {
  auto data = reader_->imageData(at);
  if (!data) return std::nullopt;
  Bitmap bmp;
  if (!makeBitmap(*decoder_, std::move(*data), reader_->imageFormatLabel(at).value_or(""), bmp)) {
    LOGW("undecodable image: " + reader_->imageName(at).value_or("?"));
    return std::nullopt;
  }
  return bmp;
}

std::optional<std::string> ArchiveImageSource::fileName(size_t at) const {
  return reader_->imageName(at);
}

std::optional<PixelSize> ArchiveImageSource::imageSize(size_t at) {
  return reader_->imageDimensions(at);
}

std::optional<uint64_t> ArchiveImageSource::fileSize(size_t at) const {
  return reader_->imageByteSize(at);
}

std::optional<std::string> ArchiveImageSource::imageFormat(size_t at) const {
  return reader_->imageFormatLabel(at);
}

std::optional<TimePoint> ArchiveImageSource::fileDate(size_t at) const {
  return reader_->imageModifiedAt(at);
}

std::optional<std::string> ArchiveImageSource::imageRelativePath(size_t at) const {
  return reader_->imageName(at);
}

std::optional<std::string> ArchiveImageSource::generateFileKey() {
  if (!fileKey_) fileKey_ = fileContentKey(reader_->path(), hashBytes_);
  return fileKey_;
}

std::optional<std::string> ArchiveImageSource::generateImageFileKey(size_t at) {
  auto it = imageKeys_.find(at);
  if (it != imageKeys_.end()) return it->second;

  auto data = reader_->imageData(at);
  if (!data) return std::nullopt;
  std::string key = identityKey(data->size(), sha256_bytes(*data));
  imageKeys_.emplace(at, key);
  return key;
}

// ---- PartialImageSource ----

PartialImageSource::PartialImageSource(std::shared_ptr<ImageSource> base, std::vector<size_t> indices)
  : base_(std::move(base)), indices_(std::move(indices)) {}

std::optional<size_t> PartialImageSource::baseIndex(size_t at) const {
  if (at >= indices_.size()) return std::nullopt;
  return indices_[at];
}

std::optional<Bitmap> PartialImageSource::loadImage(size_t at) {
  auto i = baseIndex(at);
  if (!i) return std::nullopt;
  return base_->loadImage(*i);
}

std::optional<std::string> PartialImageSource::fileName(size_t at) const {
  auto i = baseIndex(at);
  if (!i) return std::nullopt;
  return base_->fileName(*i);
}

std::optional<PixelSize> PartialImageSource::imageSize(size_t at) {
  auto i = baseIndex(at);
  if (!i) return std::nullopt;
  return base_->imageSize(*i);
}

std::optional<uint64_t> PartialImageSource::fileSize(size_t at) const {
  auto i = baseIndex(at);
  if (!i) return std::nullopt;
  return base_->fileSize(*i);
}

std::optional<std::string> PartialImageSource::imageFormat(size_t at) const {
  auto i = baseIndex(at);
  if (!i) return std::nullopt;
  return base_->imageFormat(*i);
}

std::optional<TimePoint> PartialImageSource::fileDate(size_t at) const {
  auto i = baseIndex(at);
  if (!i) return std::nullopt;
  return base_->fileDate(*i);
}

std::optional<std::string> PartialImageSource::imageRelativePath(size_t at) const {
  auto i = baseIndex(at);
  if (!i) return std::nullopt;
  return base_->imageRelativePath(*i);
}

std::optional<std::string> PartialImageSource::generateImageFileKey(size_t at) {
  auto i = baseIndex(at);
  if (!i) return std::nullopt;
  return base_->generateImageFileKey(*i);
}

} // namespace panes
