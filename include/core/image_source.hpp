#pragma once
#include "core/types.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace panes {

class IArchiveReader;

// What the pagination layer pages through. Indices are [0, imageCount()).
// Out-of-range lookups return nullopt. Implementations are not
// thread-safe; callers serialize access to one source.
class ImageSource {
public:
  virtual ~ImageSource() = default;

  virtual std::string sourceName() const = 0;
  virtual size_t imageCount() const = 0;
  virtual std::optional<std::filesystem::path> sourceUrl() const = 0;
  // A single loose image file (identified by content, not location).
  virtual bool isStandalone() const = 0;

  virtual std::optional<Bitmap> loadImage(size_t at) = 0;
  virtual std::optional<std::string> fileName(size_t at) const = 0;
  virtual std::optional<PixelSize> imageSize(size_t at) = 0;
  virtual std::optional<uint64_t> fileSize(size_t at) const = 0;
  virtual std::optional<std::string> imageFormat(size_t at) const = 0;
  virtual std::optional<TimePoint> fileDate(size_t at) const = 0;
  virtual std::optional<std::string> imageRelativePath(size_t at) const = 0;

  // Identity of the container / folder / standalone file.
  virtual std::optional<std::string> generateFileKey() = 0;
  // Identity of one image, from its bytes.
  virtual std::optional<std::string> generateImageFileKey(size_t at) = 0;
};

// "<size>-<hash16>" over the first `hashBytes` of a file on disk.
std::optional<std::string> fileContentKey(const std::filesystem::path& path, uint64_t hashBytes);

// Every image of one opened container reader.
class ArchiveImageSource : public ImageSource {
public:
  ArchiveImageSource(std::shared_ptr<IArchiveReader> reader, const OpenOptions& opts);

  std::string sourceName() const override;
  size_t imageCount() const override;
  std::optional<std::filesystem::path> sourceUrl() const override;
  bool isStandalone() const override { return false; }

  std::optional<Bitmap> loadImage(size_t at) override;
  std::optional<std::string> fileName(size_t at) const override;
  std::optional<PixelSize> imageSize(size_t at) override;
  std::optional<uint64_t> fileSize(size_t at) const override;
  std::optional<std::string> imageFormat(size_t at) const override;
  std::optional<TimePoint> fileDate(size_t at) const override;
  std::optional<std::string> imageRelativePath(size_t at) const override;

  std::optional<std::string> generateFileKey() override;
  std::optional<std::string> generateImageFileKey(size_t at) override;

private:
  std::shared_ptr<IArchiveReader> reader_;
  std::shared_ptr<const BitmapDecoder> decoder_;
  uint64_t hashBytes_;
  std::optional<std::string> fileKey_;
  std::map<size_t, std::string> imageKeys_;
};

// A subset of another source, addressed through `indices` (the base
// source's own indices, in display order). Several partial views may
// share one base.
class PartialImageSource : public ImageSource {
public:
  PartialImageSource(std::shared_ptr<ImageSource> base, std::vector<size_t> indices);

  std::string sourceName() const override { return base_->sourceName(); }
  size_t imageCount() const override { return indices_.size(); }
  std::optional<std::filesystem::path> sourceUrl() const override { return base_->sourceUrl(); }
  bool isStandalone() const override { return false; }

  std::optional<Bitmap> loadImage(size_t at) override;
  std::optional<std::string> fileName(size_t at) const override;
  std::optional<PixelSize> imageSize(size_t at) override;
  std::optional<uint64_t> fileSize(size_t at) const override;
  std::optional<std::string> imageFormat(size_t at) const override;
  std::optional<TimePoint> fileDate(size_t at) const override;
  std::optional<std::string> imageRelativePath(size_t at) const override;

  std::optional<std::string> generateFileKey() override { return base_->generateFileKey(); }
  std::optional<std::string> generateImageFileKey(size_t at) override;

private:
  std::optional<size_t> baseIndex(size_t at) const;

  std::shared_ptr<ImageSource> base_;
  std::vector<size_t> indices_;
};

} // namespace panes
