#pragma once
#include "core/image_source.hpp"

namespace panes {

// Loose image files or a directory tree, natural order by full path.
//
// Identity: a single standalone file is keyed by content (rename-tolerant);
// a folder is keyed by inode + device (content may change, location may not).
class FileSystemSource : public ImageSource {
public:
  explicit FileSystemSource(const OpenOptions& opts);

  // Collects images from `inputs` (files and/or directories, searched
  // recursively, hidden entries skipped). False with NoContentFound when
  // nothing displayable turns up.
  bool open(const std::vector<std::filesystem::path>& inputs, OpenError& code, std::string& err);

  std::string sourceName() const override { return name_; }
  size_t imageCount() const override { return files_.size(); }
  std::optional<std::filesystem::path> sourceUrl() const override;
  bool isStandalone() const override { return standalone_; }

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
  std::optional<Bytes> readFile(size_t at) const;

  std::shared_ptr<const BitmapDecoder> decoder_;
  uint64_t hashBytes_;
  std::vector<std::filesystem::path> files_;
  std::filesystem::path root_;   // folder input, or parent of the first file
  std::string name_;
  bool standalone_ = false;
  bool folder_ = false;
  std::optional<std::string> fileKey_;
  std::map<size_t, std::string> imageKeys_;
};

// "<device>-<inode>" of a directory; nullopt when stat fails.
std::optional<std::string> locationKey(const std::filesystem::path& dir);

} // namespace panes
