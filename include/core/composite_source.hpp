#pragma once
#include "core/image_source.hpp"
#include "core/temp_file.hpp"

namespace panes {

enum class SegmentKind { Parent, Nested, Directory };

const char* toString(SegmentKind k);

// One contiguous run of the composite, backed by exactly one source.
// `temp` is declared first so the source (and any open handle on the
// file) is destroyed before the file is deleted.
struct Segment {
  TempFile temp;
  std::unique_ptr<ImageSource> source;
  std::string name;      // "" for parent runs, stem for nested, dir path for directories
  SegmentKind kind = SegmentKind::Parent;
  size_t start = 0;      // first global index
  size_t count = 0;
};

// Ordered segments flattened into one index space.
// Built by appending segments, then frozen; read-only afterwards.
// Destroying it deletes every temp file the segments own.
class CompositeImageSource : public ImageSource {
public:
  CompositeImageSource(std::filesystem::path archivePath, uint64_t hashBytes);

  // Empty sources are dropped (their temp file is deleted right away).
  // Returns false once frozen.
  bool addSegment(std::unique_ptr<ImageSource> source, std::string name,
                  SegmentKind kind, TempFile temp = TempFile());
  void freeze() { frozen_ = true; }
  bool frozen() const { return frozen_; }

  void markPasswordRequired(const std::string& archiveName);
  bool needsPassword() const { return !passwordRequired_.empty(); }
  const std::vector<std::string>& passwordRequiredArchives() const { return passwordRequired_; }

  size_t segmentCount() const { return segments_.size(); }
  const Segment& segment(size_t i) const { return segments_.at(i); }
  // One line per segment: "[i] name kind start..end (n images)".
  std::string describeSegments() const;

  std::string sourceName() const override;
  size_t imageCount() const override { return total_; }
  std::optional<std::filesystem::path> sourceUrl() const override { return archivePath_; }
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
  // Global index -> (segment, local index).
  const Segment* locate(size_t at, size_t& local) const;

  std::filesystem::path archivePath_;
  uint64_t hashBytes_;
  std::vector<Segment> segments_;
  std::vector<size_t> starts_;   // segments_[i].start, kept for binary search
  size_t total_ = 0;
  bool frozen_ = false;
  std::vector<std::string> passwordRequired_;
  std::optional<std::string> fileKey_;
};

} // namespace panes
