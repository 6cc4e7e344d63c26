// src/core/composite_source.cpp
#include "core/composite_source.hpp"
#include "log.h"
#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

namespace panes {

const char* toString(SegmentKind k) {
  switch (k) {
    case SegmentKind::Parent: return "parent";
    case SegmentKind::Nested: return "nested";
    case SegmentKind::Directory: return "directory";
  }
  return "?";
}

CompositeImageSource::CompositeImageSource(fs::path archivePath, uint64_t hashBytes)
  : archivePath_(std::move(archivePath)), hashBytes_(hashBytes) {}

bool CompositeImageSource::addSegment(std::unique_ptr<ImageSource> source, std::string name,
                                      SegmentKind kind, TempFile temp) {
  if (frozen_) {
    LOGE("segment added after freeze: " + name);
    return false;
  }
  if (!source || source->imageCount() == 0) {
    LOGD("empty segment dropped: " + name);
    return true;
  }

  Segment seg;
  seg.temp = std::move(temp);
  seg.source = std::move(source);
  seg.name = std::move(name);
  seg.kind = kind;
  seg.start = total_;
  seg.count = seg.source->imageCount();

  total_ += seg.count;
  starts_.push_back(seg.start);
  segments_.push_back(std::move(seg));
  return true;
}

void CompositeImageSource::markPasswordRequired(const std::string& archiveName) {
  passwordRequired_.push_back(archiveName);
}

const Segment* CompositeImageSource::locate(size_t at, size_t& local) const {
  if (at >= total_) {
    LOGW("global index out of range: " + std::to_string(at) + " (total " + std::to_string(total_) + ")");
    return nullptr;
  }
  // last segment starting at or before `at`
  auto it = std::upper_bound(starts_.begin(), starts_.end(), at);
  const Segment& seg = segments_[static_cast<size_t>(it - starts_.begin()) - 1];
  local = at - seg.start;
  return &seg;
}

std::string CompositeImageSource::sourceName() const {
  return archivePath_.filename().string();
}

std::optional<Bitmap> CompositeImageSource::loadImage(size_t at) {
  size_t local = 0;
  const Segment* seg = locate(at, local);
  if (!seg) return std::nullopt;
  return seg->source->loadImage(local);
}

std::optional<std::string> CompositeImageSource::fileName(size_t at) const {
  size_t local = 0;
  const Segment* seg = locate(at, local);
  if (!seg) return std::nullopt;
  auto name = seg->source->fileName(local);
  if (!name) return std::nullopt;
  if (seg->kind == SegmentKind::Nested) return seg->name + "/" + *name;
  return name;
}

std::optional<PixelSize> CompositeImageSource::imageSize(size_t at) {
  size_t local = 0;
  const Segment* seg = locate(at, local);
  if (!seg) return std::nullopt;
  return seg->source->imageSize(local);
}

std::optional<uint64_t> CompositeImageSource::fileSize(size_t at) const {
  size_t local = 0;
  const Segment* seg = locate(at, local);
  if (!seg) return std::nullopt;
  return seg->source->fileSize(local);
}

std::optional<std::string> CompositeImageSource::imageFormat(size_t at) const {
  size_t local = 0;
  const Segment* seg = locate(at, local);
  if (!seg) return std::nullopt;
  return seg->source->imageFormat(local);
}

std::optional<TimePoint> CompositeImageSource::fileDate(size_t at) const {
  size_t local = 0;
  const Segment* seg = locate(at, local);
  if (!seg) return std::nullopt;
  return seg->source->fileDate(local);
}

std::optional<std::string> CompositeImageSource::imageRelativePath(size_t at) const {
  size_t local = 0;
  const Segment* seg = locate(at, local);
  if (!seg) return std::nullopt;
  auto rel = seg->source->imageRelativePath(local);
  if (seg->kind != SegmentKind::Nested) return rel;
  if (!rel) return seg->name;
  return seg->name + "/" + *rel;
}

std::optional<std::string> CompositeImageSource::generateFileKey() {
  if (!fileKey_) fileKey_ = fileContentKey(archivePath_, hashBytes_);
  return fileKey_;
}

std::optional<std::string> CompositeImageSource::generateImageFileKey(size_t at) {
  size_t local = 0;
  const Segment* seg = locate(at, local);
  if (!seg) return std::nullopt;
  return seg->source->generateImageFileKey(local);
}

std::string CompositeImageSource::describeSegments() const {
  std::ostringstream os;
  for (size_t i = 0; i < segments_.size(); ++i) {
    const Segment& s = segments_[i];
    os << "[" << i << "] '" << (s.name.empty() ? std::string("(parent)") : s.name) << "' "
       << toString(s.kind) << " " << s.start << ".." << (s.start + s.count - 1)
       << " (" << s.count << " images)";
    if (!s.temp.empty()) os << " temp=" << s.temp.path().filename().string();
    os << "\n";
  }
  return os.str();
}

} // namespace panes
