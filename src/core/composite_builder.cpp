// src/core/composite_builder.cpp
#include "core/composite_builder.hpp"
#include "core/entry_classifier.hpp"
#include "core/source_factory.hpp"
#include "log.h"
#include <algorithm>
#include <unordered_map>

namespace panes {

std::vector<std::pair<std::string, std::vector<size_t>>> groupImagesByDirectory(const IArchiveReader& reader) {
  std::vector<std::pair<std::string, std::vector<size_t>>> groups;
  std::unordered_map<std::string, size_t> slot;
  for (size_t i = 0; i < reader.imageCount(); ++i) {
    const std::string dir = directoryOf(reader.imageName(i).value_or(""));
    auto it = slot.find(dir);
    if (it == slot.end()) {
      it = slot.emplace(dir, groups.size()).first;
      groups.push_back({dir, {}});
    }
    groups[it->second].second.push_back(i);
  }
  std::stable_sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) {
    return naturalLess(a.first, b.first);
  });
  return groups;
}

static std::unique_ptr<ImageSource> buildDirectorySegments(const std::shared_ptr<IArchiveReader>& reader,
                                                           const OpenOptions& opts) {
  auto groups = groupImagesByDirectory(*reader);
  if (groups.size() <= 1) return std::make_unique<ArchiveImageSource>(reader, opts);

  auto base = std::make_shared<ArchiveImageSource>(reader, opts);
  auto composite = std::make_unique<CompositeImageSource>(reader->path(), opts.limits.standaloneHashBytes);
  for (auto& g : groups) {
    LOGD("directory segment " + g.first + " (" + std::to_string(g.second.size()) + " images)");
    composite->addSegment(std::make_unique<PartialImageSource>(base, std::move(g.second)),
                          g.first, SegmentKind::Directory);
  }
  composite->freeze();
  LOGI(reader->path().filename().string() + ": " + std::to_string(composite->imageCount()) +
       " images in " + std::to_string(composite->segmentCount()) + " directories");
  return composite;
}

static void addNestedSegment(IArchiveReader& reader, size_t at, const OpenOptions& opts,
                             CompositeImageSource& composite) {
  const std::string name = reader.nestedArchiveName(at).value_or("nested");
  auto extracted = reader.extractNestedArchive(at);
  if (!extracted) {
    LOGW(std::string(toString(OpenError::NestedArchiveOpenFailed)) + ": " + name + " (not extracted)");
    return;
  }
  TempFile temp = std::move(*extracted);

  OpenOptions child = opts;
  child.password.reset();
  child.phaseSink = nullptr;
  child.credentials.reset();
  child.rememberPassword = false;
  child.depth = opts.depth + 1;

  OpenError code = OpenError::None;
  std::string err;
  auto childReader = openArchiveReader(temp.path(), child, code, err);
  if (!childReader || code != OpenError::None) {
    if (code == OpenError::PasswordRequired || code == OpenError::WrongPassword)
      composite.markPasswordRequired(name);
    LOGW(std::string(toString(OpenError::NestedArchiveOpenFailed)) + ": " + name + " (" +
         toString(code) + (err.empty() ? "" : ": " + err) + ")");
    return;
  }

  std::unique_ptr<ImageSource> source;
  if (child.depth < child.limits.maxDepth) source = buildImageSource(childReader, child);
  else source = std::make_unique<ArchiveImageSource>(childReader, child);

  LOGD("nested segment " + name + " (" + std::to_string(source->imageCount()) + " images)");
  composite.addSegment(std::move(source), stemName(name), SegmentKind::Nested, std::move(temp));
}

std::unique_ptr<ImageSource> buildImageSource(std::shared_ptr<IArchiveReader> reader,
                                              const OpenOptions& opts) {
  if (reader->nestedArchiveCount() == 0) return buildDirectorySegments(reader, opts);

  if (opts.depth >= opts.limits.maxDepth) {
    LOGI(reader->path().filename().string() + ": nesting bound reached, " +
         std::to_string(reader->nestedArchiveCount()) + " nested archives left closed");
    return std::make_unique<ArchiveImageSource>(reader, opts);
  }

  auto base = std::make_shared<ArchiveImageSource>(reader, opts);
  auto composite = std::make_unique<CompositeImageSource>(reader->path(), opts.limits.standaloneHashBytes);
  std::vector<size_t> pending;
  auto flush = [&]() {
    if (pending.empty()) return;
    composite->addSegment(std::make_unique<PartialImageSource>(base, std::move(pending)),
                          "", SegmentKind::Parent);
    pending.clear();
  };

  for (const EntryRef& ref : reader->mergedEntries()) {
    if (ref.isImage) {
      pending.push_back(ref.index);
      continue;
    }
    flush();
    addNestedSegment(*reader, ref.index, opts, *composite);
  }
  flush();
  composite->freeze();

  LOGI(reader->path().filename().string() + ": composite of " + std::to_string(composite->imageCount()) +
       " images in " + std::to_string(composite->segmentCount()) + " segments");
  LOGD("segments:\n" + composite->describeSegments());
  return composite;
}

} // namespace panes
