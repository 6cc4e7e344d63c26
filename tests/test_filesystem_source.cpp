// tests/test_filesystem_source.cpp
#include "core/filesystem_source.hpp"
#include "core/source_factory.hpp"
#include "test_support.hpp"

using namespace panes;
namespace fs = std::filesystem;

static void walksFolderInNaturalOrder() {
  testfx::ScratchDir dir;
  auto root = dir / "album";
  CHECK(testfx::writeFile(root / "p10.png", testfx::pngBytes(6, 6, 10)));
  CHECK(testfx::writeFile(root / "p2.png", testfx::pngBytes(6, 6, 2)));
  CHECK(testfx::writeFile(root / "sub" / "p1.jpg", testfx::jpegBytes(8, 9)));
  CHECK(testfx::writeFile(root / ".hidden" / "p0.png", testfx::pngBytes(1, 1)));
  CHECK(testfx::writeFile(root / ".p0.png", testfx::pngBytes(1, 1)));
  CHECK(testfx::writeFile(root / "notes.txt", testfx::textBytes("x")));

  OpenResult res = openImageSource(root, OpenOptions{});
  CHECK(res.ok());
  if (!res.ok()) return;
  auto& src = *res.source;
  CHECK(!src.isStandalone());
  CHECK_EQ(src.sourceName(), std::string("album"));
  CHECK_EQ(src.imageCount(), 3u);
  CHECK_EQ(*src.fileName(0), std::string("p2.png"));
  CHECK_EQ(*src.fileName(1), std::string("p10.png"));
  CHECK_EQ(*src.fileName(2), std::string("p1.jpg"));
  CHECK_EQ(*src.imageRelativePath(2), std::string("sub/p1.jpg"));
  CHECK_EQ(*src.imageFormat(2), std::string("JPEG"));
  CHECK_EQ(*src.fileSize(0), testfx::pngBytes(6, 6, 2).size());
  CHECK(src.fileDate(0).has_value());
  CHECK(*src.sourceUrl() == root);

  auto sz = src.imageSize(2);
  CHECK(sz.has_value());
  CHECK_EQ(sz->width, 8u);
  auto bmp = src.loadImage(1);
  CHECK(bmp.has_value());
  CHECK(!src.loadImage(3));
  CHECK(!src.fileName(3));
}

static void folderKeyFollowsLocation() {
  testfx::ScratchDir dir;
  auto root = dir / "f";
  CHECK(testfx::writeFile(root / "a.png", testfx::pngBytes(1, 1)));
  OpenResult a = openImageSource(root, OpenOptions{});
  CHECK(a.ok());
  if (!a.ok()) return;
  auto key = a.source->generateFileKey();
  CHECK(key.has_value());
  CHECK(key == locationKey(root));

  // contents change, the key does not
  CHECK(testfx::writeFile(root / "b.png", testfx::pngBytes(2, 2)));
  OpenResult b = openImageSource(root, OpenOptions{});
  CHECK(b.ok());
  if (b.ok()) CHECK(b.source->generateFileKey() == key);
}

static void standaloneKeySurvivesRename() {
  testfx::ScratchDir dir;
  auto one = dir / "photo.png";
  auto two = dir / "renamed.png";
  CHECK(testfx::writeFile(one, testfx::pngBytes(50, 60, 1)));
  CHECK(testfx::writeFile(two, testfx::pngBytes(50, 60, 1)));

  OpenResult a = openImageSource(one, OpenOptions{});
  OpenResult b = openImageSource(two, OpenOptions{});
  CHECK(a.ok() && b.ok());
  if (!a.ok() || !b.ok()) return;
  CHECK(a.source->isStandalone());
  CHECK_EQ(a.source->imageCount(), 1u);
  auto ka = a.source->generateFileKey();
  CHECK(ka.has_value());
  CHECK(ka == a.source->generateFileKey());
  CHECK(ka == b.source->generateFileKey());
  CHECK(a.source->generateImageFileKey(0) == ka);
}

static void standaloneKeyHashesOnlyTheHead() {
  testfx::ScratchDir dir;
  panes::Bytes big = testfx::pngBytes(9, 9);
  big.resize(64 * 1024, 0x11);
  panes::Bytes tail = big;
  tail.back() = 0x22;
  CHECK(testfx::writeFile(dir / "x.png", big));
  CHECK(testfx::writeFile(dir / "y.png", tail));
  // same size and same first 32 KiB
  CHECK(fileContentKey(dir / "x.png", 32 * 1024) == fileContentKey(dir / "y.png", 32 * 1024));
  CHECK(fileContentKey(dir / "x.png", 0) != fileContentKey(dir / "y.png", 0));
}

static void looseFilesTogether() {
  testfx::ScratchDir dir;
  CHECK(testfx::writeFile(dir / "set" / "b.png", testfx::pngBytes(1, 1, 2)));
  CHECK(testfx::writeFile(dir / "set" / "a.png", testfx::pngBytes(1, 1, 1)));
  CHECK(testfx::writeFile(dir / "set" / "c.txt", testfx::textBytes("no")));
  OpenResult res = openImageSource(std::vector<fs::path>{dir / "set" / "b.png", dir / "set" / "a.png",
                                                          dir / "set" / "c.txt"}, OpenOptions{});
  CHECK(res.ok());
  if (!res.ok()) return;
  CHECK(!res.source->isStandalone());
  CHECK_EQ(res.source->imageCount(), 2u);
  CHECK_EQ(*res.source->fileName(0), std::string("a.png"));
  CHECK_EQ(res.source->sourceName(), std::string("set"));
}

static void emptyFolderHasNoContent() {
  testfx::ScratchDir dir;
  fs::create_directories(dir / "empty");
  OpenResult res = openImageSource(dir / "empty", OpenOptions{});
  CHECK(!res.ok());
  CHECK(res.error == OpenError::NoContentFound);
}

int main() {
  RUN(walksFolderInNaturalOrder);
  RUN(folderKeyFollowsLocation);
  RUN(standaloneKeySurvivesRename);
  RUN(standaloneKeyHashesOnlyTheHead);
  RUN(looseFilesTogether);
  RUN(emptyFolderHasNoContent);
  return finish();
}
