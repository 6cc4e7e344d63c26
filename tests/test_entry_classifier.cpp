// tests/test_entry_classifier.cpp
#include "core/entry_classifier.hpp"
#include "routing/router.hpp"
#include "test_support.hpp"

using namespace panes;

static void classifiesByExtension() {
  CHECK(classifyEntry("page01.JPG") == EntryKind::Image);
  CHECK(classifyEntry("a/b/c.webp") == EntryKind::Image);
  CHECK(classifyEntry("scan.j2k") == EntryKind::Image);
  CHECK(classifyEntry("bonus.CBZ") == EntryKind::NestedArchive);
  CHECK(classifyEntry("vol2.cb7") == EntryKind::NestedArchive);
  CHECK(classifyEntry("extra.rar") == EntryKind::NestedArchive);
  CHECK(classifyEntry("readme.txt") == EntryKind::Ignored);
  CHECK(classifyEntry("cover.bmp") == EntryKind::Ignored);
  CHECK(classifyEntry("noext") == EntryKind::Ignored);
  CHECK(classifyEntry("dir/") == EntryKind::Ignored);
  CHECK(classifyEntry("dir.png", true) == EntryKind::Ignored);
}

static void dropsPlatformNoise() {
  CHECK(classifyEntry("__MACOSX/ch1/p1.jpg") == EntryKind::Ignored);
  CHECK(classifyEntry("ch1/._p1.jpg") == EntryKind::Ignored);
  CHECK(classifyEntry("._cover.png") == EntryKind::Ignored);
  CHECK(classifyEntry(".hidden.png") == EntryKind::Ignored);
  CHECK(classifyEntry("ch1/p1.jpg") == EntryKind::Image);
  CHECK(classifyEntry(".hidden/p1.jpg") == EntryKind::Ignored);
  CHECK(classifyEntry("ch1/.thumbs/p1.jpg") == EntryKind::Ignored);
  CHECK(classifyEntry("ch1\\.thumbs\\p1.jpg") == EntryKind::Ignored);
  CHECK(classifyEntry("ch1/__MACOSX/p1.jpg") == EntryKind::Ignored);
  CHECK(classifyEntry("ch1.5/p1.jpg") == EntryKind::Image);
  CHECK(classifyEntry("my__MACOSX_scans/p1.jpg") == EntryKind::Image);
}

static void pathHelpers() {
  CHECK_EQ(extensionLower("A/B.TaR.Gz"), std::string("gz"));
  CHECK_EQ(extensionLower(".png"), std::string(""));
  CHECK_EQ(baseName("a/b/c.png"), std::string("c.png"));
  CHECK_EQ(baseName("a\\b\\c.png"), std::string("c.png"));
  CHECK_EQ(stemName("x/extra.rar"), std::string("extra"));
  CHECK_EQ(directoryOf("ch1/p1.jpg"), std::string("ch1"));
  CHECK_EQ(directoryOf("a/b/p1.jpg"), std::string("a/b"));
  CHECK_EQ(directoryOf("p1.jpg"), std::string("/"));
}

static void formatLabels() {
  CHECK_EQ(formatLabel("a.jpeg"), std::string("JPEG"));
  CHECK_EQ(formatLabel("a.WEBP"), std::string("WebP"));
  CHECK_EQ(formatLabel("a.tif"), std::string("TIFF"));
  CHECK_EQ(formatLabel("a.heif"), std::string("HEIC"));
  CHECK_EQ(formatLabel("a.jp2"), std::string("JPEG 2000"));
  CHECK_EQ(formatLabel("a.xyz"), std::string("XYZ"));
}

static void naturalOrdering() {
  CHECK(naturalLess("page2", "page10"));
  CHECK(!naturalLess("page10", "page2"));
  CHECK(naturalLess("Page1", "page2"));
  CHECK(naturalLess("ch1/p9.jpg", "ch1/p10.jpg"));
  CHECK(naturalLess("ch1/p1.jpg", "ch1_extra.zip"));
  CHECK(naturalLess("ch1_extra.zip", "ch2/p1.jpg"));
  CHECK_EQ(naturalCompare("a01", "a1") < 0, false);
  CHECK_EQ(naturalCompare("same", "same"), 0);
  // separators rank first, other punctuation by byte value
  CHECK(naturalLess("ch1/p1.jpg", "ch1-extra.zip"));
  CHECK(naturalLess("ch1/p1.jpg", "ch1 extra.zip"));
  CHECK(naturalLess("ch1/p1.jpg", "ch1.5/p1.jpg"));
  CHECK(naturalLess("ch1\\p1.jpg", "ch1-extra.zip"));
  CHECK(naturalLess("ch1-extra.zip", "ch1_extra.zip"));

  std::vector<std::string> v = {"p10.png", "p2.png", "P1.png", "p1.png", "p02.png"};
  naturalSort(v);
  // equal keys keep their incoming order: "P1" came before "p1"
  std::vector<std::string> want = {"P1.png", "p1.png", "p2.png", "p02.png", "p10.png"};
  CHECK(v == want);
}

static void routesByExtension() {
  CHECK(routeToHandler("book.CBZ").kind == SourceKind::Zip);
  CHECK(routeToHandler("book.cbr").kind == SourceKind::Rar);
  CHECK(routeToHandler("book.7z").kind == SourceKind::SevenZip);
  CHECK(routeToHandler("pic.png").kind == SourceKind::FileSystem);
  CHECK_EQ(routeToHandler("book.zip").reason, std::string("ext"));

  testfx::ScratchDir dir;
  RoutingDecision rd = routeToHandler(dir.path);
  CHECK(rd.kind == SourceKind::FileSystem);
  CHECK_EQ(rd.reason, std::string("dir"));

  CHECK(familyFromExtension("cb7") == ArchiveFamily::SevenZip);
  CHECK(!familyFromExtension("pdf"));
}

int main() {
  RUN(classifiesByExtension);
  RUN(dropsPlatformNoise);
  RUN(pathHelpers);
  RUN(formatLabels);
  RUN(naturalOrdering);
  RUN(routesByExtension);
  return finish();
}
