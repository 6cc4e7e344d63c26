// tests/test_cover_loader.cpp
#include "core/cover_loader.hpp"
#include "test_support.hpp"

using namespace panes;
namespace fs = std::filesystem;

static fs::path book(const testfx::ScratchDir& dir) {
  auto zip = dir / "book.cbz";
  CHECK(testfx::writeZip(zip, {{"p10.png", testfx::pngBytes(30, 40, 10)},
                               {"p2.png", testfx::pngBytes(20, 25, 2)},
                               {"notes.txt", testfx::textBytes("n")}}));
  return zip;
}

static void coverIsFirstImageInDisplayOrder() {
  testfx::ScratchDir dir;
  CoverResult res = loadCoverImage(book(dir), OpenOptions{});
  CHECK(res.error == OpenError::None);
  CHECK(res.image.has_value());
  CHECK(res.imageCount.has_value());
  CHECK_EQ(*res.imageCount, 2u);
  if (!res.image) return;
  CHECK(res.image->bytes == testfx::pngBytes(20, 25, 2));
  CHECK_EQ(res.image->size.width, 20u);
  CHECK_EQ(res.image->size.height, 25u);
  CHECK_EQ(res.image->format, std::string("PNG"));
}

static void coverIndexPicksAnotherPage() {
  testfx::ScratchDir dir;
  CoverResult second = loadCoverImage(book(dir), OpenOptions{}, 1);
  CHECK(second.image.has_value());
  if (second.image) CHECK_EQ(second.image->size.width, 30u);

  CoverResult past = loadCoverImage(book(dir), OpenOptions{}, 5);
  CHECK(!past.image.has_value());
  CHECK_EQ(*past.imageCount, 2u);
}

static void folderCover() {
  testfx::ScratchDir dir;
  CHECK(testfx::writeFile(dir / "shelf/b.png", testfx::pngBytes(2, 2, 2)));
  CHECK(testfx::writeFile(dir / "shelf/a.png", testfx::pngBytes(1, 1, 1)));
  CoverResult res = loadCoverImage(dir / "shelf", OpenOptions{});
  CHECK(res.image.has_value());
  CHECK_EQ(*res.imageCount, 2u);
  if (res.image) CHECK(res.image->bytes == testfx::pngBytes(1, 1, 1));
}

static void lockedContainerReportsPassword() {
  testfx::ScratchDir dir;
  auto zip = dir / "locked.cbz";
  CHECK(testfx::writeZip(zip, {{"p1.png", testfx::pngBytes(5, 5, 1), true},
                               {"p2.png", testfx::pngBytes(5, 5, 2), true}}, "secret"));

  CoverResult locked = loadCoverImage(zip, OpenOptions{});
  CHECK(locked.needsPassword);
  CHECK(!locked.wrongPassword);
  CHECK(!locked.image.has_value());
  CHECK(!locked.imageCount.has_value());

  OpenOptions wrong;
  wrong.password = std::string("nope");
  CoverResult rejected = loadCoverImage(zip, wrong);
  CHECK(rejected.needsPassword);
  CHECK(rejected.wrongPassword);

  OpenOptions right;
  right.password = std::string("secret");
  CoverResult res = loadCoverImage(zip, right);
  CHECK(!res.needsPassword);
  CHECK(res.image.has_value());
  if (res.image) CHECK(res.image->bytes == testfx::pngBytes(5, 5, 1));
}

static void archivedImageByName() {
  testfx::ScratchDir dir;
  auto zip = book(dir);
  CoverResult res = loadArchivedImage(zip, "p10.png", OpenOptions{});
  CHECK(res.image.has_value());
  if (res.image) CHECK(res.image->bytes == testfx::pngBytes(30, 40, 10));

  CoverResult missing = loadArchivedImage(zip, "p11.png", OpenOptions{});
  CHECK(!missing.image.has_value());
  CHECK_EQ(*missing.imageCount, 2u);
  CHECK(missing.error == OpenError::None);
}

static void missingPathCannotOpen() {
  testfx::ScratchDir dir;
  CoverResult res = loadCoverImage(dir / "gone.cbz", OpenOptions{});
  CHECK(!res.image.has_value());
  CHECK(!res.imageCount.has_value());
  CHECK(res.error == OpenError::CannotOpen);
}

static void cacheKeepsNewestCovers() {
  testfx::ScratchDir dir;
  std::vector<fs::path> zips;
  for (int i = 0; i < 3; ++i) {
    auto zip = dir / ("v" + std::to_string(i) + ".cbz");
    CHECK(testfx::writeZip(zip, {{"p1.png", testfx::pngBytes(4, 4, uint8_t(i))}}));
    zips.push_back(zip);
  }

  CoverCache cache(2);
  for (int i = 0; i < 3; ++i)
    CHECK(cache.loadCover("v" + std::to_string(i), zips[i], OpenOptions{}).has_value());
  CHECK_EQ(cache.size(), 2u);
  CHECK(!cache.cover("v0").has_value());
  CHECK(cache.cover("v2").has_value());
  // counts outlive evicted bitmaps
  CHECK(cache.imageCount("v0").has_value());
  CHECK_EQ(*cache.imageCount("v0"), 1u);

  // a hit never reopens the file
  std::error_code ec;
  fs::remove(zips[2], ec);
  auto hit = cache.loadCover("v2", zips[2], OpenOptions{});
  CHECK(hit.has_value());
  if (hit) CHECK(hit->bytes == testfx::pngBytes(4, 4, 2));
}

int main() {
  RUN(coverIsFirstImageInDisplayOrder);
  RUN(coverIndexPicksAnotherPage);
  RUN(folderCover);
  RUN(lockedContainerReportsPassword);
  RUN(archivedImageByName);
  RUN(missingPathCannotOpen);
  RUN(cacheKeepsNewestCovers);
  return finish();
}
