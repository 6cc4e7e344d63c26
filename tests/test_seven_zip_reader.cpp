// tests/test_seven_zip_reader.cpp
#include "readers/SevenZipReader.hpp"
#include "readers/LibArchiveSupport.hpp"
#include "core/temp_file.hpp"
#include "test_support.hpp"

using namespace panes;
namespace fs = std::filesystem;

static void decompressesEverythingAtOpen() {
  testfx::ScratchDir dir;
  auto arc = dir / "book.cb7";
  CHECK(testfx::write7z(arc, {{"ch1", {}, false, true},
                              {"ch1/p10.jpg", testfx::jpegBytes(30, 40, 10)},
                              {"ch1/p9.jpg", testfx::jpegBytes(30, 40, 9)},
                              {".DS_Store", testfx::textBytes("junk")},
                              {"cover.png", testfx::pngBytes(5, 7)}}));

  std::vector<std::string> phases;
  OpenOptions o;
  o.tempDir = dir.path;
  o.phaseSink = [&](const std::string& p) { phases.push_back(p); };

  SevenZipReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(arc, o, code, err));
  CHECK(code == OpenError::None);
  CHECK(r.family() == ArchiveFamily::SevenZip);
  CHECK_EQ(r.imageCount(), 3u);
  CHECK_EQ(*r.imageName(0), std::string("ch1/p9.jpg"));
  CHECK_EQ(*r.imageName(1), std::string("ch1/p10.jpg"));
  CHECK_EQ(*r.imageName(2), std::string("cover.png"));
  CHECK(*r.imageData(0) == testfx::jpegBytes(30, 40, 9));
  CHECK_EQ(*r.imageFormatLabel(1), std::string("JPEG"));
  CHECK(r.imageModifiedAt(2).has_value());

  auto dim = r.imageDimensions(2);
  CHECK(dim.has_value());
  CHECK_EQ(dim->width, 5u);
  CHECK_EQ(dim->height, 7u);

  std::vector<std::string> want = {phase::kOpening, phase::kBuildingList, phase::kExtracting};
  CHECK(phases == want);
}

static void extractsNestedFromMemory() {
  testfx::ScratchDir dir;
  auto innerPath = dir / "inner.cbz";
  CHECK(testfx::writeZip(innerPath, {{"x.png", testfx::pngBytes(1, 1)}}));
  auto inner = testfx::readAll(innerPath);

  auto arc = dir / "outer.7z";
  CHECK(testfx::write7z(arc, {{"a.png", testfx::pngBytes(2, 2)}, {"inner.cbz", inner}}));

  OpenOptions o;
  o.tempDir = dir.path;
  SevenZipReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(arc, o, code, err));
  CHECK_EQ(r.nestedArchiveCount(), 1u);
  auto tmp = r.extractNestedArchive(0);
  CHECK(tmp.has_value());
  CHECK(testfx::readAll(tmp->path()) == inner);
}

static void emptyArchiveHasNoContent() {
  testfx::ScratchDir dir;
  auto arc = dir / "docs.7z";
  CHECK(testfx::write7z(arc, {{"a.txt", testfx::textBytes("a")}}));
  OpenOptions o;
  SevenZipReader r;
  OpenError code;
  std::string err;
  CHECK(!r.open(arc, o, code, err));
  CHECK(code == OpenError::NoContentFound);
}

static void garbageCannotOpen() {
  testfx::ScratchDir dir;
  auto arc = dir / "bad.7z";
  CHECK(testfx::writeFile(arc, testfx::textBytes("definitely not 7z")));
  OpenOptions o;
  SevenZipReader r;
  OpenError code;
  std::string err;
  CHECK(!r.open(arc, o, code, err));
  CHECK(code == OpenError::CannotOpen);
  CHECK(!err.empty());
}

static void damagedMemberIsDropped() {
  OpenOptions o;
  SevenZipReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(testfx::fixture("damaged-member.cb7"), o, code, err));
  CHECK(code == OpenError::None);
  CHECK_EQ(r.imageCount(), 1u);
  CHECK_EQ(*r.imageName(0), std::string("p2.png"));
  CHECK(*r.imageData(0) == testfx::pngBytes(6, 6, 2));
  CHECK_EQ(r.skippedEntries().size(), 1u);
  CHECK_EQ(r.skippedEntries().front(), std::string("p1.png"));
  CHECK(!r.imageIndexForName("p1.png").has_value());
}

static void duplicatePathsKeepTheirOwnData() {
  OpenOptions o;
  SevenZipReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(testfx::fixture("duplicate-names.cb7"), o, code, err));
  CHECK_EQ(r.imageCount(), 3u);
  CHECK_EQ(*r.imageName(0), std::string("p1.png"));
  CHECK_EQ(*r.imageName(1), std::string("p1.png"));
  // equal names keep archive order
  CHECK(*r.imageData(0) == testfx::pngBytes(3, 3, 1));
  CHECK(*r.imageData(1) == testfx::pngBytes(3, 3, 2));
  CHECK(*r.imageData(2) == testfx::pngBytes(3, 3, 3));
}

static void unknownCodecIsUnsupported() {
  OpenOptions o;
  SevenZipReader r;
  OpenError code;
  std::string err;
  CHECK(!r.open(testfx::fixture("unknown-codec.cb7"), o, code, err));
  CHECK(code == OpenError::UnsupportedCompression);
  CHECK(!err.empty());
  CHECK_EQ(r.imageCount(), 0u);
  CHECK(!r.needsPassword());
}

static void libarchiveMessagesClassified() {
  CHECK(mentionsEncryption("Encryption is not supported"));
  CHECK(mentionsEncryption("Incorrect passphrase"));
  CHECK(mentionsEncryption("Passphrase required for this entry"));
  CHECK(!mentionsEncryption("Unrecognized archive format"));
  CHECK(!mentionsEncryption("Unknown codec ID: a0b0c"));
}

int main() {
  RUN(decompressesEverythingAtOpen);
  RUN(extractsNestedFromMemory);
  RUN(emptyArchiveHasNoContent);
  RUN(garbageCannotOpen);
  RUN(damagedMemberIsDropped);
  RUN(duplicatePathsKeepTheirOwnData);
  RUN(unknownCodecIsUnsupported);
  RUN(libarchiveMessagesClassified);
  return finish();
}
