// tests/test_rar_reader.cpp
// Fixtures are stored RAR5 archives from tests/fixtures; the encrypted
// ones use the password "secret".
#include "readers/RarReader.hpp"
#include "readers/ZipReader.hpp"
#include "core/source_factory.hpp"
#include "routing/router.hpp"
#include "test_support.hpp"

using namespace panes;

static void routesRarFamily() {
  CHECK(routeToHandler("vol.rar").kind == SourceKind::Rar);
  CHECK(routeToHandler("vol.CBR").kind == SourceKind::Rar);
  auto r = makeReader(ArchiveFamily::Rar);
  CHECK(r != nullptr);
  CHECK(r->family() == ArchiveFamily::Rar);
}

static void listsPlainArchiveInNaturalOrder() {
  std::vector<std::string> phases;
  OpenOptions o;
  o.phaseSink = [&](const std::string& p) { phases.push_back(p); };

  RarReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(testfx::fixture("plain.cbr"), o, code, err));
  CHECK(code == OpenError::None);
  CHECK(!r.needsPassword());
  CHECK(!r.hasEncryptedEntries());

  // notes.txt and the dot directory are filtered out
  CHECK_EQ(r.imageCount(), 2u);
  CHECK_EQ(*r.imageName(0), std::string("p2.png"));
  CHECK_EQ(*r.imageName(1), std::string("p10.png"));
  CHECK_EQ(r.nestedArchiveCount(), 1u);
  CHECK_EQ(*r.nestedArchiveName(0), std::string("inner.zip"));

  std::vector<std::string> want = {"inner.zip", "p2.png", "p10.png"};
  CHECK(r.allSortedEntryNames() == want);

  auto data = r.imageData(0);
  CHECK(data.has_value());
  CHECK(*data == testfx::pngBytes(2, 2, 2));
  auto dim = r.imageDimensions(1);
  CHECK(dim.has_value());
  CHECK_EQ(dim->width, 10u);
  CHECK_EQ(dim->height, 10u);
  CHECK(r.imageModifiedAt(0).has_value());
  CHECK(!r.imageData(2).has_value());

  std::vector<std::string> wantPhases = {phase::kOpening, phase::kBuildingList};
  CHECK(phases == wantPhases);
}

static void extractsNestedArchive() {
  testfx::ScratchDir dir;
  OpenOptions o;
  o.tempDir = dir.path;
  RarReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(testfx::fixture("plain.cbr"), o, code, err));

  auto tmp = r.extractNestedArchive(0);
  CHECK(tmp.has_value());
  if (!tmp) return;
  CHECK(testfx::readAll(tmp->path()) == testfx::readAll(testfx::fixture("inner.zip")));

  ZipReader inner;
  CHECK(inner.open(tmp->path(), OpenOptions{}, code, err));
  CHECK_EQ(inner.imageCount(), 1u);
  CHECK_EQ(*inner.imageName(0), std::string("x.png"));
}

static void encryptedNeedsPassword() {
  RarReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(testfx::fixture("encrypted.cbr"), OpenOptions{}, code, err));
  CHECK(code == OpenError::None);
  CHECK(r.needsPassword());
  CHECK(!r.wrongPassword());
  CHECK(r.hasEncryptedEntries());
  CHECK_EQ(r.imageCount(), 0u);

  OpenResult res = openImageSource(testfx::fixture("encrypted.cbr"), OpenOptions{});
  CHECK(!res.ok());
  CHECK(res.needsPassword);
  CHECK(!res.wrongPassword);
  CHECK(res.error == OpenError::PasswordRequired);
}

static void encryptedOpensWithPassword() {
  OpenOptions o;
  o.password = "secret";
  RarReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(testfx::fixture("encrypted.cbr"), o, code, err));
  CHECK(!r.needsPassword());
  CHECK(r.hasEncryptedEntries());
  CHECK_EQ(r.imageCount(), 2u);
  auto first = r.imageData(0);
  CHECK(first.has_value());
  CHECK(*first == testfx::pngBytes(8, 9, 1));
  auto second = r.imageData(1);
  CHECK(second.has_value());
  CHECK(*second == testfx::pngBytes(8, 9, 2));
}

static void encryptedRejectsWrongPassword() {
  OpenOptions o;
  o.password = "not-it";
  RarReader r;
  OpenError code;
  std::string err;
  CHECK(r.open(testfx::fixture("encrypted.cbr"), o, code, err));
  CHECK(r.needsPassword());
  CHECK(r.wrongPassword());
  CHECK_EQ(r.imageCount(), 0u);

  OpenResult res = openImageSource(testfx::fixture("encrypted.cbr"), o);
  CHECK(!res.ok());
  CHECK(res.wrongPassword);
  CHECK(res.error == OpenError::WrongPassword);
}

static void lockedHeadersHideListing() {
  const auto arc = testfx::fixture("locked-headers.cbr");
  OpenError code;
  std::string err;

  RarReader locked;
  CHECK(locked.open(arc, OpenOptions{}, code, err));
  CHECK(locked.needsPassword());
  CHECK(!locked.wrongPassword());
  CHECK(locked.hasEncryptedEntries());
  CHECK(locked.allSortedEntryNames().empty());

  OpenOptions wrong;
  wrong.password = "not-it";
  RarReader rejected;
  CHECK(rejected.open(arc, wrong, code, err));
  CHECK(rejected.needsPassword());
  CHECK(rejected.wrongPassword());

  OpenOptions right;
  right.password = "secret";
  RarReader r;
  CHECK(r.open(arc, right, code, err));
  CHECK(!r.needsPassword());
  CHECK_EQ(r.imageCount(), 2u);
  CHECK_EQ(*r.imageName(1), std::string("p2.png"));
  auto data = r.imageData(1);
  CHECK(data.has_value());
  CHECK(*data == testfx::pngBytes(8, 9, 2));
}

static void garbageCannotOpen() {
  testfx::ScratchDir dir;
  auto bad = dir / "bad.cbr";
  CHECK(testfx::writeFile(bad, testfx::textBytes("Rar! but not really a rar archive")));
  RarReader r;
  OpenOptions o;
  OpenError code;
  std::string err;
  CHECK(!r.open(bad, o, code, err));
  CHECK(code == OpenError::CannotOpen);
  CHECK(!err.empty());
  CHECK_EQ(r.imageCount(), 0u);
  CHECK(!r.needsPassword());
}

static void missingFileCannotOpen() {
  testfx::ScratchDir dir;
  OpenError code;
  std::string err;
  auto reader = openArchiveReader(dir / "missing.rar", OpenOptions{}, code, err);
  CHECK(reader == nullptr);
  CHECK(code == OpenError::CannotOpen);

  OpenResult res = openImageSource(dir / "missing.rar", OpenOptions{});
  CHECK(!res.ok());
  CHECK(res.error == OpenError::CannotOpen);
  CHECK(!res.needsPassword);
}

int main() {
  RUN(routesRarFamily);
  RUN(listsPlainArchiveInNaturalOrder);
  RUN(extractsNestedArchive);
  RUN(encryptedNeedsPassword);
  RUN(encryptedOpensWithPassword);
  RUN(encryptedRejectsWrongPassword);
  RUN(lockedHeadersHideListing);
  RUN(garbageCannotOpen);
  RUN(missingFileCannotOpen);
  return finish();
}
