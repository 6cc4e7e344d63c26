// tests/test_temp_file.cpp
#include "core/temp_file.hpp"
#include "test_support.hpp"

using namespace panes;
namespace fs = std::filesystem;

static void writesIntoPrivateDir() {
  testfx::ScratchDir dir;
  TempFile out;
  std::string err;
  CHECK(writePrivateTempFile(dir.path, "inner.cbz", testfx::textBytes("abc"), out, err));
  CHECK(fs::exists(out.path()));
  CHECK_EQ(out.path().filename().string(), std::string("inner.cbz"));
  CHECK(out.path().parent_path().filename().string().rfind("panes-", 0) == 0);
  CHECK(out.ownedDir() == out.path().parent_path());
  CHECK_EQ(testfx::readAll(out.path()).size(), 3u);
}

static void deletesFileAndDirOnScopeExit() {
  testfx::ScratchDir dir;
  fs::path file;
  std::string err;
  {
    TempFile t;
    CHECK(writePrivateTempFile(dir.path, "x.zip", testfx::textBytes("1"), t, err));
    CHECK(!t.empty());
    file = t.path();
  }
  CHECK(!fs::exists(file));
  CHECK(!fs::exists(file.parent_path()));
  CHECK_EQ(testfx::leftoverTempDirs(dir.path), 0u);
}

static void moveTransfersOwnership() {
  testfx::ScratchDir dir;
  std::string err;
  TempFile b;
  fs::path file;
  {
    TempFile a;
    CHECK(writePrivateTempFile(dir.path, "y.zip", testfx::textBytes("1"), a, err));
    file = a.path();
    b = std::move(a);
    CHECK(a.empty());
  }
  CHECK(fs::exists(file));
  b.reset();
  CHECK(!fs::exists(file));
  CHECK_EQ(testfx::leftoverTempDirs(dir.path), 0u);
  b.reset(); // second call is a no-op
}

static void leavesForeignDirAlone() {
  testfx::ScratchDir dir;
  auto f = dir / "plain.bin";
  CHECK(testfx::writeFile(f, testfx::textBytes("z")));
  {
    TempFile t(f);
  }
  CHECK(!fs::exists(f));
  CHECK(fs::exists(dir.path));
}

// A directory that only looks like ours is never removed.
static void lookalikeDirIsNotOwned() {
  testfx::ScratchDir dir;
  auto lookalike = dir / "panes-userdata";
  auto f = lookalike / "book.cbz";
  auto keep = lookalike / "keep.txt";
  CHECK(testfx::writeFile(f, testfx::textBytes("z")));
  CHECK(testfx::writeFile(keep, testfx::textBytes("k")));
  {
    TempFile t(f);
  }
  CHECK(!fs::exists(f));
  CHECK(fs::exists(keep));
  CHECK(fs::exists(lookalike));
}

int main() {
  RUN(writesIntoPrivateDir);
  RUN(deletesFileAndDirOnScopeExit);
  RUN(moveTransfersOwnership);
  RUN(leavesForeignDirAlone);
  RUN(lookalikeDirIsNotOwned);
  return finish();
}
