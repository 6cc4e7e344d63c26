#pragma once
#include "core/types.hpp"
#include <filesystem>
#include <string>

namespace panes {

// Creates "<base>/panes-XXXXXX" (mkdtemp). `base` empty = system temp dir.
bool makePrivateTempDir(const std::filesystem::path& base, std::filesystem::path& out, std::string& err);

class TempFile;

// Writes `data` to "<private dir>/<fileName>". `out` owns the file and
// the private directory.
bool writePrivateTempFile(const std::filesystem::path& base, const std::string& fileName,
                          const Bytes& data, TempFile& out, std::string& err);

// Owns one temp file and deletes it on destruction. A directory is removed
// with it only when passed in as `ownedDir`. Move-only.
class TempFile {
public:
  TempFile() = default;
  explicit TempFile(std::filesystem::path file, std::filesystem::path ownedDir = {});
  ~TempFile();

  TempFile(TempFile&& other) noexcept;
  TempFile& operator=(TempFile&& other) noexcept;
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::filesystem::path& path() const { return file_; }
  const std::filesystem::path& ownedDir() const { return ownedDir_; }
  bool empty() const { return file_.empty(); }

  // Deletes now; safe to call twice.
  void reset();

private:
  std::filesystem::path file_;
  std::filesystem::path ownedDir_;
};

} // namespace panes
