#pragma once
#include "core/image_source.hpp"
#include "readers/IArchiveReader.hpp"
#include <future>

namespace panes {

struct OpenResult {
  std::unique_ptr<ImageSource> source;   // null on failure
  OpenError   error = OpenError::None;
  std::string message;                   // diagnostic detail
  bool needsPassword = false;
  bool wrongPassword = false;
  bool hasEncryptedEntries = false;

  bool ok() const { return source != nullptr; }
};

// Opens one container with the reader its extension selects. A locked
// container comes back non-null with code PasswordRequired/WrongPassword.
// Null (and a code) for everything else that fails.
std::shared_ptr<IArchiveReader> openArchiveReader(const std::filesystem::path& path,
                                                  const OpenOptions& opts,
                                                  OpenError& code, std::string& err);

// Container, folder or loose image file. Consults opts.credentials when no
// password is given and records the outcome there.
OpenResult openImageSource(const std::filesystem::path& path, OpenOptions opts);
// Several loose files and/or folders as one source.
OpenResult openImageSource(const std::vector<std::filesystem::path>& paths, OpenOptions opts);

// Runs openImageSource on a worker thread. Abandoning the future discards
// the result; nothing else needs cleaning up.
std::future<OpenResult> openImageSourceAsync(std::filesystem::path path, OpenOptions opts);

} // namespace panes
