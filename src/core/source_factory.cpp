// src/core/source_factory.cpp
#include "core/source_factory.hpp"
#include "core/composite_builder.hpp"
#include "core/credential_store.hpp"
#include "core/filesystem_source.hpp"
#include "routing/router.hpp"
#include "log.h"
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace panes {

std::shared_ptr<IArchiveReader> openArchiveReader(const fs::path& path, const OpenOptions& opts,
                                                  OpenError& code, std::string& err) {
  code = OpenError::None;
  auto family = familyOf(routeToHandler(path).kind);
  if (!family) {
    err = "not a supported container: " + path.filename().string();
    code = OpenError::CannotOpen;
    return nullptr;
  }

  std::shared_ptr<IArchiveReader> reader = makeReader(*family);
  if (!reader->open(path, opts, code, err)) {
    if (code == OpenError::None) code = OpenError::CannotOpen;
    return nullptr;
  }
  if (reader->needsPassword())
    code = reader->wrongPassword() ? OpenError::WrongPassword : OpenError::PasswordRequired;
  return reader;
}

static OpenResult openContainer(const fs::path& path, const OpenOptions& opts) {
  OpenResult res;
  auto reader = openArchiveReader(path, opts, res.error, res.message);
  if (!reader) return res;

  res.hasEncryptedEntries = reader->hasEncryptedEntries();
  if (reader->needsPassword()) {
    res.needsPassword = true;
    res.wrongPassword = reader->wrongPassword();
    return res;
  }

  res.source = buildImageSource(reader, opts);
  if (res.source->imageCount() == 0) {
    // every nested container was skipped
    auto* comp = dynamic_cast<CompositeImageSource*>(res.source.get());
    if (comp && comp->needsPassword()) {
      res.error = OpenError::PasswordRequired;
      res.needsPassword = true;
      res.message = "all nested archives are locked";
    } else {
      res.error = OpenError::NoContentFound;
      res.message = "no displayable images in " + path.filename().string();
    }
    res.source.reset();
  }
  return res;
}

static std::string credentialPath(const fs::path& path) {
  std::error_code ec;
  fs::path abs = fs::absolute(path, ec);
  return (ec ? path : abs).lexically_normal().string();
}

static OpenResult openWithCredentials(const fs::path& path, OpenOptions opts) {
  const std::string key = credentialPath(path);
  ICredentialStore* store = opts.credentials.get();

  if (!opts.password && store) {
    if (auto stored = store->get(key)) {
      OpenOptions withStored = opts;
      withStored.password = stored;
      OpenResult res = openContainer(path, withStored);
      if (!res.wrongPassword) return res;
      LOGI("stored password rejected for " + path.filename().string() + ", forgetting it");
      store->remove(key);
      // fall through without a password so the caller sees PasswordRequired
    }
  }

  OpenResult res = openContainer(path, opts);
  if (res.ok() && opts.password && opts.rememberPassword && store) {
    if (store->save(*opts.password, key)) LOGD("password saved for " + path.filename().string());
  }
  return res;
}

OpenResult openImageSource(const fs::path& path, OpenOptions opts) {
  const auto start = std::chrono::steady_clock::now();
  OpenResult res;
  const RoutingDecision rd = routeToHandler(path);
  LOGD("route " + path.filename().string() + " -> " + toString(rd.kind) + " (" + rd.reason + ")");

  if (rd.kind == SourceKind::FileSystem) {
    return openImageSource(std::vector<fs::path>{path}, std::move(opts));
  }

  res = openWithCredentials(path, std::move(opts));
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  if (res.ok()) {
    LOGI("opened " + path.filename().string() + ": " + std::to_string(res.source->imageCount()) +
         " images in " + std::to_string(ms) + "ms");
  } else {
    LOGW("open " + path.filename().string() + " -> " + toString(res.error) +
         (res.message.empty() ? "" : " (" + res.message + ")"));
  }
  return res;
}

OpenResult openImageSource(const std::vector<fs::path>& paths, OpenOptions opts) {
  OpenResult res;
  reportPhase(opts, phase::kOpening);
  auto src = std::make_unique<FileSystemSource>(opts);
  reportPhase(opts, phase::kBuildingList);
  if (!src->open(paths, res.error, res.message)) return res;
  res.source = std::move(src);
  return res;
}

std::future<OpenResult> openImageSourceAsync(fs::path path, OpenOptions opts) {
  return std::async(std::launch::async, [path = std::move(path), opts = std::move(opts)]() mutable {
    return openImageSource(path, std::move(opts));
  });
}

} // namespace panes
