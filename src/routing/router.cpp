// src/routing/router.cpp
#include "routing/router.hpp"
#include "core/entry_classifier.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace panes {

const char* toString(SourceKind k) {
  switch (k) {
    case SourceKind::Zip: return "zip";
    case SourceKind::Rar: return "rar";
    case SourceKind::SevenZip: return "seven_zip";
    case SourceKind::FileSystem: return "filesystem";
  }
  return "?";
}

std::optional<ArchiveFamily> familyFromExtension(const std::string& e) {
  if (e == "zip" || e == "cbz") return ArchiveFamily::Zip;
  if (e == "rar" || e == "cbr") return ArchiveFamily::Rar;
  if (e == "7z"  || e == "cb7") return ArchiveFamily::SevenZip;
  return std::nullopt;
}

RoutingDecision routeToHandler(const fs::path& path) {
  RoutingDecision rd{};

  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    rd.kind = SourceKind::FileSystem;
    rd.reason = "dir";
    return rd;
  }

  if (auto fam = familyFromExtension(extensionLower(path.string()))) {
    switch (*fam) {
      case ArchiveFamily::Zip: rd.kind = SourceKind::Zip; break;
      case ArchiveFamily::Rar: rd.kind = SourceKind::Rar; break;
      case ArchiveFamily::SevenZip: rd.kind = SourceKind::SevenZip; break;
    }
    rd.reason = "ext";
    return rd;
  }

  // loose files and anything unknown
  rd.kind = SourceKind::FileSystem;
  rd.reason = "fallback";
  return rd;
}

} // namespace panes
