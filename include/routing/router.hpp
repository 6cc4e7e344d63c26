#pragma once
#include "core/types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace panes {

enum class SourceKind { Zip, Rar, SevenZip, FileSystem };

struct RoutingDecision {
  SourceKind  kind = SourceKind::FileSystem;
  std::string reason;  // "ext" / "dir" / "fallback"
};

const char* toString(SourceKind k);

// Container family for a lowercased extension; nullopt when not a container.
std::optional<ArchiveFamily> familyFromExtension(const std::string& extLower);

RoutingDecision routeToHandler(const std::filesystem::path& path);

inline std::optional<ArchiveFamily> familyOf(SourceKind k) {
  switch (k) {
    case SourceKind::Zip: return ArchiveFamily::Zip;
    case SourceKind::Rar: return ArchiveFamily::Rar;
    case SourceKind::SevenZip: return ArchiveFamily::SevenZip;
    case SourceKind::FileSystem: break;
  }
  return std::nullopt;
}

} // namespace panes
