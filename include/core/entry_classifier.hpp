#pragma once
#include <string>
#include <vector>

namespace panes {

enum class EntryKind { Image, NestedArchive, Ignored };

// Lowercased extension without the dot ("" when none).
std::string extensionLower(const std::string& path);
std::string baseName(const std::string& path);   // after the last '/' or '\\'
std::string stemName(const std::string& path);   // baseName without extension
// Directory part of an entry path; "/" for entries at the root.
std::string directoryOf(const std::string& path);

bool isImageExtension(const std::string& extLower);
bool isArchiveExtension(const std::string& extLower);

// Any path component that is __MACOSX or starts with '.' (dotfiles,
// dot directories, AppleDouble "._" names).
bool isPlatformNoise(const std::string& path);

EntryKind classifyEntry(const std::string& path, bool isDirectory = false);

// Image format label derived from the extension alone.
std::string formatLabel(const std::string& path);

// Case-insensitive, digit-run-aware ordering ("page2" < "page10").
// ASCII case folding only. '/' and '\\' sort before every other byte, so a
// directory's contents precede siblings that extend its name ("ch1/p1"
// < "ch1-extra" < "ch1_extra"). Other punctuation compares by byte value.
int naturalCompare(const std::string& a, const std::string& b);
inline bool naturalLess(const std::string& a, const std::string& b) {
  return naturalCompare(a, b) < 0;
}

// Stable natural sort; equal keys keep their incoming order.
void naturalSort(std::vector<std::string>& names);

} // namespace panes
