// src/core/entry_classifier.cpp
#include "core/entry_classifier.hpp"
#include <algorithm>
#include <cctype>

namespace panes {

static const char* kImageExts[]   = {"jpg", "jpeg", "png", "gif", "webp", "jp2", "j2k"};
static const char* kArchiveExts[] = {"zip", "cbz", "rar", "cbr", "7z", "cb7"};

static size_t lastSep(const std::string& path) {
  return path.find_last_of("/\\");
}

std::string baseName(const std::string& path) {
  std::string p = path;
  while (!p.empty() && (p.back() == '/' || p.back() == '\\')) p.pop_back();
  size_t s = lastSep(p);
  return s == std::string::npos ? p : p.substr(s + 1);
}

std::string extensionLower(const std::string& path) {
  std::string name = baseName(path);
  size_t dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0) return "";
  std::string e = name.substr(dot + 1);
  std::transform(e.begin(), e.end(), e.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return e;
}

std::string stemName(const std::string& path) {
  std::string name = baseName(path);
  size_t dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0) return name;
  return name.substr(0, dot);
}

std::string directoryOf(const std::string& path) {
  size_t s = lastSep(path);
  if (s == std::string::npos || s == 0) return "/";
  return path.substr(0, s);
}

bool isImageExtension(const std::string& extLower) {
  for (const char* e : kImageExts) if (extLower == e) return true;
  return false;
}

bool isArchiveExtension(const std::string& extLower) {
  for (const char* e : kArchiveExts) if (extLower == e) return true;
  return false;
}

bool isPlatformNoise(const std::string& path) {
  size_t start = 0;
  while (start < path.size()) {
    size_t end = path.find_first_of("/\\", start);
    if (end == std::string::npos) end = path.size();
    // "." and "._*" components included
    if (end > start && path[start] == '.') return true;
    if (path.compare(start, end - start, "__MACOSX") == 0) return true;
    start = end + 1;
  }
  return false;
}

EntryKind classifyEntry(const std::string& path, bool isDirectory) {
  if (isDirectory || path.empty() || path.back() == '/' || path.back() == '\\')
    return EntryKind::Ignored;
  if (isPlatformNoise(path)) return EntryKind::Ignored;
  std::string ext = extensionLower(path);
  if (isImageExtension(ext)) return EntryKind::Image;
  if (isArchiveExtension(ext)) return EntryKind::NestedArchive;
  return EntryKind::Ignored;
}

std::string formatLabel(const std::string& path) {
  std::string ext = extensionLower(path);
  if (ext == "jpg" || ext == "jpeg") return "JPEG";
  if (ext == "png") return "PNG";
  if (ext == "gif") return "GIF";
  if (ext == "webp") return "WebP";
  if (ext == "bmp") return "BMP";
  if (ext == "tiff" || ext == "tif") return "TIFF";
  if (ext == "heic" || ext == "heif") return "HEIC";
  if (ext == "jp2" || ext == "j2k") return "JPEG 2000";
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return (char)std::toupper(c); });
  return ext;
}

static bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Path separators rank below every other byte.
static unsigned char foldChar(char c) {
  if (c == '/' || c == '\\') return 0;
  return (unsigned char)std::tolower((unsigned char)c);
}

int naturalCompare(const std::string& a, const std::string& b) {
  size_t i = 0, j = 0;
  while (i < a.size() && j < b.size()) {
    if (isDigit(a[i]) && isDigit(b[j])) {
      size_t si = i, sj = j;
      while (si < a.size() && a[si] == '0') ++si;
      while (sj < b.size() && b[sj] == '0') ++sj;
      size_t ei = si, ej = sj;
      while (ei < a.size() && isDigit(a[ei])) ++ei;
      while (ej < b.size() && isDigit(b[ej])) ++ej;
      size_t li = ei - si, lj = ej - sj;
      if (li != lj) return li < lj ? -1 : 1;
      int c = a.compare(si, li, b, sj, lj);
      if (c != 0) return c < 0 ? -1 : 1;
      // same value: fewer leading zeros first
      if ((ei - i) != (ej - j)) return (ei - i) < (ej - j) ? -1 : 1;
      i = ei; j = ej;
      continue;
    }
    unsigned char ca = foldChar(a[i]);
    unsigned char cb = foldChar(b[j]);
    if (ca != cb) return ca < cb ? -1 : 1;
    ++i; ++j;
  }
  if (i < a.size()) return 1;
  if (j < b.size()) return -1;
  return 0;
}

void naturalSort(std::vector<std::string>& names) {
  std::stable_sort(names.begin(), names.end(), naturalLess);
}

} // namespace panes
