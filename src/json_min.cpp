// src/json_min.cpp
#include "json_min.h"
#include <cstdint>
#include <cstdio>

namespace panes {

static void put_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x110000) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += "\xEF\xBF\xBD"; // U+FFFD
  }
}

std::string utf8(const std::wstring& ws) {
  std::string out; out.reserve(ws.size());
  for (size_t i = 0; i < ws.size(); ++i) {
    uint32_t cp = static_cast<uint32_t>(ws[i]);
    // 16-bit wchar_t platforms hand us surrogate pairs
    if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < ws.size()) {
      uint32_t lo = static_cast<uint32_t>(ws[i + 1]);
      if (lo >= 0xDC00 && lo <= 0xDFFF) {
        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        ++i;
      }
    }
    put_utf8(out, cp);
  }
  return out;
}

std::wstring widen(const std::string& s) {
  std::wstring out; out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    uint8_t c = static_cast<uint8_t>(s[i]);
    uint32_t cp = 0xFFFD;
    size_t len = 1;
    if (c < 0x80) { cp = c; }
    else if ((c >> 5) == 0x6) { len = 2; cp = c & 0x1F; }
    else if ((c >> 4) == 0xE) { len = 3; cp = c & 0x0F; }
    else if ((c >> 3) == 0x1E) { len = 4; cp = c & 0x07; }
    else { out += static_cast<wchar_t>(0xFFFD); ++i; continue; }
    if (i + len > s.size()) { out += static_cast<wchar_t>(0xFFFD); break; }
    for (size_t k = 1; k < len; ++k) {
      uint8_t cc = static_cast<uint8_t>(s[i + k]);
      if ((cc >> 6) != 0x2) { cp = 0xFFFD; len = k; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (sizeof(wchar_t) == 2 && cp >= 0x10000 && cp != 0xFFFD) {
      cp -= 0x10000;
      out += static_cast<wchar_t>(0xD800 + (cp >> 10));
      out += static_cast<wchar_t>(0xDC00 + (cp & 0x3FF));
    } else {
      out += static_cast<wchar_t>(cp);
    }
    i += len;
  }
  return out;
}

std::string jsonEscape(const std::string& s) {
  std::string out; out.reserve(s.size() + 16);
  for (char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[7]; std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c);
          out += buf;
        } else out += c;
    }
  }
  return out;
}

} // namespace panes
