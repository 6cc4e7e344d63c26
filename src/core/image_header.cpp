// src/core/image_header.cpp
#include "core/image_header.hpp"
#include <cstring>

namespace panes {

static uint32_t be16(const uint8_t* p) { return (uint32_t(p[0]) << 8) | p[1]; }
static uint32_t be32(const uint8_t* p) {
  return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3];
}
static uint32_t le16(const uint8_t* p) { return uint32_t(p[0]) | (uint32_t(p[1]) << 8); }
static uint32_t le24(const uint8_t* p) { return le16(p) | (uint32_t(p[2]) << 16); }
static uint32_t le32(const uint8_t* p) { return le24(p) | (uint32_t(p[3]) << 24); }

static bool png(const Bytes& d, PixelSize& out) {
  static const uint8_t sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  if (d.size() < 24 || std::memcmp(d.data(), sig, 8) != 0) return false;
  if (std::memcmp(d.data() + 12, "IHDR", 4) != 0) return false;
  out.width = be32(d.data() + 16);
  out.height = be32(d.data() + 20);
  return true;
}

static bool gif(const Bytes& d, PixelSize& out) {
  if (d.size() < 10) return false;
  if (std::memcmp(d.data(), "GIF87a", 6) != 0 && std::memcmp(d.data(), "GIF89a", 6) != 0) return false;
  out.width = le16(d.data() + 6);
  out.height = le16(d.data() + 8);
  return true;
}

static bool bmp(const Bytes& d, PixelSize& out) {
  if (d.size() < 26 || d[0] != 'B' || d[1] != 'M') return false;
  // widened so INT32_MIN negates cleanly
  int64_t w = static_cast<int32_t>(le32(d.data() + 18));
  int64_t h = static_cast<int32_t>(le32(d.data() + 22));
  out.width = static_cast<uint32_t>(w < 0 ? -w : w);
  out.height = static_cast<uint32_t>(h < 0 ? -h : h); // negative = top-down rows
  return true;
}

static bool jpeg(const Bytes& d, PixelSize& out) {
  if (d.size() < 4 || d[0] != 0xFF || d[1] != 0xD8) return false;
  size_t i = 2;
  while (i + 4 <= d.size()) {
    if (d[i] != 0xFF) return false;
    uint8_t marker = d[i + 1];
    if (marker == 0xFF) { ++i; continue; }          // fill byte
    if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) { i += 2; continue; }
    if (marker == 0xD9 || marker == 0xDA) return false; // EOI / SOS before any SOF
    uint32_t len = be16(d.data() + i + 2);
    if (len < 2) return false;
    bool sof = marker >= 0xC0 && marker <= 0xCF &&
               marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
    if (sof) {
      if (i + 9 > d.size()) return false;
      out.height = be16(d.data() + i + 5);
      out.width = be16(d.data() + i + 7);
      return true;
    }
    i += 2 + len;
  }
  return false;
}

static bool webp(const Bytes& d, PixelSize& out) {
  if (d.size() < 30) return false;
  if (std::memcmp(d.data(), "RIFF", 4) != 0 || std::memcmp(d.data() + 8, "WEBP", 4) != 0) return false;
  const uint8_t* c = d.data() + 12;
  if (std::memcmp(c, "VP8X", 4) == 0) {
    out.width = le24(c + 12) + 1;
    out.height = le24(c + 15) + 1;
    return true;
  }
  if (std::memcmp(c, "VP8L", 4) == 0) {
    if (c[8] != 0x2F) return false;
    uint32_t bits = le32(c + 9);
    out.width = (bits & 0x3FFF) + 1;
    out.height = ((bits >> 14) & 0x3FFF) + 1;
    return true;
  }
  if (std::memcmp(c, "VP8 ", 4) == 0) {
    // frame tag (3) + start code 9D 01 2A + 14-bit sizes
    const uint8_t* f = c + 8;
    if (f[3] != 0x9D || f[4] != 0x01 || f[5] != 0x2A) return false;
    out.width = le16(f + 6) & 0x3FFF;
    out.height = le16(f + 8) & 0x3FFF;
    return true;
  }
  return false;
}

static bool jp2(const Bytes& d, PixelSize& out) {
  // raw codestream: SOC FF4F then SIZ FF51
  if (d.size() >= 16 && d[0] == 0xFF && d[1] == 0x4F && d[2] == 0xFF && d[3] == 0x51) {
    uint32_t xsiz = be32(d.data() + 8), ysiz = be32(d.data() + 12);
    uint32_t xo = d.size() >= 24 ? be32(d.data() + 16) : 0;
    uint32_t yo = d.size() >= 24 ? be32(d.data() + 20) : 0;
    if (xsiz < xo || ysiz < yo) return false;
    out.width = xsiz - xo;
    out.height = ysiz - yo;
    return true;
  }
  // JP2 box file: look for the image header box
  static const uint8_t sig[12] = {0, 0, 0, 0x0C, 'j', 'P', ' ', ' ', 0x0D, 0x0A, 0x87, 0x0A};
  if (d.size() < 12 || std::memcmp(d.data(), sig, 12) != 0) return false;
  for (size_t i = 12; i + 16 <= d.size(); ++i) {
    if (std::memcmp(d.data() + i, "ihdr", 4) == 0) {
      out.height = be32(d.data() + i + 4);
      out.width = be32(d.data() + i + 8);
      return true;
    }
  }
  return false;
}

bool HeaderBitmapDecoder::measure(const Bytes& data, PixelSize& out) const {
  PixelSize sz;
  bool ok = png(data, sz) || jpeg(data, sz) || gif(data, sz) ||
            webp(data, sz) || bmp(data, sz) || jp2(data, sz);
  if (!ok || sz.width == 0 || sz.height == 0) return false;
  out = sz;
  return true;
}

std::shared_ptr<const BitmapDecoder> defaultDecoder() {
  static const std::shared_ptr<const BitmapDecoder> dec = std::make_shared<HeaderBitmapDecoder>();
  return dec;
}

bool makeBitmap(const BitmapDecoder& dec, Bytes bytes, const std::string& format, Bitmap& out) {
  PixelSize sz;
  if (!dec.measure(bytes, sz)) return false;
  out.bytes = std::move(bytes);
  out.size = sz;
  out.format = format;
  return true;
}

} // namespace panes
