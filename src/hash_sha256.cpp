// src/hash_sha256.cpp
#include "hash_sha256.h"
#include <fstream>
#include <memory>
#include <openssl/evp.h>

namespace panes {

static std::string hex(const unsigned char* d, size_t n) {
  static const char* he = "0123456789abcdef";
  std::string s; s.resize(n*2);
  for (size_t i=0;i<n;++i){ s[2*i]=he[d[i]>>4]; s[2*i+1]=he[d[i]&0xF]; }
  return s;
}

using MdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

static std::string digest(const void* data, size_t n) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_Digest(data, n, md, &len, EVP_sha256(), nullptr) != 1) return "";
  return hex(md, len);
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
  return digest(data.data(), data.size());
}

std::string sha256_string(const std::string& str) {
  return digest(str.data(), str.size());
}

std::string sha256_file(const std::filesystem::path& path, uint64_t limit, size_t chunk) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return "";

  MdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return "";

  std::vector<char> buf(chunk);
  uint64_t remaining = limit;
  while (f) {
    size_t want = buf.size();
    if (limit != 0) {
      if (remaining == 0) break;
      if (remaining < want) want = static_cast<size_t>(remaining);
    }
    f.read(buf.data(), static_cast<std::streamsize>(want));
    std::streamsize got = f.gcount();
    if (got <= 0) break;
    if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(got)) != 1) return "";
    if (limit != 0) remaining -= static_cast<uint64_t>(got);
  }
  if (f.bad()) return "";

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) return "";
  return hex(md, len);
}

std::string identityKey(uint64_t byteSize, const std::string& sha256Hex) {
  return std::to_string(byteSize) + "-" + sha256Hex.substr(0, 16);
}

} // namespace panes
