// src/readers/RarReader.cpp
// Built with _UNIX defined so dll.hpp maps HANDLE/LPARAM/CALLBACK.
#include "readers/RarReader.hpp"
#include "json_min.h"
#include "log.h"
#include <cstring>
#include <cwchar>
#include <ctime>
#include <unrar/dll.hpp>

namespace panes {

#ifndef ERAR_MISSING_PASSWORD
#define ERAR_MISSING_PASSWORD 22
#endif
#ifndef ERAR_BAD_PASSWORD
#define ERAR_BAD_PASSWORD 24
#endif

namespace {

struct CallbackCtx {
  Bytes* sink = nullptr;
  const std::optional<std::string>* password = nullptr;
};

int CALLBACK rarCallback(UINT msg, LPARAM userData, LPARAM p1, LPARAM p2) {
  auto* ctx = reinterpret_cast<CallbackCtx*>(userData);
  switch (msg) {
    case UCM_PROCESSDATA:
      if (ctx->sink) {
        const auto* d = reinterpret_cast<const uint8_t*>(p1);
        ctx->sink->insert(ctx->sink->end(), d, d + static_cast<size_t>(p2));
      }
      return 1;
    case UCM_NEEDPASSWORDW: {
      if (!ctx->password || !ctx->password->has_value() || p2 <= 0) return -1;
      std::wstring pw = widen(**ctx->password);
      wchar_t* buf = reinterpret_cast<wchar_t*>(p1);
      size_t cap = static_cast<size_t>(p2);
      size_t n = pw.size() < cap - 1 ? pw.size() : cap - 1;
      std::wmemcpy(buf, pw.data(), n);
      buf[n] = L'\0';
      return 1;
    }
    case UCM_NEEDPASSWORD: {
      if (!ctx->password || !ctx->password->has_value() || p2 <= 0) return -1;
      const std::string& pw = **ctx->password;
      char* buf = reinterpret_cast<char*>(p1);
      size_t cap = static_cast<size_t>(p2);
      std::strncpy(buf, pw.c_str(), cap - 1);
      buf[cap - 1] = '\0';
      return 1;
    }
    default:
      return 0; // volume changes: multi-volume sets are not followed
  }
}

// Closes the unrar handle on scope exit.
struct ArcHandle {
  HANDLE h = nullptr;
  ~ArcHandle() { if (h) RARCloseArchive(h); }
};

HANDLE openHandle(const std::filesystem::path& path, unsigned int mode, CallbackCtx& ctx,
                  int& result, bool& encHeaders) {
  std::string name = path.string();
  std::vector<char> arcName(name.begin(), name.end());
  arcName.push_back('\0');

  RAROpenArchiveDataEx data;
  std::memset(&data, 0, sizeof(data));
  data.ArcName = arcName.data();
  data.OpenMode = mode;
  data.Callback = rarCallback;
  data.UserData = reinterpret_cast<LPARAM>(&ctx);

  HANDLE h = RAROpenArchiveEx(&data);
  result = static_cast<int>(data.OpenResult);
  encHeaders = (data.Flags & ROADF_ENCHEADERS) != 0;
  return h;
}

bool isDirectory(const RARHeaderDataEx& hd) {
#ifdef RHDF_DIRECTORY
  return (hd.Flags & RHDF_DIRECTORY) != 0;
#else
  return (hd.Flags & 0xE0) == 0xE0;
#endif
}

std::string entryName(const RARHeaderDataEx& hd) {
  if (hd.FileNameW[0] != 0) return utf8(hd.FileNameW);
  return hd.FileName;
}

std::optional<TimePoint> dosTime(unsigned int ft) {
  if (ft == 0) return std::nullopt;
  std::tm tm{};
  unsigned int date = ft >> 16, time = ft & 0xFFFF;
  tm.tm_year = static_cast<int>(((date >> 9) & 0x7F) + 80);
  tm.tm_mon  = static_cast<int>(((date >> 5) & 0x0F)) - 1;
  tm.tm_mday = static_cast<int>(date & 0x1F);
  tm.tm_hour = static_cast<int>(time >> 11);
  tm.tm_min  = static_cast<int>((time >> 5) & 0x3F);
  tm.tm_sec  = static_cast<int>((time & 0x1F) * 2);
  tm.tm_isdst = -1;
  std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  return std::chrono::system_clock::from_time_t(t);
}

// RAR5 carries a password check value; RAR4 and check-less RAR5 data
// only fail later as damaged data.
bool looksLikeWrongPassword(int rc) {
  return rc == ERAR_BAD_PASSWORD || rc == ERAR_BAD_DATA;
}

std::string rarErrorString(int rc) {
  switch (rc) {
    case ERAR_NO_MEMORY: return "out of memory";
    case ERAR_BAD_DATA: return "damaged data or CRC error";
    case ERAR_BAD_ARCHIVE: return "not a valid RAR archive";
    case ERAR_UNKNOWN_FORMAT: return "unknown archive format";
    case ERAR_EOPEN: return "cannot open file";
    case ERAR_EREAD: return "read error";
    case ERAR_MISSING_PASSWORD: return "password required";
    case ERAR_BAD_PASSWORD: return "wrong password";
    default: return "unrar error " + std::to_string(rc);
  }
}

} // namespace

bool RarReader::open(const std::filesystem::path& path, const OpenOptions& opts,
                     OpenError& code, std::string& err) {
  beginOpen(path, opts);
  password_ = opts.password;
  code = OpenError::None;
  lastError_ = 0;
  const bool havePassword = password_.has_value();

  // Locked headers: nothing can be listed until the password is right.
  auto headerLock = [&](int rc, bool encHeaders) {
    if (rc == ERAR_MISSING_PASSWORD) {
      hasEncrypted_ = true;
      lockOut(false);
      return true;
    }
    if (rc == ERAR_BAD_PASSWORD || (encHeaders && havePassword && rc == ERAR_BAD_DATA)) {
      hasEncrypted_ = true;
      lockOut(true);
      return true;
    }
    return false;
  };

  reportPhase(opts, phase::kOpening);
  CallbackCtx ctx;
  ctx.password = &password_;
  int rc = 0;
  bool encHeaders = false;
  ArcHandle arc;
  arc.h = openHandle(path, RAR_OM_LIST, ctx, rc, encHeaders);
  if (!arc.h || rc != ERAR_SUCCESS) {
    lastError_ = rc;
    if (headerLock(rc, encHeaders)) return true;
    err = "RAROpenArchiveEx failed: " + rarErrorString(rc);
    code = OpenError::CannotOpen;
    return false;
  }

  reportPhase(opts, phase::kBuildingList);
  std::vector<Entry> all;
  bool encryptedSeen = encHeaders;
  uint64_t ordinal = 0;
  RARHeaderDataEx hd;
  std::memset(&hd, 0, sizeof(hd));
  while ((rc = RARReadHeaderEx(arc.h, &hd)) == ERAR_SUCCESS) {
    Entry e;
    e.path = entryName(hd);
    e.libIndex = ordinal++;
    e.isDirectory = isDirectory(hd);
    e.uncompressedSize = (static_cast<uint64_t>(hd.UnpSizeHigh) << 32) | hd.UnpSize;
    e.modifiedAt = dosTime(hd.FileTime);
    e.isEncrypted = (hd.Flags & RHDF_ENCRYPTED) != 0;
    encryptedSeen = encryptedSeen || e.isEncrypted;
    all.push_back(std::move(e));

    rc = RARProcessFile(arc.h, RAR_SKIP, nullptr, nullptr);
    if (rc != ERAR_SUCCESS) break;
    std::memset(&hd, 0, sizeof(hd));
  }
  if (rc != ERAR_SUCCESS && rc != ERAR_END_ARCHIVE) {
    lastError_ = rc;
    if (all.empty()) {
      if (headerLock(rc, encHeaders)) return true;
      err = "RARReadHeaderEx failed: " + rarErrorString(rc);
      code = OpenError::CannotOpen;
      return false;
    }
    // damaged tail: keep what was listed
    LOGW(path.filename().string() + ": listing stopped early (" + rarErrorString(rc) + ")");
  }

  catalog(all, havePassword);
  hasEncrypted_ = encryptedSeen;

  if (!havePassword && hasEncrypted_ && !hasContent()) {
    lockOut(false);
    return true;
  }

  // Verify the password on one encrypted entry before exposing anything.
  if (havePassword && encryptedSeen) {
    if (const Entry* sample = firstEncryptedEntry()) {
      Bytes scratch;
      std::string serr;
      if (!readEntry(*sample, scratch, serr)) {
        if (looksLikeWrongPassword(lastError_)) {
          lockOut(true);
          return true;
        }
        if (lastError_ == ERAR_MISSING_PASSWORD) {
          lockOut(false);
          return true;
        }
        LOGW("password check failed on " + sample->path + ": " + serr);
      }
    }
  }

  if (!hasContent()) {
    err = "no images or nested archives in " + path.filename().string();
    code = OpenError::NoContentFound;
    return false;
  }
  return true;
}

bool RarReader::readEntry(const Entry& e, Bytes& out, std::string& err) {
  lastError_ = 0;
  out.clear();

  CallbackCtx ctx;
  ctx.password = &password_;
  int rc = 0;
  bool encHeaders = false;
  ArcHandle arc;
  arc.h = openHandle(path_, RAR_OM_EXTRACT, ctx, rc, encHeaders);
  if (!arc.h || rc != ERAR_SUCCESS) {
    lastError_ = rc;
    err = "RAROpenArchiveEx failed: " + rarErrorString(rc);
    return false;
  }

  uint64_t ordinal = 0;
  RARHeaderDataEx hd;
  std::memset(&hd, 0, sizeof(hd));
  while ((rc = RARReadHeaderEx(arc.h, &hd)) == ERAR_SUCCESS) {
    if (ordinal++ == e.libIndex) {
      out.reserve(static_cast<size_t>(e.uncompressedSize));
      ctx.sink = &out;
      rc = RARProcessFile(arc.h, RAR_TEST, nullptr, nullptr);
      ctx.sink = nullptr;
      if (rc != ERAR_SUCCESS) {
        lastError_ = rc;
        err = "RARProcessFile failed: " + rarErrorString(rc);
        out.clear();
        return false;
      }
      return true;
    }
    rc = RARProcessFile(arc.h, RAR_SKIP, nullptr, nullptr);
    if (rc != ERAR_SUCCESS) break;
    std::memset(&hd, 0, sizeof(hd));
  }
  lastError_ = rc;
  err = (rc == ERAR_END_ARCHIVE) ? "entry not found: " + e.path
                                 : "RARReadHeaderEx failed: " + rarErrorString(rc);
  return false;
}

std::unique_ptr<IArchiveReader> makeRarReader() {
  return std::make_unique<RarReader>();
}

} // namespace panes
