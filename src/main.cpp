#include "core/composite_source.hpp"
#include "core/config.hpp"
#include "core/cover_loader.hpp"
#include "core/credential_store.hpp"
#include "core/source_factory.hpp"
#include "json_min.h"
#include "log.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <sstream>

using namespace std;
namespace fs = std::filesystem;
using namespace panes;

static void usage() {
  cerr << "usage: panes-inspect [--config FILE] [--password PW] [--remember] [--json] [--cover N] PATH...\n";
}

static string dateString(const optional<TimePoint>& tp) {
  if (!tp) return "";
  time_t t = chrono::system_clock::to_time_t(*tp);
  tm tmv{};
  localtime_r(&t, &tmv);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
  return buf;
}

static string sizeString(const optional<PixelSize>& s) {
  if (!s) return "?";
  return to_string(s->width) + "x" + to_string(s->height);
}

static string jstr(const optional<string>& s) {
  return s ? "\"" + jsonEscape(*s) + "\"" : "null";
}

static void printText(ImageSource& src) {
  cout << "source: " << src.sourceName() << " (" << src.imageCount() << " images"
       << (src.isStandalone() ? ", standalone" : "") << ")\n";
  cout << "key: " << src.generateFileKey().value_or("?") << "\n";
  if (auto* comp = dynamic_cast<CompositeImageSource*>(&src)) {
    cout << "segments:\n" << comp->describeSegments();
    for (const auto& a : comp->passwordRequiredArchives()) cout << "locked nested archive: " << a << "\n";
  }
  for (size_t i = 0; i < src.imageCount(); ++i) {
    cout << i << "\t" << src.fileName(i).value_or("?")
         << "\t" << src.imageFormat(i).value_or("?")
         << "\t" << (src.fileSize(i) ? to_string(*src.fileSize(i)) : string("?"))
         << "\t" << sizeString(src.imageSize(i))
         << "\t" << dateString(src.fileDate(i))
         << "\t" << src.generateImageFileKey(i).value_or("?") << "\n";
  }
}

static void printJson(ImageSource& src) {
  ostringstream os;
  os << "{\"source\":\"" << jsonEscape(src.sourceName()) << "\""
     << ",\"count\":" << src.imageCount()
     << ",\"standalone\":" << (src.isStandalone() ? "true" : "false")
     << ",\"key\":" << jstr(src.generateFileKey())
     << ",\"images\":[";
  for (size_t i = 0; i < src.imageCount(); ++i) {
    auto dim = src.imageSize(i);
    auto bytes = src.fileSize(i);
    if (i) os << ",";
    os << "{\"name\":" << jstr(src.fileName(i))
       << ",\"path\":" << jstr(src.imageRelativePath(i))
       << ",\"format\":" << jstr(src.imageFormat(i))
       << ",\"bytes\":" << (bytes ? to_string(*bytes) : string("null"))
       << ",\"width\":" << (dim ? to_string(dim->width) : string("null"))
       << ",\"height\":" << (dim ? to_string(dim->height) : string("null"))
       << ",\"key\":" << jstr(src.generateImageFileKey(i)) << "}";
  }
  os << "]}";
  cout << os.str() << "\n";
}

int main(int argc, char** argv) {
  string configPath;
  optional<string> password;
  bool remember = false, json = false;
  optional<size_t> coverIndex;
  vector<fs::path> inputs;

  for (int i = 1; i < argc; ++i) {
    string a = argv[i];
    if (a == "--config" && i + 1 < argc) configPath = argv[++i];
    else if (a == "--password" && i + 1 < argc) password = string(argv[++i]);
    else if (a == "--remember") remember = true;
    else if (a == "--json") json = true;
    else if (a == "--cover" && i + 1 < argc) coverIndex = strtoul(argv[++i], nullptr, 10);
    else if (a == "-h" || a == "--help") { usage(); return 0; }
    else if (a.rfind("--", 0) == 0) { usage(); return 2; }
    else inputs.push_back(a);
  }
  if (inputs.empty()) { usage(); return 2; }

  AppConfig cfg;
  if (!configPath.empty()) {
    string err;
    if (!loadConfigYaml(configPath, cfg, err)) {
      LOGE("config " + configPath + ": " + err);
      return 2;
    }
  }
  setLogLevel(cfg.engine.logLevel);

  OpenOptions opts;
  applyConfig(cfg, opts);
  opts.password = password;
  opts.rememberPassword = remember;
  opts.phaseSink = [](const string& p) { LOGI("phase: " + p); };
  if (!cfg.credentialStorePath.empty()) {
    auto store = make_shared<YamlCredentialStore>(cfg.credentialStorePath);
    string err;
    if (!store->load(err)) LOGW("credential store " + cfg.credentialStorePath + ": " + err);
    else opts.credentials = store;
  }

  if (coverIndex) {
    CoverResult cover = loadCoverImage(inputs[0], opts, *coverIndex);
    if (!cover.image) {
      cerr << (cover.needsPassword ? userMessage(cover.wrongPassword ? OpenError::WrongPassword
                                                                     : OpenError::PasswordRequired)
                                   : string("no cover image")) << "\n";
      return cover.needsPassword ? 3 : 1;
    }
    cout << "cover: " << sizeString(cover.image->size) << " " << cover.image->format
         << " (" << cover.imageCount.value_or(0) << " images)\n";
    return 0;
  }

  OpenResult res = inputs.size() == 1
      ? openImageSourceAsync(inputs[0], opts).get()
      : openImageSource(inputs, opts);

  if (!res.ok()) {
    cerr << userMessage(res.error);
    if (!res.message.empty()) cerr << " (" << res.message << ")";
    cerr << "\n";
    return res.needsPassword ? 3 : 1;
  }
  if (res.hasEncryptedEntries) LOGW("some entries are encrypted and were skipped");

  if (json) printJson(*res.source);
  else printText(*res.source);
  return 0;
}
