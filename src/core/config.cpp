#include "core/config.hpp"
#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace panes {

bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err) {
  try {
    YAML::Node root = YAML::LoadFile(path);
    auto eng = root["engine"];
    if (eng) {
      outCfg.engine.tempDir = eng["temp_dir"].as<std::string>("");
      outCfg.engine.logLevel = parseLogLevel(eng["log_level"].as<std::string>("info"));
    }
    auto lim = root["limits"];
    if (lim) {
      const Limits def;
      if (auto r=lim["recursion"]) {
        uint32_t d = r["max_depth"].as<uint32_t>(def.maxDepth);
        outCfg.limits.maxDepth = std::min(std::max(d, kMinDepth), kMaxDepth);
      }
      if (auto s=lim["size"]) {
        outCfg.limits.maxNestedArchiveBytes = s["max_nested_archive_bytes"].as<uint64_t>(def.maxNestedArchiveBytes);
      }
      if (auto c=lim["cache"]) {
        outCfg.limits.maxEntryCacheBytes = c["max_entry_cache_bytes"].as<uint64_t>(def.maxEntryCacheBytes);
      }
      if (auto p=lim["scan"]) {
        outCfg.limits.eocdScanBytes = p["eocd_scan_bytes"].as<uint64_t>(def.eocdScanBytes);
      }
      if (auto id=lim["identity"]) {
        outCfg.limits.standaloneHashBytes = id["standalone_hash_bytes"].as<uint64_t>(def.standaloneHashBytes);
      }
    }
    auto cred = root["credentials"];
    if (cred) {
      outCfg.credentialStorePath = cred["store_path"].as<std::string>("");
    }
    return true;
  } catch (const std::exception& ex) {
    err = ex.what();
    return false;
  }
}

void applyConfig(const AppConfig& cfg, OpenOptions& opts) {
  opts.limits = cfg.limits;
  opts.tempDir = cfg.engine.tempDir;
}

} // namespace panes
