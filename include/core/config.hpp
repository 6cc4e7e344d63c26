#pragma once
#include "core/types.hpp"
#include "log.h"
#include <string>

namespace panes {

struct EngineConfig {
  std::string tempDir;                 // empty -> system temp
  LogLevel logLevel = LogLevel::Info;
};

struct AppConfig {
  EngineConfig engine;
  Limits limits;
  std::string credentialStorePath;     // empty -> passwords are not kept
};

constexpr uint32_t kMinDepth = 1;
constexpr uint32_t kMaxDepth = 4;

bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err);

// Copies the per-open parts of `cfg` into `opts`.
void applyConfig(const AppConfig& cfg, OpenOptions& opts);

} // namespace panes
