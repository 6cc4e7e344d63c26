// src/log.cpp
#include "log.h"
#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace panes {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_mu;

void setLogLevel(LogLevel lvl) { g_level = static_cast<int>(lvl); }
LogLevel logLevel() { return static_cast<LogLevel>(g_level.load()); }

LogLevel parseLogLevel(const std::string& in) {
  std::string s(in);
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "debug") return LogLevel::Debug;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  return LogLevel::Info;
}

static const char* tag(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO ";
    case LogLevel::Warn:  return "WARN ";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO ";
}

void logEmit(LogLevel lvl, const std::string& msg) {
  if (static_cast<int>(lvl) < g_level.load()) return;
  std::time_t now = std::time(nullptr);
  std::tm st{};
  localtime_r(&now, &st);
  std::lock_guard<std::mutex> lk(g_mu);
  std::fprintf(stderr, "[%s] %04d-%02d-%02d %02d:%02d:%02d | %s\n",
               tag(lvl), st.tm_year + 1900, st.tm_mon + 1, st.tm_mday,
               st.tm_hour, st.tm_min, st.tm_sec, msg.c_str());
}

} // namespace panes
