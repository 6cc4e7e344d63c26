#pragma once
#include <string>

namespace panes {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void setLogLevel(LogLevel lvl);
LogLevel logLevel();
LogLevel parseLogLevel(const std::string& s);

void logEmit(LogLevel lvl, const std::string& msg);

} // namespace panes

#define LOGD(m) ::panes::logEmit(::panes::LogLevel::Debug, (m))
#define LOGI(m) ::panes::logEmit(::panes::LogLevel::Info,  (m))
#define LOGW(m) ::panes::logEmit(::panes::LogLevel::Warn,  (m))
#define LOGE(m) ::panes::logEmit(::panes::LogLevel::Error, (m))
