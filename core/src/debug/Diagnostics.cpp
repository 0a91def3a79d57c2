#include "tc/debug/Diagnostics.hpp"

#include <cstdio>

namespace tc {

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "off";
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
  if (name == "debug") { out = LogLevel::Debug; return true; }
  if (name == "info")  { out = LogLevel::Info;  return true; }
  if (name == "warn")  { out = LogLevel::Warn;  return true; }
  if (name == "error") { out = LogLevel::Error; return true; }
  if (name == "off")   { out = LogLevel::Off;   return true; }
  return false;
}

void StderrDiagnostics::log(LogLevel level, const std::string& message) {
  if (level == LogLevel::Off || level < minLevel_) return;
  std::fprintf(stderr, "[tracechart] %s: %s\n", logLevelName(level), message.c_str());
}

void StderrDiagnostics::metric(const char* name, double milliseconds) {
  if (minLevel_ > LogLevel::Debug) return;
  std::fprintf(stderr, "[tracechart] metric %s = %.3f ms\n", name, milliseconds);
}

Diagnostics& nullDiagnostics() {
  static NullDiagnostics sink;
  return sink;
}

} // namespace tc
