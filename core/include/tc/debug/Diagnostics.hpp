#pragma once
#include <cstdint>
#include <string>

namespace tc {

enum class LogLevel : std::uint8_t {
  Debug = 0, Info, Warn, Error, Off
};

const char* logLevelName(LogLevel level);

// Returns false (and leaves `out` alone) for unknown names.
bool parseLogLevel(const std::string& name, LogLevel& out);

// Narrow reporting interface handed to the engine at construction.
// No component logs through globals.
class Diagnostics {
public:
  virtual ~Diagnostics() = default;
  virtual void log(LogLevel level, const std::string& message) = 0;
  virtual void metric(const char* name, double milliseconds) { (void)name; (void)milliseconds; }
};

class StderrDiagnostics : public Diagnostics {
public:
  explicit StderrDiagnostics(LogLevel minLevel = LogLevel::Warn) : minLevel_(minLevel) {}

  void setMinLevel(LogLevel level) { minLevel_ = level; }
  LogLevel minLevel() const { return minLevel_; }

  void log(LogLevel level, const std::string& message) override;
  void metric(const char* name, double milliseconds) override;

private:
  LogLevel minLevel_;
};

class NullDiagnostics : public Diagnostics {
public:
  void log(LogLevel, const std::string&) override {}
};

// Shared fallback used when a component is constructed without a sink.
Diagnostics& nullDiagnostics();

} // namespace tc
