#pragma once
#include <cstdint>
#include <string>

namespace animkit::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

// Receives every message that passes the level filter. Null restores the default sink, which
// writes "[animkit][LEVEL] message" to stderr (colored on a terminal unless NO_COLOR is set).
using LogSink = void(*)(LogLevel, const std::string&);

// The starting level is read once from ANIMKIT_LOG_LEVEL (error, warn, info or debug,
// case-insensitive) and defaults to Warn. setLogLevel overrides it.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

void setLogSink(LogSink sink);
LogSink getLogSink();

// True when messages at `level` are delivered under the current level.
bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& msg);
void log(LogLevel level, const char* msg);

const char* logLevelToString(LogLevel level);

}  // namespace animkit::core
