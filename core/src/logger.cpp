#include "animkit/core/common/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace animkit::core {

// Initial level comes from ANIMKIT_LOG_LEVEL (error|warn|info|debug), Warn otherwise.
static LogLevel levelFromEnvironment() {
  const char* env = std::getenv("ANIMKIT_LOG_LEVEL");
  if (env == nullptr) return LogLevel::Warn;

  std::string value(env);
  for (char& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (value == "error") return LogLevel::Error;
  if (value == "info") return LogLevel::Info;
  if (value == "debug") return LogLevel::Debug;
  return LogLevel::Warn;
}

static std::atomic<LogLevel>& levelStorage() {
  static std::atomic<LogLevel> level{levelFromEnvironment()};
  return level;
}

static std::atomic<LogSink> g_sink{nullptr};

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

static bool stderrIsColorTerminal() {
#ifdef _WIN32
  return false;
#else
  static const bool color =
    std::getenv("NO_COLOR") == nullptr && isatty(fileno(stderr)) != 0;
  return color;
#endif
}

static const char* levelColor(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "\x1b[31m";
    case LogLevel::Warn: return "\x1b[33m";
    case LogLevel::Info: return "\x1b[36m";
    case LogLevel::Debug: return "\x1b[90m";
  }
  return "\x1b[0m";
}

static void stderrSink(LogLevel level, const std::string& msg) {
  const bool color = stderrIsColorTerminal();
  if (color) std::cerr << levelColor(level);
  std::cerr << "[animkit][" << logLevelToString(level) << "] " << msg;
  if (color) std::cerr << "\x1b[0m";
  std::cerr << '\n';
}

void setLogLevel(LogLevel level) {
  levelStorage().store(level);
}

LogLevel getLogLevel() {
  return levelStorage().load();
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(getLogLevel());
}

void log(LogLevel level, const std::string& msg) {
  if (!shouldLog(level)) return;
  const LogSink sink = g_sink.load();
  (sink ? sink : &stderrSink)(level, msg);
}

void log(LogLevel level, const char* msg) {
  if (!shouldLog(level)) return;
  log(level, msg ? std::string(msg) : std::string());
}

}  // namespace animkit::core
