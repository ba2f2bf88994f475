#pragma once

#include <sstream>
#include <string>

// Usage: LOG(INFO) << "parsed " << n << " directives";
// The temporary Logger collects the message and emits it on destruction.
#define LOG(level) Logger(Logger::level, __FILE__, __LINE__).stream()

class Logger {
 public:
  enum LogLevel { DEBUG, INFO, ERROR };

  Logger(LogLevel level, const char* file, int line);
  ~Logger();

  std::ostringstream& stream();

  static void setLevel(LogLevel level);
  static LogLevel level();
  static bool isEnabled(LogLevel level);
  static std::string levelToString(LogLevel level);

  static void log(LogLevel level, const std::string& message);

  static void printStartupLevel();

 private:
  Logger(const Logger& other);
  Logger& operator=(const Logger& other);

  static std::string getCurrentTime();

  static LogLevel level_;

  LogLevel msgLevel_;
  const char* file_;
  int line_;
  std::ostringstream stream_;
};
