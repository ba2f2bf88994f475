#include "Logger.hpp"

#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>

#include "constants.hpp"

// Logger instance implementation used as a temporary RAII stream object
// constructed by the LOG(...) macro.

Logger::Logger(LogLevel level, const char* file, int line)
    : msgLevel_(level), file_(file), line_(line) {}

Logger::~Logger() {
  if (!isEnabled(msgLevel_)) {
    return;
  }
  // keep only the basename, full build paths make the lines unreadable
  const char* base = std::strrchr(file_, '/');
  std::ostringstream output;
  output << "(" << (base ? base + 1 : file_) << ":" << line_ << ") "
         << stream_.str();
  Logger::log(msgLevel_, output.str());
}

std::ostringstream& Logger::stream() {
  return stream_;
}

Logger::LogLevel Logger::level_ =
    (LOG_LEVEL >= Logger::DEBUG && LOG_LEVEL <= Logger::ERROR)
        ? static_cast<Logger::LogLevel>(LOG_LEVEL)
        : Logger::INFO;

void Logger::setLevel(LogLevel level) {
  level_ = level;
}

Logger::LogLevel Logger::level() {
  return level_;
}

bool Logger::isEnabled(LogLevel level) {
  return level >= level_;
}

std::string Logger::getCurrentTime() {
  static const size_t kTimeBufferSize = 32;
  time_t now = time(0);
  struct tm* timeinfo = localtime(&now);
  char buffer[kTimeBufferSize];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", timeinfo);
  return std::string(buffer);
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
    case DEBUG:
      return "DEBUG";
    case INFO:
      return "INFO";
    case ERROR:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

// Rendered configuration goes to stdout, so log lines go to stderr.
void Logger::log(LogLevel level, const std::string& message) {
  if (!isEnabled(level)) {
    return;
  }

  std::cerr << "[" << getCurrentTime() << "] [" << levelToString(level) << "] "
            << message << std::endl;
}

void Logger::printStartupLevel() {
  std::cerr << "Effective log level: " << levelToString(level_) << std::endl;
}
