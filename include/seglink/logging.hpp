#pragma once
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace seglink {

enum class LogLevel { TRACE = 0, DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
public:
  static Logger& instance();

  void set_level(LogLevel lvl);
  LogLevel level() const;

  // Append to `path` instead of stderr. Returns false if it cannot be opened.
  bool set_file(const std::string& path);
  void set_stderr();

  void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
      __attribute__((format(printf, 3, 4)))
#endif
      ;

private:
  Logger() = default;
  ~Logger();
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  mutable std::mutex mtx_;
  LogLevel level_ = LogLevel::INFO;
  std::FILE* file_ = nullptr;

  static const char* level_str(LogLevel lvl);
};

// "trace", "debug", "info", "warn", "error" or "off".
bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace seglink
