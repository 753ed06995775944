#include "seglink/logging.hpp"
#include <chrono>
#include <ctime>

namespace seglink {

Logger& Logger::instance() {
  static Logger inst;
  return inst;
}

Logger::~Logger() {
  if (file_) std::fclose(file_);
}

void Logger::set_level(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mtx_);
  level_ = lvl;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return level_;
}

bool Logger::set_file(const std::string& path) {
  std::FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return false;
  std::lock_guard<std::mutex> lk(mtx_);
  if (file_) std::fclose(file_);
  file_ = f;
  return true;
}

void Logger::set_stderr() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (file_) std::fclose(file_);
  file_ = nullptr;
}

const char* Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  if (s == "trace") out = LogLevel::TRACE;
  else if (s == "debug") out = LogLevel::DEBUG;
  else if (s == "info") out = LogLevel::INFO;
  else if (s == "warn") out = LogLevel::WARN;
  else if (s == "error") out = LogLevel::ERROR;
  else if (s == "off") out = LogLevel::OFF;
  else return false;
  return true;
}

void Logger::log(LogLevel lvl, const char* fmt, ...) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (lvl == LogLevel::OFF || lvl < level_) return;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  auto ms = (int)(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

  std::FILE* out = file_ ? file_ : stderr;
  std::fprintf(out, "%s.%03d [%s] ", ts, ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
  std::fflush(out);
}

} // namespace seglink
