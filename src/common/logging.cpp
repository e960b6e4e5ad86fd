#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace chunkcast {

bool parse_log_level(const std::string &name, LogLevel &out) {
  std::string s(name);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (s == "trace")
    out = LogLevel::TRACE;
  else if (s == "debug")
    out = LogLevel::DEBUG;
  else if (s == "info")
    out = LogLevel::INFO;
  else if (s == "warn" || s == "warning")
    out = LogLevel::WARN;
  else if (s == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) {
  level_.store(lvl, std::memory_order_relaxed);
}

void Logger::set_output(FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out_ = out;
}

const char *Logger::level_str(LogLevel lvl) {
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

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_.load(std::memory_order_relaxed))
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  FILE *out = out_ ? out_ : stderr;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(out, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
  std::fflush(out);
}

} // namespace chunkcast
