#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace byteframe {

namespace {

const char *const kLevelNames[] = {"trace", "debug", "info", "warn", "error"};
const char *const kLevelTags[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};
constexpr int kNumLevels = 5;

} // namespace

bool parse_log_level(const std::string &name, LogLevel &out) {
  for (int i = 0; i < kNumLevels; i++) {
    if (name == kLevelNames[i]) {
      out = static_cast<LogLevel>(i);
      return true;
    }
  }
  return false;
}

const char *log_level_name(LogLevel lvl) {
  int i = static_cast<int>(lvl);
  return (i >= 0 && i < kNumLevels) ? kLevelNames[i] : "?";
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) { level_ = lvl; }

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  // one line per call; the lock keeps lines from concurrent io threads whole
  std::lock_guard<std::mutex> lk(mtx_);
  std::fprintf(stderr, "%s.%03d [%s] ", ts, static_cast<int>(ms),
               kLevelTags[static_cast<int>(lvl)]);
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fputc('\n', stderr);
}

} // namespace byteframe
