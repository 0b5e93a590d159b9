#include "util/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace dmclean::util {

static std::atomic<LogLevel> g_level{LogLevel::Info};

void set_log_level(LogLevel level) { g_level.store(level); }

static void vlog(LogLevel level, const char* component, const char* fmt, va_list ap) {
  if (static_cast<int>(level) > static_cast<int>(g_level.load())) return;
  // Single write per line so concurrent invocations do not interleave mid-line
  char msg[1024];
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  const char* tag = "";
  switch (level) {
    case LogLevel::Error: tag = "error: "; break;
    case LogLevel::Warn:  tag = "warning: "; break;
    case LogLevel::Info:  break;
    case LogLevel::Debug: tag = "debug: "; break;
  }
  std::fprintf(stderr, "dmclean: %s: %s%s\n", component, tag, msg);
}

void log_error(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Error, component, fmt, ap); va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Warn, component, fmt, ap); va_end(ap);
}

void log_info(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Info, component, fmt, ap); va_end(ap);
}

void log_debug(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Debug, component, fmt, ap); va_end(ap);
}

} // namespace dmclean::util
