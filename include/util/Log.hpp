// Leveled stderr logging: "dmclean: <Component>: <message>"
#pragma once

namespace dmclean::util {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Messages above this level are dropped. Default: Info.
void set_log_level(LogLevel level);

void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace dmclean::util
