#pragma once

namespace davdrive {

// printf-style logging. Info goes to stdout, errors to stderr.
// Debug output is dropped unless verbose logging has been enabled.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose_logging(bool enabled);
bool verbose_logging();

} // namespace davdrive
