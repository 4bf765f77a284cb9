#pragma once

namespace s3pane {

/// Enable or disable log_debug() output (off by default).
void set_log_verbose(bool verbose);
bool log_verbose();

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace s3pane
