#include "s3pane/core/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace s3pane {

namespace {

std::atomic<bool> g_verbose{false};
std::mutex g_log_mutex;

void write_line(FILE* out, const char* level, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&tt, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(out, "%s %s", stamp, level);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_log_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool log_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!log_verbose()) return;
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

}  // namespace s3pane
