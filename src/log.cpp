#include "panxfer/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace panxfer {

namespace {

std::atomic<bool> g_verbose{false};

// Worker threads log concurrently; keep each line whole.
std::mutex g_log_mutex;

void emit(FILE* out, const char* prefix, const char* fmt, va_list args) {
    std::lock_guard lock(g_log_mutex);
    if (prefix) fputs(prefix, out);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_verbose(bool verbose) { g_verbose = verbose; }

bool verbose_enabled() { return g_verbose; }

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(stderr, "WARN: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!g_verbose) return;
    va_list args;
    va_start(args, fmt);
    emit(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

}  // namespace panxfer
