#include "hib/log.hpp"

#include <cstdio>
#include <ctime>

namespace hib {

namespace {

void write_line(FILE* out, const char* level, const char* fmt, va_list args) {
    char stamp[32];
    time_t now = time(nullptr);
    struct tm tm_val;
    gmtime_r(&now, &tm_val);
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm_val);

    fprintf(out, "%s %s", stamp, level);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

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
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "debug: ", fmt, args);
    va_end(args);
}

}  // namespace hib
