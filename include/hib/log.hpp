#pragma once

#include <cstdarg>

namespace hib {

/// printf-style log helpers. Info and debug go to stdout, warnings and
/// errors to stderr. Each line is prefixed with a UTC timestamp and flushed.
///
/// There is no global verbosity switch: callers gate debug output on the
/// `verbose` flag of whatever options struct they were handed.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace hib
