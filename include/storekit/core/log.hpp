#pragma once

namespace storekit {

// printf-style logging. Info goes to stdout; debug, warnings and errors go
// to stderr with a severity prefix. Every line is newline-terminated.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Only printed when verbose logging is on
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose(bool verbose);
bool verbose_enabled();

} // namespace storekit
