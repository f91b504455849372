#pragma once

// Diagnostic logging to stderr.
// Internal implementation - not part of public API.
//
//   logMessage("GL", "shader error: %s", log);   ->   mui GL: shader error: ...
//
// Silent when MUI_ENABLE_LOGGING is 0.

#include <cstdarg>
#include <cstdio>

#ifndef MUI_ENABLE_LOGGING
#define MUI_ENABLE_LOGGING 1
#endif

namespace mui {

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
inline void logMessage(const char* component, const char* fmt, ...) {
#if MUI_ENABLE_LOGGING
    std::fprintf(stderr, "mui %s: ", component);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
#else
    (void)component;
    (void)fmt;
#endif
}

} // namespace mui
