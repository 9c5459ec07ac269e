#pragma once

#include <cstdio>

// Session diagnostics. Compiled out unless MAPEDIT_ENABLE_LOGGING is non-zero.
#ifndef MAPEDIT_ENABLE_LOGGING
#define MAPEDIT_ENABLE_LOGGING 0
#endif

#if MAPEDIT_ENABLE_LOGGING
#define MAPEDIT_LOG_LINE(prefix, ...) \
    do { \
        std::fputs(prefix, stderr); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fputc('\n', stderr); \
    } while (0)
#define MAPEDIT_LOG_DEBUG(...) MAPEDIT_LOG_LINE("[mapedit] ", __VA_ARGS__)
#define MAPEDIT_LOG_WARN(...) MAPEDIT_LOG_LINE("[mapedit] warning: ", __VA_ARGS__)
#else
#define MAPEDIT_LOG_DEBUG(...) do { } while (0)
#define MAPEDIT_LOG_WARN(...) do { } while (0)
#endif
