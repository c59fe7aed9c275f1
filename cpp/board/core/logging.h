#pragma once

#include <cstdio>

#ifndef BOARD_ENABLE_LOGGING
#define BOARD_ENABLE_LOGGING 0
#endif

#if BOARD_ENABLE_LOGGING
#define BOARD_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[board] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define BOARD_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[board][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define BOARD_LOG_DEBUG(...) do { } while (0)
#define BOARD_LOG_WARN(...) do { } while (0)
#endif
