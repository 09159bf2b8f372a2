#pragma once

#include <cstdio>

#ifndef COMPOSER_ENABLE_LOGGING
#define COMPOSER_ENABLE_LOGGING 0
#endif

#if COMPOSER_ENABLE_LOGGING
#define COMPOSER_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[composer:debug] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define COMPOSER_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[composer:warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define COMPOSER_LOG_DEBUG(...) do { } while (0)
#define COMPOSER_LOG_WARN(...) do { } while (0)
#endif
