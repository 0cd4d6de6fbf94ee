#pragma once

#include <cstdio>

namespace asmlower {

constexpr const char* VERSION = "0.3.0";

// Debug utilities
#ifdef AL_DEBUG
    #define AL_DEBUG_LOWER(fmt, ...) \
        printf("[LOWER] " fmt "\n", ##__VA_ARGS__)
#else
    #define AL_DEBUG_LOWER(fmt, ...)
#endif

} // namespace asmlower
