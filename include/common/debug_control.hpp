#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace ext2vm {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - EXT2VM_PROFILE: Enable/disable profiling output (timing measurements)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * - EXT2VM_DEBUG: Enable/disable debug output (per-procedure stack traces)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static const bool cached = env_flag_enabled("EXT2VM_PROFILE");
    return cached;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool cached = env_flag_enabled("EXT2VM_DEBUG");
    return cached;
}

} // namespace debug
} // namespace ext2vm

// Profile printing (timing measurements)
#define EXT2VM_PROFILE_PRINT(...) \
    do { \
        if (ext2vm::debug::is_profile_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define EXT2VM_PROFILE_COUT(expr) \
    do { \
        if (ext2vm::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (stack traces), written to stderr so stdout stays parseable
#define EXT2VM_DEBUG_CERR(expr) \
    do { \
        if (ext2vm::debug::is_debug_enabled()) { \
            std::cerr << expr; \
        } \
    } while(0)
