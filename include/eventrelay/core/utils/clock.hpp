// ============================================================================
// MONOTONIC CLOCK FOR STREAM TIMING
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>

namespace EventRelay {

class Clock {
public:
    // Current time in nanoseconds (monotonic, steady)
    static inline uint64_t now_ns() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }

    static inline std::chrono::nanoseconds since(uint64_t start_ns) {
        return std::chrono::nanoseconds(now_ns() - start_ns);
    }

    static inline double perSecond(int64_t count, std::chrono::nanoseconds elapsed) {
        const double seconds = std::chrono::duration<double>(elapsed).count();
        return seconds > 0.0 ? static_cast<double>(count) / seconds : 0.0;
    }
};

} // namespace EventRelay
