#pragma once
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace EventRelay {

// Counters one worker (or the sum of all workers) reports for a streaming pass.
struct WorkerResult {
    int64_t sent = 0;
    int64_t succeeded = 0;
    int64_t failed = 0;

    WorkerResult& operator+=(const WorkerResult& other) {
        sent += other.sent;
        succeeded += other.succeeded;
        failed += other.failed;
        return *this;
    }
};

/**
 * @brief Final statistics of a streaming pass or session.
 *
 * total_dropped is only ever non-zero for Session, which merges the
 * non-blocking drop counter in at finalize().
 */
struct StreamStats {
    int64_t total_sent = 0;
    int64_t total_succeeded = 0;
    int64_t total_failed = 0;
    int64_t total_dropped = 0;
    std::chrono::nanoseconds duration{0};
    double events_per_sec = 0.0;
    size_t active_streams = 0;
};

} // namespace EventRelay
