#pragma once
#include <eventrelay/client/stream_client.hpp>
#include <eventrelay/client/stream_stats.hpp>
#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>

namespace EventRelay {

enum class SessionState {
    CREATED,
    STARTED,
    FINALIZED
};

/**
 * @class Session
 * @brief High-throughput ingestion session over several parallel streams.
 *
 * Producers push events into a bounded buffer; a background pipeline
 * distributes them round-robin over the pool's streams. A session is single
 * use: CREATED -> STARTED -> FINALIZED.
 *
 * Usage:
 * @code
 *   Session session(apiKey);              // connects SESSION_NUM_STREAMS streams
 *   for (...) session.submitBlocking(makeEvent(...));
 *   StreamStats stats = session.finalize();
 *   session.close();
 * @endcode
 *
 * The non-blocking drop counter is only merged into the statistics at
 * finalize(); there is no live view of it.
 */
class Session {
public:
    // Connects immediately. @throws ConnectionError
    explicit Session(std::string apiKey,
                     ClientOptions options = ClientOptions::sessionDefaults(),
                     TransportPtr transport = nullptr);
    ~Session() noexcept;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Launches the pipeline; later calls are no-ops.
    void start(const StreamContext& ctx = {});

    /**
     * @brief Queue an event, waiting while the buffer is full
     *
     * Starts the session on first use. Never drops.
     * @throws SessionFinalizedError once the session has been finalized
     */
    void submitBlocking(EventPtr event);

    /**
     * @brief Queue an event without waiting
     * @return false if the session is not running or the buffer is full;
     *         only the buffer-full case is counted as a drop
     */
    bool submitNonBlocking(EventPtr event);

    /**
     * @brief Stop accepting events, wait for every stream to finish, return stats
     *
     * Calling it again returns the same statistics.
     * @throws NotStartedError if the session was never started (including one
     *         closed before it started)
     */
    StreamStats finalize();

    // Finalizes if still running (best effort), then closes the connections.
    // A session closed before it started can no longer be started.
    void close();

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    size_t numStreams() const { return client_.numStreams(); }
    size_t bufferCapacity() const { return inbound_.capacity(); }

private:
    void startLocked(const StreamContext& ctx);

    // Declared before client_ so the pipeline's thread pool is joined first.
    EventQueue inbound_;
    StreamClient client_;

    std::mutex mutex_;  // guards state transitions and result_
    std::atomic<SessionState> state_{SessionState::CREATED};
    std::shared_future<StreamStats> result_;
    std::atomic<int64_t> dropped_{0};
};

} // namespace EventRelay
