#pragma once
#include <eventrelay/client/distributor.hpp>
#include <eventrelay/client/stream_stats.hpp>
#include <eventrelay/core/config/client_options.hpp>
#include <eventrelay/core/utils/thread_pool.hpp>
#include <eventrelay/transport/connection_pool.hpp>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace EventRelay {

/**
 * @class StreamClient
 * @brief Low-level multi-stream client: connect, stream a queue, close.
 *
 * Usage:
 * @code
 *   StreamClient client(apiKey, options);
 *   client.connect();
 *   auto stats = client.streamEvents(events);   // events closed by the producer
 *   client.close();
 * @endcode
 */
class StreamClient {
public:
    // transport defaults to GrpcTransport
    StreamClient(std::string apiKey, ClientOptions options, TransportPtr transport = nullptr);
    ~StreamClient() noexcept;

    StreamClient(const StreamClient&) = delete;
    StreamClient& operator=(const StreamClient&) = delete;

    // @throws ConnectionError
    void connect();

    // Must not race an active streaming pass.
    void close();
    bool isConnected() const { return pool_.size() > 0; }

    /**
     * @brief Stream every event of `events` until the queue is closed and drained
     * @throws NotConnectedError if connect() has not succeeded
     */
    StreamStats streamEvents(EventQueue& events, const StreamContext& ctx = {});

    // Convenience: streams a fixed batch of events.
    StreamStats streamEvents(const std::vector<EventPtr>& events, const StreamContext& ctx = {});

    /**
     * @brief Run streamEvents() as the coordinating task on the client's thread pool
     *
     * The queue must outlive the returned future. Destroying the client
     * waits for the pass, so the queue must be closed by then.
     */
    std::future<StreamStats> streamEventsAsync(EventQueue& events, StreamContext ctx = {});

    size_t numStreams() const { return options_.num_streams; }

private:
    void waitForAsyncPasses();

    std::string apiKey_;
    ClientOptions options_;
    ConnectionPool pool_;
    ThreadPool threads_;

    std::mutex asyncMutex_;
    std::condition_variable asyncDone_;
    size_t asyncPasses_ = 0;  // submitted by streamEventsAsync and not yet finished
};

} // namespace EventRelay
