#pragma once
#include <eventrelay/client/stream_stats.hpp>
#include <eventrelay/core/events/event.hpp>
#include <eventrelay/core/queues/bounded_queue.hpp>
#include <eventrelay/transport/transport.hpp>
#include <atomic>
#include <cstdint>
#include <string>

namespace EventRelay {

using EventQueue = BoundedQueue<EventPtr>;

/**
 * @class StreamWorker
 * @brief Drives one connection's duplex stream from an event queue to completion.
 *
 * The calling thread runs the send loop; a reader thread drains
 * acknowledgements until the server ends the stream. Once the queue is
 * exhausted the worker half-closes, waits for the reader and reconciles its
 * counters (see reconcile()).
 *
 * The queue is always drained to the end, even when the stream cannot be
 * opened, so whoever feeds the queue never blocks forever.
 *
 * Failures never escape run(); they only show up in the returned counters.
 */
class StreamWorker {
public:
    StreamWorker(Connection& connection, std::string apiKey, StreamContext ctx);

    WorkerResult run(EventQueue& events);

    /**
     * @brief Turn raw counters into the reported result
     *
     * With at least one acknowledgement the server's verdicts are trusted:
     * succeeded = ackOk, failed = ackFailed + sendErrors.
     *
     * Without any acknowledgement (server processes asynchronously, or lost
     * them) every event handed to the transport is assumed to have succeeded:
     * succeeded = sent - sendErrors, failed = sendErrors. This is a best-effort
     * estimate; "still processing" and "silently dropped" are indistinguishable
     * from the client side.
     */
    static WorkerResult reconcile(int64_t sent, int64_t sendErrors, int64_t ackOk, int64_t ackFailed);

private:
    WorkerResult drainAsFailed(EventQueue& events);
    void receiveLoop(DuplexStream* stream);

    Connection& connection_;
    std::string apiKey_;
    StreamContext ctx_;

    std::atomic<int64_t> ackOk_{0};
    std::atomic<int64_t> ackFailed_{0};
};

} // namespace EventRelay
