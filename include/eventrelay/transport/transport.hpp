#pragma once
#include <eventrelay/core/events/event_codec.hpp>
#include <eventrelay/transport/cancel_token.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <grpcpp/support/status.h>

namespace EventRelay {

/**
 * @brief Caller-side controls for one streaming pass.
 *
 * The deadline bounds every duplex call opened during the pass. Cancelling the
 * token aborts all streams attached to it, unblocking pending reads/writes.
 */
struct StreamContext {
    std::optional<std::chrono::system_clock::time_point> deadline;
    std::shared_ptr<CancelToken> cancel_token;
};

/**
 * @brief Send/receive halves of one bidirectional call.
 *
 * One thread may write while another reads. writesDone() and finish() belong
 * to the writing side; finish() must only be called after read() returned false.
 */
class DuplexStream {
public:
    virtual ~DuplexStream() = default;

    virtual bool write(const wire::EventRequest& request) = 0;

    // false once the server has closed its side or the call failed
    virtual bool read(wire::EventResponse* response) = 0;

    // Half-close: no more writes will follow.
    virtual bool writesDone() = 0;

    virtual grpc::Status finish() = 0;

    // Thread-safe; makes pending and future read/write calls fail fast.
    virtual void cancel() = 0;
};

// One live connection to the ingestion endpoint, used by exactly one worker.
class Connection {
public:
    virtual ~Connection() = default;

    /**
     * @brief Open a duplex call carrying the API key as call metadata
     * @return nullptr if the call could not be opened
     */
    virtual std::unique_ptr<DuplexStream> openStream(const std::string& apiKey,
                                                     const StreamContext& ctx) = 0;

    // May throw; ConnectionPool collects the first failure.
    virtual void close() = 0;

    virtual const std::string& endpoint() const = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Establish one connection, waiting at most `timeout`
     * @throws std::runtime_error (or subclass) if the endpoint is unreachable
     */
    virtual std::unique_ptr<Connection> dial(const std::string& endpoint,
                                             std::chrono::milliseconds timeout,
                                             bool secure) = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace EventRelay
