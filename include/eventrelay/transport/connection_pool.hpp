#pragma once
#include <eventrelay/transport/transport.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace EventRelay {

/**
 * @class ConnectionPool
 * @brief Owns numStreams independent connections to one endpoint.
 *
 * The connection list is only mutated under the pool mutex. Callers stream
 * over a snapshot; one pool backs one streaming pass at a time.
 */
class ConnectionPool {
public:
    ConnectionPool(TransportPtr transport, size_t numStreams);
    ~ConnectionPool() noexcept;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Dial numStreams connections, replacing any existing ones
     * @throws ConnectionError naming the index that failed; connections opened
     *         before it are closed again
     */
    void connect(const std::string& endpoint, std::chrono::milliseconds timeout, bool secure);

    /**
     * @brief Close every connection
     *
     * All connections are attempted even if one fails; the first failure is
     * rethrown once the pool is empty.
     */
    void close();

    std::vector<Connection*> snapshot() const;
    size_t size() const;
    size_t numStreams() const { return numStreams_; }

private:
    void closeAllLocked(bool rethrow);

    TransportPtr transport_;
    const size_t numStreams_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Connection>> connections_;
};

} // namespace EventRelay
