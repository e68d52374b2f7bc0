#include <eventrelay/transport/connection_pool.hpp>
#include <eventrelay/client/errors.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <stdexcept>

namespace EventRelay {

ConnectionPool::ConnectionPool(TransportPtr transport, size_t numStreams)
    : transport_(std::move(transport)), numStreams_(numStreams) {
    if (!transport_) {
        throw std::invalid_argument("ConnectionPool requires a transport");
    }
    if (numStreams_ == 0) {
        throw std::invalid_argument("ConnectionPool requires at least one stream");
    }
}

ConnectionPool::~ConnectionPool() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::warn("[ConnectionPool] Error while closing connections: {}", e.what());
    }
}

void ConnectionPool::connect(const std::string& endpoint, std::chrono::milliseconds timeout, bool secure) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!connections_.empty()) {
        spdlog::info("[ConnectionPool] Reconnecting, closing {} existing connection(s)", connections_.size());
        closeAllLocked(false);
    }

    connections_.reserve(numStreams_);
    for (size_t i = 0; i < numStreams_; ++i) {
        try {
            connections_.push_back(transport_->dial(endpoint, timeout, secure));
        } catch (const std::exception& e) {
            spdlog::error("[ConnectionPool] Stream {} failed to connect to {}: {}", i, endpoint, e.what());
            closeAllLocked(false);
            throw ConnectionError(i, e.what());
        }
    }
    spdlog::info("[ConnectionPool] Connected {} stream(s) to {} ({})",
                 numStreams_, endpoint, secure ? "tls" : "plaintext");
}

void ConnectionPool::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeAllLocked(true);
}

void ConnectionPool::closeAllLocked(bool rethrow) {
    std::exception_ptr firstError;
    for (auto& conn : connections_) {
        if (!conn) continue;
        try {
            conn->close();
        } catch (const std::exception& e) {
            spdlog::warn("[ConnectionPool] Failed to close connection to {}: {}", conn->endpoint(), e.what());
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    connections_.clear();

    if (rethrow && firstError) {
        std::rethrow_exception(firstError);
    }
}

std::vector<Connection*> ConnectionPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Connection*> conns;
    conns.reserve(connections_.size());
    for (const auto& conn : connections_) {
        conns.push_back(conn.get());
    }
    return conns;
}

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

} // namespace EventRelay
