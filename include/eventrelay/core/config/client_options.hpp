#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace EventRelay {

inline constexpr const char* DEFAULT_ENDPOINT = "ingest.example.com:443";
inline constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};
inline constexpr size_t DEFAULT_NUM_STREAMS = 1;
inline constexpr size_t SESSION_NUM_STREAMS = 4;
inline constexpr size_t DEFAULT_BUFFER_CAPACITY = 100000;
inline constexpr size_t DEFAULT_WORKER_QUEUE_CAPACITY = 10000;

/**
 * @brief Connection and streaming settings for StreamClient / Session.
 *
 * use_tls is a request: TLS is only negotiated when the endpoint also names
 * port 443, otherwise the connection is plaintext (see secure()).
 */
struct ClientOptions {
    std::string endpoint = DEFAULT_ENDPOINT;
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
    bool use_tls = true;
    size_t num_streams = DEFAULT_NUM_STREAMS;

    // Session inbound buffer; only used by Session
    size_t buffer_capacity = DEFAULT_BUFFER_CAPACITY;
    // Per-worker queue between distributor and stream worker
    size_t worker_queue_capacity = DEFAULT_WORKER_QUEUE_CAPACITY;

    bool secure() const {
        return use_tls && endpoint.find(":443") != std::string::npos;
    }

    static ClientOptions sessionDefaults() {
        ClientOptions o;
        o.num_streams = SESSION_NUM_STREAMS;
        return o;
    }
};

} // namespace EventRelay
