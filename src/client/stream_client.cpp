#include <eventrelay/client/stream_client.hpp>
#include <eventrelay/client/errors.hpp>
#include <eventrelay/transport/grpc_transport.hpp>
#include <eventrelay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

namespace EventRelay {

namespace {

TransportPtr orDefault(TransportPtr transport) {
    return transport ? std::move(transport) : std::make_shared<GrpcTransport>();
}

size_t validStreams(size_t n) {
    return n > 0 ? n : DEFAULT_NUM_STREAMS;
}

} // namespace

StreamClient::StreamClient(std::string apiKey, ClientOptions options, TransportPtr transport)
    : apiKey_(std::move(apiKey)),
      options_([&] { options.num_streams = validStreams(options.num_streams); return std::move(options); }()),
      pool_(orDefault(std::move(transport)), options_.num_streams),
      threads_(options_.num_streams + 1) {}

StreamClient::~StreamClient() noexcept {
    // An async pass may still hold the pool's connections; let it finish first.
    waitForAsyncPasses();
    threads_.shutdown();
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::warn("[StreamClient] Error while closing: {}", e.what());
    }
}

void StreamClient::connect() {
    pool_.connect(options_.endpoint, options_.timeout, options_.secure());
}

void StreamClient::close() {
    pool_.close();
}

StreamStats StreamClient::streamEvents(EventQueue& events, const StreamContext& ctx) {
    auto connections = pool_.snapshot();
    if (connections.empty()) {
        throw NotConnectedError();
    }

    const uint64_t startNs = Clock::now_ns();
    Distributor distributor(connections, apiKey_, threads_, options_.worker_queue_capacity);
    WorkerResult total = distributor.run(events, ctx);
    const auto elapsed = Clock::since(startNs);

    StreamStats stats;
    stats.total_sent = total.sent;
    stats.total_succeeded = total.succeeded;
    stats.total_failed = total.failed;
    stats.duration = elapsed;
    stats.events_per_sec = Clock::perSecond(total.sent, elapsed);
    stats.active_streams = connections.size();

    spdlog::info("[StreamClient] Sent {} event(s) over {} stream(s): {} succeeded, {} failed ({:.0f} events/s)",
                 stats.total_sent, stats.active_streams, stats.total_succeeded,
                 stats.total_failed, stats.events_per_sec);
    return stats;
}

StreamStats StreamClient::streamEvents(const std::vector<EventPtr>& events, const StreamContext& ctx) {
    EventQueue queue(events.empty() ? 1 : events.size());
    for (const auto& event : events) {
        queue.push(event);
    }
    queue.close();
    return streamEvents(queue, ctx);
}

std::future<StreamStats> StreamClient::streamEventsAsync(EventQueue& events, StreamContext ctx) {
    {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        ++asyncPasses_;
    }
    try {
        return threads_.submit([this, &events, ctx = std::move(ctx)]() {
            struct PassDone {
                StreamClient* client;
                ~PassDone() {
                    std::lock_guard<std::mutex> lock(client->asyncMutex_);
                    --client->asyncPasses_;
                    client->asyncDone_.notify_all();
                }
            } done{this};
            return streamEvents(events, ctx);
        });
    } catch (...) {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        --asyncPasses_;
        throw;
    }
}

void StreamClient::waitForAsyncPasses() {
    std::unique_lock<std::mutex> lock(asyncMutex_);
    if (asyncPasses_ > 0) {
        spdlog::info("[StreamClient] Waiting for {} streaming pass(es) before shutdown", asyncPasses_);
    }
    asyncDone_.wait(lock, [this] { return asyncPasses_ == 0; });
}

} // namespace EventRelay
