#include <eventrelay/client/session.hpp>
#include <eventrelay/client/errors.hpp>
#include <spdlog/spdlog.h>

namespace EventRelay {

Session::Session(std::string apiKey, ClientOptions options, TransportPtr transport)
    : inbound_(options.buffer_capacity),
      client_(std::move(apiKey), std::move(options), std::move(transport)) {
    client_.connect();
    spdlog::info("[Session] Ready: {} stream(s), buffer capacity {}", client_.numStreams(), inbound_.capacity());
}

Session::~Session() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::warn("[Session] Error while closing: {}", e.what());
    }
}

void Session::startLocked(const StreamContext& ctx) {
    result_ = client_.streamEventsAsync(inbound_, ctx).share();
    state_.store(SessionState::STARTED, std::memory_order_release);
    spdlog::info("[Session] Started streaming session");
}

void Session::start(const StreamContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load(std::memory_order_acquire) != SessionState::CREATED) {
        return;
    }
    startLocked(ctx);
}

void Session::submitBlocking(EventPtr event) {
    if (state_.load(std::memory_order_acquire) != SessionState::STARTED) {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_.load(std::memory_order_acquire)) {
        case SessionState::CREATED:
            startLocked(StreamContext{});
            break;
        case SessionState::FINALIZED:
            throw SessionFinalizedError();
        default:
            break;
        }
    }
    if (!inbound_.push(std::move(event))) {
        // buffer closed by finalize() while we were waiting
        throw SessionFinalizedError();
    }
}

bool Session::submitNonBlocking(EventPtr event) {
    if (state_.load(std::memory_order_acquire) != SessionState::STARTED) {
        return false;
    }
    switch (inbound_.tryPush(std::move(event))) {
    case EventQueue::TryPushResult::OK:
        return true;
    case EventQueue::TryPushResult::FULL:
        dropped_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[Session] Buffer full, event dropped");
        return false;
    case EventQueue::TryPushResult::CLOSED:
    default:
        return false;
    }
}

StreamStats Session::finalize() {
    std::shared_future<StreamStats> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // closed before it was ever started: there is no pass to report on
        if (state_.load(std::memory_order_acquire) == SessionState::CREATED || !result_.valid()) {
            throw NotStartedError();
        }
        result = result_;
    }

    if (inbound_.close()) {
        spdlog::debug("[Session] Input closed, waiting for streams to drain");
    }

    StreamStats stats;
    try {
        stats = result.get();
    } catch (...) {
        state_.store(SessionState::FINALIZED, std::memory_order_release);
        throw;
    }
    stats.total_dropped = dropped_.load(std::memory_order_relaxed);
    state_.store(SessionState::FINALIZED, std::memory_order_release);

    spdlog::info("[Session] Finalized: sent={} succeeded={} failed={} dropped={} in {}ms",
                 stats.total_sent, stats.total_succeeded, stats.total_failed, stats.total_dropped,
                 std::chrono::duration_cast<std::chrono::milliseconds>(stats.duration).count());
    return stats;
}

void Session::close() {
    if (state_.load(std::memory_order_acquire) == SessionState::STARTED) {
        try {
            finalize();
        } catch (const std::exception& e) {
            spdlog::warn("[Session] Finalize during close failed: {}", e.what());
        }
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load(std::memory_order_acquire) == SessionState::CREATED) {
            state_.store(SessionState::FINALIZED, std::memory_order_release);
        }
    }
    inbound_.close();
    client_.close();
}

} // namespace EventRelay
