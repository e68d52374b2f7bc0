#include <eventrelay/transport/cancel_token.hpp>
#include <eventrelay/transport/transport.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace EventRelay {

void CancelToken::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    spdlog::warn("[CancelToken] Cancelling {} active stream(s)", streams_.size());
    for (auto* stream : streams_) {
        stream->cancel();
    }
}

bool CancelToken::attach(DuplexStream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load(std::memory_order_acquire)) {
        return false;
    }
    streams_.push_back(stream);
    return true;
}

void CancelToken::detach(DuplexStream* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.erase(std::remove(streams_.begin(), streams_.end(), stream), streams_.end());
}

} // namespace EventRelay
