#include <eventrelay/client/stream_worker.hpp>
#include <eventrelay/core/events/event_codec.hpp>
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>

namespace EventRelay {

namespace {

// Keeps a stream registered with the pass's cancel token while it is live.
class CancelAttachment {
public:
    CancelAttachment(CancelToken* token, DuplexStream* stream) : token_(token), stream_(stream) {
        if (token_ && !token_->attach(stream_)) {
            token_ = nullptr;
            stream_->cancel();
        }
    }
    ~CancelAttachment() {
        if (token_) token_->detach(stream_);
    }

    CancelAttachment(const CancelAttachment&) = delete;
    CancelAttachment& operator=(const CancelAttachment&) = delete;

private:
    CancelToken* token_;
    DuplexStream* stream_;
};

} // namespace

StreamWorker::StreamWorker(Connection& connection, std::string apiKey, StreamContext ctx)
    : connection_(connection), apiKey_(std::move(apiKey)), ctx_(std::move(ctx)) {}

WorkerResult StreamWorker::reconcile(int64_t sent, int64_t sendErrors, int64_t ackOk, int64_t ackFailed) {
    WorkerResult r;
    r.sent = sent;
    if (ackOk > 0 || ackFailed > 0) {
        r.succeeded = ackOk;
        r.failed = ackFailed + sendErrors;
    } else {
        r.succeeded = sent - sendErrors;
        r.failed = sendErrors;
    }
    return r;
}

WorkerResult StreamWorker::drainAsFailed(EventQueue& events) {
    WorkerResult r;
    while (events.pop()) {
        ++r.sent;
        ++r.failed;
    }
    spdlog::warn("[StreamWorker] Stream to {} unavailable, {} event(s) counted as failed",
                 connection_.endpoint(), r.failed);
    return r;
}

void StreamWorker::receiveLoop(DuplexStream* stream) {
    wire::EventResponse response;
    try {
        while (stream->read(&response)) {
            Acknowledgement ack = EventCodec::fromResponse(response);
            if (ack.outcome() == AckStatus::FAILED) {
                ackFailed_.fetch_add(1, std::memory_order_relaxed);
                spdlog::debug("[StreamWorker] Event {} rejected: {}", ack.event_id, ack.error.value_or(ack.status));
            } else {
                ackOk_.fetch_add(1, std::memory_order_relaxed);
            }
        }
    } catch (const std::exception& e) {
        // No more acknowledgements can be read; abort the call so pending writes fail fast
        spdlog::error("[StreamWorker] Acknowledgement reader on {} failed: {}", connection_.endpoint(), e.what());
        stream->cancel();
    }
}

WorkerResult StreamWorker::run(EventQueue& events) {
    ackOk_.store(0, std::memory_order_relaxed);
    ackFailed_.store(0, std::memory_order_relaxed);

    std::unique_ptr<DuplexStream> stream;
    try {
        stream = connection_.openStream(apiKey_, ctx_);
    } catch (const std::exception& e) {
        spdlog::error("[StreamWorker] Failed to open stream to {}: {}", connection_.endpoint(), e.what());
    }
    if (!stream) {
        return drainAsFailed(events);
    }

    CancelAttachment attachment(ctx_.cancel_token.get(), stream.get());

    std::thread reader;
    try {
        reader = std::thread(&StreamWorker::receiveLoop, this, stream.get());
    } catch (const std::system_error& e) {
        spdlog::error("[StreamWorker] Could not start acknowledgement reader: {}", e.what());
        stream->cancel();
        return drainAsFailed(events);
    }

    int64_t sent = 0;
    int64_t sendErrors = 0;
    while (auto event = events.pop()) {
        ++sent;  // every attempt counts
        try {
            if (!stream->write(EventCodec::toRequest(**event))) {
                ++sendErrors;
            }
        } catch (const std::exception& e) {
            ++sendErrors;
            spdlog::debug("[StreamWorker] Could not send event for {}: {}", (*event)->subject_id, e.what());
        }
    }

    if (!stream->writesDone()) {
        spdlog::debug("[StreamWorker] Half-close on stream to {} failed", connection_.endpoint());
    }
    reader.join();

    grpc::Status status = stream->finish();
    if (!status.ok()) {
        spdlog::warn("[StreamWorker] Stream to {} ended with status {}: {}",
                     connection_.endpoint(), static_cast<int>(status.error_code()), status.error_message());
    }

    int64_t ackOk = ackOk_.load(std::memory_order_relaxed);
    int64_t ackFailed = ackFailed_.load(std::memory_order_relaxed);
    if (ackOk == 0 && ackFailed == 0 && sent > sendErrors) {
        spdlog::debug("[StreamWorker] No acknowledgements received for {} event(s); assuming success",
                      sent - sendErrors);
    }
    if (sendErrors > 0) {
        spdlog::warn("[StreamWorker] {} of {} send(s) to {} failed", sendErrors, sent, connection_.endpoint());
    }
    return reconcile(sent, sendErrors, ackOk, ackFailed);
}

} // namespace EventRelay
