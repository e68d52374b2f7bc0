#pragma once
// ============================================================================
// IN-MEMORY TRANSPORT FOR TESTS
// ============================================================================
// Stands in for the ingestion service: records what every connection was sent
// and answers according to a configurable behaviour.
// ============================================================================

#include <eventrelay/transport/transport.hpp>
#include <eventrelay/core/queues/bounded_queue.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace EventRelay::Testing {

enum class AckMode {
    ACK_OK,            // one "ok" ack per event, sent immediately
    ACK_FAILED,        // one "failed" ack per event
    ACK_ALTERNATING,   // ok, error, ok, error, ...
    ACK_REVERSED,      // one "ok" ack per event, all sent after half-close in reverse order
    SILENT,            // never acks, ends the stream on half-close
    HANG               // never acks, never ends the stream until cancelled
};

struct FakeBehaviour {
    AckMode mode = AckMode::ACK_OK;
    bool failOpen = false;
    bool throwOnClose = false;
    bool throwOnRead = false;                 // the acknowledgement reader hits a transport exception
    int failWritesAfter = -1;                 // writes with index >= this fail; -1 = never
    std::chrono::microseconds writeDelay{0};  // simulated transport backpressure
};

// What one connection observed over its lifetime.
struct StreamLog {
    std::mutex m;
    std::vector<std::string> subjects;
    std::vector<wire::EventRequest> requests;
    std::string apiKey;
    int streamsOpened = 0;
    bool halfClosed = false;

    std::vector<std::string> subjectsSnapshot() {
        std::lock_guard<std::mutex> lock(m);
        return subjects;
    }
};

class FakeDuplexStream : public DuplexStream {
public:
    FakeDuplexStream(std::shared_ptr<StreamLog> log, FakeBehaviour behaviour)
        : log_(std::move(log)), behaviour_(behaviour), acks_(1 << 20) {}

    bool write(const wire::EventRequest& request) override {
        if (cancelled_.load()) return false;
        if (behaviour_.writeDelay.count() > 0) {
            std::this_thread::sleep_for(behaviour_.writeDelay);
        }
        const int index = writes_++;
        if (behaviour_.failWritesAfter >= 0 && index >= behaviour_.failWritesAfter) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(log_->m);
            log_->subjects.push_back(request.user_id());
            log_->requests.push_back(request);
        }

        wire::EventResponse ack;
        ack.set_event_id("evt-" + request.user_id());
        ack.set_certificate_id("cert-" + std::to_string(index));
        switch (behaviour_.mode) {
        case AckMode::ACK_OK:
            ack.set_status("ok");
            acks_.push(ack);
            break;
        case AckMode::ACK_FAILED:
            ack.set_status("failed");
            ack.set_error("rejected by test");
            acks_.push(ack);
            break;
        case AckMode::ACK_ALTERNATING:
            ack.set_status(index % 2 == 0 ? "ok" : "error");
            acks_.push(ack);
            break;
        case AckMode::ACK_REVERSED: {
            ack.set_status("ok");
            std::lock_guard<std::mutex> lock(pendingMutex_);
            pending_.push_back(ack);
            break;
        }
        case AckMode::SILENT:
        case AckMode::HANG:
            break;
        }
        return true;
    }

    bool read(wire::EventResponse* response) override {
        if (behaviour_.throwOnRead) {
            throw std::runtime_error("malformed frame");
        }
        auto ack = acks_.pop();
        if (!ack) return false;
        *response = std::move(*ack);
        return true;
    }

    bool writesDone() override {
        {
            std::lock_guard<std::mutex> lock(log_->m);
            log_->halfClosed = true;
        }
        if (behaviour_.mode == AckMode::ACK_REVERSED) {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            for (auto it = pending_.rbegin(); it != pending_.rend(); ++it) {
                acks_.push(*it);
            }
        }
        if (behaviour_.mode != AckMode::HANG) {
            acks_.close();
        }
        return !cancelled_.load();
    }

    grpc::Status finish() override {
        if (cancelled_.load()) {
            return grpc::Status(grpc::StatusCode::CANCELLED, "cancelled");
        }
        return grpc::Status::OK;
    }

    void cancel() override {
        cancelled_.store(true);
        acks_.close();
    }

private:
    std::shared_ptr<StreamLog> log_;
    FakeBehaviour behaviour_;
    BoundedQueue<wire::EventResponse> acks_;
    std::atomic<bool> cancelled_{false};
    std::atomic<int> writes_{0};
    std::mutex pendingMutex_;
    std::vector<wire::EventResponse> pending_;
};

class FakeConnection : public Connection {
public:
    FakeConnection(std::string endpoint, std::shared_ptr<StreamLog> log, FakeBehaviour behaviour,
                   std::atomic<int>& closedCounter)
        : endpoint_(std::move(endpoint)), log_(std::move(log)), behaviour_(behaviour),
          closedCounter_(closedCounter) {}

    std::unique_ptr<DuplexStream> openStream(const std::string& apiKey, const StreamContext&) override {
        if (behaviour_.failOpen) return nullptr;
        {
            std::lock_guard<std::mutex> lock(log_->m);
            log_->apiKey = apiKey;
            ++log_->streamsOpened;
        }
        return std::make_unique<FakeDuplexStream>(log_, behaviour_);
    }

    void close() override {
        if (closed_) return;
        closed_ = true;
        closedCounter_.fetch_add(1);
        if (behaviour_.throwOnClose) {
            throw std::runtime_error("close failed on " + endpoint_);
        }
    }

    const std::string& endpoint() const override { return endpoint_; }

private:
    std::string endpoint_;
    std::shared_ptr<StreamLog> log_;
    FakeBehaviour behaviour_;
    std::atomic<int>& closedCounter_;
    bool closed_ = false;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(FakeBehaviour behaviour = {}) : behaviour_(behaviour) {}

    std::unique_ptr<Connection> dial(const std::string& endpoint,
                                     std::chrono::milliseconds,
                                     bool secure) override {
        std::lock_guard<std::mutex> lock(m_);
        const int index = dials_++;
        lastSecure_ = secure;
        if (failDialAt_ >= 0 && index == failDialAt_) {
            throw std::runtime_error("endpoint unreachable");
        }
        auto log = std::make_shared<StreamLog>();
        logs_.push_back(log);
        FakeBehaviour b = behaviour_;
        if (index < static_cast<int>(perConnection_.size())) {
            b = perConnection_[index];
        }
        return std::make_unique<FakeConnection>(endpoint, log, b, closed_);
    }

    // Dial number `index` (0-based, counted across reconnects) throws.
    void failDialAt(int index) { failDialAt_ = index; }
    void setPerConnection(std::vector<FakeBehaviour> b) { perConnection_ = std::move(b); }

    std::shared_ptr<StreamLog> log(size_t i) {
        std::lock_guard<std::mutex> lock(m_);
        return logs_.at(i);
    }
    int dials() {
        std::lock_guard<std::mutex> lock(m_);
        return dials_;
    }
    int closed() const { return closed_.load(); }
    bool lastSecure() {
        std::lock_guard<std::mutex> lock(m_);
        return lastSecure_;
    }

private:
    FakeBehaviour behaviour_;
    std::vector<FakeBehaviour> perConnection_;
    std::mutex m_;
    std::vector<std::shared_ptr<StreamLog>> logs_;
    int dials_ = 0;
    int failDialAt_ = -1;
    bool lastSecure_ = false;
    std::atomic<int> closed_{0};
};

inline EventPtr subjectEvent(const std::string& subject, const std::string& type = "action") {
    return makeEvent(Event(subject, type));
}

} // namespace EventRelay::Testing
