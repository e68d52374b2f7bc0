// ============================================================================
// STREAM WORKER UNIT TESTS
// ============================================================================
// Send/receive loops, acknowledgement accounting, reconciliation policy
// and queue draining on failure
// ============================================================================

#include <gtest/gtest.h>
#include <eventrelay/client/stream_worker.hpp>
#include "fake_transport.hpp"
#include <thread>

using namespace EventRelay;
using namespace EventRelay::Testing;

class StreamWorkerTest : public ::testing::Test {
protected:
    std::atomic<int> closed{0};

    std::unique_ptr<FakeConnection> connection(FakeBehaviour b, std::shared_ptr<StreamLog> log) {
        return std::make_unique<FakeConnection>("fake:1", std::move(log), b, closed);
    }

    static void fill(EventQueue& q, int n) {
        for (int i = 0; i < n; ++i) {
            q.push(subjectEvent("user-" + std::to_string(i)));
        }
        q.close();
    }
};

TEST_F(StreamWorkerTest, AllAcknowledgedOk) {
    auto log = std::make_shared<StreamLog>();
    auto conn = connection(FakeBehaviour{}, log);
    EventQueue q(16);
    fill(q, 10);

    StreamWorker worker(*conn, "key-123", StreamContext{});
    WorkerResult r = worker.run(q);

    EXPECT_EQ(r.sent, 10);
    EXPECT_EQ(r.succeeded, 10);
    EXPECT_EQ(r.failed, 0);
    EXPECT_EQ(log->subjects.size(), 10u);
    EXPECT_EQ(log->apiKey, "key-123");
    EXPECT_TRUE(log->halfClosed);
}

TEST_F(StreamWorkerTest, SendsInQueueOrder) {
    auto log = std::make_shared<StreamLog>();
    auto conn = connection(FakeBehaviour{}, log);
    EventQueue q(16);
    fill(q, 5);

    StreamWorker(*conn, "k", StreamContext{}).run(q);

    std::vector<std::string> expected = {"user-0", "user-1", "user-2", "user-3", "user-4"};
    EXPECT_EQ(log->subjects, expected);
}

TEST_F(StreamWorkerTest, FailedAcknowledgementsAreCounted) {
    FakeBehaviour b;
    b.mode = AckMode::ACK_ALTERNATING;
    auto conn = connection(b, std::make_shared<StreamLog>());
    EventQueue q(16);
    fill(q, 6);

    WorkerResult r = StreamWorker(*conn, "k", StreamContext{}).run(q);

    EXPECT_EQ(r.sent, 6);
    EXPECT_EQ(r.succeeded, 3);
    EXPECT_EQ(r.failed, 3);
    EXPECT_EQ(r.succeeded + r.failed, r.sent);
}

TEST_F(StreamWorkerTest, OutOfOrderAcknowledgementsStillBalance) {
    FakeBehaviour b;
    b.mode = AckMode::ACK_REVERSED;
    auto conn = connection(b, std::make_shared<StreamLog>());
    EventQueue q(64);
    fill(q, 40);

    WorkerResult r = StreamWorker(*conn, "k", StreamContext{}).run(q);

    EXPECT_EQ(r.sent, 40);
    EXPECT_EQ(r.succeeded, 40);
    EXPECT_EQ(r.failed, 0);
}

TEST_F(StreamWorkerTest, OpenFailureDrainsQueueAndCountsEverythingFailed) {
    FakeBehaviour b;
    b.failOpen = true;
    auto conn = connection(b, std::make_shared<StreamLog>());
    EventQueue q(4);

    // Producer pushes more than the queue holds; it only finishes if the worker drains.
    std::thread producer([&] { fill(q, 20); });
    WorkerResult r = StreamWorker(*conn, "k", StreamContext{}).run(q);
    producer.join();

    EXPECT_EQ(r.sent, 20);
    EXPECT_EQ(r.succeeded, 0);
    EXPECT_EQ(r.failed, 20);
    EXPECT_EQ(q.size(), 0u);
}

// The service may process asynchronously and never acknowledge. Without acks
// the worker can only assume that every event the transport accepted arrived.
TEST_F(StreamWorkerTest, SilentServerAssumesAcceptedEventsSucceeded) {
    FakeBehaviour b;
    b.mode = AckMode::SILENT;
    b.failWritesAfter = 7;
    auto conn = connection(b, std::make_shared<StreamLog>());
    EventQueue q(16);
    fill(q, 10);

    WorkerResult r = StreamWorker(*conn, "k", StreamContext{}).run(q);

    EXPECT_EQ(r.sent, 10);
    EXPECT_EQ(r.succeeded, 7);
    EXPECT_EQ(r.failed, 3);
}

TEST_F(StreamWorkerTest, SendErrorsAddToServerFailures) {
    FakeBehaviour b;
    b.mode = AckMode::ACK_OK;
    b.failWritesAfter = 4;
    auto conn = connection(b, std::make_shared<StreamLog>());
    EventQueue q(16);
    fill(q, 6);

    WorkerResult r = StreamWorker(*conn, "k", StreamContext{}).run(q);

    EXPECT_EQ(r.sent, 6);
    EXPECT_EQ(r.succeeded, 4);
    EXPECT_EQ(r.failed, 2);
}

TEST_F(StreamWorkerTest, CancelUnblocksHungStream) {
    FakeBehaviour b;
    b.mode = AckMode::HANG;
    auto conn = connection(b, std::make_shared<StreamLog>());
    EventQueue q(16);
    fill(q, 5);

    StreamContext ctx;
    ctx.cancel_token = std::make_shared<CancelToken>();
    std::thread canceller([token = ctx.cancel_token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token->cancel();
    });

    WorkerResult r = StreamWorker(*conn, "k", ctx).run(q);
    canceller.join();

    EXPECT_EQ(r.sent, 5);
    EXPECT_EQ(r.succeeded + r.failed, 5);
}

TEST_F(StreamWorkerTest, AlreadyCancelledTokenFailsWrites) {
    auto conn = connection(FakeBehaviour{}, std::make_shared<StreamLog>());
    EventQueue q(16);
    fill(q, 3);

    StreamContext ctx;
    ctx.cancel_token = std::make_shared<CancelToken>();
    ctx.cancel_token->cancel();

    WorkerResult r = StreamWorker(*conn, "k", ctx).run(q);
    EXPECT_EQ(r.sent, 3);
    EXPECT_EQ(r.failed, 3);
    EXPECT_EQ(r.succeeded, 0);
}

TEST_F(StreamWorkerTest, ReaderFailureEndsStreamInsteadOfTerminating) {
    FakeBehaviour b;
    b.throwOnRead = true;
    b.writeDelay = std::chrono::milliseconds(5);
    auto log = std::make_shared<StreamLog>();
    auto conn = connection(b, log);
    EventQueue q(16);
    fill(q, 8);

    WorkerResult r = StreamWorker(*conn, "k", StreamContext{}).run(q);

    // Every event is still accounted for once the reader has gone away
    EXPECT_EQ(r.sent, 8);
    EXPECT_EQ(r.succeeded + r.failed, 8);
    EXPECT_TRUE(log->halfClosed);
}

TEST(StreamWorkerReconcile, TrustsAcknowledgementsWhenPresent) {
    WorkerResult r = StreamWorker::reconcile(10, 2, 5, 1);
    EXPECT_EQ(r.sent, 10);
    EXPECT_EQ(r.succeeded, 5);
    EXPECT_EQ(r.failed, 3);
}

TEST(StreamWorkerReconcile, EstimatesWithoutAcknowledgements) {
    WorkerResult r = StreamWorker::reconcile(10, 2, 0, 0);
    EXPECT_EQ(r.succeeded, 8);
    EXPECT_EQ(r.failed, 2);
}
