// ============================================================================
// DISTRIBUTOR UNIT TESTS
// ============================================================================
// Round-robin fan-out, no loss / no duplication, result aggregation
// ============================================================================

#include <gtest/gtest.h>
#include <eventrelay/client/distributor.hpp>
#include "fake_transport.hpp"
#include <set>
#include <thread>

using namespace EventRelay;
using namespace EventRelay::Testing;

class DistributorTest : public ::testing::Test {
protected:
    std::atomic<int> closed{0};
    std::vector<std::shared_ptr<StreamLog>> logs;
    std::vector<std::unique_ptr<FakeConnection>> owned;

    std::vector<Connection*> makeConnections(size_t k, FakeBehaviour b = {}) {
        std::vector<Connection*> conns;
        for (size_t i = 0; i < k; ++i) {
            logs.push_back(std::make_shared<StreamLog>());
            owned.push_back(std::make_unique<FakeConnection>("fake:" + std::to_string(i), logs.back(), b, closed));
            conns.push_back(owned.back().get());
        }
        return conns;
    }
};

TEST_F(DistributorTest, RoundRobinAssignsEqualShareInSubmissionOrder) {
    constexpr size_t K = 4;
    constexpr int M = 25;
    ThreadPool pool(K + 1);
    Distributor distributor(makeConnections(K), "k", pool, 8);

    EventQueue inbound(16);
    std::thread producer([&] {
        for (int i = 0; i < static_cast<int>(M * K); ++i) {
            inbound.push(subjectEvent("user-" + std::to_string(i)));
        }
        inbound.close();
    });
    WorkerResult r = distributor.run(inbound, StreamContext{});
    producer.join();

    EXPECT_EQ(r.sent, static_cast<int64_t>(M * K));
    for (size_t w = 0; w < K; ++w) {
        auto subjects = logs[w]->subjectsSnapshot();
        ASSERT_EQ(subjects.size(), static_cast<size_t>(M)) << "worker " << w;
        for (int j = 0; j < M; ++j) {
            EXPECT_EQ(subjects[j], "user-" + std::to_string(j * K + w));
        }
    }
}

TEST_F(DistributorTest, EveryEventReachesExactlyOneWorker) {
    constexpr size_t K = 3;
    constexpr int N = 1000;  // not a multiple of K
    ThreadPool pool(K + 1);
    Distributor distributor(makeConnections(K), "k", pool, 32);

    EventQueue inbound(N);
    for (int i = 0; i < N; ++i) {
        inbound.push(subjectEvent("user-" + std::to_string(i)));
    }
    inbound.close();
    WorkerResult r = distributor.run(inbound, StreamContext{});

    std::set<std::string> seen;
    size_t total = 0;
    for (auto& log : logs) {
        for (const auto& s : log->subjectsSnapshot()) {
            EXPECT_TRUE(seen.insert(s).second) << "duplicate " << s;
            ++total;
        }
    }
    EXPECT_EQ(total, static_cast<size_t>(N));
    EXPECT_EQ(seen.size(), static_cast<size_t>(N));
    EXPECT_EQ(r.sent, N);
    EXPECT_EQ(r.succeeded, N);
}

TEST_F(DistributorTest, TwoWorkersExampleScenario) {
    ThreadPool pool(3);
    Distributor distributor(makeConnections(2), "k", pool, 10);

    EventQueue inbound(10);
    for (int i = 0; i < 5; ++i) {
        inbound.push(subjectEvent("user-" + std::to_string(i)));
    }
    inbound.close();
    WorkerResult r = distributor.run(inbound, StreamContext{});

    EXPECT_EQ(logs[0]->subjectsSnapshot(), (std::vector<std::string>{"user-0", "user-2", "user-4"}));
    EXPECT_EQ(logs[1]->subjectsSnapshot(), (std::vector<std::string>{"user-1", "user-3"}));
    EXPECT_EQ(r.sent, 5);
    EXPECT_EQ(r.succeeded, 5);
    EXPECT_EQ(r.failed, 0);
}

TEST_F(DistributorTest, SingleConnectionIsDrivenDirectly) {
    // No pool thread is needed when there is only one stream
    ThreadPool pool(1);
    pool.submit([] { std::this_thread::sleep_for(std::chrono::milliseconds(200)); });
    Distributor distributor(makeConnections(1), "k", pool);

    EventQueue inbound(4);
    for (int i = 0; i < 3; ++i) inbound.push(subjectEvent("user-" + std::to_string(i)));
    inbound.close();

    auto start = std::chrono::steady_clock::now();
    WorkerResult r = distributor.run(inbound, StreamContext{});
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(150));
    EXPECT_EQ(r.sent, 3);
    EXPECT_EQ(logs[0]->subjectsSnapshot().size(), 3u);
}

TEST_F(DistributorTest, AggregatesMixedWorkerOutcomes) {
    ThreadPool pool(3);
    auto conns = makeConnections(1);
    FakeBehaviour broken;
    broken.failOpen = true;
    logs.push_back(std::make_shared<StreamLog>());
    owned.push_back(std::make_unique<FakeConnection>("fake:broken", logs.back(), broken, closed));
    conns.push_back(owned.back().get());
    Distributor distributor(conns, "k", pool, 4);

    EventQueue inbound(16);
    for (int i = 0; i < 10; ++i) inbound.push(subjectEvent("user-" + std::to_string(i)));
    inbound.close();
    WorkerResult r = distributor.run(inbound, StreamContext{});

    EXPECT_EQ(r.sent, 10);
    EXPECT_EQ(r.succeeded, 5);
    EXPECT_EQ(r.failed, 5);
}

TEST_F(DistributorTest, RequiresConnections) {
    ThreadPool pool(1);
    EXPECT_THROW(Distributor({}, "k", pool), std::invalid_argument);
}
