// ============================================================================
// BENCHMARK: SESSION FAN-OUT THROUGHPUT
// ============================================================================
// Events per second through Session -> Distributor -> StreamWorkers against
// an in-memory transport, so only the client-side pipeline is measured.
//
// Scenarios:
// 1. Blocking submit, single producer (1, 2, 4, 8 streams)
// 2. Blocking submit, 4 producers (1, 2, 4, 8 streams)
// 3. Non-blocking submit with a small buffer (drop rate)
// ============================================================================

#include <iostream>
#include <iomanip>
#include <string>
#include <thread>
#include <vector>
#include <eventrelay/client/session.hpp>
#include <eventrelay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include "fake_transport.hpp"

using namespace EventRelay;
using namespace EventRelay::Testing;

namespace {

constexpr int NUM_EVENTS = 200000;

ClientOptions benchOptions(size_t streams, size_t buffer) {
    ClientOptions o = ClientOptions::sessionDefaults();
    o.endpoint = "localhost:50051";
    o.num_streams = streams;
    o.buffer_capacity = buffer;
    return o;
}

std::vector<EventPtr> prepareEvents(int n) {
    std::vector<EventPtr> events;
    events.reserve(n);
    for (int i = 0; i < n; ++i) {
        Event e("user-" + std::to_string(i % 1000), "page_view");
        e.data["index"] = Json::Value(i);
        events.push_back(makeEvent(std::move(e)));
    }
    return events;
}

void printStats(const StreamStats& stats, double wall_sec) {
    std::cout << "  Sent:        " << stats.total_sent << std::endl;
    std::cout << "  Succeeded:   " << stats.total_succeeded << std::endl;
    std::cout << "  Dropped:     " << stats.total_dropped << std::endl;
    std::cout << "  Wall time:   " << std::fixed << std::setprecision(3) << wall_sec << " sec" << std::endl;
    std::cout << "  Throughput:  " << std::setprecision(2)
              << (wall_sec > 0 ? stats.total_sent / wall_sec / 1e6 : 0.0) << " M events/sec" << std::endl;
}

void benchBlocking(size_t streams, int producers, const std::vector<EventPtr>& events) {
    std::cout << "\n[" << streams << " stream(s), " << producers << " producer(s)]" << std::endl;

    Session session("bench-key", benchOptions(streams, 10000), std::make_shared<FakeTransport>());
    session.start();

    uint64_t start = Clock::now_ns();
    std::vector<std::thread> threads;
    const size_t share = events.size() / producers;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&session, &events, p, share] {
            for (size_t i = p * share; i < (p + 1) * share; ++i) {
                session.submitBlocking(events[i]);
            }
        });
    }
    for (auto& t : threads) t.join();
    StreamStats stats = session.finalize();

    printStats(stats, std::chrono::duration<double>(Clock::since(start)).count());
}

void benchNonBlocking(size_t streams, const std::vector<EventPtr>& events) {
    std::cout << "\n[" << streams << " stream(s), buffer 256, non-blocking]" << std::endl;

    Session session("bench-key", benchOptions(streams, 256), std::make_shared<FakeTransport>());
    session.start();

    uint64_t start = Clock::now_ns();
    for (const auto& e : events) {
        session.submitNonBlocking(e);
    }
    StreamStats stats = session.finalize();

    printStats(stats, std::chrono::duration<double>(Clock::since(start)).count());
    std::cout << "  Drop rate:   " << std::setprecision(2)
              << 100.0 * stats.total_dropped / events.size() << " %" << std::endl;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);
    const auto events = prepareEvents(NUM_EVENTS);
    const size_t streamCounts[] = {1, 2, 4, 8};

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST 1: BLOCKING SUBMIT, SINGLE PRODUCER (" << NUM_EVENTS << " events)" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    for (size_t streams : streamCounts) benchBlocking(streams, 1, events);

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST 2: BLOCKING SUBMIT, 4 PRODUCERS" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    for (size_t streams : streamCounts) benchBlocking(streams, 4, events);

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST 3: NON-BLOCKING SUBMIT, SMALL BUFFER" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    for (size_t streams : streamCounts) benchNonBlocking(streams, events);

    return 0;
}
