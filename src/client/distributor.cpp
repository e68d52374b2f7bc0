#include <eventrelay/client/distributor.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>

namespace EventRelay {

Distributor::Distributor(std::vector<Connection*> connections,
                         std::string apiKey,
                         ThreadPool& pool,
                         size_t workerQueueCapacity)
    : connections_(std::move(connections)),
      apiKey_(std::move(apiKey)),
      pool_(pool),
      workerQueueCapacity_(workerQueueCapacity) {
    if (connections_.empty()) {
        throw std::invalid_argument("Distributor requires at least one connection");
    }
}

WorkerResult Distributor::run(EventQueue& inbound, const StreamContext& ctx) {
    if (connections_.size() == 1) {
        StreamWorker worker(*connections_.front(), apiKey_, ctx);
        return worker.run(inbound);
    }
    return runMulti(inbound, ctx);
}

WorkerResult Distributor::runMulti(EventQueue& inbound, const StreamContext& ctx) {
    const size_t numWorkers = connections_.size();

    std::vector<std::unique_ptr<EventQueue>> queues;
    queues.reserve(numWorkers);
    for (size_t i = 0; i < numWorkers; ++i) {
        queues.push_back(std::make_unique<EventQueue>(workerQueueCapacity_));
    }

    std::atomic<int64_t> sent{0};
    std::atomic<int64_t> succeeded{0};
    std::atomic<int64_t> failed{0};

    std::vector<std::future<void>> tasks;
    tasks.reserve(numWorkers);
    try {
        for (size_t i = 0; i < numWorkers; ++i) {
            Connection* conn = connections_[i];
            EventQueue* queue = queues[i].get();
            tasks.push_back(pool_.submit([&, conn, queue]() {
                StreamWorker worker(*conn, apiKey_, ctx);
                WorkerResult r = worker.run(*queue);
                sent.fetch_add(r.sent, std::memory_order_relaxed);
                succeeded.fetch_add(r.succeeded, std::memory_order_relaxed);
                failed.fetch_add(r.failed, std::memory_order_relaxed);
            }));
        }
    } catch (const std::exception& e) {
        // Workers already launched reference this frame; let them finish first
        spdlog::error("[Distributor] Failed to launch stream workers: {}", e.what());
        for (auto& queue : queues) {
            queue->close();
        }
        for (auto& task : tasks) {
            task.wait();
        }
        throw;
    }
    spdlog::debug("[Distributor] Launched {} stream workers", numWorkers);

    // Round-robin; the push blocks while that worker's queue is full
    size_t idx = 0;
    while (auto event = inbound.pop()) {
        queues[idx % numWorkers]->push(std::move(*event));
        ++idx;
    }

    for (auto& queue : queues) {
        queue->close();
    }
    for (auto& task : tasks) {
        task.get();
    }

    WorkerResult total;
    total.sent = sent.load(std::memory_order_relaxed);
    total.succeeded = succeeded.load(std::memory_order_relaxed);
    total.failed = failed.load(std::memory_order_relaxed);
    spdlog::debug("[Distributor] Distributed {} event(s) over {} streams", idx, numWorkers);
    return total;
}

} // namespace EventRelay
