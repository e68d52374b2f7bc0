#pragma once
#include <eventrelay/client/stream_worker.hpp>
#include <eventrelay/core/config/client_options.hpp>
#include <eventrelay/core/utils/thread_pool.hpp>
#include <string>
#include <vector>

namespace EventRelay {

/**
 * @class Distributor
 * @brief Fans one inbound event flow out over a set of connections.
 *
 * Event N goes to worker N mod K, in pool order. Each worker has its own
 * bounded queue and runs as a task on the thread pool; the per-worker queues
 * are closed once the inbound queue is exhausted and every task is joined
 * before the totals are read. With a single connection the worker consumes
 * the inbound queue directly.
 */
class Distributor {
public:
    Distributor(std::vector<Connection*> connections,
                std::string apiKey,
                ThreadPool& pool,
                size_t workerQueueCapacity = DEFAULT_WORKER_QUEUE_CAPACITY);

    WorkerResult run(EventQueue& inbound, const StreamContext& ctx);

private:
    WorkerResult runMulti(EventQueue& inbound, const StreamContext& ctx);

    std::vector<Connection*> connections_;
    std::string apiKey_;
    ThreadPool& pool_;
    size_t workerQueueCapacity_;
};

} // namespace EventRelay
