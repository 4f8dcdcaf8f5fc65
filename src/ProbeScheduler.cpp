#include "ProbeScheduler.hpp"
#include "Logger.hpp"
#include "WorkerPool.hpp"
#include <algorithm>

ProbeScheduler::ProbeScheduler(Prober &p, std::size_t max_in_flight, const std::atomic<bool> &cancel_flag,
                               std::shared_ptr<PacingPolicy> pacing_policy)
    : prober(p),
      concurrency(std::max<std::size_t>(1, max_in_flight)),
      cancelled(cancel_flag),
      pacing(pacing_policy ? std::move(pacing_policy) : std::make_shared<NoPacing>()),
      rng(std::random_device{}()) {}

std::vector<WorkItem> ProbeScheduler::build_work_set(const std::vector<HostEntry> &hosts,
                                                     const std::vector<uint16_t> &ports) {
    std::vector<WorkItem> work;
    work.reserve(hosts.size() * ports.size());
    for (const auto &host : hosts) {
        for (uint16_t port : ports)
            work.push_back({host.address, port});
    }
    return work;
}

std::vector<WorkItem> ProbeScheduler::dispatch_order(std::vector<WorkItem> work) {
    std::shuffle(work.begin(), work.end(), rng);
    return work;
}

/**
 * @brief Runs the shuffled work set with at most `concurrency` probes in flight.
 *
 * Each worker takes the next item under the dispatch lock, lets the pacing
 * policy hold it back if it wants to, then probes without the lock. After a
 * cancellation nothing new is dispatched and results of probes that were cut
 * short are dropped instead of being reported as filtered.
 *
 * @param hosts Reachable hosts.
 * @param ports Ports to probe on each host.
 * @param on_result Receives every delivered result; called concurrently.
 * @return std::size_t Number of results delivered.
 */
std::size_t ProbeScheduler::run(const std::vector<HostEntry> &hosts, const std::vector<uint16_t> &ports,
                                const ResultCallback &on_result) {
    const std::vector<WorkItem> work = dispatch_order(build_work_set(hosts, ports));
    std::size_t next = 0;
    std::atomic<std::size_t> delivered{0};

    auto worker = [&]() {
        while (true) {
            const WorkItem *item = nullptr;
            {
                std::lock_guard<std::mutex> lock(dispatch_mtx);
                if (cancelled.load() || next >= work.size())
                    return;
                item = &work[next++];
                pacing->before_dispatch(*item);
            }

            ProbeResult result = prober.probe(item->host, item->port);
            if (cancelled.load())
                return;
            log_debug("target port connect probe complete: host=", result.host, " port=", result.port,
                      " status=", port_state_to_string(result.state));
            on_result(result);
            delivered.fetch_add(1);
        }
    };

    run_workers(std::min(concurrency, work.size()), worker, spawn);

    return delivered.load();
}
