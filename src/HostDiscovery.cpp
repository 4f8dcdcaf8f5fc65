#include "HostDiscovery.hpp"
#include "Logger.hpp"
#include "WorkerPool.hpp"
#include <algorithm>
#include <exception>

HostDiscovery::HostDiscovery(LivenessProbe &p, std::size_t max_parallel, const std::atomic<bool> &cancel_flag)
    : probe(p), concurrency(std::max<std::size_t>(1, max_parallel)), cancelled(cancel_flag) {}

/**
 * @brief Probes one host, turning an unexpected probe failure into "down".
 *
 * A failing host must not take discovery of the other hosts with it.
 */
bool HostDiscovery::check_host(const HostEntry &host) {
    try {
        return probe.is_alive(host.address);
    } catch (const std::exception &e) {
        log_error("liveness probe for ", host.address, " failed: ", e.what());
        return false;
    }
}

/**
 * @brief Checks every host and splits them into reachable and unreachable.
 *
 * Workers pull host indices from a shared counter; each index is written by
 * exactly one worker, so the status vector needs no lock. Hosts not reached
 * before a cancellation count as unreachable.
 *
 * @param hosts Hosts in request order.
 * @param on_host Optional progress callback.
 * @return DiscoveryResult Both partitions, each in request order.
 */
DiscoveryResult HostDiscovery::run(const std::vector<HostEntry> &hosts, const HostCallback &on_host) {
    std::vector<char> alive(hosts.size(), 0);
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        while (!cancelled.load()) {
            std::size_t index = next.fetch_add(1);
            if (index >= hosts.size())
                return;
            bool up = check_host(hosts[index]);
            alive[index] = up ? 1 : 0;
            log_debug("ping probe complete: host=", hosts[index].address, " status=", up ? "up" : "down");
            if (on_host)
                on_host(hosts[index], up);
        }
    };

    run_workers(std::min(concurrency, hosts.size()), worker);

    DiscoveryResult result;
    for (std::size_t i = 0; i < hosts.size(); ++i) {
        if (alive[i])
            result.reachable.push_back(hosts[i]);
        else
            result.unreachable.push_back(hosts[i]);
    }
    return result;
}
