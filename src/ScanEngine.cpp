#include "ScanEngine.hpp"
#include "ResultAggregator.hpp"
#include "Logger.hpp"

ScanEngine::ScanEngine(const ScanOptions &opts, const SpecExpander &spec_expander, LivenessProbe &liveness_probe,
                       Prober &connect_prober, const ServiceTable &service_table, std::atomic<bool> &cancel_flag)
    : options(opts),
      expander(spec_expander),
      liveness(liveness_probe),
      prober(connect_prober),
      services(service_table),
      cancelled(cancel_flag) {}

/**
 * @brief Expands the specs, prunes unreachable hosts, probes the rest and
 *        returns the report in request order.
 *
 * With skip_discovery every host is marked ASSUMED_UP and probed.
 *
 * @param host_specs Host tokens in request order.
 * @param port_specs Port tokens in request order; empty means the common ports.
 * @return ScanReport The finalized report.
 */
ScanReport ScanEngine::run(const std::vector<std::string> &host_specs, const std::vector<std::string> &port_specs) {
    // Both expansions run before anything touches the network.
    std::vector<HostEntry> hosts = expander.expand_hosts(host_specs);
    std::vector<uint16_t> ports = expander.expand_ports(port_specs);
    log_debug("expanded ", hosts.size(), " host(s) and ", ports.size(), " port(s)");

    ResultAggregator aggregator(hosts, ports, services, options.protocol);

    std::vector<HostEntry> live_hosts;
    if (options.skip_discovery) {
        for (const auto &host : hosts)
            aggregator.set_host_status(host.address, HostStatus::ASSUMED_UP);
        live_hosts = hosts;
    } else {
        HostDiscovery discovery(liveness, options.ping_concurrency, cancelled);
        DiscoveryResult discovered = discovery.run(hosts, on_host_discovered);
        for (const auto &host : discovered.reachable)
            aggregator.set_host_status(host.address, HostStatus::UP);
        for (const auto &host : discovered.unreachable)
            aggregator.set_host_status(host.address, HostStatus::DOWN);
        live_hosts = std::move(discovered.reachable);
    }

    if (!cancelled.load() && !live_hosts.empty()) {
        ProbeScheduler scheduler(prober, options.concurrency, cancelled, pacing);
        if (seeded)
            scheduler.seed(shuffle_seed);
        std::size_t delivered = scheduler.run(live_hosts, ports, [&](const ProbeResult &result) {
            aggregator.record(result);
            if (on_probe_result)
                on_probe_result(result);
        });
        log_debug(delivered, " probe(s) completed");
    }

    return aggregator.finalize(cancelled.load());
}
