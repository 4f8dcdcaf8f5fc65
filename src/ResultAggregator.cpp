#include "ResultAggregator.hpp"
#include "Logger.hpp"

ResultAggregator::ResultAggregator(std::vector<HostEntry> requested_hosts, std::vector<uint16_t> requested_ports,
                                   const ServiceTable &service_table, std::string proto)
    : hosts(std::move(requested_hosts)),
      ports(std::move(requested_ports)),
      services(service_table),
      protocol(std::move(proto)) {}

void ResultAggregator::set_host_status(const std::string &address, HostStatus status) {
    std::lock_guard<std::mutex> lock(results_mtx);
    host_status[address] = status;
}

bool ResultAggregator::record(const ProbeResult &result) {
    std::lock_guard<std::mutex> lock(results_mtx);
    bool inserted = results.emplace(Key(result.host, result.port), result).second;
    if (!inserted)
        log_error("duplicate result for ", result.host, ":", result.port, " ignored");
    return inserted;
}

HostStatus ResultAggregator::status_of(const std::string &address) const {
    auto it = host_status.find(address);
    return it == host_status.end() ? HostStatus::DOWN : it->second;
}

std::size_t ResultAggregator::live_count() const {
    std::size_t live = 0;
    for (const auto &host : hosts) {
        if (status_of(host.address) != HostStatus::DOWN)
            ++live;
    }
    return live;
}

std::size_t ResultAggregator::expected_count() const {
    std::lock_guard<std::mutex> lock(results_mtx);
    return live_count() * ports.size();
}

std::size_t ResultAggregator::recorded_count() const {
    std::lock_guard<std::mutex> lock(results_mtx);
    return results.size();
}

/**
 * @brief Renders the report by walking the request order, never the completion order.
 *
 * Hosts without a status are treated as down. Results for down hosts are not
 * rendered.
 *
 * @param partial True when the scan was cancelled.
 * @return ScanReport Hosts in request order, ports in request order within each host.
 * @throws IncompleteReport if a live host is missing a port result on a complete scan.
 */
ScanReport ResultAggregator::finalize(bool partial) const {
    std::lock_guard<std::mutex> lock(results_mtx);
    ScanReport report;
    report.partial = partial;
    report.hosts.reserve(hosts.size());

    for (const auto &host : hosts) {
        HostReport entry;
        entry.address = host.address;
        entry.hostname = host.hostname;
        entry.status = status_of(host.address);

        if (entry.status != HostStatus::DOWN) {
            entry.ports.reserve(ports.size());
            for (uint16_t port : ports) {
                auto it = results.find(Key(host.address, port));
                if (it == results.end()) {
                    if (partial)
                        continue;
                    throw IncompleteReport("no result for " + host.address + ":" + std::to_string(port) + " (" +
                                           std::to_string(results.size()) + " of " +
                                           std::to_string(live_count() * ports.size()) + " results recorded)");
                }
                PortReport port_entry;
                port_entry.port = port;
                port_entry.state = it->second.state;
                port_entry.detail = it->second.detail;
                port_entry.service = services.lookup(port, protocol);
                entry.ports.push_back(std::move(port_entry));
            }
        }
        report.hosts.push_back(std::move(entry));
    }
    return report;
}
