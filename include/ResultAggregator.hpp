#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "ScanTypes.hpp"
#include "ServiceTable.hpp"

/**
 * Collects probe results in whatever order they complete and renders them in
 * request order.
 *
 * record() may be called from any number of threads; finalize() must run after
 * the last record() returned.
 */
class ResultAggregator {
private:
    using Key = std::pair<std::string, uint16_t>;

    std::vector<HostEntry> hosts;
    std::vector<uint16_t> ports;
    const ServiceTable &services;
    std::string protocol;

    std::map<std::string, HostStatus> host_status;
    std::map<Key, ProbeResult> results;
    mutable std::mutex results_mtx;

public:
    ResultAggregator(std::vector<HostEntry> requested_hosts, std::vector<uint16_t> requested_ports,
                     const ServiceTable &service_table, std::string proto = "tcp");

    void set_host_status(const std::string &address, HostStatus status);

    /// Stores one result. Returns false (and keeps the first) if the pair was already recorded.
    bool record(const ProbeResult &result);

    std::size_t expected_count() const;
    std::size_t recorded_count() const;

    /**
     * Builds the report. With `partial` unset every expected pair must have a
     * result, otherwise IncompleteReport is thrown; with it set missing pairs
     * are left out and the report is flagged partial.
     */
    ScanReport finalize(bool partial = false) const;

private:
    HostStatus status_of(const std::string &address) const;
    std::size_t live_count() const;
};
