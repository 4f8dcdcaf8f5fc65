#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "ScanTypes.hpp"
#include "SpecExpander.hpp"
#include "HostDiscovery.hpp"
#include "ConnectProber.hpp"
#include "ProbeScheduler.hpp"
#include "ServiceTable.hpp"

/**
 * Wires the scan pipeline together:
 * expand specs -> discover hosts -> schedule connect probes -> aggregate.
 *
 * The collaborators are passed in so the CLI can pick real probes and tests can
 * substitute fakes.
 */
class ScanEngine {
public:
    std::function<void(const HostEntry &, bool)> on_host_discovered;
    std::function<void(const ProbeResult &)> on_probe_result;

private:
    ScanOptions options;
    const SpecExpander &expander;
    LivenessProbe &liveness;
    Prober &prober;
    const ServiceTable &services;
    std::atomic<bool> &cancelled;
    std::shared_ptr<PacingPolicy> pacing;
    bool seeded = false;
    uint32_t shuffle_seed = 0;

public:
    ScanEngine(const ScanOptions &opts, const SpecExpander &spec_expander, LivenessProbe &liveness_probe,
               Prober &connect_prober, const ServiceTable &service_table, std::atomic<bool> &cancel_flag);

    void set_pacing(std::shared_ptr<PacingPolicy> policy) { pacing = std::move(policy); }
    void set_seed(uint32_t value) {
        seeded = true;
        shuffle_seed = value;
    }

    /**
     * Runs a complete scan. Throws InvalidSpec before any probe is sent if a
     * token is malformed. After a cancellation the returned report is partial.
     */
    ScanReport run(const std::vector<std::string> &host_specs, const std::vector<std::string> &port_specs);

    void cancel() { cancelled.store(true); }
    bool is_cancelled() const { return cancelled.load(); }
};
