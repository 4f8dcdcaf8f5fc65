#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "ScanTypes.hpp"

/**
 * Abstract liveness check for a single host.
 * Implementations wait at most their own timeout and must not throw for
 * network errors; an unanswered or unreachable host is simply not alive.
 */
class LivenessProbe {
public:
    virtual ~LivenessProbe() = default;
    virtual bool is_alive(const std::string &address) = 0;
};

/// Hosts partitioned by discovery, each list in original request order.
struct DiscoveryResult {
    std::vector<HostEntry> reachable;
    std::vector<HostEntry> unreachable;
};

/**
 * Runs a LivenessProbe over every host with bounded concurrency.
 */
class HostDiscovery {
public:
    using HostCallback = std::function<void(const HostEntry &, bool)>;

private:
    LivenessProbe &probe;
    std::size_t concurrency;
    const std::atomic<bool> &cancelled;

public:
    HostDiscovery(LivenessProbe &p, std::size_t max_parallel, const std::atomic<bool> &cancel_flag);

    /**
     * Probes all hosts. `on_host` (optional) is invoked from worker threads as
     * each host finishes and must be thread-safe.
     */
    DiscoveryResult run(const std::vector<HostEntry> &hosts, const HostCallback &on_host = nullptr);

private:
    bool check_host(const HostEntry &host);
};
