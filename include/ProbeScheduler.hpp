#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "ScanTypes.hpp"
#include "ConnectProber.hpp"
#include "WorkerPool.hpp"

/// One (host, port) pair awaiting a probe.
struct WorkItem {
    std::string host;
    uint16_t port;
};

/**
 * Hook called before every dispatch, in dispatch order, with the dispatch lock
 * held. A rate limiter (inter-probe delay, token bucket, per-host caps) blocks
 * here until the item may go out.
 */
class PacingPolicy {
public:
    virtual ~PacingPolicy() = default;
    virtual void before_dispatch(const WorkItem &item) = 0;
};

/// Dispatches as fast as the concurrency ceiling allows.
class NoPacing : public PacingPolicy {
public:
    void before_dispatch(const WorkItem &) override {}
};

/**
 * Shuffles the full work set and runs it through a fixed pool of workers.
 *
 * The number of workers is the system-wide ceiling on in-flight connect
 * attempts. Results are handed to `on_result` from worker threads.
 */
class ProbeScheduler {
public:
    using ResultCallback = std::function<void(const ProbeResult &)>;

private:
    Prober &prober;
    std::size_t concurrency;
    const std::atomic<bool> &cancelled;
    std::shared_ptr<PacingPolicy> pacing;
    std::mt19937 rng;
    std::mutex dispatch_mtx;
    ThreadFactory spawn;

public:
    ProbeScheduler(Prober &p, std::size_t max_in_flight, const std::atomic<bool> &cancel_flag,
                   std::shared_ptr<PacingPolicy> pacing_policy = nullptr);

    void seed(uint32_t value) { rng.seed(value); }
    void set_thread_factory(ThreadFactory factory) { spawn = std::move(factory); }

    /// Cross product of hosts and ports, hosts outer, both in request order.
    static std::vector<WorkItem> build_work_set(const std::vector<HostEntry> &hosts,
                                                const std::vector<uint16_t> &ports);

    /// Shuffled copy of `work`, the order probes are dispatched in.
    std::vector<WorkItem> dispatch_order(std::vector<WorkItem> work);

    /**
     * Probes every pair once. Returns the number of probes whose result was
     * delivered; less than the work set size only after a cancellation.
     */
    std::size_t run(const std::vector<HostEntry> &hosts, const std::vector<uint16_t> &ports,
                    const ResultCallback &on_result);
};
