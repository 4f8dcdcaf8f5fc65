#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ScanTypes.hpp"
#include "HostDiscovery.hpp"

/**
 * Command-line front end: parses options, picks the discovery probe, runs the
 * scan engine and prints the report.
 */
class PortScanner {
private:
    std::string interface;
    std::string source_ip;
    std::string source_ip6;
    std::vector<std::string> host_specs;
    std::vector<std::string> port_specs;
    ScanOptions options;
    bool show_all = false;
    std::atomic<bool> cancelled{false};
    std::mutex progress_mtx;

public:
    enum ExitCode {
        EXIT_OK = 0,
        EXIT_USAGE = 1,
        EXIT_INCOMPLETE = 2,
        EXIT_INTERRUPTED = 130
    };

    /// Upper bounds for -c/-C and -w/-W.
    static constexpr long MAX_CONCURRENCY = 4096;
    static constexpr long MAX_TIMEOUT_MS = 3600000;

    void parse_arguments(int argc, char* argv[]);
    void get_source_ip();
    int run();

    /// Async-signal-safe: only stores to a lock-free atomic.
    void cancel() { cancelled.store(true); }
    bool is_cancelled() const { return cancelled.load(); }
    const ScanOptions &scan_options() const { return options; }
    const std::vector<std::string> &targets() const { return host_specs; }

private:
    void list_interfaces() const;
    std::string get_ip_from_iface(const std::string &iface, bool ipv6) const;
    std::unique_ptr<LivenessProbe> make_liveness_probe();
};
