#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/// Classification of a single TCP connect attempt.
enum class PortState {
    OPEN,
    CLOSED,
    FILTERED
};

/// Liveness of a host as seen by discovery.
enum class HostStatus {
    UP,
    DOWN,
    ASSUMED_UP  // discovery skipped
};

std::string port_state_to_string(PortState state);
std::string host_status_to_string(HostStatus status);

/**
 * @brief One concrete host produced by spec expansion.
 *
 * `hostname` is set only when the host came from a hostname spec.
 */
struct HostEntry {
    std::string address;
    std::string hostname;
};

/**
 * @brief Outcome of one connect probe. Never modified after the prober returns it.
 */
struct ProbeResult {
    std::string host;
    uint16_t port = 0;
    PortState state = PortState::FILTERED;
    std::string detail;
};

struct PortReport {
    uint16_t port = 0;
    PortState state = PortState::FILTERED;
    std::string service;
    std::string detail;
};

struct HostReport {
    std::string address;
    std::string hostname;
    HostStatus status = HostStatus::DOWN;
    std::vector<PortReport> ports;
};

/**
 * @brief Finalized scan output, hosts and ports in the order they were requested.
 *
 * `partial` is set when the scan was cancelled before every probe reported.
 */
struct ScanReport {
    std::vector<HostReport> hosts;
    bool partial = false;

    std::size_t result_count() const;
};

/// Tunables consumed by the scan engine.
struct ScanOptions {
    bool skip_discovery = false;
    std::size_t concurrency = 32;
    int timeout_ms = 2000;
    std::size_t ping_concurrency = 32;
    int ping_timeout_ms = 1000;
    std::string protocol = "tcp";
};

/// A host or port token that matches no grammar rule.
class InvalidSpec : public std::runtime_error {
public:
    explicit InvalidSpec(const std::string &what) : std::runtime_error(what) {}
};

/// A requested (host, port) pair ended the scan without a result.
class IncompleteReport : public std::logic_error {
public:
    explicit IncompleteReport(const std::string &what) : std::logic_error(what) {}
};
