#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <sys/socket.h>
#include "ScanTypes.hpp"

/**
 * Probes one (host, port) pair. Implementations classify every network outcome
 * into a ProbeResult and never throw for network errors.
 */
class Prober {
public:
    virtual ~Prober() = default;
    virtual ProbeResult probe(const std::string &host, uint16_t port) = 0;
};

/**
 * TCP connect prober: non-blocking connect(), then poll() until the handshake
 * completes, is refused or the timeout expires.
 */
class ConnectProber : public Prober {
private:
    int timeout_ms;
    const std::atomic<bool> *cancelled;

public:
    static constexpr int POLL_SLICE_MS = 100;

    ConnectProber(int timeout, const std::atomic<bool> *cancel_flag = nullptr);
    ProbeResult probe(const std::string &host, uint16_t port) override;

    int timeout() const { return timeout_ms; }
};

/// Fills `addr` for a numeric IPv4 or IPv6 address. Returns false if `host` is not one.
bool make_sockaddr(const std::string &host, uint16_t port, sockaddr_storage &addr, socklen_t &len);

/// Maps a connect() errno to open/closed/filtered.
PortState classify_connect_error(int err);
