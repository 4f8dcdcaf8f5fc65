#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include "ConnectProber.hpp"
#include "HostDiscovery.hpp"
#include "ServiceTable.hpp"

/// TCP listener on 127.0.0.1 with a kernel-assigned port, closed on destruction.
class LoopbackListener {
private:
    int fd = -1;
    uint16_t bound_port = 0;

public:
    LoopbackListener() {
        fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            throw std::runtime_error("socket failed");
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            listen(fd, 64) < 0 ||
            getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
            close(fd);
            throw std::runtime_error("listener setup failed");
        }
        bound_port = ntohs(addr.sin_port);
    }
    ~LoopbackListener() {
        if (fd >= 0)
            close(fd);
    }
    LoopbackListener(const LoopbackListener &) = delete;
    LoopbackListener &operator=(const LoopbackListener &) = delete;

    uint16_t port() const { return bound_port; }
};

/// A loopback port nothing listens on: bound once to learn a free port, then released.
inline uint16_t closed_loopback_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    close(fd);
    return ntohs(addr.sin_port);
}

class FakeServiceTable : public ServiceTable {
public:
    std::map<std::pair<uint16_t, std::string>, std::string> names;

    std::string lookup(uint16_t port, const std::string &protocol) const override {
        auto it = names.find({port, protocol});
        return it == names.end() ? "" : it->second;
    }
};

/// Liveness decided by a fixed set of live addresses.
class FakeLivenessProbe : public LivenessProbe {
public:
    std::set<std::string> alive;
    std::set<std::string> throwing;
    std::atomic<int> calls{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    int delay_ms = 0;

    bool is_alive(const std::string &address) override {
        ++calls;
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}
        if (delay_ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        --in_flight;
        if (throwing.count(address))
            throw std::runtime_error("probe exploded");
        return alive.count(address) > 0;
    }
};

/**
 * Prober returning canned states. Ports listed in `slow_ports` take longer so
 * completion order can be forced to differ from request order.
 */
class FakeProber : public Prober {
public:
    std::map<std::pair<std::string, uint16_t>, PortState> states;
    std::map<uint16_t, int> delay_ms;
    std::vector<std::pair<std::string, uint16_t>> probed;
    std::mutex probed_mtx;
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    ProbeResult probe(const std::string &host, uint16_t port) override {
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}

        auto delay = delay_ms.find(port);
        if (delay != delay_ms.end())
            std::this_thread::sleep_for(std::chrono::milliseconds(delay->second));
        {
            std::lock_guard<std::mutex> lock(probed_mtx);
            probed.emplace_back(host, port);
        }
        --in_flight;

        ProbeResult result;
        result.host = host;
        result.port = port;
        auto it = states.find({host, port});
        result.state = it == states.end() ? PortState::CLOSED : it->second;
        return result;
    }
};
