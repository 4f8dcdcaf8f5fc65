#include "ConnectProber.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>

// The kernel does the handshake:
//  SYN-ACK          -> SO_ERROR == 0             -> open
//  RST              -> ECONNREFUSED              -> closed
//  nothing / ICMP   -> timeout, ETIMEDOUT,
//                      EHOSTUNREACH, ...         -> filtered

namespace {

/// Closes the probe socket on every return path.
struct SocketCloser {
    int fd;
    ~SocketCloser() {
        if (fd >= 0)
            close(fd);
    }
};

ProbeResult make_result(const std::string &host, uint16_t port, PortState state, std::string detail) {
    ProbeResult result;
    result.host = host;
    result.port = port;
    result.state = state;
    result.detail = std::move(detail);
    return result;
}

std::string describe(int err) {
    switch (err) {
        case 0:
            return "connection succeeded";
        case ECONNREFUSED:
            return "connection refused";
        case ETIMEDOUT:
            return "connection timed out";
        default:
            return std::strerror(err);
    }
}

} // namespace

bool make_sockaddr(const std::string &host, uint16_t port, sockaddr_storage &addr, socklen_t &len) {
    std::memset(&addr, 0, sizeof(addr));
    auto *sin = reinterpret_cast<struct sockaddr_in*>(&addr);
    if (inet_pton(AF_INET, host.c_str(), &sin->sin_addr) == 1) {
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        len = sizeof(struct sockaddr_in);
        return true;
    }

    // getaddrinfo keeps scope ids ("fe80::1%eth0") that inet_pton rejects.
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_INET6;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICHOST;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res)
        return false;
    std::memcpy(&addr, res->ai_addr, res->ai_addrlen);
    len = res->ai_addrlen;
    freeaddrinfo(res);
    reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port = htons(port);
    return true;
}

PortState classify_connect_error(int err) {
    if (err == 0)
        return PortState::OPEN;
    if (err == ECONNREFUSED)
        return PortState::CLOSED;
    return PortState::FILTERED;
}

ConnectProber::ConnectProber(int timeout, const std::atomic<bool> *cancel_flag)
    : timeout_ms(timeout), cancelled(cancel_flag) {}

/**
 * @brief Attempts one TCP handshake and classifies the outcome.
 *
 * An established connection is closed straight away without sending data.
 * Socket setup failures (e.g. out of descriptors) are reported as filtered with
 * the error attached so sibling probes carry on.
 *
 * @param host Numeric IPv4 or IPv6 address.
 * @param port Destination port.
 * @return ProbeResult The classified outcome.
 */
ProbeResult ConnectProber::probe(const std::string &host, uint16_t port) {
    sockaddr_storage addr{};
    socklen_t addr_len = 0;
    if (!make_sockaddr(host, port, addr, addr_len))
        return make_result(host, port, PortState::FILTERED, "not a numeric address");

    SocketCloser sock{socket(addr.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if (sock.fd < 0) {
        int err = errno;
        log_error("socket() for ", host, ":", port, " failed: ", std::strerror(err));
        return make_result(host, port, PortState::FILTERED, std::string("socket: ") + std::strerror(err));
    }

    if (connect(sock.fd, reinterpret_cast<sockaddr*>(&addr), addr_len) == 0)
        return make_result(host, port, PortState::OPEN, describe(0));
    if (errno != EINPROGRESS) {
        int err = errno;
        return make_result(host, port, classify_connect_error(err), describe(err));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (cancelled && cancelled->load())
            return make_result(host, port, PortState::FILTERED, "scan cancelled");

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0)
            return make_result(host, port, PortState::FILTERED, "timeout (no response)");

        struct pollfd pfd{};
        pfd.fd = sock.fd;
        pfd.events = POLLOUT;
        int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS)));
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            int err = errno;
            return make_result(host, port, PortState::FILTERED, std::string("poll: ") + std::strerror(err));
        }
        if (ready == 0)
            continue;

        // Linux stores the final result of a non-blocking connect in SO_ERROR.
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            err = errno;
            return make_result(host, port, PortState::FILTERED, std::string("getsockopt: ") + std::strerror(err));
        }
        return make_result(host, port, classify_connect_error(err), describe(err));
    }
}
