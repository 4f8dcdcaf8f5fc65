#include "PingProbe.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <netinet/icmp6.h>
#include <sys/socket.h>

namespace {
const std::size_t ECHO_PAYLOAD = 16;
std::atomic<uint16_t> echo_sequence{0};
}

uint16_t icmp_checksum(const void *data, std::size_t len) {
    const auto *buf = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    while (len > 1) {
        sum += static_cast<uint16_t>((buf[0] << 8) | buf[1]);
        buf += 2;
        len -= 2;
    }
    if (len == 1)
        sum += static_cast<uint16_t>(buf[0] << 8);
    while (sum >> 16)
        sum = (sum & 0xffff) + (sum >> 16);
    return htons(static_cast<uint16_t>(~sum));
}

std::vector<uint8_t> build_echo_request(uint16_t id, uint16_t seq) {
    std::vector<uint8_t> packet(sizeof(struct icmphdr) + ECHO_PAYLOAD, 0);
    auto *icmp = reinterpret_cast<struct icmphdr*>(packet.data());
    icmp->type = ICMP_ECHO;
    icmp->code = 0;
    icmp->un.echo.id = htons(id);
    icmp->un.echo.sequence = htons(seq);
    for (std::size_t i = 0; i < ECHO_PAYLOAD; ++i)
        packet[sizeof(struct icmphdr) + i] = static_cast<uint8_t>('a' + i);
    icmp->checksum = 0;
    icmp->checksum = icmp_checksum(packet.data(), packet.size());
    return packet;
}

std::vector<uint8_t> build_echo6_request(uint16_t id, uint16_t seq) {
    std::vector<uint8_t> packet(sizeof(struct icmp6_hdr) + ECHO_PAYLOAD, 0);
    auto *icmp6 = reinterpret_cast<struct icmp6_hdr*>(packet.data());
    icmp6->icmp6_type = ICMP6_ECHO_REQUEST;
    icmp6->icmp6_code = 0;
    icmp6->icmp6_id = htons(id);
    icmp6->icmp6_seq = htons(seq);
    for (std::size_t i = 0; i < ECHO_PAYLOAD; ++i)
        packet[sizeof(struct icmp6_hdr) + i] = static_cast<uint8_t>('a' + i);
    return packet;
}

uint16_t next_echo_sequence() {
    return echo_sequence.fetch_add(1) + 1;
}

ConnectLivenessProbe::ConnectLivenessProbe(int timeout, const std::atomic<bool> *cancel_flag,
                                           std::vector<uint16_t> p)
    : prober(timeout, cancel_flag), ports(std::move(p)) {}

/**
 * @brief A refused connection proves the host is up just as well as an accepted one.
 */
bool ConnectLivenessProbe::is_alive(const std::string &address) {
    for (uint16_t port : ports) {
        ProbeResult result = prober.probe(address, port);
        if (result.state != PortState::FILTERED)
            return true;
    }
    return false;
}

PingSocketProbe::PingSocketProbe(int timeout, const std::atomic<bool> *cancel_flag,
                                 std::unique_ptr<LivenessProbe> fallback_probe)
    : timeout_ms(timeout), cancelled(cancel_flag), fallback(std::move(fallback_probe)) {}

bool PingSocketProbe::use_fallback(const std::string &address, int err) {
    if (!fallback) {
        log_error("ping socket for ", address, ": ", std::strerror(err));
        return false;
    }
    std::call_once(fallback_notice, [err]() {
        log_warning("ICMP ping sockets unavailable (", std::strerror(err),
                    "), using TCP connect for host discovery");
    });
    return fallback->is_alive(address);
}

/**
 * @brief Sends one echo request and waits for the matching reply.
 *
 * Ping sockets hand back the ICMP message without the IP header, and the kernel
 * rewrites the identifier, so replies are matched by sequence number.
 *
 * @param address Numeric IPv4 or IPv6 address.
 * @return true If an echo reply arrived before the timeout.
 */
bool PingSocketProbe::is_alive(const std::string &address) {
    bool is_ipv6 = address.find(':') != std::string::npos;
    int sock = socket(is_ipv6 ? AF_INET6 : AF_INET, SOCK_DGRAM | SOCK_CLOEXEC,
                      is_ipv6 ? IPPROTO_ICMPV6 : IPPROTO_ICMP);
    if (sock < 0) {
        int err = errno;
        if (err == EACCES || err == EPERM || err == EPROTONOSUPPORT || err == EAFNOSUPPORT)
            return use_fallback(address, err);
        log_error("ping socket for ", address, ": ", std::strerror(err));
        return false;
    }

    sockaddr_storage dst{};
    socklen_t dst_len = 0;
    if (!make_sockaddr(address, 0, dst, dst_len)) {
        close(sock);
        return false;
    }

    uint16_t seq = next_echo_sequence();
    std::vector<uint8_t> packet = is_ipv6 ? build_echo6_request(0, seq) : build_echo_request(0, seq);
    if (sendto(sock, packet.data(), packet.size(), 0, reinterpret_cast<sockaddr*>(&dst), dst_len) < 0) {
        log_debug("ping to ", address, " not sent: ", std::strerror(errno));
        close(sock);
        return false;
    }

    bool alive = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    uint8_t buffer[BUFFER_SIZE];
    while (!alive) {
        if (cancelled && cancelled->load())
            break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0)
            break;

        struct pollfd pfd{};
        pfd.fd = sock;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, ConnectProber::POLL_SLICE_MS)));
        if (ready < 0 && errno != EINTR)
            break;
        if (ready <= 0)
            continue;

        ssize_t n = recv(sock, buffer, sizeof(buffer), 0);
        if (n < 0) {
            // ICMP errors (e.g. host unreachable) surface as recv() failures.
            log_debug("ping to ", address, ": ", std::strerror(errno));
            break;
        }
        if (is_ipv6) {
            if (n < static_cast<ssize_t>(sizeof(struct icmp6_hdr)))
                continue;
            auto *reply = reinterpret_cast<struct icmp6_hdr*>(buffer);
            alive = reply->icmp6_type == ICMP6_ECHO_REPLY && ntohs(reply->icmp6_seq) == seq;
        } else {
            if (n < static_cast<ssize_t>(sizeof(struct icmphdr)))
                continue;
            auto *reply = reinterpret_cast<struct icmphdr*>(buffer);
            alive = reply->type == ICMP_ECHOREPLY && ntohs(reply->un.echo.sequence) == seq;
        }
    }

    close(sock);
    return alive;
}
