#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "HostDiscovery.hpp"
#include "ConnectProber.hpp"

const int BUFFER_SIZE = 1500;

/**
 * Liveness by TCP connect: a host that accepts or actively refuses a connection
 * on any of a few common ports is up. Needs no privileges.
 */
class ConnectLivenessProbe : public LivenessProbe {
private:
    ConnectProber prober;
    std::vector<uint16_t> ports;

public:
    ConnectLivenessProbe(int timeout, const std::atomic<bool> *cancel_flag = nullptr,
                         std::vector<uint16_t> p = {80, 443, 22});
    bool is_alive(const std::string &address) override;
};

/**
 * ICMP echo over an unprivileged Linux ping socket (SOCK_DGRAM + IPPROTO_ICMP).
 *
 * When the kernel does not allow ping sockets for this user
 * (net.ipv4.ping_group_range), the probe hands the host to `fallback`.
 */
class PingSocketProbe : public LivenessProbe {
private:
    int timeout_ms;
    const std::atomic<bool> *cancelled;
    std::unique_ptr<LivenessProbe> fallback;
    std::once_flag fallback_notice;

public:
    PingSocketProbe(int timeout, const std::atomic<bool> *cancel_flag,
                    std::unique_ptr<LivenessProbe> fallback_probe);
    bool is_alive(const std::string &address) override;

private:
    bool use_fallback(const std::string &address, int err);
};

/**
 * ICMP echo sent from a raw socket bound to an interface address, with the
 * replies captured through libpcap on that interface. Requires CAP_NET_RAW.
 */
class PcapPingProbe : public LivenessProbe {
private:
    std::string iface;
    std::string source_ip;
    std::string source_ip6;
    int timeout_ms;
    const std::atomic<bool> *cancelled;

public:
    PcapPingProbe(const std::string &interface, const std::string &src, const std::string &src6,
                  int timeout, const std::atomic<bool> *cancel_flag);
    bool is_alive(const std::string &address) override;
};

/// Internet checksum (RFC 1071) over `len` bytes.
uint16_t icmp_checksum(const void *data, std::size_t len);

/// Builds an ICMPv4 echo request with a checksum filled in.
std::vector<uint8_t> build_echo_request(uint16_t id, uint16_t seq);

/// Builds an ICMPv6 echo request; the kernel fills in the checksum.
std::vector<uint8_t> build_echo6_request(uint16_t id, uint16_t seq);

/// Bytes of link-layer header in front of the IP packet for a pcap DLT_* type.
int link_header_length(int dlt);

/**
 * True if the captured frame, with its IP packet starting at `offset`, is an
 * ICMP or ICMPv6 echo reply carrying (id, seq).
 */
bool is_matching_reply(const uint8_t *packet, uint32_t caplen, int offset, bool is_ipv6,
                       uint16_t id, uint16_t seq);

/// Next echo sequence number, shared by all probes in the process.
uint16_t next_echo_sequence();
