#include "PingProbe.hpp"
#include "Logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip6.h>
#include <netinet/ip_icmp.h>
#include <netinet/icmp6.h>
#include <sys/socket.h>
#include <pcap.h>

namespace {

using PcapHandle = std::unique_ptr<pcap_t, decltype(&pcap_close)>;

/**
 * @brief Opens a capture on `iface` that only passes echo replies from `dst_ip`.
 */
PcapHandle open_reply_capture(const std::string &iface, const std::string &dst_ip, bool is_ipv6, int slice_ms) {
    char errbuf[PCAP_ERRBUF_SIZE];
    PcapHandle handle(pcap_open_live(iface.c_str(), 65535, 0, slice_ms, errbuf), &pcap_close);
    if (!handle) {
        log_error("pcap_open_live: ", errbuf);
        return handle;
    }

    char filter_exp[256];
    if (is_ipv6)
        snprintf(filter_exp, sizeof(filter_exp), "icmp6 and src host %s and ip6[40] == 129", dst_ip.c_str());
    else
        snprintf(filter_exp, sizeof(filter_exp), "icmp and src host %s and icmp[icmptype] == icmp-echoreply",
                 dst_ip.c_str());

    struct bpf_program fp;
    if (pcap_compile(handle.get(), &fp, filter_exp, 1, PCAP_NETMASK_UNKNOWN) == -1) {
        log_error("pcap_compile error: ", pcap_geterr(handle.get()));
        return PcapHandle(nullptr, &pcap_close);
    }
    if (pcap_setfilter(handle.get(), &fp) == -1) {
        log_error("pcap_setfilter error: ", pcap_geterr(handle.get()));
        pcap_freecode(&fp);
        return PcapHandle(nullptr, &pcap_close);
    }
    pcap_freecode(&fp);
    return handle;
}

/**
 * @brief Opens a raw ICMP socket bound to the interface's source address.
 */
int open_raw_icmp_socket(const std::string &src_ip, bool is_ipv6) {
    int sock = socket(is_ipv6 ? AF_INET6 : AF_INET, SOCK_RAW | SOCK_CLOEXEC,
                      is_ipv6 ? IPPROTO_ICMPV6 : IPPROTO_ICMP);
    if (sock < 0) {
        log_error("raw ICMP socket: ", std::strerror(errno));
        return -1;
    }
    sockaddr_storage src{};
    socklen_t src_len = 0;
    if (!make_sockaddr(src_ip, 0, src, src_len) ||
        bind(sock, reinterpret_cast<sockaddr*>(&src), src_len) < 0) {
        log_error("bind to ", src_ip, ": ", std::strerror(errno));
        close(sock);
        return -1;
    }
    return sock;
}

} // namespace

int link_header_length(int dlt) {
    switch (dlt) {
        case DLT_EN10MB:
            return 14;
        case DLT_LINUX_SLL:
            return 16;
        case DLT_NULL:
        case DLT_LOOP:
            return 4;
        case DLT_RAW:
            return 0;
        default:
            return 14;
    }
}

/**
 * @brief Checks whether a captured frame is the echo reply for (id, seq).
 *
 * The IPv4 header length is taken from IHL, so replies carrying IP options are
 * matched too. Frames shorter than the headers they claim are rejected.
 */
bool is_matching_reply(const uint8_t *packet, uint32_t caplen, int offset, bool is_ipv6,
                       uint16_t id, uint16_t seq) {
    if (offset < 0 || caplen <= static_cast<uint32_t>(offset))
        return false;
    const uint8_t *ip = packet + offset;
    uint32_t remaining = caplen - static_cast<uint32_t>(offset);

    if (is_ipv6) {
        if (remaining < sizeof(struct ip6_hdr) + sizeof(struct icmp6_hdr))
            return false;
        auto *ip6h = reinterpret_cast<const struct ip6_hdr*>(ip);
        if (ip6h->ip6_nxt != IPPROTO_ICMPV6)
            return false;
        auto *icmp6 = reinterpret_cast<const struct icmp6_hdr*>(ip + sizeof(struct ip6_hdr));
        return icmp6->icmp6_type == ICMP6_ECHO_REPLY &&
               ntohs(icmp6->icmp6_id) == id && ntohs(icmp6->icmp6_seq) == seq;
    }

    if (remaining < sizeof(struct iphdr))
        return false;
    auto *iph = reinterpret_cast<const struct iphdr*>(ip);
    unsigned ip_hdr_len = iph->ihl * 4;
    if (iph->version != 4 || ip_hdr_len < sizeof(struct iphdr))
        return false;
    if (iph->protocol != IPPROTO_ICMP || remaining < ip_hdr_len + sizeof(struct icmphdr))
        return false;
    auto *icmp = reinterpret_cast<const struct icmphdr*>(ip + ip_hdr_len);
    return icmp->type == ICMP_ECHOREPLY &&
           ntohs(icmp->un.echo.id) == id && ntohs(icmp->un.echo.sequence) == seq;
}

PcapPingProbe::PcapPingProbe(const std::string &interface, const std::string &src, const std::string &src6,
                             int timeout, const std::atomic<bool> *cancel_flag)
    : iface(interface), source_ip(src), source_ip6(src6), timeout_ms(timeout), cancelled(cancel_flag) {}

/**
 * @brief Pings `address` from the interface and waits for the reply on the wire.
 *
 * The capture is opened before the request is sent so a fast reply cannot be
 * missed. Setup failures are logged and the host counts as down.
 *
 * @param address Numeric IPv4 or IPv6 address.
 * @return true If a matching echo reply was captured before the timeout.
 */
bool PcapPingProbe::is_alive(const std::string &address) {
    bool is_ipv6 = address.find(':') != std::string::npos;
    const std::string &src = is_ipv6 ? source_ip6 : source_ip;
    if (src.empty()) {
        log_warning(address, " skipped (no source ", is_ipv6 ? "IPv6" : "IPv4", " address on ", iface, ")");
        return false;
    }

    PcapHandle handle = open_reply_capture(iface, address, is_ipv6, ConnectProber::POLL_SLICE_MS);
    if (!handle)
        return false;

    int sock = open_raw_icmp_socket(src, is_ipv6);
    if (sock < 0)
        return false;

    uint16_t id = static_cast<uint16_t>(getpid() & 0xffff);
    uint16_t seq = next_echo_sequence();
    std::vector<uint8_t> packet = is_ipv6 ? build_echo6_request(id, seq) : build_echo_request(id, seq);

    sockaddr_storage dst{};
    socklen_t dst_len = 0;
    bool sent = make_sockaddr(address, 0, dst, dst_len) &&
                sendto(sock, packet.data(), packet.size(), 0, reinterpret_cast<sockaddr*>(&dst), dst_len) >= 0;
    if (!sent)
        log_debug("ping to ", address, " not sent: ", std::strerror(errno));
    close(sock);
    if (!sent)
        return false;

    int offset = link_header_length(pcap_datalink(handle.get()));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    struct pcap_pkthdr *header;
    const u_char *frame;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancelled && cancelled->load())
            return false;
        int ret = pcap_next_ex(handle.get(), &header, &frame);
        if (ret < 0) {
            log_error("pcap_next_ex: ", pcap_geterr(handle.get()));
            return false;
        }
        if (ret == 0)
            continue; // buffer timeout, no packet yet
        if (is_matching_reply(frame, header->caplen, offset, is_ipv6, id, seq))
            return true;
    }
    return false;
}
