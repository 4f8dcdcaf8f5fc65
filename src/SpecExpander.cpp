#include "SpecExpander.hpp"
#include <array>
#include <cctype>
#include <cstring>
#include <set>
#include <utility>
#include <netdb.h>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace {

const uint16_t MIN_PORT = 1;
const uint16_t MAX_PORT = 65535;

bool is_digits(const std::string &s) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

uint16_t parse_port_number(const std::string &token, const std::string &spec) {
    if (!is_digits(token) || token.size() > 5)
        throw InvalidSpec("invalid port '" + token + "' in '" + spec + "'");
    unsigned long value = std::stoul(token);
    if (value < MIN_PORT || value > MAX_PORT)
        throw InvalidSpec("port " + token + " out of range 1-65535 in '" + spec + "'");
    return static_cast<uint16_t>(value);
}

std::vector<std::string> split_list(const std::string &spec) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t comma = spec.find(',', start);
        if (comma == std::string::npos) {
            parts.push_back(spec.substr(start));
            break;
        }
        parts.push_back(spec.substr(start, comma - start));
        start = comma + 1;
    }
    return parts;
}

bool is_hostname(const std::string &spec) {
    if (spec.empty() || spec.size() > 253)
        return false;
    for (char c : spec) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_'))
            return false;
    }
    return spec.front() != '-' && spec.front() != '.';
}

std::string format_address(int family, const void *addr) {
    char buf[INET6_ADDRSTRLEN];
    if (!inet_ntop(family, addr, buf, sizeof(buf)))
        return "";
    return buf;
}

} // namespace

/**
 * @brief Resolves a hostname and returns the first address getaddrinfo reports.
 *
 * Neither IPv4 nor IPv6 is preferred.
 *
 * @param hostname Name to resolve.
 * @return The address in canonical text form, or nothing if resolution failed.
 */
std::optional<std::string> resolve_first_address(const std::string &hostname) {
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &res) != 0 || !res)
        return std::nullopt;

    std::optional<std::string> result;
    for (struct addrinfo *rp = res; rp && !result; rp = rp->ai_next) {
        if (rp->ai_family == AF_INET) {
            auto *sin = reinterpret_cast<struct sockaddr_in*>(rp->ai_addr);
            result = format_address(AF_INET, &sin->sin_addr);
        } else if (rp->ai_family == AF_INET6) {
            auto *sin6 = reinterpret_cast<struct sockaddr_in6*>(rp->ai_addr);
            result = format_address(AF_INET6, &sin6->sin6_addr);
        }
    }
    freeaddrinfo(res);
    if (result && result->empty())
        return std::nullopt;
    return result;
}

/**
 * @brief Normalizes an IPv4 or IPv6 literal so equal addresses compare equal.
 *
 * "::0001" and "::1" both become "::1".
 */
std::optional<std::string> canonical_address(const std::string &literal) {
    struct in_addr v4{};
    if (inet_pton(AF_INET, literal.c_str(), &v4) == 1)
        return format_address(AF_INET, &v4);
    struct in6_addr v6{};
    if (inet_pton(AF_INET6, literal.c_str(), &v6) == 1)
        return format_address(AF_INET6, &v6);
    return std::nullopt;
}

/**
 * @brief Ports probed when the user gives no port specification.
 *
 * The most frequently open TCP ports, most common first.
 */
const std::vector<uint16_t> &common_ports() {
    static const std::vector<uint16_t> ports = {
        80, 23, 443, 21, 22, 25, 3389, 110, 445, 139,
        143, 53, 135, 3306, 8080, 1723, 111, 995, 993, 5900,
        1025, 587, 8888, 199, 1720, 465, 548, 113, 81, 6001,
        10000, 514, 5060, 179, 1026, 2000, 8443, 8000, 32768, 554,
        26, 1433, 49152, 2001, 515, 8008, 49154, 1027, 5666, 646,
        5000, 5631, 631, 49153, 8081, 2049, 88, 79, 5800, 106,
        2121, 1110, 49155, 6000, 513, 990, 5357, 427, 49156, 543,
        544, 5101, 144, 7, 389, 8009, 3128, 444, 9999, 5009,
        7070, 5190, 3000, 5432, 1900, 3986, 13, 1029, 9, 5051,
        6646, 49157, 1028, 873, 1755, 2717, 4899, 9100, 119, 37
    };
    return ports;
}

SpecExpander::SpecExpander() : resolver(resolve_first_address) {}

SpecExpander::SpecExpander(Resolver r) : resolver(std::move(r)) {}

/**
 * @brief Parses one port specification into a list of port numbers.
 *
 * Supports single ports ("80"), ranges ("20-25"), open ranges ("1024-", "-1023"),
 * every port ("-") and comma-separated combinations ("22,80-81,443").
 * Duplicates inside the specification are dropped, first occurrence wins.
 *
 * @param spec The string containing the port specification.
 * @return std::vector<uint16_t> Ports in the order they were written.
 * @throws InvalidSpec on malformed elements, inverted ranges or ports outside 1-65535.
 */
std::vector<uint16_t> SpecExpander::parse_ports(const std::string &spec) const {
    std::vector<uint16_t> ports;
    std::vector<bool> seen(MAX_PORT + 1, false);
    auto add = [&](uint16_t port) {
        if (!seen[port]) {
            seen[port] = true;
            ports.push_back(port);
        }
    };

    for (const std::string &element : split_list(spec)) {
        if (element.empty())
            throw InvalidSpec("empty element in port specification '" + spec + "'");

        if (element == "-") {
            for (uint32_t port = MIN_PORT; port <= MAX_PORT; ++port)
                add(static_cast<uint16_t>(port));
            continue;
        }

        std::size_t dash = element.find('-');
        if (dash == std::string::npos) {
            add(parse_port_number(element, spec));
            continue;
        }

        std::string lhs = element.substr(0, dash);
        std::string rhs = element.substr(dash + 1);
        if (rhs.find('-') != std::string::npos)
            throw InvalidSpec("malformed range '" + element + "' in '" + spec + "'");

        uint16_t start = lhs.empty() ? MIN_PORT : parse_port_number(lhs, spec);
        uint16_t end = rhs.empty() ? MAX_PORT : parse_port_number(rhs, spec);
        if (start > end)
            throw InvalidSpec("inverted range '" + element + "' in '" + spec + "'");

        for (uint32_t port = start; port <= end; ++port)
            add(static_cast<uint16_t>(port));
    }
    return ports;
}

std::vector<uint16_t> SpecExpander::expand_ports(const std::vector<std::string> &specs) const {
    if (specs.empty())
        return common_ports();

    std::vector<uint16_t> ports;
    std::vector<bool> seen(MAX_PORT + 1, false);
    for (const auto &spec : specs) {
        for (uint16_t port : parse_ports(spec)) {
            if (!seen[port]) {
                seen[port] = true;
                ports.push_back(port);
            }
        }
    }
    return ports;
}

/**
 * @brief Expands a CIDR block ("10.0.0.0/24", "fd00::/120") into its usable hosts.
 *
 * Host bits in the address part are masked off. For IPv4 the network and
 * broadcast addresses are skipped when the prefix is /30 or shorter; for IPv6
 * the subnet-router anycast address is skipped unless the prefix is /127 or /128.
 */
std::vector<HostEntry> SpecExpander::expand_cidr(const std::string &spec) const {
    std::size_t slash = spec.find('/');
    std::string addr_part = spec.substr(0, slash);
    std::string prefix_part = spec.substr(slash + 1);

    if (!is_digits(prefix_part) || prefix_part.size() > 3)
        throw InvalidSpec("invalid prefix length in '" + spec + "'");
    int prefix = std::stoi(prefix_part);

    std::vector<HostEntry> hosts;
    struct in_addr v4{};
    struct in6_addr v6{};

    if (inet_pton(AF_INET, addr_part.c_str(), &v4) == 1) {
        if (prefix > 32)
            throw InvalidSpec("prefix length out of range in '" + spec + "'");
        int host_bits = 32 - prefix;
        uint64_t size = uint64_t(1) << host_bits;
        if (size > MAX_BLOCK_HOSTS)
            throw InvalidSpec("block '" + spec + "' is too large to scan");

        uint32_t mask = prefix == 0 ? 0 : ~uint32_t(0) << host_bits;
        uint32_t network = ntohl(v4.s_addr) & mask;
        uint64_t first = 0, last = size - 1;
        if (prefix <= 30) {
            first = 1;
            last = size - 2;
        }
        hosts.reserve(last - first + 1);
        for (uint64_t offset = first; offset <= last; ++offset) {
            struct in_addr host{};
            host.s_addr = htonl(network + static_cast<uint32_t>(offset));
            hosts.push_back({format_address(AF_INET, &host), ""});
        }
        return hosts;
    }

    if (inet_pton(AF_INET6, addr_part.c_str(), &v6) == 1) {
        if (prefix > 128)
            throw InvalidSpec("prefix length out of range in '" + spec + "'");
        int host_bits = 128 - prefix;
        if (host_bits >= 64 || (uint64_t(1) << host_bits) > MAX_BLOCK_HOSTS)
            throw InvalidSpec("block '" + spec + "' is too large to scan");

        std::array<uint8_t, 16> base{};
        std::memcpy(base.data(), v6.s6_addr, base.size());
        for (int bit = prefix; bit < 128; ++bit)
            base[bit / 8] &= static_cast<uint8_t>(~(0x80 >> (bit % 8)));

        uint64_t size = uint64_t(1) << host_bits;
        uint64_t first = prefix < 127 ? 1 : 0;
        hosts.reserve(size - first);
        for (uint64_t offset = first; offset < size; ++offset) {
            std::array<uint8_t, 16> bytes = base;
            for (int b = 0; b < 4; ++b)
                bytes[15 - b] |= static_cast<uint8_t>((offset >> (8 * b)) & 0xff);
            struct in6_addr host{};
            std::memcpy(host.s6_addr, bytes.data(), bytes.size());
            hosts.push_back({format_address(AF_INET6, &host), ""});
        }
        return hosts;
    }

    throw InvalidSpec("invalid network address in '" + spec + "'");
}

/**
 * @brief Expands a single host specification.
 *
 * @param spec An IPv4/IPv6 literal, a CIDR block or a hostname.
 * @return Concrete hosts; a hostname yields one entry carrying the name.
 * @throws InvalidSpec if the token matches no rule or the hostname does not resolve.
 */
std::vector<HostEntry> SpecExpander::expand_host(const std::string &spec) const {
    if (spec.find('/') != std::string::npos)
        return expand_cidr(spec);

    if (auto literal = canonical_address(spec))
        return {{*literal, ""}};

    if (!is_hostname(spec))
        throw InvalidSpec("'" + spec + "' is not a valid host specification");

    std::optional<std::string> resolved = resolver ? resolver(spec) : std::nullopt;
    if (!resolved)
        throw InvalidSpec("failed to resolve hostname '" + spec + "'");

    std::string address = canonical_address(*resolved).value_or(*resolved);
    return {{address, spec}};
}

std::vector<HostEntry> SpecExpander::expand_hosts(const std::vector<std::string> &specs) const {
    std::vector<HostEntry> hosts;
    std::set<std::string> seen;
    for (const auto &spec : specs) {
        for (auto &host : expand_host(spec)) {
            if (seen.insert(host.address).second)
                hosts.push_back(std::move(host));
        }
    }
    return hosts;
}
