#include "PortScanner.hpp"
#include "ConnectProber.hpp"
#include "Logger.hpp"
#include "PingProbe.hpp"
#include "ReportPrinter.hpp"
#include "ScanEngine.hpp"
#include "ServiceTable.hpp"
#include "SpecExpander.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <set>
#include <getopt.h>
#include <unistd.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <arpa/inet.h>

namespace {

/**
 * @brief Parses an integer option value in 1..max or exits with a usage error.
 */
long parse_positive(const char *value, const char *option, long max) {
    char *end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || parsed <= 0) {
        std::cerr << "Invalid value '" << value << "' for " << option << "\n";
        exit(PortScanner::EXIT_USAGE);
    }
    if (parsed > max) {
        std::cerr << "Value " << value << " for " << option << " exceeds the maximum of " << max << "\n";
        exit(PortScanner::EXIT_USAGE);
    }
    return parsed;
}

/**
 * @brief Prints help/usage information and exits the program.
 */
void print_help(const char *prog) {
    std::cout << "Usage: " << prog << " [options] <host-spec>...\n"
              << "\n"
              << "Host specs: IPv4/IPv6 address, hostname or CIDR block (10.0.0.0/24).\n"
              << "\n"
              << "Options:\n"
              << "  -p, --ports <spec>          ports to scan: 22 | 20-25 | 1024- | -1023 | - | 22,80,443\n"
              << "                              (repeatable; default: most common ports)\n"
              << "  -P, --skip-discovery        treat every host as up, no ping\n"
              << "  -c, --concurrency <n>       max connect attempts in flight (default 32)\n"
              << "  -w, --wait <ms>             connect timeout (default 2000)\n"
              << "  -C, --ping-concurrency <n>  max discovery probes in flight (default 32)\n"
              << "  -W, --ping-wait <ms>        discovery timeout (default 1000)\n"
              << "  -i, --interface <iface>     ping from this interface, capturing replies with libpcap\n"
              << "                              (-i alone lists interfaces)\n"
              << "  -a, --all                   list every port, not only open ones\n"
              << "  -d, --debug                 debug logging\n"
              << "  -h, --help                  show this help\n";
    exit(PortScanner::EXIT_OK);
}

/// One numeric address configured on an interface.
struct InterfaceAddress {
    std::string name;
    int family;
    std::string address;
    bool link_local;
};

/**
 * @brief Snapshot of every IPv4 and IPv6 address on the host, in getifaddrs() order.
 *
 * A failing getifaddrs() is logged and yields an empty list.
 */
std::vector<InterfaceAddress> interface_addresses() {
    std::vector<InterfaceAddress> found;
    struct ifaddrs *ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        log_error("getifaddrs: ", std::strerror(errno));
        return found;
    }
    for (struct ifaddrs *ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr)
            continue;
        char buf[INET6_ADDRSTRLEN];
        const void *raw = nullptr;
        bool link_local = false;
        int family = ifa->ifa_addr->sa_family;
        if (family == AF_INET) {
            raw = &reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr)->sin_addr;
        } else if (family == AF_INET6) {
            auto *sin6 = reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr);
            raw = &sin6->sin6_addr;
            link_local = IN6_IS_ADDR_LINKLOCAL(&sin6->sin6_addr);
        } else {
            continue;
        }
        if (inet_ntop(family, raw, buf, sizeof(buf)))
            found.push_back({ifa->ifa_name, family, buf, link_local});
    }
    freeifaddrs(ifaddr);
    return found;
}

} // namespace

/// Prints each interface that has an address, once.
void PortScanner::list_interfaces() const {
    std::set<std::string> seen;
    for (const auto &entry : interface_addresses()) {
        if (seen.insert(entry.name).second)
            std::cout << entry.name << std::endl;
    }
}

/**
 * @brief First address of the requested family on `iface`, skipping IPv6 link-local ones.
 *
 * @return std::string The address, or an empty string if the interface has none.
 */
std::string PortScanner::get_ip_from_iface(const std::string &iface, bool ipv6) const {
    int wanted = ipv6 ? AF_INET6 : AF_INET;
    for (const auto &entry : interface_addresses()) {
        if (entry.name == iface && entry.family == wanted && !entry.link_local)
            return entry.address;
    }
    return "";
}

/**
 * @brief Parses command-line arguments and stores configuration in member variables.
 *
 * Running without arguments, or with a bare `-i`, lists the usable interfaces.
 * Every remaining positional argument is a host specification.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 */
void PortScanner::parse_arguments(int argc, char* argv[]) {
    if (argc == 1 ||
       (argc == 2 && (std::strcmp(argv[1], "-i") == 0 || std::strcmp(argv[1], "--interface") == 0))) {
        list_interfaces();
        exit(EXIT_OK);
    }
    struct option long_options[] = {
        {"ports", required_argument, nullptr, 'p'},
        {"skip-discovery", no_argument, nullptr, 'P'},
        {"concurrency", required_argument, nullptr, 'c'},
        {"wait", required_argument, nullptr, 'w'},
        {"ping-concurrency", required_argument, nullptr, 'C'},
        {"ping-wait", required_argument, nullptr, 'W'},
        {"interface", required_argument, nullptr, 'i'},
        {"all", no_argument, nullptr, 'a'},
        {"debug", no_argument, nullptr, 'd'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    int opt;
    while ((opt = getopt_long(argc, argv, "p:Pc:w:C:W:i:adh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'p': port_specs.push_back(optarg); break;
            case 'P': options.skip_discovery = true; break;
            case 'c':
                options.concurrency = parse_positive(optarg, "--concurrency", MAX_CONCURRENCY);
                break;
            case 'w':
                options.timeout_ms = static_cast<int>(parse_positive(optarg, "--wait", MAX_TIMEOUT_MS));
                break;
            case 'C':
                options.ping_concurrency = parse_positive(optarg, "--ping-concurrency", MAX_CONCURRENCY);
                break;
            case 'W':
                options.ping_timeout_ms =
                    static_cast<int>(parse_positive(optarg, "--ping-wait", MAX_TIMEOUT_MS));
                break;
            case 'i': interface = optarg; break;
            case 'a': show_all = true; break;
            case 'd': Logger::set_debug(true); break;
            case 'h': print_help(argv[0]); break;
            default:
                std::cerr << "Invalid argument! Try --help.\n";
                exit(EXIT_USAGE);
        }
    }
    for (int i = optind; i < argc; ++i)
        host_specs.push_back(argv[i]);
    if (host_specs.empty()) {
        std::cerr << "No target specified!\n";
        exit(EXIT_USAGE);
    }
}

/**
 * @brief Determines the source addresses of the selected interface.
 *
 * Only needed for pcap discovery; exits if the interface has no usable address.
 */
void PortScanner::get_source_ip() {
    if (interface.empty() || options.skip_discovery)
        return;
    source_ip  = get_ip_from_iface(interface, false);
    source_ip6 = get_ip_from_iface(interface, true);
    if (source_ip.empty() && source_ip6.empty()) {
        std::cerr << "No usable source address on " << interface << "\n";
        exit(EXIT_USAGE);
    }
}

/**
 * @brief Chooses the discovery probe: pcap capture on a named interface, or a
 *        ping socket that falls back to TCP connect when ICMP is not permitted.
 */
std::unique_ptr<LivenessProbe> PortScanner::make_liveness_probe() {
    if (!interface.empty())
        return std::make_unique<PcapPingProbe>(interface, source_ip, source_ip6,
                                               options.ping_timeout_ms, &cancelled);
    auto fallback = std::make_unique<ConnectLivenessProbe>(options.ping_timeout_ms, &cancelled);
    return std::make_unique<PingSocketProbe>(options.ping_timeout_ms, &cancelled, std::move(fallback));
}

/**
 * @brief Runs the scan and prints the report.
 *
 * @return int Process exit code.
 */
int PortScanner::run() {
    SpecExpander expander;
    SystemServiceTable services;
    ConnectProber prober(options.timeout_ms, &cancelled);
    std::unique_ptr<LivenessProbe> liveness = make_liveness_probe();

    ScanEngine engine(options, expander, *liveness, prober, services, cancelled);
    engine.on_host_discovered = [this](const HostEntry &host, bool up) {
        if (!up) return;
        std::lock_guard<std::mutex> lock(progress_mtx);
        std::cout << "Host " << host.address << " is up" << std::endl;
    };
    engine.on_probe_result = [this](const ProbeResult &result) {
        if (result.state != PortState::OPEN) return;
        std::lock_guard<std::mutex> lock(progress_mtx);
        std::cout << "Discovered open port tcp/" << result.port << " on " << result.host << std::endl;
    };

    ScanReport report;
    try {
        report = engine.run(host_specs, port_specs);
    } catch (const InvalidSpec &e) {
        std::cerr << "Invalid specification: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const IncompleteReport &e) {
        log_error("internal error, incomplete report: ", e.what());
        return EXIT_INCOMPLETE;
    }

    std::cout << "\n";
    ReportPrinter(show_all).print(std::cout, report);
    return report.partial ? EXIT_INTERRUPTED : EXIT_OK;
}
