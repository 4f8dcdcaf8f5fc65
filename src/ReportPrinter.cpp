#include "ReportPrinter.hpp"
#include <algorithm>
#include <array>
#include <iomanip>

ReportPrinter::ReportPrinter(bool all_ports) : show_all(all_ports) {}

std::vector<const PortReport*> ReportPrinter::notable_ports(const HostReport &host) const {
    std::vector<const PortReport*> notable;
    for (const auto &port : host.ports) {
        if (show_all || port.state == PortState::OPEN)
            notable.push_back(&port);
    }
    return notable;
}

/**
 * @brief Prints one host block.
 *
 * Example:
 *   Host report for 127.0.0.1 (localhost)
 *   Host is up
 *   port     service  status
 *   tcp/22   ssh      open
 *   All other ports filtered or closed
 */
void ReportPrinter::print_host(std::ostream &out, const HostReport &host) const {
    out << "Host report for " << host.address;
    if (!host.hostname.empty())
        out << " (" << host.hostname << ")";
    out << "\n";
    out << "Host is " << host_status_to_string(host.status) << "\n";
    if (host.status == HostStatus::DOWN)
        return;

    std::vector<const PortReport*> notable = notable_ports(host);
    if (notable.empty()) {
        out << "All ports filtered or closed\n";
        return;
    }

    std::vector<std::array<std::string, 3>> rows;
    rows.push_back({"port", "service", "status"});
    for (const PortReport *port : notable) {
        rows.push_back({"tcp/" + std::to_string(port->port),
                        port->service.empty() ? "unknown" : port->service,
                        port_state_to_string(port->state)});
    }

    std::size_t col_width = 0;
    for (const auto &row : rows) {
        for (const auto &word : row)
            col_width = std::max(col_width, word.size());
    }
    col_width += COL_PADDING;

    for (const auto &row : rows) {
        for (const auto &word : row)
            out << std::left << std::setw(static_cast<int>(col_width)) << word;
        out << "\n";
    }
    if (notable.size() < host.ports.size())
        out << "All other ports filtered or closed\n";
}

void ReportPrinter::print(std::ostream &out, const ScanReport &report) const {
    for (std::size_t i = 0; i < report.hosts.size(); ++i) {
        if (i > 0)
            out << "\n";
        print_host(out, report.hosts[i]);
    }
    if (report.partial)
        out << "\nScan interrupted: report is partial\n";
}
