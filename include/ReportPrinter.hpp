#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "ScanTypes.hpp"

/**
 * Formats a finalized ScanReport, one block per host in request order.
 */
class ReportPrinter {
private:
    bool show_all;

public:
    static const int COL_PADDING = 2;

    explicit ReportPrinter(bool all_ports = false);

    void print(std::ostream &out, const ScanReport &report) const;
    void print_host(std::ostream &out, const HostReport &host) const;

private:
    std::vector<const PortReport*> notable_ports(const HostReport &host) const;
};
