#include <gtest/gtest.h>
#include <sstream>
#include "ReportPrinter.hpp"

namespace {

PortReport port(uint16_t number, PortState state, const std::string &service = "") {
    PortReport p;
    p.port = number;
    p.state = state;
    p.service = service;
    return p;
}

std::string render(const ScanReport &report, bool all = false) {
    std::ostringstream out;
    ReportPrinter(all).print(out, report);
    return out.str();
}

} // namespace

TEST(ReportPrinter, OpenPortsTable) {
    ScanReport report;
    HostReport host;
    host.address = "127.0.0.1";
    host.hostname = "localhost";
    host.status = HostStatus::UP;
    host.ports = {port(22, PortState::OPEN, "ssh"), port(80, PortState::CLOSED, "http")};
    report.hosts.push_back(host);

    EXPECT_EQ(render(report),
              "Host report for 127.0.0.1 (localhost)\n"
              "Host is up\n"
              "port     service  status   \n"
              "tcp/22   ssh      open     \n"
              "All other ports filtered or closed\n");
}

TEST(ReportPrinter, ShowAllListsEveryPort) {
    ScanReport report;
    HostReport host;
    host.address = "10.0.0.1";
    host.status = HostStatus::ASSUMED_UP;
    host.ports = {port(80, PortState::FILTERED), port(8080, PortState::CLOSED, "http-alt")};
    report.hosts.push_back(host);

    std::string text = render(report, true);
    EXPECT_NE(text.find("Host is up (discovery skipped)\n"), std::string::npos);
    EXPECT_NE(text.find("tcp/80"), std::string::npos);
    EXPECT_NE(text.find("unknown"), std::string::npos);
    EXPECT_NE(text.find("filtered"), std::string::npos);
    EXPECT_NE(text.find("http-alt"), std::string::npos);
    EXPECT_EQ(text.find("All other ports"), std::string::npos);
}

TEST(ReportPrinter, NothingNotable) {
    ScanReport report;
    HostReport host;
    host.address = "10.0.0.1";
    host.status = HostStatus::UP;
    host.ports = {port(80, PortState::FILTERED), port(81, PortState::CLOSED)};
    report.hosts.push_back(host);

    EXPECT_EQ(render(report), "Host report for 10.0.0.1\nHost is up\nAll ports filtered or closed\n");
}

TEST(ReportPrinter, DownHostAndSeparators) {
    ScanReport report;
    HostReport down;
    down.address = "10.0.0.1";
    down.status = HostStatus::DOWN;
    HostReport up;
    up.address = "10.0.0.2";
    up.status = HostStatus::UP;
    report.hosts = {down, up};
    report.partial = true;

    EXPECT_EQ(render(report),
              "Host report for 10.0.0.1\n"
              "Host is down\n"
              "\n"
              "Host report for 10.0.0.2\n"
              "Host is up\n"
              "All ports filtered or closed\n"
              "\n"
              "Scan interrupted: report is partial\n");
}
