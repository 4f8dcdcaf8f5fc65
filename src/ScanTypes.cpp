#include "ScanTypes.hpp"

std::string port_state_to_string(PortState state) {
    switch (state) {
        case PortState::OPEN:
            return "open";
        case PortState::CLOSED:
            return "closed";
        case PortState::FILTERED:
            return "filtered";
    }
    return "unknown";
}

std::string host_status_to_string(HostStatus status) {
    switch (status) {
        case HostStatus::UP:
            return "up";
        case HostStatus::DOWN:
            return "down";
        case HostStatus::ASSUMED_UP:
            return "up (discovery skipped)";
    }
    return "unknown";
}

std::size_t ScanReport::result_count() const {
    std::size_t count = 0;
    for (const auto &host : hosts)
        count += host.ports.size();
    return count;
}
