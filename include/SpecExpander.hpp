#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "ScanTypes.hpp"

/// Maps a hostname to the first address it resolves to.
using Resolver = std::function<std::optional<std::string>(const std::string &)>;

/**
 * @brief Turns host and port tokens into concrete, deduplicated sequences.
 *
 * Output keeps the order in which each host or port was first seen.
 */
class SpecExpander {
private:
    Resolver resolver;

public:
    static constexpr uint64_t MAX_BLOCK_HOSTS = uint64_t(1) << 16;

    SpecExpander();
    explicit SpecExpander(Resolver r);

    std::vector<HostEntry> expand_hosts(const std::vector<std::string> &specs) const;
    std::vector<uint16_t> expand_ports(const std::vector<std::string> &specs) const;

    std::vector<HostEntry> expand_host(const std::string &spec) const;
    std::vector<uint16_t> parse_ports(const std::string &spec) const;

private:
    std::vector<HostEntry> expand_cidr(const std::string &spec) const;
};

std::optional<std::string> resolve_first_address(const std::string &hostname);
std::optional<std::string> canonical_address(const std::string &literal);
const std::vector<uint16_t> &common_ports();
