#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <utility>

/**
 * Read-only mapping from (port, protocol) to a well-known service name.
 * Unknown pairs yield an empty string.
 */
class ServiceTable {
public:
    virtual ~ServiceTable() = default;
    virtual std::string lookup(uint16_t port, const std::string &protocol) const = 0;
};

/**
 * Service table loaded once from the system services database (/etc/services
 * through NSS). Lookups after construction are safe from any thread.
 */
class SystemServiceTable : public ServiceTable {
private:
    std::map<std::pair<uint16_t, std::string>, std::string> services;

public:
    SystemServiceTable();
    std::string lookup(uint16_t port, const std::string &protocol) const override;
    std::size_t size() const { return services.size(); }
};
