#include "ServiceTable.hpp"
#include <netdb.h>
#include <arpa/inet.h>

/**
 * @brief Reads every entry of the services database into memory.
 *
 * The first name listed for a (port, protocol) pair wins, the same one
 * getservbyport() would report.
 */
SystemServiceTable::SystemServiceTable() {
    setservent(0);
    while (struct servent *entry = getservent()) {
        if (!entry->s_name || !entry->s_proto)
            continue;
        uint16_t port = ntohs(static_cast<uint16_t>(entry->s_port));
        services.emplace(std::make_pair(port, std::string(entry->s_proto)), entry->s_name);
    }
    endservent();
}

std::string SystemServiceTable::lookup(uint16_t port, const std::string &protocol) const {
    auto it = services.find({port, protocol});
    if (it == services.end())
        return "";
    return it->second;
}
