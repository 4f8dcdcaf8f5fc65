#include <gtest/gtest.h>
#include <netdb.h>
#include <arpa/inet.h>
#include "ServiceTable.hpp"

TEST(SystemServiceTable, UnknownPairIsEmpty) {
    SystemServiceTable table;
    EXPECT_EQ(table.lookup(22, "no-such-protocol"), "");
}

TEST(SystemServiceTable, AgreesWithServicesDatabase) {
    SystemServiceTable table;
    for (uint16_t port : {22, 25, 80, 443}) {
        struct servent *entry = getservbyport(htons(port), "tcp");
        std::string expected = entry ? entry->s_name : "";
        EXPECT_EQ(table.lookup(port, "tcp"), expected) << "port " << port;
    }
}

TEST(SystemServiceTable, LookupIsStable) {
    SystemServiceTable table;
    EXPECT_EQ(table.lookup(80, "tcp"), table.lookup(80, "tcp"));
    if (table.size() == 0)
        GTEST_SKIP() << "no services database on this system";
    EXPECT_GT(table.size(), 0u);
}
