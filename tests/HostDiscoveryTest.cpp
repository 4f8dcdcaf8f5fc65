#include <gtest/gtest.h>
#include <mutex>
#include "HostDiscovery.hpp"
#include "TestUtils.hpp"

namespace {

std::vector<HostEntry> make_hosts(const std::vector<std::string> &addresses) {
    std::vector<HostEntry> hosts;
    for (const auto &a : addresses)
        hosts.push_back({a, ""});
    return hosts;
}

std::vector<std::string> addresses(const std::vector<HostEntry> &hosts) {
    std::vector<std::string> out;
    for (const auto &h : hosts)
        out.push_back(h.address);
    return out;
}

} // namespace

TEST(HostDiscovery, PartitionsPreserveRequestOrder) {
    FakeLivenessProbe probe;
    probe.alive = {"10.0.0.4", "10.0.0.1", "10.0.0.3"};
    std::atomic<bool> cancelled{false};
    HostDiscovery discovery(probe, 3, cancelled);

    DiscoveryResult result = discovery.run(make_hosts({"10.0.0.5", "10.0.0.4", "10.0.0.2", "10.0.0.1", "10.0.0.3"}));
    EXPECT_EQ(addresses(result.reachable), std::vector<std::string>({"10.0.0.4", "10.0.0.1", "10.0.0.3"}));
    EXPECT_EQ(addresses(result.unreachable), std::vector<std::string>({"10.0.0.5", "10.0.0.2"}));
}

TEST(HostDiscovery, HostnameTravelsWithReachableHost) {
    FakeLivenessProbe probe;
    probe.alive = {"10.9.8.7"};
    std::atomic<bool> cancelled{false};
    HostDiscovery discovery(probe, 4, cancelled);

    DiscoveryResult result = discovery.run({{"10.9.8.7", "scanme.test"}});
    ASSERT_EQ(result.reachable.size(), 1u);
    EXPECT_EQ(result.reachable[0].hostname, "scanme.test");
}

TEST(HostDiscovery, ConcurrencyIsBounded) {
    FakeLivenessProbe probe;
    probe.delay_ms = 20;
    std::atomic<bool> cancelled{false};
    HostDiscovery discovery(probe, 2, cancelled);

    std::vector<std::string> many;
    for (int i = 1; i <= 12; ++i)
        many.push_back("10.0.0." + std::to_string(i));
    discovery.run(make_hosts(many));

    EXPECT_EQ(probe.calls.load(), 12);
    EXPECT_LE(probe.max_in_flight.load(), 2);
}

TEST(HostDiscovery, FailingProbeOnlyAffectsItsHost) {
    FakeLivenessProbe probe;
    probe.alive = {"10.0.0.1", "10.0.0.2", "10.0.0.3"};
    probe.throwing = {"10.0.0.2"};
    std::atomic<bool> cancelled{false};
    HostDiscovery discovery(probe, 3, cancelled);

    DiscoveryResult result = discovery.run(make_hosts({"10.0.0.1", "10.0.0.2", "10.0.0.3"}));
    EXPECT_EQ(addresses(result.reachable), std::vector<std::string>({"10.0.0.1", "10.0.0.3"}));
    EXPECT_EQ(addresses(result.unreachable), std::vector<std::string>({"10.0.0.2"}));
}

TEST(HostDiscovery, CallbackSeesEveryHost) {
    FakeLivenessProbe probe;
    probe.alive = {"10.0.0.2"};
    std::atomic<bool> cancelled{false};
    HostDiscovery discovery(probe, 4, cancelled);

    std::mutex mtx;
    std::map<std::string, bool> seen;
    discovery.run(make_hosts({"10.0.0.1", "10.0.0.2", "10.0.0.3"}), [&](const HostEntry &host, bool up) {
        std::lock_guard<std::mutex> lock(mtx);
        seen[host.address] = up;
    });
    EXPECT_EQ(seen.size(), 3u);
    EXPECT_TRUE(seen["10.0.0.2"]);
    EXPECT_FALSE(seen["10.0.0.1"]);
}

TEST(HostDiscovery, CancelledBeforeStartProbesNothing) {
    FakeLivenessProbe probe;
    probe.alive = {"10.0.0.1"};
    std::atomic<bool> cancelled{true};
    HostDiscovery discovery(probe, 4, cancelled);

    DiscoveryResult result = discovery.run(make_hosts({"10.0.0.1", "10.0.0.2"}));
    EXPECT_EQ(probe.calls.load(), 0);
    EXPECT_TRUE(result.reachable.empty());
    EXPECT_EQ(result.unreachable.size(), 2u);
}

TEST(HostDiscovery, EmptyInput) {
    FakeLivenessProbe probe;
    std::atomic<bool> cancelled{false};
    HostDiscovery discovery(probe, 4, cancelled);
    DiscoveryResult result = discovery.run({});
    EXPECT_TRUE(result.reachable.empty());
    EXPECT_TRUE(result.unreachable.empty());
}
