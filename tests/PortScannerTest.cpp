#include <gtest/gtest.h>
#include <getopt.h>
#include <string>
#include <vector>
#include "PortScanner.hpp"

namespace {

/// Feeds `args` to a fresh PortScanner the way main() would.
void parse(PortScanner &scanner, std::vector<std::string> args) {
    args.insert(args.begin(), "reconscan");
    std::vector<char*> argv;
    for (auto &arg : args)
        argv.push_back(&arg[0]);
    argv.push_back(nullptr);
    optind = 0;
    scanner.parse_arguments(static_cast<int>(args.size()), argv.data());
}

void parse_fresh(std::vector<std::string> args) {
    PortScanner scanner;
    parse(scanner, std::move(args));
}

} // namespace

TEST(PortScannerArguments, ValuesAtTheLimitsAreAccepted) {
    PortScanner scanner;
    parse(scanner, {"-w", "3600000", "-W", "1", "-c", "4096", "-C", "7", "-p", "22", "10.0.0.1"});
    EXPECT_EQ(scanner.scan_options().timeout_ms, 3600000);
    EXPECT_EQ(scanner.scan_options().ping_timeout_ms, 1);
    EXPECT_EQ(scanner.scan_options().concurrency, 4096u);
    EXPECT_EQ(scanner.scan_options().ping_concurrency, 7u);
    EXPECT_EQ(scanner.targets(), std::vector<std::string>({"10.0.0.1"}));
}

TEST(PortScannerArgumentsDeathTest, OversizedTimeoutIsRejected) {
    EXPECT_EXIT(parse_fresh({"-w", "3000000000", "10.0.0.1"}),
                ::testing::ExitedWithCode(PortScanner::EXIT_USAGE), "exceeds the maximum");
    EXPECT_EXIT(parse_fresh({"-W", "3600001", "10.0.0.1"}),
                ::testing::ExitedWithCode(PortScanner::EXIT_USAGE), "exceeds the maximum");
}

TEST(PortScannerArgumentsDeathTest, OversizedConcurrencyIsRejected) {
    EXPECT_EXIT(parse_fresh({"-c", "60000", "10.0.0.1"}),
                ::testing::ExitedWithCode(PortScanner::EXIT_USAGE), "exceeds the maximum");
    EXPECT_EXIT(parse_fresh({"-C", "99999999999999999999", "10.0.0.1"}),
                ::testing::ExitedWithCode(PortScanner::EXIT_USAGE), "Invalid value");
}

TEST(PortScannerArgumentsDeathTest, NonPositiveValuesAreRejected) {
    EXPECT_EXIT(parse_fresh({"-w", "0", "10.0.0.1"}),
                ::testing::ExitedWithCode(PortScanner::EXIT_USAGE), "Invalid value");
    EXPECT_EXIT(parse_fresh({"-c", "-5", "10.0.0.1"}),
                ::testing::ExitedWithCode(PortScanner::EXIT_USAGE), "Invalid value");
}

TEST(PortScannerArgumentsDeathTest, MissingTargetIsRejected) {
    EXPECT_EXIT(parse_fresh({"-p", "22"}), ::testing::ExitedWithCode(PortScanner::EXIT_USAGE), "No target");
}
