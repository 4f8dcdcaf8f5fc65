#include "PortScanner.hpp"
#include <csignal>
#include <cstdlib>

PortScanner scanner;

/**
 * @brief SIGINT handler: the first Ctrl+C cancels the scan so a partial report
 *        can be printed, the second exits immediately.
 *
 * @param signal The signal number (unused).
 */
void signal_handler(int) {
    if (scanner.is_cancelled())
        std::_Exit(PortScanner::EXIT_INTERRUPTED);
    scanner.cancel();
}

/**
 * @brief Entry point of the program. Parses arguments and runs the scan.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return int Exit status code.
 */
int main(int argc, char *argv[]) {
    std::signal(SIGINT, signal_handler);

    scanner.parse_arguments(argc, argv);
    scanner.get_source_ip();
    return scanner.run();
}
