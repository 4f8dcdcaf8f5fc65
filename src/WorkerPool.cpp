#include "WorkerPool.hpp"
#include "Logger.hpp"
#include <system_error>
#include <vector>

std::size_t run_workers(std::size_t count, const std::function<void()> &worker, const ThreadFactory &spawn) {
    std::vector<std::thread> workers;
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        try {
            workers.push_back(spawn ? spawn(worker) : std::thread(worker));
        } catch (const std::system_error &e) {
            log_warning("started ", workers.size(), " of ", count, " worker threads: ", e.what());
            break;
        }
    }

    if (workers.empty() && count > 0) {
        worker();
        return 1;
    }
    for (auto &t : workers)
        t.join();
    return workers.size();
}
