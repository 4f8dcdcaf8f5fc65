#pragma once
#include <cstddef>
#include <functional>
#include <thread>

using ThreadFactory = std::function<std::thread(const std::function<void()> &)>;

/**
 * Runs `worker` on up to `count` threads and joins them.
 *
 * Workers are expected to pull their own work from shared state until it runs
 * out. If the system refuses to create more threads the pool keeps the ones
 * already started; if not even one could be started, `worker` runs on the
 * calling thread.
 *
 * @param spawn Thread constructor, replaceable for tests. Null means std::thread.
 * @return std::size_t Number of workers that actually ran.
 */
std::size_t run_workers(std::size_t count, const std::function<void()> &worker,
                        const ThreadFactory &spawn = nullptr);
