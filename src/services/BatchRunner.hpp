/**
 * @file BatchRunner.hpp
 * @brief Fixed-size concurrent batches with a pause in between
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

struct BatchPolicy {
    size_t batch_size = 5;
    std::chrono::milliseconds pause{150};
};

/**
 * @brief Run work(i) for i in [0, count), batch_size items concurrently
 *
 * Every item of a batch is awaited before the pause and before the next
 * batch starts. should_stop is checked before each batch; once it returns
 * true no further items are started.
 *
 * @return Number of items that were started
 */
auto run_in_batches(size_t count, const BatchPolicy& policy,
                    const std::function<void(size_t)>& work,
                    const std::function<bool()>& should_stop) -> size_t;
