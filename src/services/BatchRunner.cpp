#include "services/BatchRunner.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <vector>

auto run_in_batches(size_t count, const BatchPolicy& policy,
                    const std::function<void(size_t)>& work,
                    const std::function<bool()>& should_stop) -> size_t {
    const size_t batch_size = std::max<size_t>(policy.batch_size, 1);
    size_t started = 0;

    while (started < count) {
        if (should_stop && should_stop()) {
            break;
        }

        const size_t batch_end = std::min(count, started + batch_size);
        std::vector<std::future<void>> pending;
        pending.reserve(batch_end - started);

        for (size_t i = started; i < batch_end; ++i) {
            pending.push_back(std::async(std::launch::async, [&work, i] { work(i); }));
        }
        started = batch_end;

        // Wait for the whole batch before surfacing the first failure.
        std::exception_ptr first_failure;
        for (auto& future : pending) {
            try {
                future.get();
            } catch (...) {
                if (!first_failure) {
                    first_failure = std::current_exception();
                }
            }
        }
        if (first_failure) {
            std::rethrow_exception(first_failure);
        }

        if (started < count && policy.pause.count() > 0) {
            std::this_thread::sleep_for(policy.pause);
        }
    }

    return started;
}
