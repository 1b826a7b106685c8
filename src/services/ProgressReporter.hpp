/**
 * @file ProgressReporter.hpp
 * @brief Turns raw byte counts into throttled Processing events with speed
 */

#pragma once

#include "models/ProgressTypes.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <string>

/**
 * @class ProgressReporter
 * @brief Rolling-average speed calculation over byte progress
 *
 * Speed is recomputed at most once per interval from the bytes moved since
 * the previous sample and averaged over the last MAX_SAMPLES samples. An
 * event is emitted at the start and end of every item and otherwise at most
 * once per interval.
 *
 * @note Not thread-safe; owned by the worker running a single item at a time.
 */
class ProgressReporter {
public:
    ProgressReporter(ProgressCallback callback, std::chrono::milliseconds min_interval);

    /**
     * @brief Start a new item; speed history carries over between items
     */
    void begin_item(std::string name, size_t index, size_t total_items);

    void report(uint64_t bytes_transferred, uint64_t total_bytes);

    /**
     * @brief Adapter for IBackendTransport progress parameters
     */
    [[nodiscard]] auto as_transfer_callback() -> TransferProgressCallback;

    [[nodiscard]] auto current_speed() const -> uint64_t;

private:
    static constexpr size_t MAX_SAMPLES = 10;

    ProgressCallback callback_;
    std::chrono::milliseconds min_interval_;

    std::string item_name_;
    size_t item_index_ = 0;
    size_t total_items_ = 0;

    std::chrono::steady_clock::time_point last_sample_time_;
    std::chrono::steady_clock::time_point last_emit_time_;
    uint64_t last_sample_bytes_ = 0;
    std::deque<uint64_t> speed_samples_;
};
