/**
 * @file ProgressChannel.hpp
 * @brief Bounded producer/consumer pipe of ProgressEvents
 *
 * The worker producing events never blocks: Processing samples offered to a
 * full buffer are dropped. Starting and Completed are control events and are
 * always enqueued, so a consumer sees exactly one of each per operation.
 */

#pragma once

#include "models/ProgressTypes.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

class ProgressChannel {
public:
    explicit ProgressChannel(size_t capacity = 64);

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    /**
     * @brief Offer a sample without blocking
     * @return false if the buffer was full or the channel is closed
     */
    auto try_send(ProgressEvent event) -> bool;

    /**
     * @brief Enqueue a control event regardless of capacity
     * @return false if the channel is already closed
     */
    auto send_control(ProgressEvent event) -> bool;

    /**
     * @brief Stop accepting events; buffered events stay readable
     */
    void close();

    /**
     * @brief Block until an event arrives
     * @return std::nullopt once the channel is closed and drained
     */
    auto receive() -> std::optional<ProgressEvent>;

    /**
     * @brief Like receive() but gives up after @p timeout
     */
    auto receive_for(std::chrono::milliseconds timeout) -> std::optional<ProgressEvent>;

    auto try_receive() -> std::optional<ProgressEvent>;

    [[nodiscard]] auto is_closed() const -> bool;

    /**
     * @brief Closed and nothing left to read
     */
    [[nodiscard]] auto is_drained() const -> bool;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto capacity() const -> size_t { return capacity_; }
    [[nodiscard]] auto dropped_count() const -> uint64_t;

private:
    auto pop_front_locked() -> std::optional<ProgressEvent>;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<ProgressEvent> events_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};
