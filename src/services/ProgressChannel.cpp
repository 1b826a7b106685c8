#include "services/ProgressChannel.hpp"

#include <utility>

ProgressChannel::ProgressChannel(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

auto ProgressChannel::try_send(ProgressEvent event) -> bool {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        if (events_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        events_.push_back(std::move(event));
    }
    available_.notify_one();
    return true;
}

auto ProgressChannel::send_control(ProgressEvent event) -> bool {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        events_.push_back(std::move(event));
    }
    available_.notify_one();
    return true;
}

void ProgressChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

auto ProgressChannel::pop_front_locked() -> std::optional<ProgressEvent> {
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

auto ProgressChannel::receive() -> std::optional<ProgressEvent> {
    std::unique_lock lock(mutex_);
    available_.wait(lock, [this] { return !events_.empty() || closed_; });
    return pop_front_locked();
}

auto ProgressChannel::receive_for(std::chrono::milliseconds timeout)
    -> std::optional<ProgressEvent> {
    std::unique_lock lock(mutex_);
    available_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    return pop_front_locked();
}

auto ProgressChannel::try_receive() -> std::optional<ProgressEvent> {
    std::lock_guard lock(mutex_);
    return pop_front_locked();
}

auto ProgressChannel::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto ProgressChannel::is_drained() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_ && events_.empty();
}

auto ProgressChannel::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return events_.size();
}

auto ProgressChannel::dropped_count() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return dropped_;
}
