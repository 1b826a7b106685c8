#include "services/ProgressReporter.hpp"

#include <utility>

ProgressReporter::ProgressReporter(ProgressCallback callback, std::chrono::milliseconds min_interval)
    : callback_(std::move(callback)),
      min_interval_(min_interval),
      last_sample_time_(std::chrono::steady_clock::now()),
      last_emit_time_(last_sample_time_) {}

void ProgressReporter::begin_item(std::string name, size_t index, size_t total_items) {
    item_name_ = std::move(name);
    item_index_ = index;
    total_items_ = total_items;
    last_sample_bytes_ = 0;
    last_sample_time_ = std::chrono::steady_clock::now();
}

void ProgressReporter::report(uint64_t bytes_transferred, uint64_t total_bytes) {
    if (!callback_) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    auto since_sample =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - last_sample_time_);

    if (since_sample >= min_interval_ && bytes_transferred > last_sample_bytes_ &&
        since_sample.count() > 0) {
        const uint64_t delta = bytes_transferred - last_sample_bytes_;
        const double seconds = static_cast<double>(since_sample.count()) / 1000.0;

        speed_samples_.push_back(static_cast<uint64_t>(static_cast<double>(delta) / seconds));
        if (speed_samples_.size() > MAX_SAMPLES) {
            speed_samples_.pop_front();
        }

        last_sample_time_ = now;
        last_sample_bytes_ = bytes_transferred;
    }

    const bool boundary = bytes_transferred == 0 || bytes_transferred >= total_bytes;
    if (!boundary && now - last_emit_time_ < min_interval_) {
        return;
    }
    last_emit_time_ = now;

    callback_(ProgressProcessing{
        .current_item = item_name_,
        .index = item_index_,
        .total = total_items_,
        .bytes_transferred = bytes_transferred,
        .total_bytes = total_bytes,
        .speed_bytes_per_sec = current_speed(),
    });
}

auto ProgressReporter::as_transfer_callback() -> TransferProgressCallback {
    return [this](uint64_t bytes_transferred, uint64_t total_bytes) {
        report(bytes_transferred, total_bytes);
    };
}

auto ProgressReporter::current_speed() const -> uint64_t {
    if (speed_samples_.empty()) {
        return 0;
    }
    uint64_t total = 0;
    for (auto sample : speed_samples_) {
        total += sample;
    }
    return total / speed_samples_.size();
}
