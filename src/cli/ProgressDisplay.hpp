/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI file operations
 */

#pragma once

#include "models/OperationResult.hpp"
#include "models/ProgressTypes.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar fed by ProgressEvents
 *
 * Shows the current item, its position in the input, a progress bar for the
 * item's bytes and the transfer speed. Falls back to plain lines when
 * stdout is not a terminal.
 */
class ProgressDisplay {
public:
    ProgressDisplay();

    /**
     * @brief Print the header for a starting operation
     */
    void start(const ProgressStarting& event);

    void update(const ProgressProcessing& event);

    /**
     * @brief Print the final outcome and every per-file error
     */
    void complete(const OperationResult& result);

    /**
     * @brief Show a notice on its own line without disturbing the bar
     */
    void notice(const std::string& message);

    void set_color_enabled(bool enable);

    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Human-readable size, e.g. "245.0 MB"
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

    [[nodiscard]] static auto format_speed(uint64_t bytes_per_sec) -> std::string;

    /**
     * @brief "mm:ss", or "h:mm:ss" past an hour
     */
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

private:
    [[nodiscard]] auto generate_progress_bar(double percentage) -> std::string;

    void clear_line();

    bool color_enabled_ = true;
    bool line_active_ = false;
    std::string last_item_;
    std::chrono::steady_clock::time_point start_time_;

    static constexpr int BAR_WIDTH = 30;
};

}  // namespace cli
