/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include "util/Overloaded.hpp"

#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <variant>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";
constexpr auto YELLOW = "\033[33m";
constexpr auto CYAN = "\033[36m";

}  // namespace

ProgressDisplay::ProgressDisplay()
    : color_enabled_(is_terminal()), start_time_(std::chrono::steady_clock::now()) {}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

void ProgressDisplay::start(const ProgressStarting& event) {
    start_time_ = std::chrono::steady_clock::now();

    if (color_enabled_) {
        std::cout << BOLD;
    }
    std::cout << operation_name(event.operation) << " of " << event.total_items << " item"
              << (event.total_items != 1 ? "s" : "");
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << "\n" << std::flush;
}

void ProgressDisplay::update(const ProgressProcessing& event) {
    // Non-terminals get one line per item instead of a redrawn bar
    if (!is_terminal()) {
        if (event.current_item != last_item_) {
            std::cout << "[" << (event.index + 1) << "/" << event.total << "] "
                      << event.current_item << "\n";
            last_item_ = event.current_item;
        }
        return;
    }

    double percentage = 100.0;
    if (event.total_bytes > 0) {
        percentage = 100.0 * static_cast<double>(event.bytes_transferred) /
                     static_cast<double>(event.total_bytes);
    }

    std::string status_line =
        fmt::format("[{}/{}] {} {} {:5.1f}%", event.index + 1, event.total, event.current_item,
                    generate_progress_bar(percentage), percentage);

    if (event.speed_bytes_per_sec > 0) {
        status_line += "  |  " + format_speed(event.speed_bytes_per_sec);

        if (event.total_bytes > event.bytes_transferred) {
            auto remaining = static_cast<int64_t>((event.total_bytes - event.bytes_transferred) /
                                                  event.speed_bytes_per_sec);
            status_line += "  |  ETA: " + format_duration(remaining);
        }
    }

    clear_line();
    std::cout << status_line << std::flush;
    line_active_ = true;
    last_item_ = event.current_item;
}

void ProgressDisplay::notice(const std::string& message) {
    if (line_active_) {
        clear_line();
        line_active_ = false;
    }
    if (color_enabled_) {
        std::cout << YELLOW;
    }
    std::cout << message;
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << "\n" << std::flush;
}

void ProgressDisplay::complete(const OperationResult& result) {
    if (line_active_) {
        clear_line();
        line_active_ = false;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::steady_clock::now() - start_time_)
                             .count();

    const bool success = std::holds_alternative<SuccessResult>(result);
    const bool partial = std::holds_alternative<PartialSuccessResult>(result);

    if (color_enabled_) {
        std::cout << (success ? GREEN : partial ? YELLOW : RED) << BOLD;
    }
    std::cout << (success ? "[OK] " : partial ? "[PARTIAL] " : "[FAILED] ")
              << describe_result(result);
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << " (" << format_duration(elapsed) << ")\n";

    std::visit(util::Overloaded{
                   [&](const PartialSuccessResult& r) {
                       for (const auto& error : r.errors) {
                           if (color_enabled_) {
                               std::cout << CYAN;
                           }
                           std::cout << "  - ";
                           if (color_enabled_) {
                               std::cout << RESET;
                           }
                           std::cout << error << "\n";
                       }
                   },
                   [](const auto&) {},
               },
               result);

    std::cout << std::endl;
}

auto ProgressDisplay::format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;
    constexpr uint64_t TB = GB * 1024;

    if (bytes >= TB) {
        return fmt::format("{:.1f} TB", static_cast<double>(bytes) / static_cast<double>(TB));
    } else if (bytes >= GB) {
        return fmt::format("{:.1f} GB", static_cast<double>(bytes) / static_cast<double>(GB));
    } else if (bytes >= MB) {
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / static_cast<double>(MB));
    } else if (bytes >= KB) {
        return fmt::format("{:.1f} KB", static_cast<double>(bytes) / static_cast<double>(KB));
    }
    return fmt::format("{} B", bytes);
}

auto ProgressDisplay::format_speed(uint64_t bytes_per_sec) -> std::string {
    return format_bytes(bytes_per_sec) + "/s";
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return fmt::format("{:02d}:{:02d}", minutes, secs);
}

auto ProgressDisplay::generate_progress_bar(double percentage) -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";

    if (color_enabled_) {
        bar += GREEN;
    }

    for (int i = 0; i < filled; ++i) {
        bar += "\u2588";  // Full block character
    }

    if (color_enabled_) {
        bar += RESET;
    }

    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "\u2591";  // Light shade character
    }

    bar += "]";

    return bar;
}

void ProgressDisplay::clear_line() {
    if (is_terminal()) {
        std::cout << "\r\033[K";
    } else {
        std::cout << "\n";
    }
}

}  // namespace cli
