/**
 * @file ProgressTypes.hpp
 * @brief Progress events streamed while an operation runs
 */

#pragma once

#include "models/OperationResult.hpp"
#include "models/OperationTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

/**
 * @struct ProgressStarting
 * @brief First event of every stream
 */
struct ProgressStarting {
    Operation operation;
    size_t total_items = 0;

    auto operator==(const ProgressStarting&) const -> bool = default;
};

/**
 * @struct ProgressProcessing
 * @brief Byte-level progress for the item currently being transferred
 */
struct ProgressProcessing {
    std::string current_item;  ///< File name of the item
    size_t index = 0;          ///< 0-based position in the input
    size_t total = 0;          ///< Input item count
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    uint64_t speed_bytes_per_sec = 0;

    auto operator==(const ProgressProcessing&) const -> bool = default;
};

/**
 * @struct ProgressCompleted
 * @brief Last event of every stream
 */
struct ProgressCompleted {
    OperationResult result;

    auto operator==(const ProgressCompleted&) const -> bool = default;
};

using ProgressEvent = std::variant<ProgressStarting, ProgressProcessing, ProgressCompleted>;

/**
 * @brief Callback handlers use to report Processing events
 */
using ProgressCallback = std::function<void(const ProgressProcessing&)>;

/**
 * @brief Raw byte callback passed to transports: (bytes transferred, total bytes)
 */
using TransferProgressCallback = std::function<void(uint64_t, uint64_t)>;
