/**
 * @file OperationHistory.hpp
 * @brief The last executed operation, kept for undo
 */

#pragma once

#include "models/OperationResult.hpp"
#include "models/OperationTypes.hpp"

#include <chrono>

struct OperationHistory {
    Operation operation;
    OperationResult result;
    std::chrono::system_clock::time_point timestamp;

    auto operator==(const OperationHistory&) const -> bool = default;
};
