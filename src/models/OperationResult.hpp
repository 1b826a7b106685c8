/**
 * @file OperationResult.hpp
 * @brief Outcome of an executed operation
 */

#pragma once

#include "models/OperationTypes.hpp"
#include "util/Error.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

/**
 * @struct SuccessResult
 * @brief Every input item was processed
 */
struct SuccessResult {
    size_t processed_count = 0;
    Operation operation;
    std::vector<std::string> produced_paths;  ///< Locators created at the destination
    std::vector<std::string> source_paths;    ///< Input locator of each produced path, same order

    auto operator==(const SuccessResult&) const -> bool = default;
};

/**
 * @struct PartialSuccessResult
 * @brief Some items failed; processed_count + failed_count equals the input count
 */
struct PartialSuccessResult {
    size_t processed_count = 0;
    size_t failed_count = 0;
    std::vector<std::string> errors;          ///< One rendered FileError per failed item
    std::vector<std::string> produced_paths;  ///< Locators of the items that did succeed
    std::vector<std::string> source_paths;    ///< Input locator of each produced path, same order

    auto operator==(const PartialSuccessResult&) const -> bool = default;
};

/**
 * @struct FailureResult
 * @brief Nothing was processed, or the operation was rejected up front
 */
struct FailureResult {
    std::string message;
    util::ErrorKind kind = util::ErrorKind::UNKNOWN;

    auto operator==(const FailureResult&) const -> bool = default;
};

/**
 * @struct AuthenticationRequiredResult
 * @brief A backend refused the credentials; the caller must re-authenticate
 */
struct AuthenticationRequiredResult {
    std::string provider;
    std::string message;

    auto operator==(const AuthenticationRequiredResult&) const -> bool = default;
};

using OperationResult =
    std::variant<SuccessResult, PartialSuccessResult, FailureResult, AuthenticationRequiredResult>;

/**
 * @brief Items that succeeded (0 for Failure and AuthenticationRequired)
 */
[[nodiscard]] auto result_processed_count(const OperationResult& result) -> size_t;

/**
 * @brief Items that failed, given the operation's input count
 */
[[nodiscard]] auto result_failed_count(const OperationResult& result, size_t total_items) -> size_t;

/**
 * @brief Paths created by the operation (Success and PartialSuccess only)
 */
[[nodiscard]] auto result_produced_paths(const OperationResult& result) -> std::vector<std::string>;

/**
 * @brief Inputs paired with result_produced_paths; empty when the result did not record them
 */
[[nodiscard]] auto result_source_paths(const OperationResult& result) -> std::vector<std::string>;

[[nodiscard]] auto is_success(const OperationResult& result) -> bool;

/**
 * @brief One-line human-readable summary, used in logs and by the CLI
 */
[[nodiscard]] auto describe_result(const OperationResult& result) -> std::string;
