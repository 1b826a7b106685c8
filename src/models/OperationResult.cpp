#include "models/OperationResult.hpp"

#include "util/Overloaded.hpp"

#include <fmt/format.h>

auto result_processed_count(const OperationResult& result) -> size_t {
    return std::visit(util::Overloaded{
                          [](const SuccessResult& r) { return r.processed_count; },
                          [](const PartialSuccessResult& r) { return r.processed_count; },
                          [](const FailureResult&) -> size_t { return 0; },
                          [](const AuthenticationRequiredResult&) -> size_t { return 0; },
                      },
                      result);
}

auto result_failed_count(const OperationResult& result, size_t total_items) -> size_t {
    return std::visit(util::Overloaded{
                          [](const SuccessResult&) -> size_t { return 0; },
                          [](const PartialSuccessResult& r) { return r.failed_count; },
                          [total_items](const FailureResult&) { return total_items; },
                          [total_items](const AuthenticationRequiredResult&) { return total_items; },
                      },
                      result);
}

auto result_produced_paths(const OperationResult& result) -> std::vector<std::string> {
    if (const auto* success = std::get_if<SuccessResult>(&result)) {
        return success->produced_paths;
    }
    if (const auto* partial = std::get_if<PartialSuccessResult>(&result)) {
        return partial->produced_paths;
    }
    return {};
}

auto result_source_paths(const OperationResult& result) -> std::vector<std::string> {
    if (const auto* success = std::get_if<SuccessResult>(&result)) {
        return success->source_paths;
    }
    if (const auto* partial = std::get_if<PartialSuccessResult>(&result)) {
        return partial->source_paths;
    }
    return {};
}

auto is_success(const OperationResult& result) -> bool {
    return std::holds_alternative<SuccessResult>(result);
}

auto describe_result(const OperationResult& result) -> std::string {
    return std::visit(
        util::Overloaded{
            [](const SuccessResult& r) {
                return fmt::format("{} completed: {} item(s)", operation_name(r.operation),
                                   r.processed_count);
            },
            [](const PartialSuccessResult& r) {
                return fmt::format("Partially completed: {} succeeded, {} failed",
                                   r.processed_count, r.failed_count);
            },
            [](const FailureResult& r) { return fmt::format("Failed: {}", r.message); },
            [](const AuthenticationRequiredResult& r) {
                return fmt::format("Authentication required for {}: {}", r.provider, r.message);
            },
        },
        result);
}
