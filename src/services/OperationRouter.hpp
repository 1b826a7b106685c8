/**
 * @file OperationRouter.hpp
 * @brief Selects the one handler that executes an operation
 *
 * Routing is an ordered table of (name, predicate, target) rules evaluated
 * against the set of backends an operation touches; the first match wins.
 * The table can be inspected and evaluated without any handler registered.
 */

#pragma once

#include "models/BackendType.hpp"
#include "models/OperationResult.hpp"
#include "models/OperationTypes.hpp"
#include "models/ProgressTypes.hpp"
#include "services/IOperationHandler.hpp"
#include "services/ProtocolClassifier.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct BackendPresence
 * @brief Which backends an operation touches, and in what order they appear
 */
struct BackendPresence {
    std::vector<BackendType> detection_order;  ///< Distinct backends in locator order
    std::optional<BackendType> destination;    ///< Copy/Move only

    [[nodiscard]] auto has(BackendType backend) const -> bool;

    /**
     * @brief Whichever of @p a and @p b appears first in locator order
     */
    [[nodiscard]] auto first_of(BackendType a, BackendType b) const -> BackendType;

    /**
     * @brief Network backends present (SMB, SFTP, FTP, CLOUD)
     */
    [[nodiscard]] auto network_backends() const -> std::vector<BackendType>;
};

/**
 * @struct RoutingRule
 * @brief One row of the priority table
 */
struct RoutingRule {
    std::string name;
    std::function<bool(const BackendPresence&)> matches;
    std::function<BackendType(const BackendPresence&)> target;
};

class OperationRouter {
public:
    explicit OperationRouter(std::shared_ptr<ProtocolClassifier> classifier = nullptr);

    /**
     * @brief Register the handler for handler->backend()
     *
     * The LOCAL handler also serves SCOPED locators.
     */
    void register_handler(std::shared_ptr<IOperationHandler> handler);

    [[nodiscard]] auto analyze(const Operation& operation) const -> BackendPresence;

    /**
     * @brief Backend whose handler the table selects
     */
    [[nodiscard]] auto select_backend(const Operation& operation) const -> BackendType;

    /**
     * @brief Name of the rule that matched (for logs and tests)
     */
    [[nodiscard]] auto matching_rule(const Operation& operation) const -> std::string;

    /**
     * @return Selected handler, or nullptr if none is registered for its backend
     */
    [[nodiscard]] auto select_handler(const Operation& operation) const
        -> std::shared_ptr<IOperationHandler>;

    /**
     * @brief Handler responsible for a single locator
     */
    [[nodiscard]] auto handler_for_locator(const std::string& locator) const
        -> std::shared_ptr<IOperationHandler>;

    /**
     * @brief Select a handler and invoke its entry point for the operation
     */
    auto dispatch(const Operation& operation, const ProgressCallback& progress,
                  const std::atomic<bool>& cancel_requested) -> OperationResult;

    [[nodiscard]] auto rules() const -> const std::vector<RoutingRule>& { return rules_; }

    [[nodiscard]] static auto default_rules() -> std::vector<RoutingRule>;

private:
    [[nodiscard]] auto evaluate(const BackendPresence& presence) const
        -> std::pair<const RoutingRule*, BackendType>;

    std::shared_ptr<ProtocolClassifier> classifier_;
    std::vector<RoutingRule> rules_;
    mutable std::mutex mutex_;
    std::map<BackendType, std::shared_ptr<IOperationHandler>> handlers_;
};
