#include "services/OperationRouter.hpp"

#include "util/Logger.hpp"
#include "util/Overloaded.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace {

constexpr std::string_view COMPONENT = "OperationRouter";

}  // namespace

auto BackendPresence::has(BackendType backend) const -> bool {
    return std::find(detection_order.begin(), detection_order.end(), backend) !=
           detection_order.end();
}

auto BackendPresence::first_of(BackendType a, BackendType b) const -> BackendType {
    for (auto backend : detection_order) {
        if (backend == a || backend == b) {
            return backend;
        }
    }
    return a;
}

auto BackendPresence::network_backends() const -> std::vector<BackendType> {
    std::vector<BackendType> network;
    for (auto backend : detection_order) {
        if (is_network_backend(backend)) {
            network.push_back(backend);
        }
    }
    return network;
}

auto OperationRouter::default_rules() -> std::vector<RoutingRule> {
    std::vector<RoutingRule> rules;

    rules.push_back({"cloud",
                     [](const BackendPresence& p) { return p.has(BackendType::CLOUD); },
                     [](const BackendPresence&) { return BackendType::CLOUD; }});

    rules.push_back({"smb+sftp",
                     [](const BackendPresence& p) {
                         return p.has(BackendType::SMB) && p.has(BackendType::SFTP);
                     },
                     [](const BackendPresence& p) {
                         if (p.destination) {
                             return *p.destination == BackendType::SFTP ? BackendType::SFTP
                                                                        : BackendType::SMB;
                         }
                         return p.first_of(BackendType::SMB, BackendType::SFTP);
                     }});

    rules.push_back({"smb+ftp",
                     [](const BackendPresence& p) {
                         return p.has(BackendType::SMB) && p.has(BackendType::FTP);
                     },
                     [](const BackendPresence&) { return BackendType::SMB; }});

    rules.push_back({"sftp+ftp",
                     [](const BackendPresence& p) {
                         return p.has(BackendType::SFTP) && p.has(BackendType::FTP);
                     },
                     [](const BackendPresence&) { return BackendType::SFTP; }});

    rules.push_back({"single-network",
                     [](const BackendPresence& p) { return p.network_backends().size() == 1; },
                     [](const BackendPresence& p) { return p.network_backends().front(); }});

    rules.push_back({"local", [](const BackendPresence&) { return true; },
                     [](const BackendPresence&) { return BackendType::LOCAL; }});

    return rules;
}

OperationRouter::OperationRouter(std::shared_ptr<ProtocolClassifier> classifier)
    : classifier_(classifier ? std::move(classifier) : std::make_shared<ProtocolClassifier>()),
      rules_(default_rules()) {}

void OperationRouter::register_handler(std::shared_ptr<IOperationHandler> handler) {
    if (!handler) {
        return;
    }
    const auto backend = handler->backend();
    std::lock_guard lock(mutex_);
    handlers_[backend] = std::move(handler);
}

auto OperationRouter::analyze(const Operation& operation) const -> BackendPresence {
    BackendPresence presence;

    for (const auto& locator : operation_locators(operation)) {
        auto backend = classifier_->classify(locator);
        if (!presence.has(backend)) {
            presence.detection_order.push_back(backend);
        }
    }

    std::visit(util::Overloaded{
                   [&](const CopyOperation& op) {
                       presence.destination = classifier_->classify(op.destination);
                   },
                   [&](const MoveOperation& op) {
                       presence.destination = classifier_->classify(op.destination);
                   },
                   [](const auto&) {},
               },
               operation);

    return presence;
}

auto OperationRouter::evaluate(const BackendPresence& presence) const
    -> std::pair<const RoutingRule*, BackendType> {
    for (const auto& rule : rules_) {
        if (rule.matches(presence)) {
            return {&rule, rule.target(presence)};
        }
    }
    return {nullptr, BackendType::LOCAL};
}

auto OperationRouter::select_backend(const Operation& operation) const -> BackendType {
    return evaluate(analyze(operation)).second;
}

auto OperationRouter::matching_rule(const Operation& operation) const -> std::string {
    auto [rule, backend] = evaluate(analyze(operation));
    return rule ? rule->name : std::string();
}

auto OperationRouter::select_handler(const Operation& operation) const
    -> std::shared_ptr<IOperationHandler> {
    auto backend = select_backend(operation);
    if (backend == BackendType::SCOPED) {
        backend = BackendType::LOCAL;
    }

    std::lock_guard lock(mutex_);
    auto it = handlers_.find(backend);
    return it == handlers_.end() ? nullptr : it->second;
}

auto OperationRouter::handler_for_locator(const std::string& locator) const
    -> std::shared_ptr<IOperationHandler> {
    return select_handler(DeleteOperation{{locator}, false});
}

auto OperationRouter::dispatch(const Operation& operation, const ProgressCallback& progress,
                               const std::atomic<bool>& cancel_requested) -> OperationResult {
    auto [rule, backend] = evaluate(analyze(operation));
    auto handler = select_handler(operation);

    if (!handler) {
        const auto message =
            fmt::format("No handler registered for {} storage", backend_name(backend));
        LOG_ERROR(COMPONENT, message);
        return FailureResult{message, util::ErrorKind::BACKEND_UNSUPPORTED_OPERATION};
    }

    LOG_DEBUG(COMPONENT, fmt::format("{} routed to {} handler (rule {})", operation_name(operation),
                                     backend_name(handler->backend()),
                                     rule ? rule->name : std::string("none")));

    return std::visit(util::Overloaded{
                          [&](const CopyOperation& op) {
                              return handler->copy(op, progress, cancel_requested);
                          },
                          [&](const MoveOperation& op) {
                              return handler->move(op, progress, cancel_requested);
                          },
                          [&](const RenameOperation& op) { return handler->rename(op); },
                          [&](const DeleteOperation& op) {
                              return handler->remove(op, progress, cancel_requested);
                          },
                      },
                      operation);
}
