#include "services/UndoHistory.hpp"

#include "services/ProtocolClassifier.hpp"
#include "util/Overloaded.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

namespace {

struct CreatedPath {
    std::string source;
    std::string produced;
};

// Produced paths paired with the input they came from. A successful result
// that recorded neither is derived as destination/<name> of every source.
// Results without the pairing are matched by file name; a name shared by
// several sources leaves the source empty.
auto created_paths(const std::vector<std::string>& sources, const std::string& destination,
                   const OperationResult& result) -> std::vector<CreatedPath> {
    std::vector<CreatedPath> created;
    const auto produced = result_produced_paths(result);
    const auto recorded_sources = result_source_paths(result);

    if (produced.empty()) {
        if (std::holds_alternative<SuccessResult>(result)) {
            for (const auto& source : sources) {
                created.push_back({source, protocol::join(destination, protocol::file_name(source))});
            }
        }
        return created;
    }

    if (recorded_sources.size() == produced.size()) {
        for (size_t i = 0; i < produced.size(); ++i) {
            created.push_back({recorded_sources[i], produced[i]});
        }
        return created;
    }

    for (const auto& path : produced) {
        const auto name = protocol::file_name(path);
        const auto same_name = [&name](const std::string& source) {
            return protocol::file_name(source) == name;
        };
        if (std::count_if(sources.begin(), sources.end(), same_name) != 1) {
            created.push_back({{}, path});
            continue;
        }
        created.push_back({*std::find_if(sources.begin(), sources.end(), same_name), path});
    }
    return created;
}

auto plan_copy_undo(const CopyOperation& op, const OperationResult& result,
                    const UndoHistory::ExistsPredicate& exists) -> std::vector<Operation> {
    DeleteOperation undo{.files = {}, .soft_delete = false};
    for (const auto& created : created_paths(op.sources, op.destination, result)) {
        if (exists(created.produced)) {
            undo.files.push_back(created.produced);
        }
    }
    if (undo.files.empty()) {
        return {};
    }
    return {undo};
}

auto plan_move_undo(const MoveOperation& op, const OperationResult& result,
                    const UndoHistory::ExistsPredicate& exists) -> std::vector<Operation> {
    std::vector<MoveOperation> moves;

    for (const auto& created : created_paths(op.sources, op.destination, result)) {
        if (created.source.empty() || !exists(created.produced)) {
            continue;
        }

        const auto original_parent = protocol::parent(created.source);
        auto move = std::find_if(moves.begin(), moves.end(), [&original_parent](const auto& m) {
            return m.destination == original_parent;
        });
        if (move == moves.end()) {
            moves.push_back(MoveOperation{.sources = {},
                                          .destination = original_parent,
                                          .overwrite = true,
                                          .source_credentials_id = op.source_credentials_id});
            move = std::prev(moves.end());
        }
        move->sources.push_back(created.produced);
    }

    return {moves.begin(), moves.end()};
}

auto plan_rename_undo(const RenameOperation& op, const OperationResult& result,
                      const UndoHistory::ExistsPredicate& exists) -> std::vector<Operation> {
    const auto* success = std::get_if<SuccessResult>(&result);
    if (success == nullptr) {
        return {};
    }
    const auto renamed = success->produced_paths.empty()
                             ? protocol::replace_file_name(op.file, op.new_name)
                             : success->produced_paths.front();
    if (!exists(renamed)) {
        return {};
    }
    return {RenameOperation{.file = renamed, .new_name = protocol::file_name(op.file)}};
}

}  // namespace

void UndoHistory::record(Operation operation, OperationResult result) {
    std::lock_guard lock(mutex_);
    last_ = OperationHistory{std::move(operation), std::move(result),
                             std::chrono::system_clock::now()};
}

auto UndoHistory::last() const -> std::optional<OperationHistory> {
    std::lock_guard lock(mutex_);
    return last_;
}

void UndoHistory::clear() {
    std::lock_guard lock(mutex_);
    last_.reset();
}

auto UndoHistory::can_undo() const -> bool {
    std::lock_guard lock(mutex_);
    return last_ && is_undoable(*last_);
}

auto UndoHistory::is_undoable(const OperationHistory& entry) -> bool {
    if (std::holds_alternative<DeleteOperation>(entry.operation)) {
        return false;
    }
    return std::holds_alternative<SuccessResult>(entry.result) ||
           std::holds_alternative<PartialSuccessResult>(entry.result);
}

auto UndoHistory::plan_undo(const OperationHistory& entry, const ExistsPredicate& exists)
    -> std::vector<Operation> {
    if (!is_undoable(entry)) {
        return {};
    }
    return std::visit(util::Overloaded{
                          [&](const CopyOperation& op) {
                              return plan_copy_undo(op, entry.result, exists);
                          },
                          [&](const MoveOperation& op) {
                              return plan_move_undo(op, entry.result, exists);
                          },
                          [&](const RenameOperation& op) {
                              return plan_rename_undo(op, entry.result, exists);
                          },
                          [](const DeleteOperation&) { return std::vector<Operation>{}; },
                      },
                      entry.operation);
}

auto UndoHistory::combine(const std::vector<std::pair<Operation, OperationResult>>& steps)
    -> std::optional<OperationResult> {
    if (steps.empty()) {
        return std::nullopt;
    }
    if (steps.size() == 1) {
        return steps.front().second;
    }

    size_t processed = 0;
    size_t failed = 0;
    std::vector<std::string> errors;
    std::vector<std::string> produced;
    std::vector<std::string> sources;

    for (const auto& [operation, result] : steps) {
        if (std::holds_alternative<AuthenticationRequiredResult>(result)) {
            return result;
        }
        const auto total = operation_item_count(operation);
        processed += result_processed_count(result);
        failed += result_failed_count(result, total);

        std::visit(util::Overloaded{
                       [&](const PartialSuccessResult& r) {
                           errors.insert(errors.end(), r.errors.begin(), r.errors.end());
                       },
                       [&](const FailureResult& r) { errors.push_back(r.message); },
                       [](const auto&) {},
                   },
                   result);
        auto paths = result_produced_paths(result);
        produced.insert(produced.end(), paths.begin(), paths.end());
        auto inputs = result_source_paths(result);
        sources.insert(sources.end(), inputs.begin(), inputs.end());
    }
    if (sources.size() != produced.size()) {
        sources.clear();
    }

    if (failed == 0) {
        return SuccessResult{processed, steps.back().first, std::move(produced), std::move(sources)};
    }
    if (processed > 0) {
        return PartialSuccessResult{processed, failed, std::move(errors), std::move(produced),
                                    std::move(sources)};
    }

    std::string message = "Undo failed:";
    for (const auto& error : errors) {
        message += " " + error;
    }
    return FailureResult{std::move(message)};
}
