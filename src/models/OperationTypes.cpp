#include "models/OperationTypes.hpp"

#include "util/Overloaded.hpp"

auto operation_name(const Operation& operation) -> std::string_view {
    return std::visit(util::Overloaded{
                          [](const CopyOperation&) -> std::string_view { return "Copy"; },
                          [](const MoveOperation&) -> std::string_view { return "Move"; },
                          [](const RenameOperation&) -> std::string_view { return "Rename"; },
                          [](const DeleteOperation&) -> std::string_view { return "Delete"; },
                      },
                      operation);
}

auto operation_item_count(const Operation& operation) -> size_t {
    return std::visit(util::Overloaded{
                          [](const CopyOperation& op) { return op.sources.size(); },
                          [](const MoveOperation& op) { return op.sources.size(); },
                          [](const RenameOperation&) -> size_t { return 1; },
                          [](const DeleteOperation& op) { return op.files.size(); },
                      },
                      operation);
}

auto operation_locators(const Operation& operation) -> std::vector<std::string> {
    return std::visit(util::Overloaded{
                          [](const CopyOperation& op) {
                              auto locators = op.sources;
                              locators.push_back(op.destination);
                              return locators;
                          },
                          [](const MoveOperation& op) {
                              auto locators = op.sources;
                              locators.push_back(op.destination);
                              return locators;
                          },
                          [](const RenameOperation& op) { return std::vector<std::string>{op.file}; },
                          [](const DeleteOperation& op) { return op.files; },
                      },
                      operation);
}
