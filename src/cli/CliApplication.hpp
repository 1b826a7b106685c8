/**
 * @file CliApplication.hpp
 * @brief Command-line front end for the transfer core
 */

#pragma once

#include "cli/ConfigLoader.hpp"
#include "di/Container.hpp"
#include "models/OperationResult.hpp"
#include "models/OperationTypes.hpp"

#include <optional>
#include <string>
#include <vector>

class IFileOperationService;
class TrashManager;

namespace cli {

enum class Command {
    NONE,
    COPY,
    MOVE,
    RENAME,
    DELETE,
    RESTORE_LAST,
    LIST_TRASH,
    SWEEP_TRASH
};

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool verbose = false;
    bool overwrite = false;
    bool permanent = false;
    Command command = Command::NONE;
    std::vector<std::string> paths;  ///< Positional arguments: sources or files
    std::string destination;         ///< --to
    std::string file;                ///< --rename
    std::string new_name;            ///< --name
    std::string directory;           ///< --restore-last, --list-trash, --sweep-trash
    std::optional<int> max_age_days;
    std::string config_path;
    std::string error;  ///< Set when the arguments are inconsistent
};

/**
 * @class CliApplication
 * @brief Runs one operation or trash command and maps the outcome to an exit code
 *
 * Exit codes: 0 on success, 2 on partial success, 1 otherwise.
 */
class CliApplication {
public:
    CliApplication();
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    auto run(int argc, char* argv[]) -> int;

    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Build the operation for a Copy/Move/Rename/Delete command
     */
    [[nodiscard]] static auto build_operation(const CliOptions& options) -> std::optional<Operation>;

    [[nodiscard]] static auto exit_code_for(const OperationResult& result) -> int;

    static void print_help();

    static void print_version();

private:
    void initialize_logging(const CliConfig& config, bool verbose);

    /**
     * @brief Execute with a live progress bar; SIGINT cancels
     */
    auto cmd_operation(const Operation& operation) -> int;

    auto cmd_restore_last(const std::string& directory) -> int;

    auto cmd_list_trash(const std::string& directory) -> int;

    auto cmd_sweep_trash(const std::string& directory, std::optional<int> max_age_days) -> int;

    di::Container container_;
    CliConfig config_;
};

}  // namespace cli
