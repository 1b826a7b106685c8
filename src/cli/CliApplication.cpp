/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "services/IFileOperationService.hpp"
#include "services/StagingArea.hpp"
#include "services/TransferServices.hpp"
#include "services/TrashManager.hpp"
#include "util/Logger.hpp"
#include "util/Overloaded.hpp"

#include <fmt/format.h>
#include <glib.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

#include <getopt.h>

namespace cli {

namespace {

// Global for signal handling
std::atomic<bool> g_cancel_requested{false};

void signal_handler(int /*signal*/) {
    g_cancel_requested.store(true);
}

constexpr auto APP_NAME = "media-transfer-cli";

constexpr auto EXIT_OK = 0;
constexpr auto EXIT_FAILED = 1;
constexpr auto EXIT_PARTIAL = 2;

// Leftover staged files older than this are from a run that did not clean up
constexpr auto STALE_STAGING_AGE = std::chrono::hours{24};

// Command line options
const struct option long_options[] = {
    {        "help",       no_argument, nullptr, 'h'},
    {     "version",       no_argument, nullptr, 'V'},
    {     "verbose",       no_argument, nullptr, 'v'},
    {        "copy",       no_argument, nullptr, 'c'},
    {        "move",       no_argument, nullptr, 'm'},
    {      "rename", required_argument, nullptr, 'r'},
    {        "name", required_argument, nullptr, 'n'},
    {      "delete",       no_argument, nullptr, 'd'},
    {          "to", required_argument, nullptr, 't'},
    {   "overwrite",       no_argument, nullptr, 'o'},
    {   "permanent",       no_argument, nullptr, 'p'},
    {"restore-last", required_argument, nullptr, 'R'},
    {  "list-trash", required_argument, nullptr, 'L'},
    { "sweep-trash", required_argument, nullptr, 'S'},
    {"max-age-days", required_argument, nullptr, 'a'},
    {      "config", required_argument, nullptr, 'C'},
    {       nullptr,                 0, nullptr,   0}
};

void set_command(CliOptions& options, Command command) {
    if (options.command != Command::NONE && options.command != command) {
        options.error = "Only one command can be given at a time";
        return;
    }
    options.command = command;
}

auto format_time(std::chrono::system_clock::time_point time) -> std::string {
    auto time_t_value = std::chrono::system_clock::to_time_t(time);
    std::tm tm_buf{};
    localtime_r(&time_t_value, &tm_buf);

    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

}  // namespace

CliApplication::CliApplication() = default;

CliApplication::~CliApplication() {
    container_.clear();
}

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (options.show_help) {
        print_help();
        return EXIT_OK;
    }

    if (options.show_version) {
        print_version();
        return EXIT_OK;
    }

    if (!options.error.empty()) {
        std::cerr << "Error: " << options.error << "\n"
                  << "Run with --help to see the available commands.\n";
        return EXIT_FAILED;
    }

    if (options.command == Command::NONE) {
        print_help();
        return EXIT_FAILED;
    }

    auto config_path =
        options.config_path.empty() ? default_config_path() : std::filesystem::path(options.config_path);
    auto config = load_config(config_path);
    if (!config) {
        std::cerr << "Error: " << config.error().message << "\n";
        return EXIT_FAILED;
    }
    config_ = *config;

    initialize_logging(config_, options.verbose);

    // Network transports are provided by the embedding application; the CLI
    // serves local and scoped paths only.
    configure_transfer_services(container_, config_.settings, {}, nullptr);

    auto purged = container_.resolve<StagingArea>()->purge_stale(STALE_STAGING_AGE);
    if (purged > 0) {
        LOG_INFO("CLI", fmt::format("Removed {} stale staged file(s)", purged));
    }

    switch (options.command) {
        case Command::COPY:
        case Command::MOVE:
        case Command::RENAME:
        case Command::DELETE: {
            auto operation = build_operation(options);
            if (!operation) {
                std::cerr << "Error: Incomplete arguments for the operation\n";
                return EXIT_FAILED;
            }
            return cmd_operation(*operation);
        }
        case Command::RESTORE_LAST:
            return cmd_restore_last(options.directory);
        case Command::LIST_TRASH:
            return cmd_list_trash(options.directory);
        case Command::SWEEP_TRASH:
            return cmd_sweep_trash(options.directory, options.max_age_days);
        case Command::NONE:
            break;
    }

    print_help();
    return EXIT_FAILED;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Restart scanning in case getopt was used before in this process
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVvcmr:n:dt:opR:L:S:a:C:", long_options, nullptr)) !=
           -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'c':
                set_command(options, Command::COPY);
                break;
            case 'm':
                set_command(options, Command::MOVE);
                break;
            case 'r':
                set_command(options, Command::RENAME);
                options.file = optarg;
                break;
            case 'n':
                options.new_name = optarg;
                break;
            case 'd':
                set_command(options, Command::DELETE);
                break;
            case 't':
                options.destination = optarg;
                break;
            case 'o':
                options.overwrite = true;
                break;
            case 'p':
                options.permanent = true;
                break;
            case 'R':
                set_command(options, Command::RESTORE_LAST);
                options.directory = optarg;
                break;
            case 'L':
                set_command(options, Command::LIST_TRASH);
                options.directory = optarg;
                break;
            case 'S':
                set_command(options, Command::SWEEP_TRASH);
                options.directory = optarg;
                break;
            case 'a': {
                std::string_view text(optarg);
                int days = 0;
                auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), days);
                if (ec != std::errc{} || end != text.data() + text.size() || days < 0) {
                    options.error = "Invalid --max-age-days value: " + std::string(text);
                } else {
                    options.max_age_days = days;
                }
                break;
            }
            case 'C':
                options.config_path = optarg;
                break;
            default:
                options.show_help = true;
                break;
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.paths.emplace_back(argv[i]);
    }

    if (!options.error.empty()) {
        return options;
    }

    switch (options.command) {
        case Command::COPY:
        case Command::MOVE:
            if (options.paths.empty() || options.destination.empty()) {
                options.error = "--copy and --move need at least one source and --to <dir>";
            }
            break;
        case Command::RENAME:
            if (options.new_name.empty()) {
                options.error = "--rename needs --name <new name>";
            }
            break;
        case Command::DELETE:
            if (options.paths.empty()) {
                options.error = "--delete needs at least one file";
            }
            break;
        default:
            break;
    }

    return options;
}

auto CliApplication::build_operation(const CliOptions& options) -> std::optional<Operation> {
    switch (options.command) {
        case Command::COPY:
            return CopyOperation{.sources = options.paths,
                                 .destination = options.destination,
                                 .overwrite = options.overwrite,
                                 .source_credentials_id = std::nullopt};
        case Command::MOVE:
            return MoveOperation{.sources = options.paths,
                                 .destination = options.destination,
                                 .overwrite = options.overwrite,
                                 .source_credentials_id = std::nullopt};
        case Command::RENAME:
            return RenameOperation{.file = options.file, .new_name = options.new_name};
        case Command::DELETE:
            return DeleteOperation{.files = options.paths, .soft_delete = !options.permanent};
        default:
            return std::nullopt;
    }
}

auto CliApplication::exit_code_for(const OperationResult& result) -> int {
    return std::visit(util::Overloaded{
                          [](const SuccessResult&) { return EXIT_OK; },
                          [](const PartialSuccessResult&) { return EXIT_PARTIAL; },
                          [](const FailureResult&) { return EXIT_FAILED; },
                          [](const AuthenticationRequiredResult&) { return EXIT_FAILED; },
                      },
                      result);
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " COMMAND [OPTIONS] [PATHS...]\n\n"
              << "Copy, move, rename and delete files across storage backends\n\n"
              << "Commands:\n"
              << "  -c, --copy SRC... --to DIR     Copy files into DIR\n"
              << "  -m, --move SRC... --to DIR     Move files into DIR\n"
              << "  -r, --rename FILE --name NEW   Rename FILE within its directory\n"
              << "  -d, --delete FILE...           Move files to trash (see --permanent)\n"
              << "  -R, --restore-last DIR         Restore every trashed file under DIR\n"
              << "  -L, --list-trash DIR           List trashed files under DIR\n"
              << "  -S, --sweep-trash DIR          Remove expired trash directories under DIR\n\n"
              << "Options:\n"
              << "  -t, --to DIR                   Destination directory\n"
              << "  -n, --name NEW                 New name for --rename\n"
              << "  -o, --overwrite                Replace existing files at the destination\n"
              << "  -p, --permanent                Delete without using trash\n"
              << "  -a, --max-age-days N           Trash age for --sweep-trash (0 removes all)\n"
              << "  -C, --config FILE              Configuration file\n"
              << "  -v, --verbose                  Log debug output to stderr\n"
              << "  -h, --help                     Show this help message\n"
              << "  -V, --version                  Show version information\n\n"
              << "Exit status: 0 on success, 2 if some files failed, 1 otherwise.\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --copy a.jpg b.jpg --to /media/backup\n"
              << "  " << APP_NAME << " --move smb://nas/share/video.mp4 --to ~/Videos\n"
              << "  " << APP_NAME << " --delete old.png\n"
              << "  " << APP_NAME << " --sweep-trash ~/Pictures --max-age-days 0\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of media-transfer - multi-backend file operations\n";
}

void CliApplication::initialize_logging(const CliConfig& config, bool verbose) {
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "media-transfer" / "logs";
    auto level = verbose ? util::LogLevel::DEBUG : config.log_level;

    auto& logger = util::Logger::instance();
    if (!logger.initialize(log_dir, APP_NAME, level, config.rotation)) {
        std::cerr << "Warning: logging to " << log_dir.string() << " is unavailable\n";
    }
    logger.set_console_output(verbose || config.log_to_console);
}

auto CliApplication::cmd_operation(const Operation& operation) -> int {
    auto service = container_.resolve<IFileOperationService>();

    g_cancel_requested.store(false);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ProgressDisplay display;
    std::optional<OperationResult> result;
    bool cancel_sent = false;

    auto channel = service->execute_with_progress(operation);
    while (!channel->is_drained()) {
        if (g_cancel_requested.load() && !cancel_sent) {
            cancel_sent = true;
            if (service->cancel_current_operation()) {
                display.notice("Cancellation requested, finishing the current file...");
            }
        }

        auto event = channel->receive_for(std::chrono::milliseconds{100});
        if (!event) {
            continue;
        }

        std::visit(util::Overloaded{
                       [&](const ProgressStarting& e) { display.start(e); },
                       [&](const ProgressProcessing& e) { display.update(e); },
                       [&](const ProgressCompleted& e) {
                           result = e.result;
                           display.complete(e.result);
                       },
                   },
                   *event);
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (!result) {
        LOG_ERROR("CLI", "Progress stream closed without a result");
        std::cerr << "Error: Operation ended without a result\n";
        return EXIT_FAILED;
    }
    return exit_code_for(*result);
}

auto CliApplication::cmd_restore_last(const std::string& directory) -> int {
    auto trash = container_.resolve<TrashManager>();
    auto entries = trash->trash_contents(directory);
    if (entries.empty()) {
        std::cout << "Nothing to restore in " << directory << "\n";
        return EXIT_OK;
    }

    size_t restored = 0;
    for (const auto& entry : entries) {
        auto target = trash->restore(entry);
        if (!target) {
            LOG_WARNING("CLI", fmt::format("Restore failed: {}", target.error().message));
            std::cerr << "Failed to restore " << entry.original_path << ": "
                      << target.error().message << "\n";
            continue;
        }
        ++restored;
        std::cout << "Restored " << *target << "\n";
    }

    std::cout << restored << " of " << entries.size() << " item(s) restored\n";
    if (restored == entries.size()) {
        return EXIT_OK;
    }
    return restored > 0 ? EXIT_PARTIAL : EXIT_FAILED;
}

auto CliApplication::cmd_list_trash(const std::string& directory) -> int {
    auto entries = container_.resolve<TrashManager>()->trash_contents(directory);
    if (entries.empty()) {
        std::cout << "Trash is empty.\n";
        return EXIT_OK;
    }

    constexpr int COL_DELETED = 22;

    std::cout << std::left << std::setw(COL_DELETED) << "DELETED"
              << "ORIGINAL PATH\n";
    std::cout << std::string(COL_DELETED + 40, '-') << "\n";
    for (const auto& entry : entries) {
        std::cout << std::left << std::setw(COL_DELETED) << format_time(entry.deleted_at)
                  << entry.original_path << "\n";
    }
    return EXIT_OK;
}

auto CliApplication::cmd_sweep_trash(const std::string& directory,
                                     std::optional<int> max_age_days) -> int {
    auto trash = container_.resolve<TrashManager>();

    size_t removed = 0;
    if (max_age_days) {
        removed = trash->sweep(directory, std::chrono::duration_cast<std::chrono::milliseconds>(
                                              std::chrono::hours{24} * *max_age_days));
    } else {
        removed = trash->sweep(directory);
    }

    std::cout << "Removed " << removed << " trash director" << (removed == 1 ? "y" : "ies")
              << "\n";
    return EXIT_OK;
}

}  // namespace cli
