#include "services/TrashManager.hpp"

#include "models/FileError.hpp"
#include "services/BatchRunner.hpp"
#include "services/LocalFileSystem.hpp"
#include "util/Logger.hpp"
#include "util/Retry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <map>
#include <thread>

namespace {

constexpr std::string_view COMPONENT = "TrashManager";

auto now_ns() -> int64_t {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto worker_id() -> uint64_t {
    return std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
}

auto from_ns(int64_t timestamp_ns) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(timestamp_ns)));
}

auto all_digits(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

// Entries renamed on collision carry a "<ns>_" prefix; camera-style names such
// as "20240101_1200.jpg" are shorter than a nanosecond timestamp.
auto original_name_of(std::string_view entry_name) -> std::string {
    auto pos = entry_name.find('_');
    if (pos != std::string_view::npos && pos >= 16 && all_digits(entry_name.substr(0, pos))) {
        return std::string(entry_name.substr(pos + 1));
    }
    return std::string(entry_name);
}

}  // namespace

TrashManager::TrashManager(TransferSettings settings, std::shared_ptr<ILocalFileSystem> file_system)
    : settings_(std::move(settings)), file_system_(std::move(file_system)) {
    if (!file_system_) {
        file_system_ = local_fs::native_file_system();
    }
}

auto TrashManager::is_trash_directory_name(std::string_view name) -> bool {
    return name.starts_with(TRASH_DIR_PREFIX);
}

auto TrashManager::trash_directory_timestamp(std::string_view name) -> std::optional<int64_t> {
    if (!is_trash_directory_name(name)) {
        return std::nullopt;
    }
    auto rest = name.substr(TRASH_DIR_PREFIX.size());
    auto digits = rest.substr(0, rest.find('_'));
    if (!all_digits(digits)) {
        return std::nullopt;
    }
    int64_t timestamp = 0;
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), timestamp);
    if (ec != std::errc{} || end != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return timestamp;
}

auto TrashManager::make_trash_directory_name(int64_t timestamp_ns, uint64_t worker) -> std::string {
    return fmt::format("{}{}_{}", TRASH_DIR_PREFIX, timestamp_ns, worker);
}

auto TrashManager::is_already_trashed(const std::filesystem::path& file) const -> bool {
    for (auto dir = file.parent_path(); !dir.empty() && dir != dir.root_path();
         dir = dir.parent_path()) {
        if (is_trash_directory_name(dir.filename().string())) {
            return true;
        }
    }

    std::lock_guard lock(mutex_);
    return std::any_of(recent_.begin(), recent_.end(), [&file](const TrashedFile& trashed) {
        return trashed.trash_path == file.string();
    });
}

auto TrashManager::create_trash_directory(const std::filesystem::path& parent)
    -> std::expected<std::filesystem::path, util::Error> {
    auto timestamp = now_ns();
    const auto worker = worker_id();

    for (int attempt = 0; attempt < 16; ++attempt, ++timestamp) {
        auto dir = parent / make_trash_directory_name(timestamp, worker);
        std::error_code ec;
        if (std::filesystem::create_directory(dir, ec)) {
            return dir;
        }
        if (ec) {
            return std::unexpected(
                util::error_from_code("Failed to create trash directory in " + parent.string(), ec));
        }
    }
    return std::unexpected(util::Error{"Failed to create a unique trash directory in " +
                                           parent.string(),
                                       util::ErrorKind::ALREADY_EXISTS});
}

auto TrashManager::move_across(const std::filesystem::path& from, const std::filesystem::path& to,
                               bool& copy_done) -> std::expected<void, util::Error> {
    if (!copy_done) {
        auto renamed = file_system_->rename_path(from, to);
        if (renamed || renamed.error().kind == util::ErrorKind::NOT_FOUND) {
            return renamed;
        }
        LOG_DEBUG(COMPONENT, fmt::format("Rename of {} failed ({}), copying instead", from.string(),
                                         renamed.error().message));

        auto copied = file_system_->copy_file(from, to, false, settings_.copy_buffer_size, {});
        if (!copied) {
            return std::unexpected(copied.error());
        }
        copy_done = true;
    }

    auto removed = file_system_->remove_path(from);
    if (!removed) {
        return std::unexpected(util::Error{
            fmt::format("Failed to delete original after copy to trash: {}",
                        removed.error().message),
            removed.error().code, removed.error().kind});
    }
    return {};
}

auto TrashManager::trash_file(const std::filesystem::path& file,
                              const std::filesystem::path& trash_dir)
    -> std::expected<TrashedFile, util::Error> {
    const auto name = file.filename().string();

    auto target = trash_dir / name;
    if (local_fs::exists(target)) {
        target = trash_dir / fmt::format("{}_{}", now_ns(), name);
    }

    bool copy_done = false;
    auto moved = util::retry_with_backoff<void>(
        util::RetryPolicy{settings_.delete_max_attempts, settings_.delete_backoff_step},
        [&]() { return move_across(file, target, copy_done); },
        [&name](int attempt, const util::Error& error) {
            LOG_WARNING(COMPONENT, fmt::format("Retrying trash of {} (attempt {} failed): {}", name,
                                               attempt, error.message));
        });
    if (!moved) {
        return std::unexpected(moved.error());
    }

    return TrashedFile{
        .original_path = file.string(),
        .trash_path = target.string(),
        .deleted_at = std::chrono::system_clock::now(),
    };
}

auto TrashManager::move_to_trash(const std::vector<std::string>& files,
                                 const ProgressCallback& progress,
                                 const std::atomic<bool>& cancel_requested) -> TrashBatchResult {
    TrashBatchResult result;
    std::mutex result_mutex;

    auto record_error = [&](const std::filesystem::path& file, const util::Error& error) {
        auto rendered =
            FileError::from_error(error, file.filename().string(), file.string()).render();
        std::lock_guard lock(result_mutex);
        result.errors.push_back(std::move(rendered));
    };

    // One trash directory per distinct parent, created before any file moves.
    std::map<std::filesystem::path, std::expected<std::filesystem::path, util::Error>> trash_dirs;
    for (const auto& file : files) {
        auto parent = std::filesystem::path(file).parent_path();
        if (!trash_dirs.contains(parent)) {
            auto created = create_trash_directory(parent);
            if (created) {
                result.trash_directories.push_back(created->string());
            }
            trash_dirs.emplace(parent, std::move(created));
        }
    }

    LOG_INFO(COMPONENT, fmt::format("Moving {} file(s) to trash across {} folder(s)", files.size(),
                                    trash_dirs.size()));

    auto work = [&](size_t index) {
        const std::filesystem::path file(files[index]);
        const auto name = file.filename().string();

        auto outcome = [&]() -> std::expected<TrashedFile, util::Error> {
            const auto& trash_dir = trash_dirs.at(file.parent_path());
            if (!trash_dir) {
                return std::unexpected(trash_dir.error());
            }
            if (is_already_trashed(file)) {
                return std::unexpected(
                    util::Error{name + " is already in trash", util::ErrorKind::ALREADY_EXISTS});
            }
            if (!local_fs::exists(file)) {
                return std::unexpected(
                    util::Error{name + " not found", util::ErrorKind::NOT_FOUND});
            }
            return trash_file(file, *trash_dir);
        }();

        if (outcome) {
            std::lock_guard lock(result_mutex);
            result.trashed.push_back(std::move(*outcome));
        } else {
            LOG_WARNING(COMPONENT,
                        fmt::format("Failed to trash {}: {}", file.string(), outcome.error().message));
            record_error(file, outcome.error());
        }

        if (progress) {
            std::lock_guard lock(result_mutex);
            progress(ProgressProcessing{.current_item = name, .index = index, .total = files.size()});
        }
    };

    const size_t started = run_in_batches(
        files.size(), BatchPolicy{settings_.delete_batch_size, settings_.delete_batch_pause}, work,
        [&cancel_requested] { return cancel_requested.load(); });

    for (size_t i = started; i < files.size(); ++i) {
        record_error(files[i], util::Error{std::filesystem::path(files[i]).filename().string() +
                                           ": Operation cancelled"});
    }

    // Drop trash directories that ended up empty.
    for (auto it = result.trash_directories.begin(); it != result.trash_directories.end();) {
        std::error_code ec;
        if (std::filesystem::is_empty(*it, ec) && !ec) {
            std::filesystem::remove(*it, ec);
            it = result.trash_directories.erase(it);
        } else {
            ++it;
        }
    }

    remember(result.trashed);
    return result;
}

void TrashManager::remember(const std::vector<TrashedFile>& files) {
    std::lock_guard lock(mutex_);
    for (const auto& file : files) {
        recent_.push_front(file);
    }
    while (recent_.size() > settings_.recent_trash_limit) {
        recent_.pop_back();
    }
}

void TrashManager::forget_under(const std::filesystem::path& directory) {
    const auto prefix = directory.string() + "/";
    std::lock_guard lock(mutex_);
    std::erase_if(recent_, [&prefix](const TrashedFile& file) {
        return file.trash_path.starts_with(prefix);
    });
}

auto TrashManager::restore_target(const std::filesystem::path& original) -> std::filesystem::path {
    if (!local_fs::exists(original)) {
        return original;
    }

    const auto parent = original.parent_path();
    const auto stem = original.stem().string();
    const auto extension = original.extension().string();

    auto candidate = parent / (stem + "_restored" + extension);
    for (int n = 1; local_fs::exists(candidate); ++n) {
        candidate = parent / fmt::format("{}_restored_{}{}", stem, n, extension);
    }
    return candidate;
}

auto TrashManager::restore(const TrashedFile& file) -> std::expected<std::string, util::Error> {
    const std::filesystem::path trash_path(file.trash_path);
    const std::filesystem::path original(file.original_path);

    if (!local_fs::exists(trash_path)) {
        return std::unexpected(util::Error{original.filename().string() + " not found in trash",
                                           util::ErrorKind::NOT_FOUND});
    }

    if (auto parent = local_fs::ensure_directory(original.parent_path()); !parent) {
        return std::unexpected(parent.error());
    }

    const auto target = restore_target(original);
    bool copy_done = false;
    if (auto moved = move_across(trash_path, target, copy_done); !moved) {
        LOG_ERROR(COMPONENT,
                  fmt::format("Failed to restore {}: {}", file.trash_path, moved.error().message));
        return std::unexpected(moved.error());
    }

    {
        std::lock_guard lock(mutex_);
        std::erase_if(recent_, [&file](const TrashedFile& tracked) {
            return tracked.trash_path == file.trash_path;
        });
    }

    std::error_code ec;
    const auto trash_dir = trash_path.parent_path();
    if (std::filesystem::is_empty(trash_dir, ec) && !ec) {
        std::filesystem::remove(trash_dir, ec);
    }

    LOG_INFO(COMPONENT,
             fmt::format("Restored {} to {}", original.filename().string(), target.string()));
    return target.string();
}

auto TrashManager::recently_deleted() const -> std::vector<TrashedFile> {
    std::lock_guard lock(mutex_);
    return {recent_.begin(), recent_.end()};
}

auto TrashManager::last_deleted() const -> std::optional<TrashedFile> {
    std::lock_guard lock(mutex_);
    if (recent_.empty()) {
        return std::nullopt;
    }
    return recent_.front();
}

void TrashManager::clear_undo_history() {
    std::lock_guard lock(mutex_);
    recent_.clear();
}

auto TrashManager::trash_contents(const std::filesystem::path& directory) const
    -> std::vector<TrashedFile> {
    std::vector<TrashedFile> contents;
    std::error_code ec;

    for (const auto& trash_dir : std::filesystem::directory_iterator(directory, ec)) {
        const auto dir_name = trash_dir.path().filename().string();
        if (!trash_dir.is_directory(ec) || !is_trash_directory_name(dir_name)) {
            continue;
        }

        auto deleted_at = std::chrono::system_clock::time_point{};
        if (auto timestamp = trash_directory_timestamp(dir_name)) {
            deleted_at = from_ns(*timestamp);
        }

        std::error_code inner_ec;
        for (const auto& entry : std::filesystem::directory_iterator(trash_dir.path(), inner_ec)) {
            const auto entry_name = entry.path().filename().string();
            contents.push_back(TrashedFile{
                .original_path = (directory / original_name_of(entry_name)).string(),
                .trash_path = entry.path().string(),
                .deleted_at = deleted_at,
            });
        }
    }

    std::sort(contents.begin(), contents.end(), [](const TrashedFile& a, const TrashedFile& b) {
        return a.deleted_at > b.deleted_at;
    });
    return contents;
}

auto TrashManager::empty_trash(const std::filesystem::path& directory)
    -> std::expected<size_t, util::Error> {
    std::error_code ec;
    std::vector<std::filesystem::path> trash_dirs;

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_directory(ec) && is_trash_directory_name(entry.path().filename().string())) {
            trash_dirs.push_back(entry.path());
        }
    }
    if (ec) {
        return std::unexpected(util::error_from_code("Failed to list " + directory.string(), ec));
    }

    size_t removed = 0;
    for (const auto& dir : trash_dirs) {
        auto count = std::filesystem::remove_all(dir, ec);
        if (ec) {
            return std::unexpected(util::error_from_code("Failed to empty " + dir.string(), ec));
        }
        // remove_all counts the directory itself.
        removed += count > 0 ? count - 1 : 0;
        forget_under(dir);
    }

    LOG_INFO(COMPONENT,
             fmt::format("Emptied trash in {}: {} entries removed", directory.string(), removed));
    return removed;
}

auto TrashManager::sweep(const std::filesystem::path& root, std::chrono::milliseconds max_age)
    -> size_t {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return 0;
    }

    const auto now = std::chrono::system_clock::now();
    std::vector<std::filesystem::path> expired;

    auto options = std::filesystem::directory_options::skip_permission_denied;
    for (auto it = std::filesystem::recursive_directory_iterator(root, options, ec);
         it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || it->is_symlink(entry_ec)) {
            continue;
        }
        const auto name = it->path().filename().string();
        if (!is_trash_directory_name(name)) {
            continue;
        }
        it.disable_recursion_pending();

        bool is_expired = max_age.count() == 0;
        if (!is_expired) {
            if (auto timestamp = trash_directory_timestamp(name)) {
                is_expired = now - from_ns(*timestamp) >= max_age;
            }
        }
        if (is_expired) {
            expired.push_back(it->path());
        }
    }

    size_t removed = 0;
    for (const auto& dir : expired) {
        std::error_code remove_ec;
        std::filesystem::remove_all(dir, remove_ec);
        if (remove_ec) {
            LOG_WARNING(COMPONENT,
                        fmt::format("Failed to remove {}: {}", dir.string(), remove_ec.message()));
            continue;
        }
        forget_under(dir);
        ++removed;
    }

    if (removed > 0) {
        LOG_INFO(COMPONENT,
                 fmt::format("Swept {} trash folder(s) under {}", removed, root.string()));
    }
    return removed;
}

auto TrashManager::sweep(const std::filesystem::path& root) -> size_t {
    return sweep(root, std::chrono::duration_cast<std::chrono::milliseconds>(
                           settings_.trash_retention));
}
