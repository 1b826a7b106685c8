/**
 * @file TrashManager.hpp
 * @brief Soft delete into per-parent trash directories, restore and sweep
 *
 * Trash layout: every soft delete creates one ".trash_<ns>_<worker>"
 * directory per distinct parent of the deleted files. Files keep their
 * name inside it unless that name is taken, in which case they become
 * "<ns>_<name>". Trash directories stay on disk until sweep() removes them.
 */

#pragma once

#include "models/ProgressTypes.hpp"
#include "models/TransferSettings.hpp"
#include "models/TrashTypes.hpp"
#include "services/ILocalFileSystem.hpp"
#include "util/Error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class TrashManager {
public:
    static constexpr std::string_view TRASH_DIR_PREFIX = ".trash_";

    explicit TrashManager(TransferSettings settings = {},
                          std::shared_ptr<ILocalFileSystem> file_system = nullptr);

    TrashManager(const TrashManager&) = delete;
    TrashManager& operator=(const TrashManager&) = delete;

    /**
     * @brief Move local files into trash
     *
     * Files are processed in concurrent batches (delete_batch_size, paused by
     * delete_batch_pause) with per-file retry. A file already inside a trash
     * directory, or one this manager trashed and still tracks, is rejected.
     * Once @p cancel_requested is set no further batch is started and the
     * remaining files are reported as cancelled.
     */
    auto move_to_trash(const std::vector<std::string>& files, const ProgressCallback& progress,
                       const std::atomic<bool>& cancel_requested) -> TrashBatchResult;

    /**
     * @brief Move a trashed file back to its original path
     *
     * An occupied original path yields "<stem>_restored<ext>", then
     * "<stem>_restored_1<ext>" and so on.
     *
     * @return Path the file was restored to
     */
    auto restore(const TrashedFile& file) -> std::expected<std::string, util::Error>;

    /**
     * @brief Most recent soft deletes, newest first (bounded by recent_trash_limit)
     */
    [[nodiscard]] auto recently_deleted() const -> std::vector<TrashedFile>;

    [[nodiscard]] auto last_deleted() const -> std::optional<TrashedFile>;

    /**
     * @brief Forget tracked deletes; files stay in trash on disk
     */
    void clear_undo_history();

    /**
     * @brief Every entry of every trash directory directly under @p directory
     */
    [[nodiscard]] auto trash_contents(const std::filesystem::path& directory) const
        -> std::vector<TrashedFile>;

    /**
     * @brief Permanently delete the trash directories directly under @p directory
     * @return Number of trashed entries removed
     */
    auto empty_trash(const std::filesystem::path& directory) -> std::expected<size_t, util::Error>;

    /**
     * @brief Recursively delete trash directories under @p root older than @p max_age
     *
     * A zero @p max_age removes every trash directory.
     *
     * @return Number of trash directories removed
     */
    auto sweep(const std::filesystem::path& root, std::chrono::milliseconds max_age) -> size_t;

    /**
     * @brief sweep() with the configured retention
     */
    auto sweep(const std::filesystem::path& root) -> size_t;

    [[nodiscard]] static auto is_trash_directory_name(std::string_view name) -> bool;

    /**
     * @brief Nanosecond timestamp embedded in a trash directory name
     */
    [[nodiscard]] static auto trash_directory_timestamp(std::string_view name)
        -> std::optional<int64_t>;

    [[nodiscard]] static auto make_trash_directory_name(int64_t timestamp_ns, uint64_t worker_id)
        -> std::string;

private:
    [[nodiscard]] auto is_already_trashed(const std::filesystem::path& file) const -> bool;

    auto create_trash_directory(const std::filesystem::path& parent)
        -> std::expected<std::filesystem::path, util::Error>;

    auto trash_file(const std::filesystem::path& file, const std::filesystem::path& trash_dir)
        -> std::expected<TrashedFile, util::Error>;

    /**
     * @brief rename(2), or copy then delete the original when the rename fails
     *        for any reason other than a missing source (EXDEV in practice)
     *
     * @p copy_done survives retries so a copy is never repeated. When deleting
     * the original fails the copy is left at @p to.
     */
    auto move_across(const std::filesystem::path& from, const std::filesystem::path& to,
                     bool& copy_done) -> std::expected<void, util::Error>;

    [[nodiscard]] static auto restore_target(const std::filesystem::path& original)
        -> std::filesystem::path;

    void remember(const std::vector<TrashedFile>& files);
    void forget_under(const std::filesystem::path& directory);

    TransferSettings settings_;
    std::shared_ptr<ILocalFileSystem> file_system_;
    mutable std::mutex mutex_;
    std::deque<TrashedFile> recent_;  ///< Newest first
};
