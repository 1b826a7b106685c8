/**
 * @file StagingArea.hpp
 * @brief Local temporary files used to bridge two non-local backends
 *
 * A transfer between backends that cannot talk to each other is a full
 * download into a staged file followed by an upload from it.
 */

#pragma once

#include "util/Error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>
#include <utility>

/**
 * @class StagedFile
 * @brief Owns a staged temporary file and deletes it on destruction
 */
class StagedFile {
public:
    StagedFile() = default;
    explicit StagedFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~StagedFile();

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;
    StagedFile(StagedFile&& other) noexcept;
    StagedFile& operator=(StagedFile&& other) noexcept;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    void remove_file() noexcept;

    std::filesystem::path path_;
};

class StagingArea {
public:
    explicit StagingArea(std::filesystem::path directory);

    /**
     * @brief Reserve a unique staged file path; the directory is created on demand
     * @param name_hint Original file name, kept as a suffix for readability
     */
    [[nodiscard]] auto create(std::string_view name_hint) -> std::expected<StagedFile, util::Error>;

    /**
     * @brief Remove leftovers older than @p max_age (from a crashed run)
     * @return Number of files removed
     */
    auto purge_stale(std::chrono::seconds max_age) -> size_t;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    std::filesystem::path directory_;
    std::atomic<uint64_t> counter_{0};
};
