#include "services/StagingArea.hpp"

#include "util/Logger.hpp"

#include <fmt/format.h>

#include <unistd.h>

#include <string>
#include <utility>

StagedFile::~StagedFile() {
    remove_file();
}

StagedFile::StagedFile(StagedFile&& other) noexcept : path_(std::exchange(other.path_, {})) {}

auto StagedFile::operator=(StagedFile&& other) noexcept -> StagedFile& {
    if (this != &other) {
        remove_file();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void StagedFile::remove_file() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_WARNING("StagingArea",
                    fmt::format("Failed to remove staged file {}: {}", path_.string(), ec.message()));
    }
    path_.clear();
}

StagingArea::StagingArea(std::filesystem::path directory) : directory_(std::move(directory)) {}

auto StagingArea::create(std::string_view name_hint) -> std::expected<StagedFile, util::Error> {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected(
            util::error_from_code("Failed to create staging directory " + directory_.string(), ec));
    }

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto sequence = counter_.fetch_add(1);

    auto name = fmt::format("transfer_{}_{}_{}", ::getpid(), stamp, sequence);
    if (!name_hint.empty()) {
        name += "_";
        name += name_hint;
    }
    return StagedFile(directory_ / name);
}

auto StagingArea::purge_stale(std::chrono::seconds max_age) -> size_t {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return 0;
    }

    const auto now = std::filesystem::file_time_type::clock::now();
    size_t removed = 0;

    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        auto modified = entry.last_write_time(ec);
        if (ec || now - modified < max_age) {
            continue;
        }
        if (std::filesystem::remove(entry.path(), ec)) {
            ++removed;
        }
    }

    if (removed > 0) {
        LOG_INFO("StagingArea", fmt::format("Removed {} stale staged file(s)", removed));
    }
    return removed;
}
