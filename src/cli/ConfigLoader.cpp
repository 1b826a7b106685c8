/**
 * @file ConfigLoader.cpp
 * @brief GKeyFile-backed configuration loading
 */

#include "cli/ConfigLoader.hpp"

#include <fmt/format.h>
#include <glib.h>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace cli {

namespace {

constexpr auto TRANSFER_GROUP = "transfer";
constexpr auto LOGGING_GROUP = "logging";

using KeyFilePtr = std::unique_ptr<GKeyFile, decltype(&g_key_file_free)>;

auto take_error(GError* error, const std::string& context) -> util::Error {
    std::string message = context + ": " + (error ? error->message : "unknown error");
    if (error) {
        g_error_free(error);
    }
    return util::Error{message};
}

auto read_int(GKeyFile* file, const char* group, const char* key, int64_t minimum)
    -> std::expected<std::optional<int64_t>, util::Error> {
    if (!g_key_file_has_key(file, group, key, nullptr)) {
        return std::nullopt;
    }

    GError* error = nullptr;
    gint64 value = g_key_file_get_int64(file, group, key, &error);
    if (error) {
        return std::unexpected(
            take_error(error, fmt::format("Invalid value for [{}] {}", group, key)));
    }
    if (value < minimum) {
        return std::unexpected(util::Error{
            fmt::format("Invalid value for [{}] {}: must be at least {}", group, key, minimum)});
    }
    return static_cast<int64_t>(value);
}

auto read_string(GKeyFile* file, const char* group, const char* key) -> std::optional<std::string> {
    if (!g_key_file_has_key(file, group, key, nullptr)) {
        return std::nullopt;
    }
    gchar* raw = g_key_file_get_string(file, group, key, nullptr);
    if (!raw) {
        return std::nullopt;
    }
    std::string value(raw);
    g_free(raw);
    return value;
}

auto apply_transfer_section(GKeyFile* file, TransferSettings& settings)
    -> std::expected<void, util::Error> {
    struct IntKey {
        const char* key;
        int64_t minimum;
        std::function<void(int64_t)> apply;
    };

    const IntKey keys[] = {
        {"delete_max_attempts", 1,
         [&](int64_t v) { settings.delete_max_attempts = static_cast<int>(v); }},
        {"delete_backoff_ms", 0,
         [&](int64_t v) { settings.delete_backoff_step = std::chrono::milliseconds{v}; }},
        {"delete_batch_size", 1,
         [&](int64_t v) { settings.delete_batch_size = static_cast<size_t>(v); }},
        {"delete_batch_pause_ms", 0,
         [&](int64_t v) { settings.delete_batch_pause = std::chrono::milliseconds{v}; }},
        {"recent_trash_limit", 1,
         [&](int64_t v) { settings.recent_trash_limit = static_cast<size_t>(v); }},
        {"trash_retention_hours", 0,
         [&](int64_t v) { settings.trash_retention = std::chrono::hours{v}; }},
        {"progress_channel_capacity", 1,
         [&](int64_t v) { settings.progress_channel_capacity = static_cast<size_t>(v); }},
        {"progress_interval_ms", 0,
         [&](int64_t v) { settings.progress_interval = std::chrono::milliseconds{v}; }},
        {"copy_buffer_size", 512,
         [&](int64_t v) { settings.copy_buffer_size = static_cast<size_t>(v); }},
    };

    for (const auto& entry : keys) {
        auto value = read_int(file, TRANSFER_GROUP, entry.key, entry.minimum);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (*value) {
            entry.apply(**value);
        }
    }

    for (auto backend : ALL_BACKEND_TYPES) {
        std::string key = "limit_";
        for (char c : backend_name(backend)) {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        auto value = read_int(file, TRANSFER_GROUP, key.c_str(), 1);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (*value) {
            settings.connection_limits[backend] = static_cast<int>(**value);
        }
    }

    if (auto staging = read_string(file, TRANSFER_GROUP, "staging_directory")) {
        settings.staging_directory = *staging;
    }
    return {};
}

auto apply_logging_section(GKeyFile* file, CliConfig& config) -> std::expected<void, util::Error> {
    if (auto name = read_string(file, LOGGING_GROUP, "level")) {
        auto level = util::parse_log_level(*name);
        if (!level) {
            return std::unexpected(util::Error{"Unknown log level: " + *name});
        }
        config.log_level = *level;
    }

    auto max_size = read_int(file, LOGGING_GROUP, "max_file_size", 1024);
    if (!max_size) {
        return std::unexpected(max_size.error());
    }
    if (*max_size) {
        config.rotation.max_file_size_bytes = static_cast<size_t>(**max_size);
    }

    auto max_files = read_int(file, LOGGING_GROUP, "max_files", 1);
    if (!max_files) {
        return std::unexpected(max_files.error());
    }
    if (*max_files) {
        config.rotation.max_files = static_cast<int>(**max_files);
    }

    if (g_key_file_has_key(file, LOGGING_GROUP, "console", nullptr)) {
        GError* error = nullptr;
        gboolean console = g_key_file_get_boolean(file, LOGGING_GROUP, "console", &error);
        if (error) {
            return std::unexpected(take_error(error, "Invalid value for [logging] console"));
        }
        config.log_to_console = console != FALSE;
    }
    return {};
}

}  // namespace

auto default_config_path() -> std::filesystem::path {
    return std::filesystem::path(g_get_user_config_dir()) / "media-transfer" / "config.ini";
}

auto load_config(const std::filesystem::path& path) -> std::expected<CliConfig, util::Error> {
    CliConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config;
    }

    KeyFilePtr file(g_key_file_new(), &g_key_file_free);
    GError* error = nullptr;
    if (!g_key_file_load_from_file(file.get(), path.c_str(), G_KEY_FILE_NONE, &error)) {
        return std::unexpected(take_error(error, "Failed to read " + path.string()));
    }

    if (auto applied = apply_transfer_section(file.get(), config.settings); !applied) {
        return std::unexpected(applied.error());
    }
    if (auto applied = apply_logging_section(file.get(), config); !applied) {
        return std::unexpected(applied.error());
    }
    return config;
}

}  // namespace cli
