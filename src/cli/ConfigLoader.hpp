/**
 * @file ConfigLoader.hpp
 * @brief Reads CLI overrides for TransferSettings and logging from an INI file
 *
 * File format (GLib key file):
 * @code
 * [transfer]
 * delete_max_attempts=3
 * delete_backoff_ms=100
 * delete_batch_size=5
 * delete_batch_pause_ms=150
 * recent_trash_limit=50
 * trash_retention_hours=168
 * progress_channel_capacity=64
 * progress_interval_ms=100
 * copy_buffer_size=65536
 * staging_directory=/var/tmp/media-transfer-staging
 * limit_smb=2
 *
 * [logging]
 * level=info
 * max_file_size=10485760
 * max_files=7
 * console=false
 * @endcode
 * Every key is optional.
 */

#pragma once

#include "models/TransferSettings.hpp"
#include "util/Error.hpp"
#include "util/Logger.hpp"

#include <expected>
#include <filesystem>

namespace cli {

struct CliConfig {
    TransferSettings settings;
    util::LogLevel log_level = util::LogLevel::INFO;
    util::LogRotationPolicy rotation;
    bool log_to_console = false;
};

/**
 * @brief $XDG_CONFIG_HOME/media-transfer/config.ini
 */
[[nodiscard]] auto default_config_path() -> std::filesystem::path;

/**
 * @brief Load @p path on top of the built-in defaults
 * @return Defaults if the file does not exist; an Error if it cannot be
 *         parsed or holds an invalid value
 */
[[nodiscard]] auto load_config(const std::filesystem::path& path)
    -> std::expected<CliConfig, util::Error>;

}  // namespace cli
