/**
 * @file TransferSettings.hpp
 * @brief Tunables shared by the handlers, the trash manager and the service
 */

#pragma once

#include "models/BackendType.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>

/**
 * @struct TransferSettings
 * @brief Plain configuration data; defaults match the production client
 */
struct TransferSettings {
    int delete_max_attempts = 3;
    std::chrono::milliseconds delete_backoff_step{100};

    size_t delete_batch_size = 5;
    std::chrono::milliseconds delete_batch_pause{150};

    size_t recent_trash_limit = 50;
    std::chrono::hours trash_retention{24 * 7};

    size_t progress_channel_capacity = 64;
    std::chrono::milliseconds progress_interval{100};

    size_t copy_buffer_size = 64 * 1024;

    std::filesystem::path staging_directory =
        std::filesystem::temp_directory_path() / "media-transfer-staging";

    std::map<BackendType, int> connection_limits = {
        {BackendType::LOCAL, 24}, {BackendType::SCOPED, 24}, {BackendType::SMB, 2},
        {BackendType::SFTP, 3},   {BackendType::FTP, 2},     {BackendType::CLOUD, 8},
    };
};
