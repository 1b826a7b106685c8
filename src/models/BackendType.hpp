/**
 * @file BackendType.hpp
 * @brief Storage backend tags derived from locator schemes
 */

#pragma once

#include <array>
#include <string_view>

/**
 * @enum BackendType
 * @brief Storage backend a locator belongs to
 */
enum class BackendType {
    LOCAL,   ///< Plain filesystem path
    SCOPED,  ///< Scoped document tree (content:/ locators)
    SMB,     ///< SMB/CIFS share
    SFTP,    ///< SFTP server
    FTP,     ///< FTP server
    CLOUD    ///< Cloud object store
};

inline constexpr std::array<BackendType, 6> ALL_BACKEND_TYPES = {
    BackendType::LOCAL, BackendType::SCOPED, BackendType::SMB,
    BackendType::SFTP,  BackendType::FTP,    BackendType::CLOUD};

[[nodiscard]] constexpr auto backend_name(BackendType type) -> std::string_view {
    switch (type) {
        case BackendType::LOCAL:
            return "LOCAL";
        case BackendType::SCOPED:
            return "SCOPED";
        case BackendType::SMB:
            return "SMB";
        case BackendType::SFTP:
            return "SFTP";
        case BackendType::FTP:
            return "FTP";
        case BackendType::CLOUD:
            return "CLOUD";
    }
    return "UNKNOWN";
}

/**
 * @brief true for backends reached through a network transport
 */
[[nodiscard]] constexpr auto is_network_backend(BackendType type) -> bool {
    return type == BackendType::SMB || type == BackendType::SFTP || type == BackendType::FTP ||
           type == BackendType::CLOUD;
}

/**
 * @brief true for locators the local filesystem can address directly
 */
[[nodiscard]] constexpr auto is_plain_local(BackendType type) -> bool {
    return type == BackendType::LOCAL;
}
