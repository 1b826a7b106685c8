/**
 * @file IBackendTransport.hpp
 * @brief Interface to a storage backend's wire client
 *
 * Implementations live outside the core (SMB, SFTP, FTP, cloud and scoped
 * storage clients). The handlers only ever stream whole files through
 * upload/download and never assume server-side copy.
 */

#pragma once

#include "models/BackendType.hpp"
#include "models/ProgressTypes.hpp"
#include "services/ICredentialsProvider.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

/**
 * @struct RemoteEntry
 * @brief One child of a listed remote directory
 */
struct RemoteEntry {
    std::string name;
    std::string locator;
    uint64_t size = 0;
    bool is_directory = false;

    auto operator==(const RemoteEntry&) const -> bool = default;
};

/**
 * @class IBackendTransport
 * @brief Abstract interface for one backend's file primitives
 *
 * Errors of kind AUTHENTICATION_REQUIRED abort the whole operation; every
 * other error is recorded against the file being processed.
 */
class IBackendTransport {
public:
    virtual ~IBackendTransport() = default;

    [[nodiscard]] virtual auto backend() const -> BackendType = 0;

    /**
     * @brief Write @p size bytes read from @p source to @p destination, replacing it
     */
    virtual auto upload(const std::string& destination, std::istream& source, uint64_t size,
                        const TransferProgressCallback& progress)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Stream @p source into @p destination
     * @return Number of bytes written
     */
    virtual auto download(const std::string& source, std::ostream& destination,
                          const TransferProgressCallback& progress)
        -> std::expected<uint64_t, util::Error> = 0;

    virtual auto remove(const std::string& locator) -> std::expected<void, util::Error> = 0;

    virtual auto list(const std::string& directory)
        -> std::expected<std::vector<RemoteEntry>, util::Error> = 0;

    /**
     * @brief Server-side rename/move within the same host
     */
    virtual auto rename(const std::string& from, const std::string& to)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Use @p credentials for subsequent calls against @p host_key
     */
    virtual void use_credentials(const std::string& host_key, const Credentials& credentials) = 0;
};
