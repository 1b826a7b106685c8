/**
 * @file ICredentialsProvider.hpp
 * @brief Lookup of stored credentials by opaque identifier
 */

#pragma once

#include <optional>
#include <string>

struct Credentials {
    std::string provider;
    std::string username;
    std::string secret;

    auto operator==(const Credentials&) const -> bool = default;
};

class ICredentialsProvider {
public:
    virtual ~ICredentialsProvider() = default;

    /**
     * @return Credentials for @p credentials_id, or std::nullopt if unknown or revoked
     */
    virtual auto lookup(const std::string& credentials_id) -> std::optional<Credentials> = 0;
};
