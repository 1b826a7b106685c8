/**
 * @file ProtocolClassifier.cpp
 * @brief Scheme recognition and locator path helpers
 */

#include "services/ProtocolClassifier.hpp"

#include <array>
#include <cctype>
#include <filesystem>
#include <optional>

namespace {

struct SchemeInfo {
    std::string_view scheme;
    BackendType type;
};

// sftp is tested before ftp; matching is anchored, so "sftp:" never matches "ftp".
constexpr std::array<SchemeInfo, 5> KNOWN_SCHEMES = {{
    {"sftp", BackendType::SFTP},
    {"smb", BackendType::SMB},
    {"ftp", BackendType::FTP},
    {"cloud", BackendType::CLOUD},
    {"content", BackendType::SCOPED},
}};

struct SchemeMatch {
    SchemeInfo info;
    std::string_view body;  ///< Everything after "scheme:" and its slashes
};

auto iequals(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

auto match_at(std::string_view locator, size_t start) -> std::optional<SchemeMatch> {
    for (const auto& info : KNOWN_SCHEMES) {
        const size_t len = info.scheme.size();
        if (locator.size() < start + len + 2) {
            continue;
        }
        if (!iequals(locator.substr(start, len), info.scheme)) {
            continue;
        }
        if (locator[start + len] != ':' || locator[start + len + 1] != '/') {
            continue;
        }

        size_t body_start = start + len + 1;
        for (int slashes = 0; slashes < 2 && body_start < locator.size() &&
                              locator[body_start] == '/';
             ++slashes) {
            ++body_start;
        }
        return SchemeMatch{info, locator.substr(body_start)};
    }
    return std::nullopt;
}

auto match_scheme(std::string_view locator) -> std::optional<SchemeMatch> {
    if (auto match = match_at(locator, 0)) {
        return match;
    }
    if (!locator.empty() && locator.front() == '/') {
        return match_at(locator, 1);
    }
    return std::nullopt;
}

auto strip_trailing_slashes(std::string_view body) -> std::string_view {
    while (body.size() > 1 && body.back() == '/') {
        body.remove_suffix(1);
    }
    return body;
}

}  // namespace

namespace protocol {

auto classify(std::string_view locator) -> BackendType {
    if (auto match = match_scheme(locator)) {
        return match->info.type;
    }
    return BackendType::LOCAL;
}

auto normalize_locator(std::string_view locator) -> std::string {
    auto match = match_scheme(locator);
    if (!match) {
        return std::string(locator);
    }
    std::string normalized(match->info.scheme);
    normalized += "://";
    normalized += match->body;
    return normalized;
}

auto file_name(std::string_view locator) -> std::string {
    if (auto match = match_scheme(locator)) {
        auto body = strip_trailing_slashes(match->body);
        auto pos = body.rfind('/');
        return std::string(pos == std::string_view::npos ? body : body.substr(pos + 1));
    }
    auto path = strip_trailing_slashes(locator);
    auto pos = path.rfind('/');
    if (pos == std::string_view::npos) {
        return std::string(path);
    }
    return path.size() == 1 ? std::string() : std::string(path.substr(pos + 1));
}

auto parent(std::string_view locator) -> std::string {
    if (auto match = match_scheme(locator)) {
        auto body = strip_trailing_slashes(match->body);
        auto pos = body.rfind('/');
        std::string result(match->info.scheme);
        result += "://";
        result += pos == std::string_view::npos ? body : body.substr(0, pos);
        return result;
    }
    auto path = std::filesystem::path(std::string(strip_trailing_slashes(locator)));
    auto parent_path = path.parent_path();
    return parent_path.empty() ? std::string(".") : parent_path.string();
}

auto join(std::string_view directory, std::string_view name) -> std::string {
    if (directory.empty()) {
        return std::string(name);
    }
    std::string joined(directory);
    if (joined.back() != '/') {
        joined += '/';
    }
    joined += name;
    return joined;
}

auto replace_file_name(std::string_view locator, std::string_view new_name) -> std::string {
    return join(parent(locator), new_name);
}

auto host_key(std::string_view locator) -> std::string {
    auto match = match_scheme(locator);
    if (!match) {
        return "local";
    }
    auto body = match->body;
    auto pos = body.find('/');
    std::string key(match->info.scheme);
    key += "://";
    key += pos == std::string_view::npos ? body : body.substr(0, pos);
    return key;
}

}  // namespace protocol

ProtocolClassifier::ProtocolClassifier(size_t max_entries)
    : max_entries_(max_entries > 0 ? max_entries : 1) {}

auto ProtocolClassifier::classify(std::string_view locator) -> BackendType {
    std::lock_guard lock(mutex_);

    auto it = cache_.find(std::string(locator));
    if (it != cache_.end()) {
        return it->second;
    }

    if (cache_.size() >= max_entries_) {
        cache_.clear();
    }

    auto type = protocol::classify(locator);
    cache_.emplace(std::string(locator), type);
    return type;
}

auto ProtocolClassifier::cached_entries() const -> size_t {
    std::lock_guard lock(mutex_);
    return cache_.size();
}

void ProtocolClassifier::clear() {
    std::lock_guard lock(mutex_);
    cache_.clear();
}
