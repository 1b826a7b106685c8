#include "services/TransferBridge.hpp"

#include "services/LocalFileSystem.hpp"
#include "services/ProtocolClassifier.hpp"
#include "util/Logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <utility>

namespace {

constexpr std::string_view COMPONENT = "TransferBridge";

}  // namespace

TransferBridge::TransferBridge(std::shared_ptr<TransportRegistry> transports,
                               std::shared_ptr<ConnectionThrottle> throttle,
                               std::shared_ptr<StagingArea> staging, TransferSettings settings,
                               std::shared_ptr<ILocalFileSystem> file_system)
    : transports_(std::move(transports)),
      throttle_(std::move(throttle)),
      staging_(std::move(staging)),
      file_system_(std::move(file_system)),
      settings_(std::move(settings)) {
    if (!file_system_) {
        file_system_ = local_fs::native_file_system();
    }
    if (!throttle_) {
        throttle_ = std::make_shared<ConnectionThrottle>(settings_.connection_limits);
    }
    if (!staging_) {
        staging_ = std::make_shared<StagingArea>(settings_.staging_directory);
    }
}

auto TransferBridge::transport_for(BackendType backend) const
    -> std::expected<std::shared_ptr<IBackendTransport>, util::Error> {
    auto transport = transports_ ? transports_->find(backend) : nullptr;
    if (!transport) {
        return std::unexpected(util::Error{fmt::format("No transport configured for {} storage",
                                                       backend_name(backend)),
                                           util::ErrorKind::BACKEND_UNSUPPORTED_OPERATION});
    }
    return transport;
}

auto TransferBridge::exists(const std::string& locator) -> std::expected<bool, util::Error> {
    const auto backend = protocol::classify(locator);
    if (backend == BackendType::LOCAL) {
        return local_fs::exists(locator);
    }

    auto transport = transport_for(backend);
    if (!transport) {
        return std::unexpected(transport.error());
    }

    const auto normalized = protocol::normalize_locator(locator);
    const auto name = protocol::file_name(normalized);

    auto permit = throttle_->acquire(backend, protocol::host_key(normalized));
    auto entries = (*transport)->list(protocol::parent(normalized));
    if (!entries) {
        if (entries.error().kind == util::ErrorKind::NOT_FOUND) {
            return false;
        }
        return std::unexpected(entries.error());
    }

    return std::any_of(entries->begin(), entries->end(),
                       [&name](const RemoteEntry& entry) { return entry.name == name; });
}

auto TransferBridge::download_to_file(const std::string& source,
                                      const std::filesystem::path& target,
                                      const TransferProgressCallback& progress)
    -> std::expected<uint64_t, util::Error> {
    const auto backend = protocol::classify(source);
    auto transport = transport_for(backend);
    if (!transport) {
        return std::unexpected(transport.error());
    }

    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(util::error_from_errno("Failed to create " + target.string(), errno));
    }

    const auto normalized = protocol::normalize_locator(source);
    auto downloaded = [&] {
        auto permit = throttle_->acquire(backend, protocol::host_key(normalized));
        return (*transport)->download(normalized, output, progress);
    }();

    output.close();
    if (downloaded && output.fail()) {
        downloaded = std::unexpected(util::Error{"Failed to write " + target.string()});
    }
    if (!downloaded) {
        std::error_code ec;
        std::filesystem::remove(target, ec);
    }
    return downloaded;
}

auto TransferBridge::upload_from_file(const std::filesystem::path& source,
                                      const std::string& target,
                                      const TransferProgressCallback& progress)
    -> std::expected<uint64_t, util::Error> {
    const auto backend = protocol::classify(target);
    auto transport = transport_for(backend);
    if (!transport) {
        return std::unexpected(transport.error());
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return std::unexpected(util::error_from_errno("Failed to open " + source.string(), errno));
    }

    const auto size = local_fs::file_size(source);
    const auto normalized = protocol::normalize_locator(target);

    auto permit = throttle_->acquire(backend, protocol::host_key(normalized));
    if (auto uploaded = (*transport)->upload(normalized, input, size, progress); !uploaded) {
        return std::unexpected(uploaded.error());
    }
    return size;
}

auto TransferBridge::transfer(const std::string& source, const std::string& target,
                              bool overwrite, const TransferProgressCallback& progress)
    -> std::expected<uint64_t, util::Error> {
    const auto source_backend = protocol::classify(source);
    const auto target_backend = protocol::classify(target);

    if (source_backend == BackendType::LOCAL && target_backend == BackendType::LOCAL) {
        return file_system_->copy_file(source, target, overwrite, settings_.copy_buffer_size,
                                       progress);
    }
    if (source_backend == BackendType::LOCAL) {
        return upload_from_file(source, target, progress);
    }
    if (target_backend == BackendType::LOCAL) {
        return download_to_file(source, target, progress);
    }

    // Remote to remote: full download into a staged file, then upload.
    auto staged = staging_->create(protocol::file_name(source));
    if (!staged) {
        return std::unexpected(staged.error());
    }

    LOG_DEBUG(COMPONENT, fmt::format("Staging {} via {}", source, staged->path().string()));

    if (auto downloaded = download_to_file(source, staged->path(), progress); !downloaded) {
        return std::unexpected(downloaded.error());
    }
    return upload_from_file(staged->path(), target, progress);
}

auto TransferBridge::remove(const std::string& locator) -> std::expected<void, util::Error> {
    const auto backend = protocol::classify(locator);
    if (backend == BackendType::LOCAL) {
        return file_system_->remove_path(locator);
    }

    auto transport = transport_for(backend);
    if (!transport) {
        return std::unexpected(transport.error());
    }

    const auto normalized = protocol::normalize_locator(locator);
    auto permit = throttle_->acquire(backend, protocol::host_key(normalized));
    return (*transport)->remove(normalized);
}

auto TransferBridge::supports_direct_rename(const std::string& from, const std::string& to)
    -> bool {
    return protocol::classify(from) == protocol::classify(to) &&
           protocol::host_key(from) == protocol::host_key(to);
}

auto TransferBridge::rename(const std::string& from, const std::string& to)
    -> std::expected<void, util::Error> {
    if (!supports_direct_rename(from, to)) {
        return std::unexpected(util::Error{"Cannot rename across storage backends or hosts",
                                           util::ErrorKind::BACKEND_UNSUPPORTED_OPERATION});
    }

    const auto backend = protocol::classify(from);
    if (backend == BackendType::LOCAL) {
        return file_system_->rename_path(from, to);
    }

    auto transport = transport_for(backend);
    if (!transport) {
        return std::unexpected(transport.error());
    }

    const auto normalized_from = protocol::normalize_locator(from);
    auto permit = throttle_->acquire(backend, protocol::host_key(normalized_from));
    return (*transport)->rename(normalized_from, protocol::normalize_locator(to));
}

void TransferBridge::use_credentials(const std::string& locator, const Credentials& credentials) {
    const auto backend = protocol::classify(locator);
    if (backend == BackendType::LOCAL) {
        return;
    }
    if (auto transport = transport_for(backend)) {
        (*transport)->use_credentials(protocol::host_key(locator), credentials);
    }
}
