/**
 * @file MockBackendTransport.hpp
 * @brief Google Mock implementation of IBackendTransport
 */

#pragma once

#include "services/IBackendTransport.hpp"
#include "services/ProtocolClassifier.hpp"

#include <gmock/gmock.h>

#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class MockBackendTransport : public IBackendTransport {
public:
    MOCK_METHOD(BackendType, backend, (), (const, override));
    MOCK_METHOD((std::expected<void, util::Error>), upload,
                (const std::string& destination, std::istream& source, uint64_t size,
                 const TransferProgressCallback& progress),
                (override));
    MOCK_METHOD((std::expected<uint64_t, util::Error>), download,
                (const std::string& source, std::ostream& destination,
                 const TransferProgressCallback& progress),
                (override));
    MOCK_METHOD((std::expected<void, util::Error>), remove, (const std::string& locator),
                (override));
    MOCK_METHOD((std::expected<std::vector<RemoteEntry>, util::Error>), list,
                (const std::string& directory), (override));
    MOCK_METHOD((std::expected<void, util::Error>), rename,
                (const std::string& from, const std::string& to), (override));
    MOCK_METHOD(void, use_credentials, (const std::string& host_key, const Credentials& credentials),
                (override));

    /**
     * @brief Files held by an in-memory mock, keyed by canonical locator
     */
    struct Store {
        std::mutex mutex;
        std::map<std::string, std::string> files;

        void put(const std::string& locator, std::string content) {
            std::lock_guard lock(mutex);
            files[protocol::normalize_locator(locator)] = std::move(content);
        }

        [[nodiscard]] auto contains(const std::string& locator) -> bool {
            std::lock_guard lock(mutex);
            return files.contains(protocol::normalize_locator(locator));
        }

        [[nodiscard]] auto get(const std::string& locator) -> std::string {
            std::lock_guard lock(mutex);
            auto it = files.find(protocol::normalize_locator(locator));
            return it == files.end() ? std::string() : it->second;
        }
    };

    // Helper: Create a nice mock whose default actions operate on @p store
    static std::shared_ptr<MockBackendTransport> CreateInMemory(
        BackendType backend, std::shared_ptr<Store> store = std::make_shared<Store>()) {
        using testing::_;

        auto mock = std::make_shared<testing::NiceMock<MockBackendTransport>>();
        mock->store = store;

        ON_CALL(*mock, backend()).WillByDefault(testing::Return(backend));

        ON_CALL(*mock, list(_)).WillByDefault([store](const std::string& directory)
                                                  -> std::expected<std::vector<RemoteEntry>,
                                                                   util::Error> {
            std::lock_guard lock(store->mutex);
            std::vector<RemoteEntry> entries;
            for (const auto& [locator, content] : store->files) {
                if (protocol::parent(locator) == protocol::normalize_locator(directory)) {
                    entries.push_back(RemoteEntry{protocol::file_name(locator), locator,
                                                  content.size(), false});
                }
            }
            return entries;
        });

        ON_CALL(*mock, download(_, _, _))
            .WillByDefault([store](const std::string& source, std::ostream& destination,
                                   const TransferProgressCallback& progress)
                               -> std::expected<uint64_t, util::Error> {
                std::lock_guard lock(store->mutex);
                auto it = store->files.find(protocol::normalize_locator(source));
                if (it == store->files.end()) {
                    return std::unexpected(util::Error{protocol::file_name(source) + " not found",
                                                       util::ErrorKind::NOT_FOUND});
                }
                destination.write(it->second.data(),
                                  static_cast<std::streamsize>(it->second.size()));
                if (progress) {
                    progress(it->second.size(), it->second.size());
                }
                return it->second.size();
            });

        ON_CALL(*mock, upload(_, _, _, _))
            .WillByDefault([store](const std::string& destination, std::istream& source,
                                   uint64_t size, const TransferProgressCallback& progress)
                               -> std::expected<void, util::Error> {
                std::string content((std::istreambuf_iterator<char>(source)),
                                    std::istreambuf_iterator<char>());
                store->put(destination, std::move(content));
                if (progress) {
                    progress(size, size);
                }
                return {};
            });

        ON_CALL(*mock, remove(_))
            .WillByDefault([store](const std::string& locator) -> std::expected<void, util::Error> {
                std::lock_guard lock(store->mutex);
                if (store->files.erase(protocol::normalize_locator(locator)) == 0) {
                    return std::unexpected(util::Error{protocol::file_name(locator) + " not found",
                                                       util::ErrorKind::NOT_FOUND});
                }
                return {};
            });

        ON_CALL(*mock, rename(_, _))
            .WillByDefault([store](const std::string& from,
                                   const std::string& to) -> std::expected<void, util::Error> {
                std::lock_guard lock(store->mutex);
                auto node = store->files.extract(protocol::normalize_locator(from));
                if (node.empty()) {
                    return std::unexpected(util::Error{protocol::file_name(from) + " not found",
                                                       util::ErrorKind::NOT_FOUND});
                }
                node.key() = protocol::normalize_locator(to);
                store->files.insert(std::move(node));
                return {};
            });

        return mock;
    }

    std::shared_ptr<Store> store;
};
