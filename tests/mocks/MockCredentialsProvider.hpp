/**
 * @file MockCredentialsProvider.hpp
 * @brief Google Mock implementation of ICredentialsProvider
 */

#pragma once

#include "services/ICredentialsProvider.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockCredentialsProvider : public ICredentialsProvider {
public:
    MOCK_METHOD(std::optional<Credentials>, lookup, (const std::string& credentials_id),
                (override));

    // Helper: Create a nice mock that knows nothing
    static std::shared_ptr<MockCredentialsProvider> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockCredentialsProvider>>();
        ON_CALL(*mock, lookup(testing::_)).WillByDefault(testing::Return(std::nullopt));
        return mock;
    }
};
