/**
 * @file ContainerTest.cpp
 * @brief Unit tests for DI Container
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <thread>
#include <vector>

#include "di/Container.hpp"
#include "mocks/MockBackendTransport.hpp"
#include "mocks/MockOperationHandler.hpp"
#include "services/IFileOperationService.hpp"
#include "services/OperationRouter.hpp"
#include "services/TransferServices.hpp"
#include "services/TransportRegistry.hpp"
#include "services/TrashManager.hpp"

class ContainerTest : public ::testing::Test {
protected:
    di::Container container;

    void TearDown() override {
        container.clear();
    }
};

// Test: register_type creates correct interface mapping
TEST_F(ContainerTest, RegisterType_ResolvesCorrectImplementation) {
    container.register_type<IOperationHandler, MockOperationHandler>();

    auto resolved = container.resolve<IOperationHandler>();

    ASSERT_NE(resolved, nullptr);
    EXPECT_NE(dynamic_cast<MockOperationHandler*>(resolved.get()), nullptr);
}

// Test: singleton lifetime returns same instance
TEST_F(ContainerTest, SingletonLifetime_ReturnsSameInstance) {
    container.register_type<IOperationHandler, MockOperationHandler>(di::Lifetime::SINGLETON);

    auto first = container.resolve<IOperationHandler>();
    auto second = container.resolve<IOperationHandler>();

    EXPECT_EQ(first.get(), second.get());
}

// Test: transient lifetime creates new instances
TEST_F(ContainerTest, TransientLifetime_CreatesNewInstances) {
    container.register_type<IOperationHandler, MockOperationHandler>(di::Lifetime::TRANSIENT);

    auto first = container.resolve<IOperationHandler>();
    auto second = container.resolve<IOperationHandler>();

    EXPECT_NE(first.get(), second.get());
}

// Test: register_instance stores pre-created instance
TEST_F(ContainerTest, RegisterInstance_ReturnsExactInstance) {
    auto instance = std::make_shared<MockOperationHandler>();
    container.register_instance<IOperationHandler>(instance);

    auto resolved = container.resolve<IOperationHandler>();

    EXPECT_EQ(resolved.get(), instance.get());
}

// Test: resolving unregistered type throws, try_resolve returns nullptr
TEST_F(ContainerTest, ResolveUnregistered_ThrowsException) {
    EXPECT_THROW((void)container.resolve<IOperationHandler>(), std::runtime_error);
    EXPECT_EQ(container.try_resolve<IOperationHandler>(), nullptr);
}

// Test: factories resolve their own dependencies through the container
TEST_F(ContainerTest, Factory_ResolvesNestedDependencies) {
    container.register_factory<TransportRegistry>(
        [](di::Container&) { return std::make_shared<TransportRegistry>(); });
    container.register_factory<OperationRouter>([](di::Container& c) {
        auto router = std::make_shared<OperationRouter>();
        (void)c.resolve<TransportRegistry>();
        router->register_handler(MockOperationHandler::CreateNiceMock(BackendType::LOCAL));
        return router;
    });

    auto router = container.resolve<OperationRouter>();

    ASSERT_NE(router, nullptr);
    EXPECT_NE(router->handler_for_locator("/tmp/a.jpg"), nullptr);
    EXPECT_EQ(container.resolve<OperationRouter>().get(), router.get());
}

// Test: is_registered returns correct status
TEST_F(ContainerTest, IsRegistered_ReturnsCorrectStatus) {
    EXPECT_FALSE(container.is_registered<IOperationHandler>());

    container.register_type<IOperationHandler, MockOperationHandler>();

    EXPECT_TRUE(container.is_registered<IOperationHandler>());
}

// Test: clear removes all registrations
TEST_F(ContainerTest, Clear_RemovesAllRegistrations) {
    container.register_type<IOperationHandler, MockOperationHandler>();
    EXPECT_EQ(container.size(), 1u);

    container.clear();

    EXPECT_EQ(container.size(), 0u);
    EXPECT_FALSE(container.is_registered<IOperationHandler>());
}

// Test: re-registering replaces previous registration
TEST_F(ContainerTest, ReRegister_ReplacesPrevious) {
    auto first_instance = std::make_shared<MockOperationHandler>();
    auto second_instance = std::make_shared<MockOperationHandler>();

    container.register_instance<IOperationHandler>(first_instance);
    container.register_instance<IOperationHandler>(second_instance);

    auto resolved = container.resolve<IOperationHandler>();
    EXPECT_EQ(resolved.get(), second_instance.get());
}

// Test: thread-safety of registration and resolution
TEST_F(ContainerTest, ConcurrentAccess_IsThreadSafe) {
    container.register_type<IOperationHandler, MockOperationHandler>(di::Lifetime::SINGLETON);

    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<IOperationHandler>> results(10);

    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([this, &results, i]() {
            results[i] = container.resolve<IOperationHandler>();
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    // All should be same singleton instance
    for (const auto& result : results) {
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result.get(), results[0].get());
    }
}

// Test: factory singleton caches after first call
TEST_F(ContainerTest, FactorySingleton_CachesInstance) {
    int call_count = 0;
    container.register_factory<IOperationHandler>(
        [&call_count](di::Container&) {
            call_count++;
            return std::make_shared<MockOperationHandler>();
        },
        di::Lifetime::SINGLETON);

    (void)container.resolve<IOperationHandler>();
    (void)container.resolve<IOperationHandler>();
    (void)container.resolve<IOperationHandler>();

    EXPECT_EQ(call_count, 1);
}

// Test: factory transient creates new each time
TEST_F(ContainerTest, FactoryTransient_CreatesEachTime) {
    int call_count = 0;
    container.register_factory<IOperationHandler>(
        [&call_count](di::Container&) {
            call_count++;
            return std::make_shared<MockOperationHandler>();
        },
        di::Lifetime::TRANSIENT);

    (void)container.resolve<IOperationHandler>();
    (void)container.resolve<IOperationHandler>();
    (void)container.resolve<IOperationHandler>();

    EXPECT_EQ(call_count, 3);
}

// Test: the transfer core wires up with every handler registered
TEST_F(ContainerTest, ConfigureTransferServices_RegistersCore) {
    TransferSettings settings;
    auto smb = MockBackendTransport::CreateInMemory(BackendType::SMB);

    configure_transfer_services(container, settings, {smb}, nullptr);

    auto service = container.resolve<IFileOperationService>();
    auto router = container.resolve<OperationRouter>();
    auto registry = container.resolve<TransportRegistry>();

    ASSERT_NE(service, nullptr);
    EXPECT_EQ(service->trash_manager().get(), container.resolve<TrashManager>().get());
    EXPECT_EQ(registry->find(BackendType::SMB).get(), smb.get());
    for (auto backend : ALL_BACKEND_TYPES) {
        EXPECT_NE(router->handler_for_locator(backend == BackendType::LOCAL    ? "/a"
                                              : backend == BackendType::SCOPED ? "content://a"
                                              : backend == BackendType::SMB    ? "smb://h/a"
                                              : backend == BackendType::SFTP   ? "sftp://h/a"
                                              : backend == BackendType::FTP    ? "ftp://h/a"
                                                                               : "cloud://h/a"),
                  nullptr)
            << backend_name(backend);
    }
    EXPECT_FALSE(container.is_registered<ICredentialsProvider>());
}
