/**
 * @file LocalOperationHandlerTest.cpp
 * @brief Unit tests for LocalOperationHandler against a temporary directory
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockBackendTransport.hpp"
#include "mocks/MockLocalFileSystem.hpp"
#include "services/LocalOperationHandler.hpp"
#include "services/TransferBridge.hpp"
#include "services/TransportRegistry.hpp"
#include "services/TrashManager.hpp"

using testing::_;
using testing::HasSubstr;
using testing::Return;
using testing::StartsWith;

class LocalOperationHandlerTest : public TempDirTestFixture {
protected:
    std::shared_ptr<TransportRegistry> registry;
    std::shared_ptr<MockLocalFileSystem> fs;
    std::shared_ptr<TrashManager> trash;
    std::shared_ptr<LocalOperationHandler> handler;
    std::atomic<bool> cancel{false};

    void SetUp() override {
        TempDirTestFixture::SetUp();
        auto settings = FastSettings();
        registry = std::make_shared<TransportRegistry>();
        fs = MockLocalFileSystem::CreateDelegating();
        trash = std::make_shared<TrashManager>(settings);
        handler = std::make_shared<LocalOperationHandler>(
            settings, std::make_shared<TransferBridge>(registry, nullptr, nullptr, settings, fs),
            trash);
    }

    auto P(const std::string& relative) const -> std::string {
        return (root / relative).string();
    }

    static auto TrashDirsIn(const std::filesystem::path& dir) -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> dirs;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (TrashManager::is_trash_directory_name(entry.path().filename().string())) {
                dirs.push_back(entry.path());
            }
        }
        return dirs;
    }
};

// Test: one collision and one missing source give a partial result
TEST_F(LocalOperationHandlerTest, Copy_CollisionAndMissing_PartialSuccess) {
    WriteFile("src/A", "new A");
    WriteFile("src/B", "B");
    WriteFile("dst/A", "old A");

    CopyOperation op{{P("src/A"), P("src/B"), P("src/C")}, P("dst"), false, std::nullopt};
    auto result = handler->copy(op, nullptr, cancel);

    ASSERT_TRUE(std::holds_alternative<PartialSuccessResult>(result));
    const auto& partial = std::get<PartialSuccessResult>(result);
    EXPECT_EQ(partial.processed_count, 1u);
    EXPECT_EQ(partial.failed_count, 2u);
    ASSERT_EQ(partial.errors.size(), 2u);
    EXPECT_THAT(partial.errors[0], StartsWith("A already exists"));
    EXPECT_THAT(partial.errors[0], HasSubstr("From: " + P("src/A")));
    EXPECT_THAT(partial.errors[1], StartsWith("C not found"));
    EXPECT_THAT(partial.produced_paths, testing::ElementsAre(P("dst/B")));

    EXPECT_EQ(ReadFile(root / "dst/A"), "old A");
    EXPECT_EQ(ReadFile(root / "dst/B"), "B");
}

TEST_F(LocalOperationHandlerTest, Copy_AllSucceed_ReturnsProducedPaths) {
    WriteFile("src/a.jpg", "aaaa");
    WriteFile("src/b.jpg", "bb");

    CopyOperation op{{P("src/a.jpg"), P("src/b.jpg")}, P("dst/new"), false, std::nullopt};
    auto result = handler->copy(op, nullptr, cancel);

    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result));
    const auto& success = std::get<SuccessResult>(result);
    EXPECT_EQ(success.processed_count, 2u);
    EXPECT_EQ(success.operation, Operation{op});
    EXPECT_THAT(success.produced_paths, testing::ElementsAre(P("dst/new/a.jpg"), P("dst/new/b.jpg")));
    EXPECT_EQ(ReadFile(root / "dst/new/a.jpg"), "aaaa");
    EXPECT_TRUE(std::filesystem::exists(root / "src/a.jpg"));
}

TEST_F(LocalOperationHandlerTest, Copy_Overwrite_ReplacesTarget) {
    WriteFile("src/A", "fresh");
    WriteFile("dst/A", "stale content");

    auto result = handler->copy(CopyOperation{{P("src/A")}, P("dst"), true, std::nullopt}, nullptr,
                                cancel);

    EXPECT_TRUE(std::holds_alternative<SuccessResult>(result));
    EXPECT_EQ(ReadFile(root / "dst/A"), "fresh");
}

TEST_F(LocalOperationHandlerTest, Copy_IntoOwnDirectory_IsRejected) {
    WriteFile("src/A", "x");

    auto result = handler->copy(CopyOperation{{P("src/A")}, P("src"), true, std::nullopt}, nullptr,
                                cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    EXPECT_THAT(std::get<FailureResult>(result).message, HasSubstr("A is already in"));
    EXPECT_EQ(ReadFile(root / "src/A"), "x");
}

TEST_F(LocalOperationHandlerTest, Copy_AllFail_ReturnsFailureWithJoinedErrors) {
    MakeDir("dst");

    auto result = handler->copy(
        CopyOperation{{P("src/x"), P("src/y")}, P("dst"), false, std::nullopt}, nullptr, cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    const auto& failure = std::get<FailureResult>(result);
    EXPECT_THAT(failure.message, StartsWith("All copy operations failed: x not found"));
    EXPECT_THAT(failure.message, HasSubstr("; y not found"));
    EXPECT_EQ(failure.kind, util::ErrorKind::NOT_FOUND);
}

TEST_F(LocalOperationHandlerTest, Copy_ReportsProgressPerItem) {
    WriteFile("src/a", std::string(1000, 'a'));
    WriteFile("src/b", std::string(10, 'b'));
    ProgressCapture capture;

    (void)handler->copy(CopyOperation{{P("src/a"), P("src/b")}, P("dst"), false, std::nullopt},
                        capture.Callback(), cancel);

    auto events = capture.Events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().current_item, "a");
    EXPECT_EQ(events.front().index, 0u);
    EXPECT_EQ(events.front().total, 2u);
    EXPECT_EQ(events.back().current_item, "b");
    EXPECT_EQ(events.back().index, 1u);
    EXPECT_EQ(events.back().bytes_transferred, 10u);
    EXPECT_EQ(events.back().total_bytes, 10u);
}

TEST_F(LocalOperationHandlerTest, Copy_CancelledBeforeStart_ReportsEveryItem) {
    WriteFile("src/a", "a");
    WriteFile("src/b", "b");
    cancel = true;

    auto result = handler->copy(
        CopyOperation{{P("src/a"), P("src/b")}, P("dst"), false, std::nullopt}, nullptr, cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    EXPECT_THAT(std::get<FailureResult>(result).message, HasSubstr("a: Operation cancelled"));
    EXPECT_FALSE(std::filesystem::exists(root / "dst/a"));
}

TEST_F(LocalOperationHandlerTest, Copy_FromScopedTree_UsesScopedTransport) {
    auto scoped = MockBackendTransport::CreateInMemory(BackendType::SCOPED);
    scoped->store->put("content://tree/primary/photo.jpg", "pixels");
    registry->register_transport(scoped);

    auto result = handler->copy(
        CopyOperation{{"content://tree/primary/photo.jpg"}, P("dst"), false, std::nullopt}, nullptr,
        cancel);

    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result)) << describe_result(result);
    EXPECT_EQ(ReadFile(root / "dst/photo.jpg"), "pixels");
}

TEST_F(LocalOperationHandlerTest, Move_WithinFilesystem_RenamesSource) {
    WriteFile("src/a", "content");

    auto result = handler->move(MoveOperation{{P("src/a")}, P("dst"), false, std::nullopt}, nullptr,
                                cancel);

    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result));
    EXPECT_FALSE(std::filesystem::exists(root / "src/a"));
    EXPECT_EQ(ReadFile(root / "dst/a"), "content");
}

TEST_F(LocalOperationHandlerTest, Move_CollisionWithoutOverwrite_LeavesBothFiles) {
    WriteFile("src/a", "new");
    WriteFile("dst/a", "old");

    auto result = handler->move(MoveOperation{{P("src/a")}, P("dst"), false, std::nullopt}, nullptr,
                                cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    EXPECT_EQ(std::get<FailureResult>(result).kind, util::ErrorKind::ALREADY_EXISTS);
    EXPECT_EQ(ReadFile(root / "src/a"), "new");
    EXPECT_EQ(ReadFile(root / "dst/a"), "old");
}

TEST_F(LocalOperationHandlerTest, Move_WithOverwrite_ReplacesTargetAndRemovesSource) {
    WriteFile("src/a", "new");
    WriteFile("dst/a", "old");

    auto result = handler->move(MoveOperation{{P("src/a")}, P("dst"), true, std::nullopt}, nullptr,
                                cancel);

    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result));
    EXPECT_FALSE(std::filesystem::exists(root / "src/a"));
    EXPECT_EQ(ReadFile(root / "dst/a"), "new");
}

// Test: a failed rename falls back to copying and deleting the source
TEST_F(LocalOperationHandlerTest, Move_RenameFails_CopiesThenDeletesSource) {
    WriteFile("src/a", "content");
    EXPECT_CALL(*fs, rename_path(_, _))
        .WillOnce(Return(std::expected<void, util::Error>(
            std::unexpected(MockLocalFileSystem::CrossDeviceError()))));
    EXPECT_CALL(*fs, copy_file(_, _, false, _, _));
    EXPECT_CALL(*fs, remove_path(std::filesystem::path(P("src/a"))));

    auto result = handler->move(MoveOperation{{P("src/a")}, P("dst"), false, std::nullopt}, nullptr,
                                cancel);

    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result)) << describe_result(result);
    EXPECT_FALSE(std::filesystem::exists(root / "src/a"));
    EXPECT_EQ(ReadFile(root / "dst/a"), "content");
}

TEST_F(LocalOperationHandlerTest, Move_SourceDeleteFailsAfterCopy_KeepsBothAndReports) {
    WriteFile("src/a", "content");
    ON_CALL(*fs, rename_path(_, _))
        .WillByDefault(Return(std::expected<void, util::Error>(
            std::unexpected(MockLocalFileSystem::CrossDeviceError()))));
    ON_CALL(*fs, remove_path(_))
        .WillByDefault(Return(std::expected<void, util::Error>(std::unexpected(
            util::Error{"Access denied", util::ErrorKind::PERMISSION_DENIED}))));

    auto result = handler->move(MoveOperation{{P("src/a")}, P("dst"), false, std::nullopt}, nullptr,
                                cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    const auto& failure = std::get<FailureResult>(result);
    EXPECT_THAT(failure.message, HasSubstr("a: Failed to delete source after copy: Access denied"));
    EXPECT_EQ(failure.kind, util::ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(ReadFile(root / "src/a"), "content");
    EXPECT_EQ(ReadFile(root / "dst/a"), "content");
}

TEST_F(LocalOperationHandlerTest, Rename_Succeeds) {
    WriteFile("dir/old.txt", "x");

    auto result = handler->rename(RenameOperation{P("dir/old.txt"), "new.txt"});

    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result));
    EXPECT_THAT(std::get<SuccessResult>(result).produced_paths,
                testing::ElementsAre(P("dir/new.txt")));
    EXPECT_FALSE(std::filesystem::exists(root / "dir/old.txt"));
    EXPECT_TRUE(std::filesystem::exists(root / "dir/new.txt"));
}

TEST_F(LocalOperationHandlerTest, Rename_Collision_Fails) {
    WriteFile("dir/a.txt", "a");
    WriteFile("dir/b.txt", "b");

    auto result = handler->rename(RenameOperation{P("dir/a.txt"), "b.txt"});

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    const auto& failure = std::get<FailureResult>(result);
    EXPECT_THAT(failure.message, StartsWith("a.txt: b.txt already exists in " + P("dir")));
    EXPECT_EQ(failure.kind, util::ErrorKind::ALREADY_EXISTS);
    EXPECT_EQ(ReadFile(root / "dir/b.txt"), "b");
}

TEST_F(LocalOperationHandlerTest, Rename_InvalidNameOrMissingFile_Fails) {
    WriteFile("dir/a.txt", "a");

    auto bad_name = handler->rename(RenameOperation{P("dir/a.txt"), "sub/b.txt"});
    ASSERT_TRUE(std::holds_alternative<FailureResult>(bad_name));
    EXPECT_TRUE(std::filesystem::exists(root / "dir/a.txt"));

    auto missing = handler->rename(RenameOperation{P("dir/nope.txt"), "b.txt"});
    ASSERT_TRUE(std::holds_alternative<FailureResult>(missing));
    EXPECT_THAT(std::get<FailureResult>(missing).message, StartsWith("nope.txt not found"));
}

TEST_F(LocalOperationHandlerTest, HardDelete_RemovesFilesAndReportsMissing) {
    WriteFile("dir/a", "a");
    WriteFile("dir/b", "b");

    auto result = handler->remove(DeleteOperation{{P("dir/a"), P("dir/b"), P("dir/c")}, false},
                                  nullptr, cancel);

    ASSERT_TRUE(std::holds_alternative<PartialSuccessResult>(result)) << describe_result(result);
    const auto& partial = std::get<PartialSuccessResult>(result);
    EXPECT_EQ(partial.processed_count, 2u);
    EXPECT_EQ(partial.failed_count, 1u);
    EXPECT_THAT(partial.errors[0], StartsWith("c"));
    EXPECT_FALSE(std::filesystem::exists(root / "dir/a"));
    EXPECT_FALSE(std::filesystem::exists(root / "dir/b"));
    EXPECT_TRUE(TrashDirsIn(root / "dir").empty());
}

// Test: soft delete makes exactly one trash directory per distinct parent
TEST_F(LocalOperationHandlerTest, SoftDelete_OneTrashDirectoryPerParent) {
    std::vector<std::string> files;
    for (int i = 0; i < 3; ++i) {
        files.push_back(WriteFile("one/f" + std::to_string(i), "1").string());
        files.push_back(WriteFile("two/g" + std::to_string(i), "2").string());
    }
    ProgressCapture capture;

    auto result = handler->remove(DeleteOperation{files, true}, capture.Callback(), cancel);

    ASSERT_TRUE(std::holds_alternative<SuccessResult>(result)) << describe_result(result);
    const auto& success = std::get<SuccessResult>(result);
    EXPECT_EQ(success.processed_count, 6u);
    EXPECT_EQ(success.produced_paths.size(), 6u);

    auto one = TrashDirsIn(root / "one");
    auto two = TrashDirsIn(root / "two");
    ASSERT_EQ(one.size(), 1u);
    ASSERT_EQ(two.size(), 1u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(std::filesystem::exists(root / ("one/f" + std::to_string(i))));
        EXPECT_TRUE(std::filesystem::exists(one[0] / ("f" + std::to_string(i))));
        EXPECT_TRUE(std::filesystem::exists(two[0] / ("g" + std::to_string(i))));
    }
    EXPECT_EQ(capture.Events().size(), 6u);
    EXPECT_EQ(trash->recently_deleted().size(), 6u);
}

TEST_F(LocalOperationHandlerTest, SoftDelete_WithScopedLocator_DeletesNothing) {
    auto local = WriteFile("dir/a", "a");

    auto result = handler->remove(
        DeleteOperation{{local.string(), "content://tree/primary/b"}, true}, nullptr, cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(result));
    EXPECT_EQ(std::get<FailureResult>(result).kind,
              util::ErrorKind::BACKEND_UNSUPPORTED_OPERATION);
    EXPECT_TRUE(std::filesystem::exists(local));
    EXPECT_TRUE(TrashDirsIn(root / "dir").empty());
}

TEST_F(LocalOperationHandlerTest, SoftDelete_AlreadyTrashedFile_IsRejected) {
    auto file = WriteFile("dir/a", "a");

    auto first = handler->remove(DeleteOperation{{file.string()}, true}, nullptr, cancel);
    ASSERT_TRUE(std::holds_alternative<SuccessResult>(first));
    const auto trashed = std::get<SuccessResult>(first).produced_paths.at(0);

    auto second = handler->remove(DeleteOperation{{trashed}, true}, nullptr, cancel);

    ASSERT_TRUE(std::holds_alternative<FailureResult>(second));
    EXPECT_THAT(std::get<FailureResult>(second).message, HasSubstr("a is already in trash"));
    EXPECT_TRUE(std::filesystem::exists(trashed));
}
