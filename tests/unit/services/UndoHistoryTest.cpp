/**
 * @file UndoHistoryTest.cpp
 * @brief Unit tests for the last-operation slot and undo planning
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "services/UndoHistory.hpp"

#include <set>

class UndoHistoryTest : public ::testing::Test {
protected:
    std::set<std::string> existing;

    auto Exists() -> UndoHistory::ExistsPredicate {
        return [this](const std::string& path) { return existing.contains(path); };
    }

    static auto Entry(Operation operation, OperationResult result) -> OperationHistory {
        return OperationHistory{std::move(operation), std::move(result), {}};
    }
};

TEST_F(UndoHistoryTest, Record_ReplacesSlot) {
    UndoHistory history;
    EXPECT_FALSE(history.last().has_value());
    EXPECT_FALSE(history.can_undo());

    const Operation first = RenameOperation{"/a/x", "y"};
    const Operation second = CopyOperation{{"/a/y"}, "/b", false, std::nullopt};
    history.record(first, SuccessResult{1, first, {"/a/y"}});
    history.record(second, SuccessResult{1, second, {"/b/y"}});

    ASSERT_TRUE(history.last().has_value());
    EXPECT_EQ(history.last()->operation, second);
    EXPECT_TRUE(history.can_undo());

    history.clear();
    EXPECT_FALSE(history.last().has_value());
}

TEST_F(UndoHistoryTest, IsUndoable_RejectsDeleteAndFailures) {
    const Operation del = DeleteOperation{{"/a"}, true};
    EXPECT_FALSE(UndoHistory::is_undoable(Entry(del, SuccessResult{1, del, {}})));

    const Operation copy = CopyOperation{{"/a"}, "/b", false, std::nullopt};
    EXPECT_FALSE(UndoHistory::is_undoable(Entry(copy, FailureResult{"x"})));
    EXPECT_FALSE(UndoHistory::is_undoable(Entry(copy, AuthenticationRequiredResult{"SMB", "x"})));
    EXPECT_TRUE(UndoHistory::is_undoable(
        Entry(copy, PartialSuccessResult{1, 1, {"e"}, {"/b/a"}})));
}

TEST_F(UndoHistoryTest, PlanUndo_Copy_HardDeletesExistingProducedFiles) {
    const Operation copy = CopyOperation{{"/s/a", "/s/b", "/s/c"}, "/d", false, std::nullopt};
    existing = {"/d/a", "/d/c"};

    auto plan = UndoHistory::plan_undo(
        Entry(copy, PartialSuccessResult{2, 1, {"b failed"}, {"/d/a", "/d/c"}}), Exists());

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], Operation(DeleteOperation{{"/d/a", "/d/c"}, false}));
}

TEST_F(UndoHistoryTest, PlanUndo_Copy_NothingLeft_IsEmpty) {
    const Operation copy = CopyOperation{{"/s/a"}, "/d", false, std::nullopt};

    EXPECT_TRUE(UndoHistory::plan_undo(Entry(copy, SuccessResult{1, copy, {"/d/a"}}), Exists())
                    .empty());
}

TEST_F(UndoHistoryTest, PlanUndo_Copy_WithoutProducedPaths_DerivesThem) {
    const Operation copy = CopyOperation{{"/s/a"}, "/d", false, std::nullopt};
    existing = {"/d/a"};

    auto plan = UndoHistory::plan_undo(Entry(copy, SuccessResult{1, copy, {}}), Exists());

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(std::get<DeleteOperation>(plan[0]).files, std::vector<std::string>{"/d/a"});
}

// Test: a move is undone with one overwriting move per original parent
TEST_F(UndoHistoryTest, PlanUndo_Move_GroupsByOriginalParent) {
    const Operation move =
        MoveOperation{{"/x/a", "/y/b", "/x/c"}, "smb://nas/share", false, std::string("cred")};
    existing = {"smb://nas/share/a", "smb://nas/share/b", "smb://nas/share/c"};

    auto plan = UndoHistory::plan_undo(
        Entry(move, SuccessResult{3, move,
                                  {"smb://nas/share/a", "smb://nas/share/b", "smb://nas/share/c"}}),
        Exists());

    ASSERT_EQ(plan.size(), 2u);
    const auto& to_x = std::get<MoveOperation>(plan[0]);
    const auto& to_y = std::get<MoveOperation>(plan[1]);
    EXPECT_EQ(to_x.destination, "/x");
    EXPECT_THAT(to_x.sources, testing::ElementsAre("smb://nas/share/a", "smb://nas/share/c"));
    EXPECT_TRUE(to_x.overwrite);
    EXPECT_EQ(to_x.source_credentials_id, std::optional<std::string>("cred"));
    EXPECT_EQ(to_y.destination, "/y");
    EXPECT_THAT(to_y.sources, testing::ElementsAre("smb://nas/share/b"));
}

TEST_F(UndoHistoryTest, PlanUndo_Move_UsesRecordedSourcePairing) {
    const Operation move = MoveOperation{{"/a/x.jpg", "/b/x.jpg"}, "/dst", false, std::nullopt};
    existing = {"/dst/x.jpg"};

    auto plan = UndoHistory::plan_undo(
        Entry(move, PartialSuccessResult{1, 1, {"x.jpg not found"}, {"/dst/x.jpg"}, {"/b/x.jpg"}}),
        Exists());

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(std::get<MoveOperation>(plan[0]).destination, "/b");
    EXPECT_THAT(std::get<MoveOperation>(plan[0]).sources, testing::ElementsAre("/dst/x.jpg"));
}

TEST_F(UndoHistoryTest, PlanUndo_Move_AmbiguousNameWithoutPairing_IsSkipped) {
    const Operation move = MoveOperation{{"/a/x.jpg", "/b/x.jpg"}, "/dst", false, std::nullopt};
    existing = {"/dst/x.jpg"};

    EXPECT_TRUE(UndoHistory::plan_undo(
                    Entry(move, PartialSuccessResult{1, 1, {"x.jpg not found"}, {"/dst/x.jpg"}}),
                    Exists())
                    .empty());
}

TEST_F(UndoHistoryTest, PlanUndo_Rename_RenamesBack) {
    const Operation rename = RenameOperation{"/dir/old.txt", "new.txt"};
    existing = {"/dir/new.txt"};

    auto plan = UndoHistory::plan_undo(Entry(rename, SuccessResult{1, rename, {"/dir/new.txt"}}),
                                       Exists());

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], Operation(RenameOperation{"/dir/new.txt", "old.txt"}));

    existing.clear();
    EXPECT_TRUE(UndoHistory::plan_undo(Entry(rename, SuccessResult{1, rename, {"/dir/new.txt"}}),
                                       Exists())
                    .empty());
}

TEST_F(UndoHistoryTest, Combine_MergesStepResults) {
    const Operation a = MoveOperation{{"/d/a"}, "/x", true, std::nullopt};
    const Operation b = MoveOperation{{"/d/b", "/d/c"}, "/y", true, std::nullopt};

    auto combined = UndoHistory::combine({
        {a, SuccessResult{1, a, {"/x/a"}, {"/d/a"}}},
        {b, PartialSuccessResult{1, 1, {"c not found"}, {"/y/b"}, {"/d/b"}}},
    });

    ASSERT_TRUE(combined.has_value());
    ASSERT_TRUE(std::holds_alternative<PartialSuccessResult>(*combined));
    const auto& partial = std::get<PartialSuccessResult>(*combined);
    EXPECT_EQ(partial.processed_count, 2u);
    EXPECT_EQ(partial.failed_count, 1u);
    EXPECT_THAT(partial.errors, testing::ElementsAre("c not found"));
    EXPECT_THAT(partial.produced_paths, testing::ElementsAre("/x/a", "/y/b"));
    EXPECT_THAT(partial.source_paths, testing::ElementsAre("/d/a", "/d/b"));
}

TEST_F(UndoHistoryTest, Combine_EdgeCases) {
    EXPECT_FALSE(UndoHistory::combine({}).has_value());

    const Operation a = DeleteOperation{{"/d/a"}, false};
    const OperationResult only = SuccessResult{1, a, {"/d/a"}};
    EXPECT_EQ(UndoHistory::combine({{a, only}}), only);

    const OperationResult auth = AuthenticationRequiredResult{"SMB", "expired"};
    EXPECT_EQ(UndoHistory::combine({{a, only}, {a, auth}}), auth);

    auto failed = UndoHistory::combine({{a, FailureResult{"one"}}, {a, FailureResult{"two"}}});
    ASSERT_TRUE(failed && std::holds_alternative<FailureResult>(*failed));
    EXPECT_EQ(std::get<FailureResult>(*failed).message, "Undo failed: one two");
}
