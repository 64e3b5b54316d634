#include <gtest/gtest.h>
#include "process/process_registry.h"
#include "support/fakes.h"
#include "workspace/git_project.h"
#include "workspace/task_runner.h"

using namespace easel;
using namespace easel::testing;

class TaskRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        canvas_id = project.ensure_default_canvas();
        drivers.registry = &registry;
    }

    TaskRunner& runner() {
        if (!runner_) {
            runner_ = std::make_unique<TaskRunner>(project, git, registry, drivers.factory());
        }
        return *runner_;
    }

    const Task* task(const std::string& id) {
        canvas_copy = project.canvas(canvas_id);
        return canvas_copy->ledger.task(id);
    }

    std::string commit_of(const std::string& id) {
        return std::get<CompletedTask>(*task(id)).commit_hash;
    }

    bool is_reverted(const std::string& id) {
        return std::get<CompletedTask>(*task(id)).is_reverted;
    }

    GitProject project{LocalSession{"/src/app"}};
    FakeGitClient git;
    ProcessRegistry registry;
    FakeDriverFactory drivers;
    std::string canvas_id;
    std::optional<Canvas> canvas_copy;
    std::unique_ptr<TaskRunner> runner_;
};

TEST_F(TaskRunnerTest, CompletedTaskIsCommittedWithItsPrompt) {
    auto result = runner().submit(canvas_id, "el-1", "  add logging \n");

    ASSERT_TRUE(result.success) << result.error;
    ASSERT_EQ(git.commits.size(), 1u);
    EXPECT_EQ(git.commits[0].first, "/src/app");
    EXPECT_EQ(git.commits[0].second, "add logging");
    EXPECT_EQ(commit_of(result.task_id), "hash-1");
    EXPECT_EQ(drivers.created[0]->prompts, (std::vector<std::string>{"add logging"}));

    auto process = project.process_by_element(canvas_id, "el-1");
    ASSERT_TRUE(process.has_value());
    EXPECT_EQ(process->process_id, result.process_id);
    EXPECT_EQ(process->terminal_id, "fake-terminal");
    EXPECT_EQ(process->status, ProcessStatus::Finished);
    EXPECT_EQ(registry.lookup_terminal("el-1"), std::optional<std::string>("fake-terminal"));
    EXPECT_NE(registry.get(result.process_id), nullptr);
}

TEST_F(TaskRunnerTest, EmptyPromptIsRefused) {
    auto result = runner().submit(canvas_id, "el-1", " \t\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Prompt is empty");
    EXPECT_EQ(drivers.count(), 0u);
}

TEST_F(TaskRunnerTest, UnknownCanvasIsRefused) {
    EXPECT_EQ(runner().submit("nope", "el-1", "x").error, "Canvas not found");
}

TEST_F(TaskRunnerTest, LockedCanvasIsRefused) {
    project.lock_canvas(canvas_id, CanvasLockState::Merging, std::string("agent"));

    auto result = runner().submit(canvas_id, "el-1", "change it");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Canvas is currently merging");
}

TEST_F(TaskRunnerTest, OneTaskInProgressPerCanvas) {
    drivers.outcome = FakeDriver::Outcome::Hang;
    ASSERT_TRUE(runner().submit(canvas_id, "el-1", "first").success);
    EXPECT_TRUE(runner().has_active_task());

    auto second = runner().submit(canvas_id, "el-2", "second");
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.error, "A task is already in progress on this canvas");
}

TEST_F(TaskRunnerTest, PromptingTaskIsReused) {
    auto draft = project.create_task(canvas_id, "draft");

    auto result = runner().submit(canvas_id, "el-1", "final wording");

    EXPECT_EQ(result.task_id, *draft);
    EXPECT_EQ(task_prompt(*task(*draft)), "final wording");
    EXPECT_EQ(project.canvas(canvas_id)->ledger.tasks().size(), 1u);
}

TEST_F(TaskRunnerTest, NoChangesIsRecorded) {
    git.commit_outcomes.push_back(CommitOutcome::NothingToCommit);

    auto result = runner().submit(canvas_id, "el-1", "just look around");
    EXPECT_EQ(commit_of(result.task_id), NO_CHANGES);
}

TEST_F(TaskRunnerTest, FailedCommitStillCompletesTask) {
    git.commit_fails = true;

    auto result = runner().submit(canvas_id, "el-1", "break git");
    EXPECT_STREQ(task_status_name(*task(result.task_id)), "completed");
    EXPECT_EQ(commit_of(result.task_id), "");
}

TEST_F(TaskRunnerTest, ReadySessionIsReusedForTheSameElement) {
    auto first = runner().submit(canvas_id, "el-1", "one");
    auto second = runner().submit(canvas_id, "el-1", "two");

    ASSERT_TRUE(second.success);
    EXPECT_EQ(drivers.count(), 1u);
    EXPECT_EQ(drivers.created[0]->prompts.size(), 2u);
    EXPECT_EQ(registry.get(first.process_id), nullptr);
    EXPECT_NE(registry.get(second.process_id), nullptr);
    EXPECT_EQ(commit_of(second.task_id), "hash-2");
}

TEST_F(TaskRunnerTest, ElementsGetTheirOwnDrivers) {
    runner().submit(canvas_id, "el-1", "one");
    runner().submit(canvas_id, "el-2", "two");

    EXPECT_EQ(drivers.count(), 2u);
    EXPECT_NE(runner().driver(canvas_id, "el-1"), runner().driver(canvas_id, "el-2"));
}

TEST_F(TaskRunnerTest, DriverFailureReleasesTheCanvas) {
    drivers.outcome = FakeDriver::Outcome::Fail;

    auto result = runner().submit(canvas_id, "el-1", "doomed");

    EXPECT_STREQ(task_status_name(*task(result.task_id)), "completed");
    EXPECT_EQ(commit_of(result.task_id), "");
    EXPECT_EQ(project.process_by_element(canvas_id, "el-1")->status, ProcessStatus::Error);
    EXPECT_EQ(registry.get(result.process_id), nullptr);
    EXPECT_TRUE(drivers.created[0]->cleaned_up);
    EXPECT_EQ(runner().driver(canvas_id, "el-1"), nullptr);
    EXPECT_TRUE(git.commits.empty());

    drivers.outcome = FakeDriver::Outcome::Complete;
    EXPECT_TRUE(runner().submit(canvas_id, "el-1", "retry").success);
}

TEST_F(TaskRunnerTest, StopClosesTheTaskWithoutCommit) {
    drivers.outcome = FakeDriver::Outcome::Hang;
    auto result = runner().submit(canvas_id, "el-1", "long job");

    EXPECT_TRUE(runner().stop(canvas_id, "el-1"));

    EXPECT_EQ(drivers.created[0]->stops, 1);
    EXPECT_EQ(commit_of(result.task_id), "");
    EXPECT_EQ(project.process_by_element(canvas_id, "el-1")->status, ProcessStatus::Finished);
    EXPECT_FALSE(runner().has_active_task());
    EXPECT_NE(runner().driver(canvas_id, "el-1"), nullptr);
    EXPECT_FALSE(runner().stop(canvas_id, "el-unknown"));
}

TEST_F(TaskRunnerTest, CleanupForgetsTheElement) {
    drivers.outcome = FakeDriver::Outcome::Hang;
    auto result = runner().submit(canvas_id, "el-1", "long job");

    EXPECT_TRUE(runner().cleanup(canvas_id, "el-1"));

    EXPECT_TRUE(drivers.created[0]->cleaned_up);
    EXPECT_TRUE(project.canvas_processes(canvas_id).empty());
    EXPECT_EQ(registry.get(result.process_id), nullptr);
    EXPECT_FALSE(registry.lookup_terminal("el-1").has_value());
    EXPECT_EQ(commit_of(result.task_id), "");
    EXPECT_FALSE(runner().cleanup(canvas_id, "el-1"));
}

TEST_F(TaskRunnerTest, RevertResetsToThePreviousCommit) {
    auto first = runner().submit(canvas_id, "el-1", "one");
    auto second = runner().submit(canvas_id, "el-1", "two");

    auto result = runner().revert(canvas_id, second.task_id);

    ASSERT_TRUE(result.success) << result.error;
    ASSERT_EQ(git.resets.size(), 1u);
    EXPECT_EQ(git.resets[0].second, "hash-1");
    EXPECT_TRUE(is_reverted(second.task_id));
    EXPECT_FALSE(is_reverted(first.task_id));
}

TEST_F(TaskRunnerTest, RevertingTheFirstTaskGoesBeforeIt) {
    auto first = runner().submit(canvas_id, "el-1", "one");
    auto second = runner().submit(canvas_id, "el-1", "two");

    ASSERT_TRUE(runner().revert(canvas_id, first.task_id).success);
    EXPECT_EQ(git.resets[0].second, "hash-1~1");
    EXPECT_TRUE(is_reverted(first.task_id));
    EXPECT_TRUE(is_reverted(second.task_id));
}

TEST_F(TaskRunnerTest, RevertPastUnchangedTasksGoesBeforeTheOldestCommit) {
    git.commit_outcomes.push_back(CommitOutcome::NothingToCommit);
    runner().submit(canvas_id, "el-1", "look around");
    auto second = runner().submit(canvas_id, "el-1", "two");
    runner().submit(canvas_id, "el-1", "three");

    ASSERT_TRUE(runner().revert(canvas_id, second.task_id).success);
    ASSERT_EQ(git.resets.size(), 1u);
    EXPECT_EQ(git.resets[0].second, "hash-2~1");
}

TEST_F(TaskRunnerTest, RestoreResetsToTheTasksOwnCommit) {
    auto first = runner().submit(canvas_id, "el-1", "one");
    auto second = runner().submit(canvas_id, "el-1", "two");
    runner().revert(canvas_id, first.task_id);

    ASSERT_TRUE(runner().restore(canvas_id, second.task_id).success);

    EXPECT_EQ(git.resets.back().second, "hash-2");
    EXPECT_FALSE(is_reverted(first.task_id));
    EXPECT_FALSE(is_reverted(second.task_id));
}

TEST_F(TaskRunnerTest, TasksWithoutCommitCannotBeRevertedOrRestored) {
    git.commit_outcomes.push_back(CommitOutcome::NothingToCommit);
    auto result = runner().submit(canvas_id, "el-1", "no-op");

    EXPECT_EQ(runner().revert(canvas_id, result.task_id).error, "Task has no commit to revert");
    EXPECT_EQ(runner().restore(canvas_id, result.task_id).error, "Task has no commit to restore");
    EXPECT_TRUE(git.resets.empty());
}

TEST_F(TaskRunnerTest, FailedResetLeavesLedgerAlone) {
    auto result = runner().submit(canvas_id, "el-1", "one");
    git.reset_fails = true;

    auto reverted = runner().revert(canvas_id, result.task_id);

    EXPECT_FALSE(reverted.success);
    EXPECT_EQ(reverted.error, "git reset failed");
    EXPECT_FALSE(is_reverted(result.task_id));
}

TEST_F(TaskRunnerTest, RevertIsRefusedWhileBusyOrLocked) {
    auto done = runner().submit(canvas_id, "el-1", "one");
    drivers.outcome = FakeDriver::Outcome::Hang;
    runner().submit(canvas_id, "el-2", "two");

    EXPECT_EQ(runner().revert(canvas_id, done.task_id).error, "Cannot revert while a task is in progress");
    runner().cleanup(canvas_id, "el-2");

    project.lock_canvas(canvas_id, CanvasLockState::Merging, std::string("agent"));
    EXPECT_EQ(runner().revert(canvas_id, done.task_id).error, "Canvas is currently merging");
    EXPECT_EQ(runner().restore(canvas_id, done.task_id).error, "Canvas is currently merging");
}
