#include <gtest/gtest.h>
#include "workspace/task_ledger.h"

using namespace easel;

namespace {

// Creates, starts and completes a task in one go.
std::string finished(TaskLedger& ledger, const std::string& prompt, const std::string& hash) {
    std::string id = ledger.create_prompting_task(prompt);
    ledger.start_task(id);
    ledger.complete_task(id, hash);
    return id;
}

bool reverted(const TaskLedger& ledger, const std::string& id) {
    return std::get<CompletedTask>(*ledger.task(id)).is_reverted;
}

}

TEST(TaskLedgerTest, TasksOnlyMoveForward) {
    TaskLedger ledger;
    std::string id = ledger.create_prompting_task("add logging");

    EXPECT_FALSE(ledger.complete_task(id, "abc"));
    EXPECT_TRUE(ledger.start_task(id, std::string("proc-1")));
    EXPECT_FALSE(ledger.start_task(id));
    EXPECT_EQ(ledger.current_in_progress_task()->process_id, std::optional<std::string>("proc-1"));

    EXPECT_TRUE(ledger.complete_task(id, "abc"));
    EXPECT_FALSE(ledger.complete_task(id, "def"));
    EXPECT_STREQ(task_status_name(*ledger.task(id)), "completed");
    EXPECT_EQ(std::get<CompletedTask>(*ledger.task(id)).commit_hash, "abc");
}

TEST(TaskLedgerTest, UnknownIdsAreRejected) {
    TaskLedger ledger;
    EXPECT_FALSE(ledger.start_task("nope"));
    EXPECT_FALSE(ledger.complete_task("nope", "x"));
    EXPECT_FALSE(ledger.update_task_prompt("nope", "x"));
    EXPECT_FALSE(ledger.revert_task("nope"));
    EXPECT_FALSE(ledger.restore_task("nope"));
    EXPECT_EQ(ledger.task("nope"), nullptr);
}

TEST(TaskLedgerTest, OnlyPromptingTasksCanBeEdited) {
    TaskLedger ledger;
    std::string id = ledger.create_prompting_task("draft");

    EXPECT_TRUE(ledger.update_task_prompt(id, "final"));
    EXPECT_EQ(ledger.current_prompting_task()->prompt, "final");

    ledger.start_task(id);
    EXPECT_FALSE(ledger.update_task_prompt(id, "too late"));
    EXPECT_EQ(task_prompt(*ledger.task(id)), "final");
}

TEST(TaskLedgerTest, CurrentTaskIsTheMostRecent) {
    TaskLedger ledger;
    ledger.create_prompting_task("one");
    ledger.create_prompting_task("two");

    EXPECT_EQ(ledger.current_prompting_task()->prompt, "two");
    EXPECT_FALSE(ledger.current_in_progress_task().has_value());
    EXPECT_EQ(ledger.prompting_tasks().size(), 2u);
}

TEST(TaskLedgerTest, RevertCascadesForward) {
    TaskLedger ledger;
    std::string a = finished(ledger, "a", "h1");
    std::string b = finished(ledger, "b", "h2");
    std::string c = finished(ledger, "c", "h3");

    EXPECT_TRUE(ledger.revert_task(b));

    EXPECT_FALSE(reverted(ledger, a));
    EXPECT_TRUE(reverted(ledger, b));
    EXPECT_TRUE(reverted(ledger, c));
    EXPECT_EQ(ledger.revertable_commits().size(), 1u);
    EXPECT_EQ(ledger.restorable_commits().size(), 2u);
}

TEST(TaskLedgerTest, RestoreCascadesBackward) {
    TaskLedger ledger;
    std::string a = finished(ledger, "a", "h1");
    std::string b = finished(ledger, "b", "h2");
    std::string c = finished(ledger, "c", "h3");
    ledger.revert_task(a);

    EXPECT_TRUE(ledger.restore_task(b));

    EXPECT_FALSE(reverted(ledger, a));
    EXPECT_FALSE(reverted(ledger, b));
    EXPECT_TRUE(reverted(ledger, c));
}

TEST(TaskLedgerTest, RestoringTheRevertedTaskLeavesLaterTasksReverted) {
    TaskLedger ledger;
    std::string a = finished(ledger, "a", "h1");
    std::string b = finished(ledger, "b", "h2");
    std::string c = finished(ledger, "c", "h3");

    EXPECT_TRUE(ledger.revert_task(b));
    EXPECT_TRUE(ledger.restore_task(b));

    EXPECT_FALSE(reverted(ledger, a));
    EXPECT_FALSE(reverted(ledger, b));
    EXPECT_TRUE(reverted(ledger, c));
    EXPECT_EQ(ledger.restorable_commits().size(), 1u);
}

TEST(TaskLedgerTest, RevertTargetSkipsTasksWithoutCommits) {
    TaskLedger ledger;
    std::string a = finished(ledger, "a", "h1");
    std::string b = finished(ledger, "b", NO_CHANGES);
    std::string c = finished(ledger, "c", "");
    std::string d = finished(ledger, "d", "h4");

    EXPECT_EQ(ledger.revert_target_commit(d), std::optional<std::string>("h1"));
    EXPECT_EQ(ledger.revert_target_commit(b), std::optional<std::string>("h1"));
    EXPECT_EQ(ledger.revert_target_commit(a), std::optional<std::string>(BEFORE_FIRST_COMMIT));
    EXPECT_FALSE(ledger.revert_target_commit("missing").has_value());
    (void)c;
}

TEST(TaskLedgerTest, TasksWithoutRealCommitsAreNeitherRevertableNorRestorable) {
    TaskLedger ledger;
    std::string a = finished(ledger, "a", NO_CHANGES);
    finished(ledger, "b", "");

    EXPECT_TRUE(ledger.revertable_commits().empty());
    ledger.revert_task(a);
    EXPECT_TRUE(ledger.restorable_commits().empty());
    EXPECT_TRUE(is_real_commit("abc123"));
    EXPECT_FALSE(is_real_commit(NO_CHANGES));
    EXPECT_FALSE(is_real_commit(""));
}

TEST(TaskLedgerTest, PromptsSkipEmptyOnes) {
    TaskLedger ledger;
    ledger.create_prompting_task("first");
    ledger.create_prompting_task("");
    finished(ledger, "second", "h");

    EXPECT_EQ(ledger.prompts(), (std::vector<std::string>{"first", "second"}));
}

TEST(TaskLedgerTest, JsonKeepsEveryState) {
    TaskLedger ledger;
    ledger.create_prompting_task("waiting");
    std::string running = ledger.create_prompting_task("running");
    ledger.start_task(running, std::string("proc-9"));
    std::string done = finished(ledger, "done", "cafe");
    ledger.revert_task(done);

    TaskLedger loaded = TaskLedger::from_json(ledger.to_json());

    ASSERT_EQ(loaded.tasks().size(), 3u);
    EXPECT_STREQ(task_status_name(loaded.tasks()[0]), "prompting");
    EXPECT_EQ(loaded.current_in_progress_task()->process_id, std::optional<std::string>("proc-9"));
    const auto& completed = std::get<CompletedTask>(loaded.tasks()[2]);
    EXPECT_EQ(completed.commit_hash, "cafe");
    EXPECT_TRUE(completed.is_reverted);
}

TEST(TaskLedgerTest, MissingFieldsLoadWithDefaults) {
    auto j = nlohmann::json::parse(R"({"tasks": [
        {"id": "t1", "prompt": "old", "status": "completed", "createdAt": 5},
        {"id": "t2", "prompt": "no status"}
    ]})");

    TaskLedger loaded = TaskLedger::from_json(j);

    const auto& first = std::get<CompletedTask>(loaded.tasks()[0]);
    EXPECT_EQ(first.started_at, 5);
    EXPECT_EQ(first.commit_hash, "");
    EXPECT_FALSE(first.is_reverted);
    EXPECT_STREQ(task_status_name(loaded.tasks()[1]), "prompting");
}
