#include <gtest/gtest.h>
#include "agents/agent_manager.h"
#include "core/error.h"
#include "process/process_registry.h"
#include "support/fakes.h"
#include "workspace/git_project.h"

#include <algorithm>
#include <atomic>
#include <future>

using namespace easel;
using namespace easel::testing;
using namespace std::chrono_literals;

class AgentManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_canvas = project.ensure_default_canvas();

        Canvas c;
        c.id = "canvas-2";
        c.name = "Canvas 2 (canvas-abc)";
        c.session = LocalSession{"/src/app-abc"};
        project.add_canvas(std::move(c));
        fs.existing.insert("/src/app-abc");

        git.branches["/src/app-abc"] = "canvas-abc";
        git.conflicts = {"src/main.cpp"};
        drivers.registry = &registry;
        drivers.on_start = [this](const std::string&) {
            if (!started_flag.exchange(true)) {
                started.set_value();
            }
        };
    }

    BackgroundAgentManager& agents(AgentManagerOptions options = {}) {
        if (!agents_) {
            agents_ = std::make_unique<BackgroundAgentManager>(git, fs, registry, drivers.factory(), options);
        }
        return *agents_;
    }

    std::string merge() {
        auto result = project.merge_canvas_to_root("canvas-2", agents());
        EXPECT_TRUE(result.success) << result.error;
        return result.agent_id;
    }

    BackgroundAgent finished_agent(const std::string& id) {
        agents().wait_all();
        auto agent = project.background_agent(id);
        EXPECT_TRUE(agent.has_value());
        return agent.value_or(BackgroundAgent{});
    }

    const MergeAgentContext& context_of(const BackgroundAgent& agent) {
        return std::get<MergeAgentContext>(agent.context);
    }

    bool wait_for_driver() {
        return started_future.wait_for(5s) == std::future_status::ready;
    }

    GitProject project{LocalSession{"/src/app"}};
    FakeGitClient git;
    FakeFileSystem fs;
    ProcessRegistry registry;
    FakeDriverFactory drivers;
    std::string root_canvas;
    std::promise<void> started;
    std::future<void> started_future = started.get_future();
    std::atomic<bool> started_flag{false};
    std::unique_ptr<BackgroundAgentManager> agents_;
};

TEST_F(AgentManagerTest, CleanMergeNeedsNoDriver) {
    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(agent.status, AgentStatus::Completed);
    EXPECT_EQ(drivers.count(), 0u);
    EXPECT_EQ(project.lock_state("canvas-2"), CanvasLockState::Merged);
    EXPECT_EQ(project.canvas("canvas-2")->locking_agent_id, std::optional<std::string>(id));

    EXPECT_EQ(working_directory(agent.session).rfind("/src/app-merge-", 0), 0u);
    EXPECT_EQ(context_of(agent).root_branch, "main");
    EXPECT_EQ(context_of(agent).canvas_branch, "canvas-abc");
    ASSERT_EQ(fs.overlays.size(), 2u);
    EXPECT_EQ(fs.overlays[1].second, "/src/app");
}

TEST_F(AgentManagerTest, CanvasIsLockedBeforeTheWorkerRuns) {
    git.merge_succeeds = false;
    drivers.outcome = FakeDriver::Outcome::Hang;
    std::string id = merge();

    EXPECT_EQ(project.canvas("canvas-2")->locking_agent_id, std::optional<std::string>(id));
    EXPECT_FALSE(project.create_task("canvas-2", "sneaky edit").has_value());

    ASSERT_TRUE(wait_for_driver());
    agents().force_remove_agent(project, id);
    agents().wait_all();
}

TEST_F(AgentManagerTest, ConflictResolvedByOneAttempt) {
    git.merge_results = {false, true};

    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(agent.status, AgentStatus::Completed);
    ASSERT_EQ(drivers.count(), 1u);
    ASSERT_EQ(drivers.created[0]->prompts.size(), 1u);
    const std::string& prompt = drivers.created[0]->prompts[0];
    EXPECT_NE(prompt.find("Merge conflicts detected in: src/main.cpp"), std::string::npos);
    EXPECT_NE(prompt.find("Attempt 1 of 3."), std::string::npos);
    EXPECT_EQ(working_directory(drivers.created[0]->last_session), working_directory(agent.session));

    auto log = git.commit_log();
    ASSERT_GE(log.size(), 2u);
    EXPECT_EQ(log[1].second, "Resolved merge conflicts - attempt 1");
    EXPECT_EQ(project.lock_state("canvas-2"), CanvasLockState::Merged);
    EXPECT_FALSE(agent.driver_process_id.has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(AgentManagerTest, GivesUpAfterMaxAttempts) {
    git.merge_succeeds = false;

    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(agent.status, AgentStatus::Failed);
    EXPECT_EQ(agent.error_message, std::optional<std::string>("Failed to complete merge after 3 attempts"));
    EXPECT_EQ(drivers.count(), 3u);
    EXPECT_EQ(git.merge_count(), 4u);
    EXPECT_EQ(context_of(agent).merge_attempts, 3);

    auto canvas = project.canvas("canvas-2");
    EXPECT_EQ(canvas->lock_state, CanvasLockState::Normal);
    EXPECT_FALSE(canvas->locking_agent_id.has_value());
}

TEST_F(AgentManagerTest, NothingToCommitKeepsGoing) {
    git.commit_outcomes = {CommitOutcome::Committed, CommitOutcome::NothingToCommit};
    git.merge_results = {false, false, true};

    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(agent.status, AgentStatus::Completed);
    EXPECT_EQ(drivers.count(), 2u);
    EXPECT_NE(drivers.created[1]->prompts[0].find("Attempt 2 of 3."), std::string::npos);
}

TEST_F(AgentManagerTest, DriverFailureFailsTheAgent) {
    git.merge_succeeds = false;
    drivers.outcome = FakeDriver::Outcome::Fail;

    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(agent.status, AgentStatus::Failed);
    EXPECT_EQ(agent.error_message, std::optional<std::string>("Claude Code task failed: scripted failure"));
    EXPECT_TRUE(drivers.created[0]->cleaned_up);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(project.can_edit_canvas("canvas-2"));
}

TEST_F(AgentManagerTest, HungDriverTimesOut) {
    git.merge_succeeds = false;
    drivers.outcome = FakeDriver::Outcome::Hang;
    AgentManagerOptions options;
    options.attempt_timeout = 50ms;
    agents(options);

    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(agent.status, AgentStatus::Failed);
    EXPECT_EQ(agent.error_message, std::optional<std::string>("Claude Code process timed out"));
    EXPECT_EQ(drivers.count(), 1u);
    EXPECT_TRUE(project.can_edit_canvas("canvas-2"));
}

TEST_F(AgentManagerTest, SetupFailureUnlocksCanvas) {
    fs.copy_fails = true;

    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(agent.status, AgentStatus::Failed);
    EXPECT_EQ(agent.error_message, std::optional<std::string>("copy failed"));
    EXPECT_TRUE(project.can_edit_canvas("canvas-2"));
}

TEST_F(AgentManagerTest, ForceRemoveStopsDriverAndCleansUp) {
    git.merge_succeeds = false;
    drivers.outcome = FakeDriver::Outcome::Hang;
    std::string id = merge();
    ASSERT_TRUE(wait_for_driver());
    std::string work_dir = working_directory(project.background_agent(id)->session);

    agents().force_remove_agent(project, id);
    agents().wait_all();

    EXPECT_FALSE(project.background_agent(id).has_value());
    EXPECT_TRUE(project.can_edit_canvas("canvas-2"));
    EXPECT_EQ(drivers.created[0]->stops, 1);
    EXPECT_NE(std::find(fs.deleted.begin(), fs.deleted.end(), work_dir), fs.deleted.end());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(agents().poll(), 0u);
}

TEST_F(AgentManagerTest, ForceRemoveWorksWithoutARun) {
    BackgroundAgent stale;
    stale.id = "stale";
    stale.session = LocalSession{"/src/app-merge-old"};
    stale.context = MergeAgentContext{};
    project.add_background_agent(stale);

    agents().force_remove_agent(project, "stale");
    agents().force_remove_agent(project, "unknown");

    EXPECT_TRUE(project.background_agents().empty());
}

TEST_F(AgentManagerTest, LockedCanvasGetsNoAgent) {
    project.lock_canvas("canvas-2", CanvasLockState::Merging, std::string("someone-else"));

    EXPECT_THROW(agents().create_merge_agent(project, "canvas-2", {}), Error);
    EXPECT_TRUE(project.background_agents().empty());
    EXPECT_EQ(agents().running(), 0u);
}

TEST_F(AgentManagerTest, BranchDetectionFallsBackToMain) {
    git.detect_branch_fails = true;

    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(context_of(agent).root_branch, "main");
    EXPECT_EQ(context_of(agent).canvas_branch, "main");
}

TEST_F(AgentManagerTest, HistoricalPromptsTravelWithTheAgent) {
    auto task = project.create_task("canvas-2", "build the settings page");
    ASSERT_TRUE(task.has_value());

    std::string id = merge();
    auto agent = finished_agent(id);

    EXPECT_EQ(context_of(agent).historical_prompts, (std::vector<std::string>{"build the settings page"}));
}

TEST_F(AgentManagerTest, ShutdownCancelsRunningAgents) {
    git.merge_succeeds = false;
    drivers.outcome = FakeDriver::Outcome::Hang;
    std::string id = merge();
    ASSERT_TRUE(wait_for_driver());

    agents_.reset();

    auto agent = project.background_agent(id);
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent->status, AgentStatus::Failed);
    EXPECT_TRUE(project.can_edit_canvas("canvas-2"));
}

TEST(AgentManagerOptionsTest, ConfigValuesAreClamped) {
    AgentConfig config;
    config.max_attempts = 0;
    config.attempt_timeout_minutes = 5;

    auto options = AgentManagerOptions::from_config(config);

    EXPECT_EQ(options.max_attempts, 1);
    EXPECT_EQ(options.attempt_timeout, std::chrono::minutes(5));
}
