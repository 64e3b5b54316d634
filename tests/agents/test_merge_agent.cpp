#include <gtest/gtest.h>
#include "agents/merge_agent.h"
#include "core/error.h"
#include "support/fakes.h"

using namespace easel;
using namespace easel::testing;

namespace {

const std::string ROOT = "/src/app";
const std::string CANVAS = "/src/app-abc";
const std::string WORK = "/src/app-merge-x";

BackgroundAgent make_agent() {
    MergeAgentContext ctx;
    ctx.root_session = LocalSession{ROOT};
    ctx.canvas_session = LocalSession{CANVAS};
    ctx.historical_prompts = {"add login page", "style the header"};
    ctx.root_branch = "main";
    ctx.canvas_branch = "canvas-abc";

    BackgroundAgent agent;
    agent.id = "agent-1";
    agent.session = LocalSession{WORK};
    agent.context = ctx;
    return agent;
}

}

class MergeAgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs.existing.insert(CANVAS);
        agent.set_status_listener([this](const BackgroundAgent& a) { published.push_back(a); });
    }

    FakeGitClient git;
    FakeFileSystem fs;
    MergeAgent agent{make_agent(), git, fs};
    std::vector<BackgroundAgent> published;
};

TEST_F(MergeAgentTest, SetupCommitsCanvasOnSideBranch) {
    agent.setup();

    ASSERT_EQ(fs.copies.size(), 1u);
    EXPECT_EQ(fs.copies[0], std::make_pair(ROOT, WORK));
    ASSERT_EQ(git.created_branches.size(), 1u);
    EXPECT_EQ(git.created_branches[0], std::make_pair(WORK, std::string(CANVAS_CHANGES_BRANCH)));
    ASSERT_EQ(fs.overlays.size(), 1u);
    EXPECT_EQ(fs.overlays[0], std::make_pair(CANVAS, WORK));
    EXPECT_TRUE(fs.overlays_excluded_git);
    ASSERT_EQ(git.commits.size(), 1u);
    EXPECT_EQ(git.commits[0].second, "Apply changes from canvas branch canvas-abc");
    EXPECT_EQ(git.branches[WORK], "main");

    EXPECT_EQ(agent.state().status, AgentStatus::Checking);
    EXPECT_EQ(agent.state().progress, std::optional<std::string>("Checking for merge conflicts..."));
    ASSERT_GE(published.size(), 2u);
    EXPECT_EQ(published.front().status, AgentStatus::Initializing);
}

TEST_F(MergeAgentTest, SetupFailsWhenCanvasIsGone) {
    fs.existing.clear();

    EXPECT_THROW(agent.setup(), FileSystemError);
    EXPECT_TRUE(fs.copies.empty());
}

TEST_F(MergeAgentTest, SetupKeepsCurrentBranchWhenRootBranchIsMissing) {
    git.branches[WORK] = "develop";
    git.failing_checkouts.insert("main");

    agent.setup();

    EXPECT_EQ(agent.context().root_branch, "develop");
    EXPECT_EQ(git.branches[WORK], "develop");
}

TEST_F(MergeAgentTest, SetupToleratesEmptyCanvasCommit) {
    git.commit_fails = true;
    EXPECT_NO_THROW(agent.setup());
    EXPECT_EQ(agent.state().status, AgentStatus::Checking);
}

TEST_F(MergeAgentTest, CleanMergeIsComplete) {
    auto check = agent.check_completion();

    EXPECT_TRUE(check.complete);
    EXPECT_FALSE(check.new_context.has_value());
    ASSERT_EQ(git.merges.size(), 1u);
    EXPECT_EQ(git.merges[0], std::make_pair(std::string(CANVAS_CHANGES_BRANCH), std::string("main")));
}

TEST_F(MergeAgentTest, ConflictsProduceNextContext) {
    git.merge_succeeds = false;
    git.conflicts = {"src/a.cpp", "src/b.h"};

    auto check = agent.check_completion();

    EXPECT_FALSE(check.complete);
    ASSERT_TRUE(check.new_context.has_value());
    EXPECT_EQ(check.new_context->merge_attempts, 1);
    EXPECT_EQ(check.new_context->conflict_files, git.conflicts);
    EXPECT_EQ(check.instructions,
              "Merge conflicts detected in: src/a.cpp, src/b.h. Please resolve all conflicts in these files by "
              "editing them directly. Do NOT run any git commands - only edit the files to resolve conflicts.");
    EXPECT_EQ(agent.context().merge_attempts, 0);
}

TEST_F(MergeAgentTest, FailureWithoutConflictsThrows) {
    git.merge_succeeds = false;
    EXPECT_THROW(agent.check_completion(), GitError);
}

TEST_F(MergeAgentTest, PromptCarriesHistoryAndConflicts) {
    auto ctx = agent.context();
    ctx.conflict_files = {"a.cpp", "b.h"};
    ctx.merge_attempts = 1;
    agent.apply_context(ctx);

    std::string prompt = agent.generate_prompt();

    EXPECT_NE(prompt.find("1. add login page\n2. style the header"), std::string::npos);
    EXPECT_NE(prompt.find("- a.cpp\n- b.h"), std::string::npos);
    EXPECT_NE(prompt.find("preserving the intent of both versions"), std::string::npos);
    EXPECT_NE(prompt.find("FILES WITH CONFLICTS: a.cpp, b.h"), std::string::npos);
    EXPECT_NE(prompt.find("Attempt 1 of 3."), std::string::npos);
    EXPECT_NE(prompt.find("DO NOT run any git commands"), std::string::npos);
}

TEST_F(MergeAgentTest, RetryInstructionsReplaceDefaultGuidance) {
    std::string prompt = agent.generate_prompt("Fix the markers in x.cpp");

    EXPECT_NE(prompt.find("Fix the markers in x.cpp"), std::string::npos);
    EXPECT_EQ(prompt.find("preserving the intent of both versions"), std::string::npos);
}

TEST_F(MergeAgentTest, FinalizeCopiesResultToRoot) {
    agent.finalize();

    ASSERT_EQ(git.commits.size(), 1u);
    EXPECT_EQ(git.commits[0].second, "Merge canvas changes: resolved conflicts automatically");
    ASSERT_EQ(fs.overlays.size(), 1u);
    EXPECT_EQ(fs.overlays[0], std::make_pair(WORK, ROOT));
    EXPECT_EQ(agent.state().status, AgentStatus::Completed);
    EXPECT_EQ(agent.state().progress, std::optional<std::string>("Merge completed successfully"));
}

TEST_F(MergeAgentTest, FinalizeSurvivesNothingToCommit) {
    git.commit_fails = true;
    EXPECT_NO_THROW(agent.finalize());
    EXPECT_EQ(fs.overlays.size(), 1u);
}

TEST_F(MergeAgentTest, DriverProcessIsPublished) {
    agent.set_driver_process(std::string("proc-7"));

    ASSERT_FALSE(published.empty());
    EXPECT_EQ(published.back().driver_process_id, std::optional<std::string>("proc-7"));
}
