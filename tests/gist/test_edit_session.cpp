#include <gtest/gtest.h>
#include <gist/edit_session.hpp>

#include "test_fakes.hpp"

#include <csignal>
#include <sstream>

using namespace gist;
using namespace gist::test;

class EditSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_root_ = fs::temp_directory_path() / "gist_edit_test";
        fs::remove_all(scratch_root_);
        fs::create_directories(scratch_root_);

        vcs_.remote_files = {{"notes.md", "# notes\n"}, {"run.sh", "echo hi\n"}};
    }

    void TearDown() override {
        fs::remove_all(scratch_root_);
    }

    Result<EditState> run_session(EditSession& session) {
        session.set_scratch_parent(scratch_root_);
        return session.run("abc123", "vim");
    }

    bool scratch_is_empty() const {
        return fs::is_empty(scratch_root_);
    }

    fs::path scratch_root_;
    FakeVcs vcs_;
    FakeLauncher launcher_;
    NullLogger logger_;
};

// ============================================================================
// Terminal states
// ============================================================================

TEST_F(EditSessionTest, NoChangesMeansNoRemoteWrites) {
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer);

    auto result = run_session(session);
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), EditState::NO_CHANGES);

    EXPECT_EQ(vcs_.clone_calls, 1);
    EXPECT_EQ(vcs_.commit_calls, 0);
    EXPECT_TRUE(vcs_.pushes.empty());
    EXPECT_TRUE(confirmer.questions.empty());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, ConfirmedChangeIsPushedOnce) {
    launcher_.on_launch = [](const fs::path& repo) {
        write_file(repo / "run.sh", "echo bye\n");
    };
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer);

    auto result = run_session(session);
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), EditState::PUSHED);

    EXPECT_EQ(vcs_.commit_calls, 1);
    ASSERT_EQ(vcs_.pushes.size(), 1);
    EXPECT_EQ(vcs_.pushes[0].at("run.sh"), "echo bye\n");
    EXPECT_EQ(vcs_.pushes[0].at("notes.md"), "# notes\n");
    EXPECT_EQ(confirmer.questions.size(), 1);
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, DeclinedChangeIsDiscarded) {
    launcher_.on_launch = [](const fs::path& repo) {
        write_file(repo / "notes.md", "rewritten\n");
    };
    FakeConfirmer confirmer(false);
    EditSession session(vcs_, launcher_, confirmer);

    auto result = run_session(session);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), EditState::DISCARDED);

    EXPECT_EQ(vcs_.commit_calls, 0);
    EXPECT_TRUE(vcs_.pushes.empty());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, AddedAndDeletedFilesCountAsChanges) {
    launcher_.on_launch = [](const fs::path& repo) {
        fs::remove(repo / "run.sh");
        write_file(repo / "new.txt", "new\n");
    };
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer);

    auto result = run_session(session);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(vcs_.pushes.size(), 1);
    EXPECT_EQ(vcs_.pushes[0], (FileMap{{"notes.md", "# notes\n"}, {"new.txt", "new\n"}}));
}

// ============================================================================
// Editor invocation
// ============================================================================

TEST_F(EditSessionTest, EditorRunsInsideClone) {
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer);

    ASSERT_TRUE(run_session(session).ok());
    ASSERT_EQ(launcher_.targets.size(), 1);
    EXPECT_EQ(launcher_.editors[0], "vim");
    EXPECT_EQ(launcher_.targets[0], vcs_.last_clone_dest);
    EXPECT_EQ(launcher_.cwds[0], vcs_.last_clone_dest);
    EXPECT_EQ(launcher_.targets[0].filename(), "abc123");
}

TEST_F(EditSessionTest, NonZeroEditorExitStillChecksChanges) {
    launcher_.exit_code = 130;
    launcher_.on_launch = [](const fs::path& repo) {
        write_file(repo / "notes.md", "edited before interrupt\n");
    };
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer, &logger_);

    auto result = run_session(session);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), EditState::PUSHED);
}

// ============================================================================
// Failures and cleanup
// ============================================================================

TEST_F(EditSessionTest, CloneFailureAbortsBeforeEditor) {
    vcs_.fail_clone = true;
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer);

    auto result = run_session(session);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::REMOTE_ERROR);
    EXPECT_EQ(session.state(), EditState::INITIAL);
    EXPECT_TRUE(launcher_.targets.empty());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, EditorLaunchFailureCleansUp) {
    launcher_.fail_launch = true;
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer);

    auto result = run_session(session);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::IO_ERROR);
    EXPECT_TRUE(vcs_.pushes.empty());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, StatusFailureCleansUp) {
    vcs_.fail_status = true;
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer, &logger_);

    auto result = run_session(session);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::IO_ERROR);
    EXPECT_TRUE(confirmer.questions.empty());
    EXPECT_EQ(vcs_.commit_calls, 0);
    EXPECT_TRUE(vcs_.pushes.empty());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, CommitFailureCleansUp) {
    vcs_.fail_commit = true;
    launcher_.on_launch = [](const fs::path& repo) {
        write_file(repo / "notes.md", "# edited\n");
    };
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer, &logger_);

    auto result = run_session(session);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::IO_ERROR);
    EXPECT_EQ(session.state(), EditState::CHANGES_DETECTED);
    EXPECT_EQ(vcs_.commit_calls, 1);
    EXPECT_TRUE(vcs_.pushes.empty());
    EXPECT_FALSE(session.preserved_directory().has_value());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, InterruptAtPromptCleansUp) {
    launcher_.on_launch = [](const fs::path& repo) {
        write_file(repo / "notes.md", "# unsaved work\n");
    };
    FakeConfirmer confirmer(true);
    confirmer.on_confirm = []() { std::raise(SIGINT); };
    EditSession session(vcs_, launcher_, confirmer, &logger_);

    auto result = run_session(session);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INTERRUPTED);
    EXPECT_EQ(vcs_.commit_calls, 0);
    EXPECT_TRUE(vcs_.pushes.empty());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, TerminationDuringEditorCleansUp) {
    launcher_.on_launch = [](const fs::path& repo) {
        write_file(repo / "notes.md", "# half written\n");
        std::raise(SIGTERM);
    };
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer, &logger_);

    auto result = run_session(session);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INTERRUPTED);
    EXPECT_TRUE(confirmer.questions.empty());
    EXPECT_TRUE(vcs_.pushes.empty());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, SignalHandlersRestoredAfterRun) {
    struct sigaction before {};
    sigaction(SIGINT, nullptr, &before);

    FakeConfirmer confirmer(false);
    EditSession session(vcs_, launcher_, confirmer, &logger_);
    ASSERT_TRUE(run_session(session).ok());

    struct sigaction after {};
    sigaction(SIGINT, nullptr, &after);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST_F(EditSessionTest, UnsafeIdRejectedBeforeClone) {
    FakeConfirmer confirmer(true);
    for (const char* id : {"", ".", "..", "../escape", "/etc", "a/b", "-rf"}) {
        EditSession session(vcs_, launcher_, confirmer, &logger_);
        session.set_scratch_parent(scratch_root_);

        auto result = session.run(id, "vim");
        ASSERT_FALSE(result.ok()) << id;
        EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT) << id;
    }
    EXPECT_EQ(vcs_.clone_calls, 0);
    EXPECT_TRUE(launcher_.targets.empty());
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(EditSessionTest, PushFailurePreservesWorkingDirectory) {
    vcs_.fail_push = true;
    launcher_.on_launch = [](const fs::path& repo) {
        write_file(repo / "run.sh", "echo keep me\n");
    };
    FakeConfirmer confirmer(true);
    EditSession session(vcs_, launcher_, confirmer);

    auto result = run_session(session);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::REMOTE_ERROR);
    EXPECT_EQ(session.state(), EditState::COMMITTED);

    ASSERT_TRUE(session.preserved_directory().has_value());
    fs::path kept = vcs_.last_clone_dest;
    EXPECT_TRUE(fs::exists(kept / "run.sh"));
    EXPECT_EQ(read_file(kept / "run.sh").value_or(""), "echo keep me\n");
    EXPECT_NE(result.error().message().find(kept.string()), std::string::npos);
    EXPECT_FALSE(scratch_is_empty());
}

// ============================================================================
// Confirmation prompt
// ============================================================================

TEST(StreamConfirmerTest, AcceptsYes) {
    for (const char* answer : {"y\n", "Y\n", "yes\n", " YES \n"}) {
        std::istringstream in(answer);
        std::ostringstream out;
        StreamConfirmer confirmer(in, out);
        EXPECT_TRUE(confirmer.confirm("Commit?")) << answer;
        EXPECT_NE(out.str().find("Commit? [y/N]"), std::string::npos);
    }
}

TEST(StreamConfirmerTest, DefaultsToNo) {
    for (const char* answer : {"\n", "n\n", "nope\n", ""}) {
        std::istringstream in(answer);
        std::ostringstream out;
        StreamConfirmer confirmer(in, out);
        EXPECT_FALSE(confirmer.confirm("Commit?")) << answer;
    }
}
