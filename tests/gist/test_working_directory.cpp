#include <gtest/gtest.h>
#include <gist/util/file_io.hpp>
#include <gist/working_directory.hpp>

using namespace gist;

class WorkingDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        parent_ = fs::temp_directory_path() / "gist_workdir_test";
        fs::remove_all(parent_);
        fs::create_directories(parent_);
    }

    void TearDown() override {
        fs::remove_all(parent_);
    }

    fs::path parent_;
};

TEST_F(WorkingDirectoryTest, RemovedOnScopeExit) {
    fs::path path;
    {
        auto dir = WorkingDirectory::create(parent_);
        ASSERT_TRUE(dir.ok()) << dir.error().to_string();
        path = dir.value().path();
        EXPECT_TRUE(fs::is_directory(path));
        EXPECT_EQ(path.parent_path(), parent_);

        fs::create_directories(path / "nested");
        ASSERT_TRUE(write_file(path / "nested" / "file.txt", "data"));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(WorkingDirectoryTest, UniquePerCreate) {
    auto a = WorkingDirectory::create(parent_);
    auto b = WorkingDirectory::create(parent_);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.value().path(), b.value().path());
}

TEST_F(WorkingDirectoryTest, ReleaseKeepsDirectory) {
    fs::path kept;
    {
        auto dir = WorkingDirectory::create(parent_);
        ASSERT_TRUE(dir.ok());
        kept = dir.value().release();
        EXPECT_FALSE(dir.value().owns());
    }
    EXPECT_TRUE(fs::is_directory(kept));
}

TEST_F(WorkingDirectoryTest, MoveTransfersOwnership) {
    fs::path path;
    {
        auto dir = WorkingDirectory::create(parent_);
        ASSERT_TRUE(dir.ok());
        WorkingDirectory moved = std::move(dir.value());
        path = moved.path();
        EXPECT_TRUE(moved.owns());
        EXPECT_FALSE(dir.value().owns());
        EXPECT_TRUE(fs::is_directory(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(WorkingDirectoryTest, RemovedDuringExceptionUnwinding) {
    fs::path path;
    try {
        auto dir = WorkingDirectory::create(parent_);
        ASSERT_TRUE(dir.ok());
        path = dir.value().path();
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(WorkingDirectoryTest, MissingParentIsIoError) {
    auto dir = WorkingDirectory::create(parent_ / "does" / "not" / "exist");
    ASSERT_FALSE(dir.ok());
    EXPECT_EQ(dir.error_code(), ErrorCode::IO_ERROR);
}
