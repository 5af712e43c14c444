#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "sandbox/workspace.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace scorer;

class WorkspaceTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        test::setup_test_environment();
    }

    execution_request make_request(const string &code) {
        execution_request request;
        request.source_code = code;
        request.time_limit = chrono::duration<double>(1);
        request.memory_limit = 128 * 1024 * 1024;
        return request;
    }
};

TEST_F(WorkspaceTest, AcquireWritesSource) {
    auto ws = workspace::acquire(make_request("print(input())"), default_language());
    ASSERT_TRUE(ws.valid());
    EXPECT_TRUE(filesystem::is_directory(ws.path()));
    EXPECT_EQ(ws.path().parent_path(), filesystem::absolute(RUN_DIR));
    EXPECT_EQ(ws.path().filename().string().substr(0, 4), "run-");
    EXPECT_EQ(ws.source_filename(), "client_script.py");
    EXPECT_EQ(read_file_content(ws.file("client_script.py")), "print(input())");

    // 沙箱目录中只有选手代码
    EXPECT_EQ(ws.sandbox(), ws.path() / "sandbox");
    size_t count = 0;
    for (auto &entry : filesystem::directory_iterator(ws.sandbox())) {
        (void)entry;
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

TEST_F(WorkspaceTest, WorkspacesAreUnique) {
    auto a = workspace::acquire(make_request(""), default_language());
    auto b = workspace::acquire(make_request(""), default_language());
    EXPECT_NE(a.path(), b.path());
}

TEST_F(WorkspaceTest, ReleaseRemovesEverything) {
    auto ws = workspace::acquire(make_request("print(1)"), default_language());
    filesystem::path dir = ws.path();
    write_file_content(ws.file(workspace::STDOUT_FILE), "1\n");
    filesystem::create_directories(dir / "nested" / "dir");

    ws.release();
    EXPECT_FALSE(ws.valid());
    EXPECT_FALSE(filesystem::exists(dir));

    // 重复释放没有作用
    EXPECT_NO_THROW(ws.release());
}

TEST_F(WorkspaceTest, DestructorReleases) {
    filesystem::path dir;
    {
        auto ws = workspace::acquire(make_request("print(1)"), default_language());
        dir = ws.path();
        EXPECT_TRUE(filesystem::exists(dir));
    }
    EXPECT_FALSE(filesystem::exists(dir));
}

TEST_F(WorkspaceTest, ReleasedWhenExceptionIsThrown) {
    filesystem::path dir;
    try {
        auto ws = workspace::acquire(make_request("print(1)"), default_language());
        dir = ws.path();
        throw internal_error("simulated failure");
    } catch (internal_error &) {
    }
    ASSERT_FALSE(dir.empty());
    EXPECT_FALSE(filesystem::exists(dir));
}

TEST_F(WorkspaceTest, MoveTransfersOwnership) {
    auto a = workspace::acquire(make_request(""), default_language());
    filesystem::path dir = a.path();

    workspace b = move(a);
    EXPECT_FALSE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_EQ(b.path(), dir);

    // 被移动的对象析构或释放时不会删除目录
    a.release();
    EXPECT_TRUE(filesystem::exists(dir));

    b.release();
    EXPECT_FALSE(filesystem::exists(dir));
}

TEST_F(WorkspaceTest, FileRejectsTraversal) {
    auto ws = workspace::acquire(make_request(""), default_language());
    EXPECT_THROW(ws.file("../escape"), runtime_error);
    EXPECT_THROW(ws.file(".."), runtime_error);
    EXPECT_EQ(ws.file(workspace::STATS_FILE), ws.sandbox() / "time_stats.txt");
    EXPECT_EQ(ws.host_file(workspace::RUNTIME_LOG), ws.path() / "runtime.log");
    EXPECT_THROW(ws.host_file("../escape"), runtime_error);
}

TEST_F(WorkspaceTest, LockedSandboxIsRemoved) {
    auto ws = workspace::acquire(make_request("print(1)"), default_language());
    filesystem::path dir = ws.path();
    filesystem::create_directories(ws.sandbox() / "a" / "b");
    write_file_content(ws.sandbox() / "a" / "b" / "file", "x");
    filesystem::permissions(ws.sandbox() / "a" / "b" / "file", filesystem::perms::none);
    filesystem::permissions(ws.sandbox() / "a" / "b", filesystem::perms::none);
    filesystem::permissions(ws.sandbox() / "a", filesystem::perms::none);
    filesystem::permissions(ws.sandbox(), filesystem::perms::none);

    EXPECT_NO_THROW(ws.release());
    EXPECT_FALSE(filesystem::exists(dir));
}

TEST_F(WorkspaceTest, RestorePermissionsDoesNotFollowSymlinks) {
    filesystem::path outside = filesystem::temp_directory_path() / "scorer-workspace-outside";
    filesystem::remove(outside);
    write_file_content(outside, "host");
    filesystem::permissions(outside, filesystem::perms::owner_read);

    {
        auto ws = workspace::acquire(make_request("print(1)"), default_language());
        filesystem::create_symlink(outside, ws.file("link"));
        write_file_content(ws.file(workspace::STDOUT_FILE), "1\n");
        filesystem::permissions(ws.file(workspace::STDOUT_FILE), filesystem::perms::none);
        filesystem::permissions(ws.sandbox(), filesystem::perms::owner_exec);

        ws.restore_permissions();
        EXPECT_EQ(read_regular_file(ws.file(workspace::STDOUT_FILE)).value_or(""), "1\n");
        EXPECT_FALSE(read_regular_file(ws.file("link")).has_value());
    }

    EXPECT_TRUE(filesystem::exists(outside));
    EXPECT_EQ(filesystem::status(outside).permissions(), filesystem::perms::owner_read);
    filesystem::permissions(outside, filesystem::perms::owner_all);
    filesystem::remove(outside);
}

TEST_F(WorkspaceTest, CreationFailureIsInternalError) {
    filesystem::path saved = RUN_DIR;
    filesystem::path blocker = filesystem::temp_directory_path() / "scorer-workspace-blocker";
    write_file_content(blocker, "not a directory");
    RUN_DIR = blocker;

    EXPECT_THROW(workspace::acquire(make_request(""), default_language()), internal_error);

    RUN_DIR = saved;
    filesystem::remove(blocker);
}

TEST_F(WorkspaceTest, UsesLanguageSourceFilename) {
    test::shell_language sh;
    auto ws = workspace::acquire(make_request("echo hi"), sh);
    EXPECT_EQ(ws.source_filename(), "client_script.sh");
    EXPECT_EQ(read_file_content(ws.file("client_script.sh")), "echo hi");
}
