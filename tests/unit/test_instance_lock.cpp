#include <gtest/gtest.h>
#include "ankiplace/canvas.hpp"
#include "ankiplace/durable_store.hpp"
#include "ankiplace/errors.hpp"
#include "ankiplace/instance_lock.hpp"
#include "temp_store.hpp"

#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

using namespace ankiplace;
using ankiplace::testing::TempDir;

TEST(InstanceLockTest, CreatesLockFileBesideStore) {
    TempDir dir;
    std::string store = dir.file("canvas.db");
    InstanceLock lock{store};
    EXPECT_EQ(lock.path(), store + ".lock");
    EXPECT_TRUE(std::filesystem::exists(lock.path()));
}

TEST(InstanceLockTest, SecondHolderRefused) {
    TempDir dir;
    std::string store = dir.file("canvas.db");
    InstanceLock first{store};
    // flock locks belong to the open file description, so a second open conflicts
    EXPECT_THROW(InstanceLock{store}, StoreError);
}

TEST(InstanceLockTest, ReleasedOnDestruction) {
    TempDir dir;
    std::string store = dir.file("canvas.db");
    { InstanceLock first{store}; }
    EXPECT_NO_THROW(InstanceLock{store});
}

TEST(InstanceLockTest, OtherProcessRefused) {
    TempDir dir;
    std::string store = dir.file("canvas.db");
    InstanceLock lock{store};

    pid_t child = fork();
    ASSERT_NE(child, -1);
    if (child == 0) {
        try {
            InstanceLock second{store};
            _exit(0);
        } catch (const StoreError&) {
            _exit(3);
        }
    }
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 3);
}

TEST(InstanceLockTest, CreatesMissingParentDirectories) {
    TempDir dir;
    std::string store = dir.file("data/nested/canvas.db");
    InstanceLock lock{store};
    EXPECT_TRUE(std::filesystem::exists(store + ".lock"));

    // Startup order: lock first, then the store in the same fresh directory
    EXPECT_NO_THROW((DurableStore{store, canvas::create_schema}));
    EXPECT_TRUE(std::filesystem::exists(store));
}

TEST(InstanceLockTest, DirectoryBlockedByFile) {
    TempDir dir;
    ankiplace::testing::write_file(dir.file("plain"), "not a directory");
    EXPECT_THROW(InstanceLock{dir.file("plain/sub/canvas.db")}, StoreError);
}
