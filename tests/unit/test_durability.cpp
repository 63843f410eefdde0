#include <gtest/gtest.h>
#include "ankiplace/durable_store.hpp"
#include "ankiplace/write_serializer.hpp"
#include "temp_store.hpp"

#include <csignal>
#include <cstdint>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace ankiplace;
using namespace std::chrono_literals;
using ankiplace::testing::TempDir;

namespace {

void ledger_schema(Database& db) {
    db.exec("CREATE TABLE IF NOT EXISTS ledger (seq INTEGER PRIMARY KEY, payload TEXT);");
}

std::int64_t count_rows(Database& db) {
    Statement count = db.prepare("SELECT count(*) FROM ledger;");
    count.step();
    return count.column_int64(0);
}

void insert_row(Database& db, std::int64_t seq) {
    Statement insert = db.prepare("INSERT INTO ledger (seq, payload) VALUES (?, ?);");
    insert.bind(1, seq).bind(2, std::string(512, 'p'));
    insert.run();
}

void write_all(int fd, const void* data, size_t size) {
    [[maybe_unused]] ssize_t _ = ::write(fd, data, size);
}

} // namespace

class DurabilityTest : public ::testing::Test {
protected:
    TempDir dir;
    std::string path = dir.file("ledger.db");
    int pipe_fds[2]{-1, -1};

    void SetUp() override {
        // Created up front so the child only ever opens an existing store
        DurableStore store{path, ledger_schema};
        ASSERT_EQ(::pipe(pipe_fds), 0);
    }

    void TearDown() override {
        for (int fd : pipe_fds) {
            if (fd >= 0)
                ::close(fd);
        }
    }

    void kill_child(pid_t child) {
        ::kill(child, SIGKILL);
        int status = 0;
        ::waitpid(child, &status, 0);
        EXPECT_TRUE(WIFSIGNALED(status));
    }
};


TEST_F(DurabilityTest, AcknowledgedWritesSurviveKill) {
    pid_t child = fork();
    ASSERT_NE(child, -1);
    if (child == 0) {
        ::close(pipe_fds[0]);
        DurableStore store{path, ledger_schema};
        WriteSerializer writer{store.writer()};
        for (std::int64_t seq = 1;; seq++) {
            writer.submit(WriteOperation{"w", Clock::now() + 5s, [seq](Database& db) {
                insert_row(db, seq);
            }});
            write_all(pipe_fds[1], &seq, sizeof(seq)); // acknowledged
        }
    }
    ::close(pipe_fds[1]);
    pipe_fds[1] = -1;

    std::int64_t acknowledged = 0;
    while (acknowledged < 25) {
        std::int64_t seq = 0;
        ASSERT_EQ(::read(pipe_fds[0], &seq, sizeof(seq)), static_cast<ssize_t>(sizeof(seq)));
        acknowledged = seq;
    }
    kill_child(child);

    DurableStore reopened{path, ledger_schema};
    EXPECT_GE(count_rows(reopened.writer()), acknowledged);
    EXPECT_NO_THROW(reopened.writer().verify_integrity());
}

TEST_F(DurabilityTest, UncommittedWriteRolledBackAfterKill) {
    pid_t child = fork();
    ASSERT_NE(child, -1);
    if (child == 0) {
        ::close(pipe_fds[0]);
        DurableStore store{path, ledger_schema};
        WriteSerializer writer{store.writer()};
        writer.submit(WriteOperation{"kept", Clock::now() + 5s, [](Database& db) {
            insert_row(db, 1);
        }});
        int ready_fd = pipe_fds[1];
        writer.submit(WriteOperation{"torn", Clock::now() + 60s, [ready_fd](Database& db) {
            for (std::int64_t seq = 2; seq < 2000; seq++)
                insert_row(db, seq);
            char ready = 1;
            write_all(ready_fd, &ready, 1);
            std::this_thread::sleep_for(60s);
        }});
        _exit(0);
    }
    ::close(pipe_fds[1]);
    pipe_fds[1] = -1;

    char ready = 0;
    ASSERT_EQ(::read(pipe_fds[0], &ready, 1), 1);
    kill_child(child);

    DurableStore reopened{path, ledger_schema};
    EXPECT_EQ(count_rows(reopened.writer()), 1);
    EXPECT_NO_THROW(reopened.writer().verify_integrity());
}
