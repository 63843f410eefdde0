#include <gtest/gtest.h>
#include "ankiplace/database.hpp"
#include "ankiplace/durable_store.hpp"
#include "ankiplace/errors.hpp"
#include "temp_store.hpp"

#include <filesystem>

using namespace ankiplace;
using ankiplace::testing::TempDir;

namespace {

void notes_schema(Database& db) {
    db.exec("CREATE TABLE IF NOT EXISTS notes (id INTEGER PRIMARY KEY, body TEXT);");
}

std::int64_t count_notes(Database& db) {
    Statement count = db.prepare("SELECT count(*) FROM notes;");
    count.step();
    return count.column_int64(0);
}

} // namespace

class DatabaseTest : public ::testing::Test {
protected:
    TempDir dir;
    std::string path = dir.file("store.db");
};


TEST_F(DatabaseTest, OpensWithDurablePragmas) {
    Database db{path, AccessMode::ReadWrite};
    EXPECT_TRUE(std::filesystem::exists(path));

    Statement mode = db.prepare("PRAGMA journal_mode;");
    ASSERT_TRUE(mode.step());
    EXPECT_EQ(mode.column_text(0), "delete");

    Statement sync = db.prepare("PRAGMA synchronous;");
    ASSERT_TRUE(sync.step());
    EXPECT_EQ(sync.column_int64(0), 2); // FULL
}

TEST_F(DatabaseTest, BindAndReadColumns) {
    Database db{path, AccessMode::ReadWrite};
    db.exec("CREATE TABLE t (i INTEGER, d REAL, s TEXT, n TEXT);");
    Statement insert = db.prepare("INSERT INTO t VALUES (?, ?, ?, ?);");
    insert.bind(1, 7).bind(2, 1.5).bind(3, std::string_view{"seven"}).bind_null(4);
    insert.run();
    EXPECT_EQ(db.changes(), 1);

    Statement select = db.prepare("SELECT i, d, s, n FROM t;");
    ASSERT_TRUE(select.step());
    EXPECT_EQ(select.column_int64(0), 7);
    EXPECT_DOUBLE_EQ(select.column_double(1), 1.5);
    EXPECT_EQ(select.column_text(2), "seven");
    EXPECT_TRUE(select.column_is_null(3));
    EXPECT_EQ(select.column_optional_text(3), std::nullopt);
    EXPECT_FALSE(select.step());
}

TEST_F(DatabaseTest, BadSqlIsStoreError) {
    Database db{path, AccessMode::ReadWrite};
    EXPECT_THROW(db.exec("NOT SQL AT ALL;"), StoreError);
    EXPECT_THROW(db.prepare("SELECT * FROM missing_table;"), StoreError);
}

TEST_F(DatabaseTest, ConstraintViolationIsStoreError) {
    Database db{path, AccessMode::ReadWrite};
    db.exec("CREATE TABLE t (id INTEGER PRIMARY KEY);");
    db.exec("INSERT INTO t VALUES (1);");
    try {
        db.exec("INSERT INTO t VALUES (1);");
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_NE(e.code(), 0);
    }
}

TEST_F(DatabaseTest, ReadOnlyConnectionCannotWrite) {
    {
        Database db{path, AccessMode::ReadWrite};
        notes_schema(db);
    }
    Database reader{path, AccessMode::ReadOnly};
    EXPECT_EQ(reader.mode(), AccessMode::ReadOnly);
    EXPECT_THROW(reader.exec("INSERT INTO notes (body) VALUES ('x');"), StoreError);
}

TEST_F(DatabaseTest, ReadOnlyMissingFileFails) {
    EXPECT_THROW((Database{dir.file("missing.db"), AccessMode::ReadOnly}), StoreError);
}

TEST_F(DatabaseTest, ExclusiveLockMakesOthersBusy) {
    Database writer{path, AccessMode::ReadWrite};
    notes_schema(writer);
    Database other{path, AccessMode::ReadWrite};
    Database reader{path, AccessMode::ReadOnly};

    other.exec("BEGIN EXCLUSIVE;");
    EXPECT_THROW(count_notes(reader), StoreBusy);
    EXPECT_THROW((Transaction{writer, Transaction::Kind::Immediate}), StoreBusy);
    other.exec("COMMIT;");

    EXPECT_EQ(count_notes(reader), 0);
}

TEST_F(DatabaseTest, TransactionRollsBackUnlessCommitted) {
    Database db{path, AccessMode::ReadWrite};
    notes_schema(db);
    {
        Transaction tx{db, Transaction::Kind::Immediate};
        db.exec("INSERT INTO notes (body) VALUES ('dropped');");
        EXPECT_TRUE(db.in_transaction());
    }
    EXPECT_FALSE(db.in_transaction());
    EXPECT_EQ(count_notes(db), 0);

    {
        Transaction tx{db, Transaction::Kind::Immediate};
        db.exec("INSERT INTO notes (body) VALUES ('kept');");
        tx.commit();
        EXPECT_FALSE(tx.active());
    }
    EXPECT_EQ(count_notes(db), 1);
}

TEST_F(DatabaseTest, BusyCommitKeepsTransactionOpen) {
    Database writer{path, AccessMode::ReadWrite};
    notes_schema(writer);
    Database reader{path, AccessMode::ReadOnly};

    // A read transaction holds its shared lock until it ends
    Transaction read_tx{reader, Transaction::Kind::Deferred};
    EXPECT_EQ(count_notes(reader), 0);

    Transaction write_tx{writer, Transaction::Kind::Immediate};
    writer.exec("INSERT INTO notes (body) VALUES ('pending');");
    EXPECT_THROW(write_tx.commit(), StoreBusy);
    EXPECT_TRUE(write_tx.active());
    EXPECT_TRUE(writer.in_transaction());

    read_tx.commit();
    write_tx.commit();
    EXPECT_FALSE(write_tx.active());
    EXPECT_EQ(count_notes(reader), 1);
}


// DurableStore

TEST_F(DatabaseTest, StoreCreatesParentDirectories) {
    std::string nested = dir.file("a/b/c/store.db");
    DurableStore store{nested, notes_schema};
    EXPECT_TRUE(std::filesystem::exists(nested));
    EXPECT_EQ(store.path(), nested);
}

TEST_F(DatabaseTest, StoreInitializationIsByteIdentical) {
    {
        DurableStore store{path, notes_schema};
        store.writer().exec("INSERT INTO notes (body) VALUES ('hello');");
    }
    std::string before = ankiplace::testing::read_file(path);
    ASSERT_FALSE(before.empty());

    {
        DurableStore store{path, notes_schema};
        store.initialize(notes_schema);
        EXPECT_EQ(count_notes(store.writer()), 1);
    }
    EXPECT_EQ(ankiplace::testing::read_file(path), before);
}

TEST_F(DatabaseTest, StoreRefusesCorruptFile) {
    ankiplace::testing::write_file(path, std::string(8192, 'x'));
    EXPECT_THROW((DurableStore{path, notes_schema}), StoreError);
    // Left exactly as found
    EXPECT_EQ(ankiplace::testing::read_file(path), std::string(8192, 'x'));
}

TEST_F(DatabaseTest, StoreFailingInitializerLeavesNothing) {
    auto failing = [](Database& db) {
        notes_schema(db);
        throw StoreError("schema refused");
    };
    EXPECT_THROW((DurableStore{path, failing}), StoreError);

    Database db{path, AccessMode::ReadWrite};
    EXPECT_THROW(count_notes(db), StoreError); // table creation rolled back
}

TEST_F(DatabaseTest, StoreReadersSeeCommittedState) {
    DurableStore store{path, notes_schema};
    auto reader = store.open_reader();
    EXPECT_EQ(reader->mode(), AccessMode::ReadOnly);
    EXPECT_EQ(count_notes(*reader), 0);

    store.writer().exec("INSERT INTO notes (body) VALUES ('a');");
    EXPECT_EQ(count_notes(*reader), 1);
}
