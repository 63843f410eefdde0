#include "ankiplace/canvas.hpp"
#include "ankiplace/errors.hpp"

#include <sqlite3.h>

namespace ankiplace::canvas {

void create_schema(Database& db) {
    {
        Statement version = db.prepare("PRAGMA user_version;");
        if (version.step() && version.column_int64(0) > kSchemaVersion) {
            throw StoreError("store schema version " + std::to_string(version.column_int64(0)) +
                             " is newer than supported version " + std::to_string(kSchemaVersion),
                             SQLITE_MISMATCH);
        }
    }

    db.exec(R"sql(
        CREATE TABLE IF NOT EXISTS canvas (
            x INTEGER,
            y INTEGER,
            color INTEGER,
            last_user_id TEXT,
            last_modified REAL,
            PRIMARY KEY (x, y)
        );
        CREATE TABLE IF NOT EXISTS users (
            user_id TEXT PRIMARY KEY,
            username TEXT,
            paint_balance INTEGER DEFAULT 0,
            created_at REAL
        );
        CREATE TABLE IF NOT EXISTS review_proofs (
            user_id TEXT,
            card_id INTEGER,
            timestamp REAL,
            PRIMARY KEY (user_id, card_id, timestamp)
        );
    )sql");

    std::int64_t cells = 0;
    {
        Statement count = db.prepare("SELECT count(*) FROM canvas;");
        if (count.step())
            cells = count.column_int64(0);
    }
    if (cells == 0) {
        Statement insert = db.prepare(
            "INSERT INTO canvas (x, y, color, last_user_id, last_modified) VALUES (?, ?, 0, NULL, 0);");
        for (int x = 0; x < kWidth; x++) {
            for (int y = 0; y < kHeight; y++) {
                insert.bind(1, x).bind(2, y);
                insert.run();
                insert.reset();
            }
        }
    }

    std::int64_t current = 0;
    {
        Statement version = db.prepare("PRAGMA user_version;");
        if (version.step())
            current = version.column_int64(0);
    }
    // Only touch the file header when the version differs
    if (current != kSchemaVersion)
        db.exec(("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";").c_str());
}

std::vector<int> read_grid(Database& db) {
    std::vector<int> grid(kWidth * kHeight, 0);
    Statement select = db.prepare("SELECT x, y, color FROM canvas;");
    while (select.step()) {
        auto x = select.column_int64(0);
        auto y = select.column_int64(1);
        if (!in_bounds(static_cast<int>(x), static_cast<int>(y)))
            continue;
        grid[y * kWidth + x] = static_cast<int>(select.column_int64(2));
    }
    return grid;
}

std::optional<Pixel> read_pixel(Database& db, int x, int y) {
    Statement select = db.prepare(R"sql(
        SELECT canvas.x, canvas.y, canvas.color, canvas.last_user_id,
               canvas.last_modified, users.username
        FROM canvas
        LEFT JOIN users ON canvas.last_user_id = users.user_id
        WHERE x = ? AND y = ?;
    )sql");
    select.bind(1, x).bind(2, y);
    if (!select.step())
        return std::nullopt;

    Pixel pixel;
    pixel.x = static_cast<int>(select.column_int64(0));
    pixel.y = static_cast<int>(select.column_int64(1));
    pixel.color = static_cast<int>(select.column_int64(2));
    pixel.last_user_id = select.column_optional_text(3);
    pixel.last_modified = select.column_double(4);
    pixel.username = select.column_optional_text(5);
    return pixel;
}

std::optional<User> read_user(Database& db, const std::string& user_id) {
    Statement select = db.prepare(
        "SELECT user_id, username, paint_balance, created_at FROM users WHERE user_id = ?;");
    select.bind(1, user_id);
    if (!select.step())
        return std::nullopt;

    User user;
    user.user_id = select.column_text(0);
    user.username = select.column_text(1);
    user.paint_balance = select.column_int64(2);
    user.created_at = select.column_double(3);
    return user;
}

void paint(Database& db, int x, int y, int color, const std::string& user_id, double now) {
    auto user = read_user(db, user_id);
    if (!user)
        throw RequestError(404, "User ID not found. Register first.");
    if (user->paint_balance < 1)
        throw RequestError(403, "Not enough paint drops. Study more cards!");

    Statement update = db.prepare(R"sql(
        UPDATE canvas
        SET color = ?, last_user_id = ?, last_modified = ?
        WHERE x = ? AND y = ?;
    )sql");
    update.bind(1, color).bind(2, user_id).bind(3, now).bind(4, x).bind(5, y);
    update.run();

    Statement charge = db.prepare(
        "UPDATE users SET paint_balance = paint_balance - 1 WHERE user_id = ?;");
    charge.bind(1, user_id);
    charge.run();
}

void insert_user(Database& db, const User& user) {
    Statement insert = db.prepare(
        "INSERT INTO users (user_id, username, paint_balance, created_at) VALUES (?, ?, ?, ?);");
    insert.bind(1, user.user_id)
          .bind(2, user.username)
          .bind(3, user.paint_balance)
          .bind(4, user.created_at);
    insert.run();
}

ReviewOutcome submit_reviews(Database& db, const std::string& user_id,
                             const std::vector<ReviewProof>& proofs) {
    if (!read_user(db, user_id))
        throw RequestError(404, "User not found");

    ReviewOutcome outcome;
    // Proofs already on record are skipped by the primary key
    Statement insert = db.prepare(
        "INSERT OR IGNORE INTO review_proofs (user_id, card_id, timestamp) VALUES (?, ?, ?);");
    for (const auto& proof : proofs) {
        insert.bind(1, user_id).bind(2, proof.card_id).bind(3, proof.timestamp);
        insert.run();
        outcome.new_proofs += db.changes();
        insert.reset();
    }

    outcome.paint_awarded = outcome.new_proofs / kReviewsPerPaint;
    if (outcome.paint_awarded > 0) {
        Statement award = db.prepare(
            "UPDATE users SET paint_balance = paint_balance + ? WHERE user_id = ?;");
        award.bind(1, outcome.paint_awarded).bind(2, user_id);
        award.run();
    }
    return outcome;
}

} // namespace ankiplace::canvas
