#pragma once

#include "ankiplace/database.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ankiplace::canvas {

constexpr int kWidth = 32;
constexpr int kHeight = 32;
constexpr int kColors = 16;
constexpr int kReviewsPerPaint = 10;
constexpr int kSchemaVersion = 1;

struct Pixel {
    int x{0};
    int y{0};
    int color{0};
    std::optional<std::string> last_user_id;
    std::optional<std::string> username;
    double last_modified{0.0};
};

struct User {
    std::string user_id;
    std::string username;
    std::int64_t paint_balance{0};
    double created_at{0.0};
};

struct ReviewProof {
    std::int64_t card_id{0};
    double timestamp{0.0};
};

struct ReviewOutcome {
    int new_proofs{0};
    int paint_awarded{0};
};

inline bool in_bounds(int x, int y) {
    return x >= 0 && x < kWidth && y >= 0 && y < kHeight;
}

inline bool valid_color(int color) {
    return color >= 0 && color < kColors;
}

// Creates tables and seeds the blank grid. Writes nothing when the
// schema is already in place. Throws StoreError for a newer schema.
void create_schema(Database& db);

// Flat row-major grid, index y * kWidth + x
std::vector<int> read_grid(Database& db);

std::optional<Pixel> read_pixel(Database& db, int x, int y);

std::optional<User> read_user(Database& db, const std::string& user_id);

// Costs one paint drop.
// Throws RequestError 404 for an unknown user, 403 without paint.
void paint(Database& db, int x, int y, int color, const std::string& user_id, double now);

void insert_user(Database& db, const User& user);

// Records proofs not seen before and awards one paint drop per
// kReviewsPerPaint new ones. Throws RequestError 404 for an unknown user.
ReviewOutcome submit_reviews(Database& db, const std::string& user_id,
                             const std::vector<ReviewProof>& proofs);

} // namespace ankiplace::canvas
