#pragma once

#include "ankiplace/database.hpp"

#include <functional>
#include <memory>
#include <string>

namespace ankiplace {

// Creates the directories above a store file; throws StoreError on failure
void ensure_parent_directory(const std::string& path);

/*
 * Owner of the store file.
 *
 * Holds the single read-write connection for the whole process lifetime
 * (lent exclusively to the WriteSerializer) and opens read-only
 * connections for the ReadPool.
 * Construction fails with StoreError on unreadable or corrupt files
 * instead of attempting recovery.
 */
class DurableStore {
public:
    // Creates the schema; must be idempotent
    using SchemaInitializer = std::function<void(Database&)>;

    DurableStore(const std::string& path, const SchemaInitializer& initialize_schema);

    DurableStore(const DurableStore&) = delete;
    DurableStore& operator=(const DurableStore&) = delete;

    // Runs initialize_schema in one immediate transaction.
    // Re-running it against an initialized file changes nothing.
    void initialize(const SchemaInitializer& initialize_schema);

    // The mutating handle. Only the writer thread may use it once
    // the WriteSerializer is running.
    Database& writer() noexcept { return *writer_; }

    std::unique_ptr<Database> open_reader() const;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    std::unique_ptr<Database> writer_;
};

} // namespace ankiplace
