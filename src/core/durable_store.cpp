#include "ankiplace/durable_store.hpp"
#include "ankiplace/errors.hpp"
#include "ankiplace/logging.hpp"

#include <filesystem>
#include <system_error>

namespace ankiplace {

void ensure_parent_directory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty())
        return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
        throw StoreError("cannot create directory '" + parent.string() + "': " + ec.message());
}

DurableStore::DurableStore(const std::string& path, const SchemaInitializer& initialize_schema)
    : path_(path) {
    ensure_parent_directory(path_);
    writer_ = std::make_unique<Database>(path_, AccessMode::ReadWrite);
    writer_->verify_integrity();
    initialize(initialize_schema);
    log_info("Store", "opened '" + path_ + "'");
}

void DurableStore::initialize(const SchemaInitializer& initialize_schema) {
    Transaction tx{*writer_, Transaction::Kind::Immediate};
    initialize_schema(*writer_);
    tx.commit();
}

std::unique_ptr<Database> DurableStore::open_reader() const {
    return std::make_unique<Database>(path_, AccessMode::ReadOnly);
}

} // namespace ankiplace
