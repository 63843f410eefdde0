#pragma once

#include "ankiplace/read_pool.hpp"
#include "ankiplace/write_serializer.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ankiplace {

/*
 * Process configuration, read once at startup from the environment.
 * Immutable afterwards and passed by reference to each component.
 */
struct Config {
    static constexpr const char* kDefaultSecret = "change-me-please";

    std::string db_path{"canvas.db"};
    std::string secret{kDefaultSecret};
    std::string environment{"development"};
    std::uint16_t port{4201};
    size_t worker_threads{8};
    size_t read_connections{4};
    int write_max_attempts{8};
    std::chrono::milliseconds write_backoff{5};
    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds shutdown_grace{5000};

    // Returns nullptr for unset variables, like std::getenv
    using Lookup = std::function<const char*(const char*)>;

    // Throws ConfigError on malformed values or a default secret in production
    static Config from_lookup(const Lookup& lookup);
    static Config from_env();

    bool uses_default_secret() const { return secret == kDefaultSecret; }
    bool production() const { return environment == "production"; }

    WriteSerializer::Options writer_options() const;
    ReadPool::Options reader_options() const;
};

} // namespace ankiplace
