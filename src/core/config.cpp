#include "ankiplace/config.hpp"
#include "ankiplace/errors.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string_view>

namespace ankiplace {

namespace {

std::optional<std::string> read(const Config::Lookup& lookup, const char* name) {
    const char* value = lookup(name);
    if (!value)
        return std::nullopt;
    return std::string{value};
}

// Decimal within [min, max]; anything else is a ConfigError
long long read_number(const Config::Lookup& lookup, const char* name, long long fallback,
                      long long min, long long max) {
    auto value = read(lookup, name);
    if (!value)
        return fallback;

    long long parsed = 0;
    const char* first = value->data();
    const char* last = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || ptr != last || value->empty())
        throw ConfigError(std::string{name} + " must be a number, got '" + *value + "'");
    if (parsed < min || parsed > max) {
        throw ConfigError(std::string{name} + " must be between " + std::to_string(min) +
                          " and " + std::to_string(max));
    }
    return parsed;
}

} // namespace

Config Config::from_lookup(const Lookup& lookup) {
    Config config;

    if (auto path = read(lookup, "DB_PATH")) {
        if (path->empty())
            throw ConfigError("DB_PATH must not be empty");
        config.db_path = *path;
    }

    if (auto secret = read(lookup, "ANKIPLACE_SECRET"))
        config.secret = *secret;
    else if (auto alias = read(lookup, "SESSION_SECRET"))
        config.secret = *alias;
    if (config.secret.empty())
        throw ConfigError("ANKIPLACE_SECRET must not be empty");

    if (auto env = read(lookup, "ANKIPLACE_ENV"))
        config.environment = *env;

    config.port = static_cast<std::uint16_t>(
        read_number(lookup, "ANKIPLACE_PORT", config.port, 0, std::numeric_limits<std::uint16_t>::max()));
    config.worker_threads = static_cast<size_t>(
        read_number(lookup, "ANKIPLACE_WORKER_THREADS", 8, 1, 1024));
    config.read_connections = static_cast<size_t>(
        read_number(lookup, "ANKIPLACE_READ_CONNECTIONS", 4, 1, 256));
    config.write_max_attempts = static_cast<int>(
        read_number(lookup, "ANKIPLACE_WRITE_MAX_ATTEMPTS", 8, 1, 1000));
    config.write_backoff = std::chrono::milliseconds(
        read_number(lookup, "ANKIPLACE_WRITE_BACKOFF_MS", 5, 1, 10000));
    config.request_timeout = std::chrono::milliseconds(
        read_number(lookup, "ANKIPLACE_REQUEST_TIMEOUT_MS", 10000, 1, 3600000));
    config.shutdown_grace = std::chrono::milliseconds(
        read_number(lookup, "ANKIPLACE_SHUTDOWN_GRACE_MS", 5000, 0, 3600000));

    if (config.production() && config.uses_default_secret())
        throw ConfigError("ANKIPLACE_SECRET must be changed from its default in production");

    return config;
}

Config Config::from_env() {
    return from_lookup([](const char* name) { return std::getenv(name); });
}

WriteSerializer::Options Config::writer_options() const {
    WriteSerializer::Options options;
    options.max_attempts = write_max_attempts;
    options.initial_backoff = write_backoff;
    options.shutdown_grace = shutdown_grace;
    return options;
}

ReadPool::Options Config::reader_options() const {
    ReadPool::Options options;
    options.connections = read_connections;
    return options;
}

} // namespace ankiplace
