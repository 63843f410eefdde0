#pragma once

#include "ankiplace/operation.hpp"
#include "ankiplace/protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ankiplace {

enum class Access { Read, Write };

struct Route {
    std::string method;
    std::string pattern; // "/user/{user_id}"; braces match one path segment
    Access access;       // fixed per endpoint, never derived from the payload
    bool privileged;     // requires the session secret
};

/*
 * HTTP-facing entry point for every request.
 *
 * Matches the route, checks the secret for privileged routes before
 * touching the body or the store, then runs the route's store call
 * through the Reader or the Writer depending on its static Access.
 * Store and availability outcomes are mapped to status codes one to one.
 */
class Gateway {
public:
    Gateway(Reader& reader, Writer& writer, std::string secret,
            std::chrono::milliseconds request_timeout);

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Never throws
    HttpResponse handle(const HttpRequest& request);

    static const std::vector<Route>& routes();

    // JSON error body {"detail": ...}
    static HttpResponse error(int status, const std::string& detail);

private:
    void authenticate(const HttpRequest& request) const;
    Clock::time_point deadline_for(const HttpRequest& request) const;
    std::string request_id(const HttpRequest& request);

    Reader& reader_;
    Writer& writer_;
    const std::string secret_;
    const std::chrono::milliseconds request_timeout_;
    std::atomic<std::uint64_t> next_request_{1};
};

} // namespace ankiplace
