#include "ankiplace/gateway.hpp"
#include "ankiplace/canvas.hpp"
#include "ankiplace/database.hpp"
#include "ankiplace/errors.hpp"
#include "ankiplace/logging.hpp"

#include <json/json.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <functional>
#include <memory>
#include <random>
#include <string_view>

namespace ankiplace {

namespace {

using StoreCall = std::function<Json::Value(Database&)>;

struct RequestContext {
    const HttpRequest& request;
    std::vector<std::string> params; // values of the {…} segments, in order
};

// Parses and validates everything that does not need the store, and
// returns the call to run against it
using Binder = StoreCall (*)(const RequestContext&);

struct Endpoint {
    Route route;
    Binder bind;
};


// JSON helpers

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = to_json(body);
    return response;
}

HttpResponse error_response(int status, const std::string& detail) {
    Json::Value body;
    body["detail"] = detail;
    return json_response(status, body);
}

Json::Value parse_body(const HttpRequest& request) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    const char* begin = request.body.data();
    if (!reader->parse(begin, begin + request.body.size(), &root, &errors))
        throw RequestError(422, "Invalid JSON body: " + errors);
    if (!root.isObject())
        throw RequestError(422, "Request body must be a JSON object");
    return root;
}

int require_int(const Json::Value& object, const char* field) {
    const Json::Value& value = object[field];
    if (!value.isInt())
        throw RequestError(422, std::string{"Field '"} + field + "' must be an integer");
    return value.asInt();
}

std::int64_t require_int64(const Json::Value& object, const char* field) {
    const Json::Value& value = object[field];
    if (!value.isInt64())
        throw RequestError(422, std::string{"Field '"} + field + "' must be an integer");
    return value.asInt64();
}

double require_number(const Json::Value& object, const char* field) {
    const Json::Value& value = object[field];
    if (!value.isNumeric())
        throw RequestError(422, std::string{"Field '"} + field + "' must be a number");
    return value.asDouble();
}

std::string require_string(const Json::Value& object, const char* field) {
    const Json::Value& value = object[field];
    if (!value.isString())
        throw RequestError(422, std::string{"Field '"} + field + "' must be a string");
    return value.asString();
}

Json::Value optional_text(const std::optional<std::string>& text) {
    return text ? Json::Value(*text) : Json::Value(Json::nullValue);
}

int path_int(const std::string& text, const char* name) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        throw RequestError(422, std::string{"Path parameter '"} + name + "' must be an integer");
    return value;
}


double wall_clock_seconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Random (version 4) UUID, all 16 bytes straight from the OS entropy source
std::string generate_user_id() {
    thread_local std::random_device device;
    std::array<unsigned char, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 4) {
        std::uint32_t word = device();
        for (size_t j = 0; j < 4; j++)
            bytes[i + j] = static_cast<unsigned char>(word >> (8 * j));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    char hex[3];
    for (size_t i = 0; i < bytes.size(); i++) {
        std::snprintf(hex, sizeof(hex), "%02x", bytes[i]);
        out += hex;
        if (i == 3 || i == 5 || i == 7 || i == 9)
            out += '-';
    }
    return out;
}

bool constant_time_equals(std::string_view a, std::string_view b) {
    unsigned char diff = a.size() == b.size() ? 0 : 1;
    size_t n = std::max(a.size(), b.size());
    for (size_t i = 0; i < n; i++) {
        unsigned char ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
        unsigned char cb = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
        diff |= ca ^ cb;
    }
    return diff == 0;
}


// Endpoints

StoreCall get_canvas(const RequestContext&) {
    return [](Database& db) {
        Json::Value grid(Json::arrayValue);
        for (int color : canvas::read_grid(db))
            grid.append(color);
        Json::Value out;
        out["canvas"] = grid;
        return out;
    };
}

StoreCall get_pixel(const RequestContext& ctx) {
    int x = path_int(ctx.params[0], "x");
    int y = path_int(ctx.params[1], "y");
    if (!canvas::in_bounds(x, y))
        throw RequestError(400, "Coordinates out of bounds");

    return [x, y](Database& db) {
        Json::Value out;
        auto pixel = canvas::read_pixel(db, x, y);
        if (!pixel) {
            out["error"] = "Pixel not found";
            return out;
        }
        out["x"] = pixel->x;
        out["y"] = pixel->y;
        out["color"] = pixel->color;
        out["last_user_id"] = optional_text(pixel->last_user_id);
        out["username"] = optional_text(pixel->username);
        out["last_modified"] = pixel->last_modified;
        return out;
    };
}

StoreCall post_paint(const RequestContext& ctx) {
    Json::Value body = parse_body(ctx.request);
    int x = require_int(body, "x");
    int y = require_int(body, "y");
    int color = require_int(body, "color");
    std::string user_id = require_string(body, "user_id");

    if (!canvas::in_bounds(x, y))
        throw RequestError(400, "Coordinates out of bounds");
    if (!canvas::valid_color(color))
        throw RequestError(400, "Invalid color index (0-15)");

    // Taken once so a retried write stamps the same time
    double now = wall_clock_seconds();
    return [=](Database& db) {
        canvas::paint(db, x, y, color, user_id, now);
        Json::Value out;
        out["status"] = "success";
        out["x"] = x;
        out["y"] = y;
        out["color"] = color;
        return out;
    };
}

StoreCall post_user(const RequestContext& ctx) {
    Json::Value body = parse_body(ctx.request);
    canvas::User user;
    user.username = require_string(body, "username");
    user.user_id = generate_user_id();
    user.created_at = wall_clock_seconds();

    return [user](Database& db) {
        canvas::insert_user(db, user);
        Json::Value out;
        out["user_id"] = user.user_id;
        out["username"] = user.username;
        return out;
    };
}

StoreCall post_submit_reviews(const RequestContext& ctx) {
    Json::Value body = parse_body(ctx.request);
    std::string user_id = require_string(body, "user_id");

    const Json::Value& list = body["proofs"];
    if (!list.isArray())
        throw RequestError(422, "Field 'proofs' must be a list");
    std::vector<canvas::ReviewProof> proofs;
    proofs.reserve(list.size());
    for (const auto& item : list) {
        if (!item.isObject())
            throw RequestError(422, "Each proof must be an object");
        proofs.push_back(canvas::ReviewProof{require_int64(item, "card_id"),
                                             require_number(item, "timestamp")});
    }

    return [user_id, proofs = std::move(proofs)](Database& db) {
        auto outcome = canvas::submit_reviews(db, user_id, proofs);
        Json::Value out;
        out["status"] = "success";
        out["new_proofs"] = outcome.new_proofs;
        out["paint_awarded"] = outcome.paint_awarded;
        return out;
    };
}

StoreCall get_balance(const RequestContext& ctx) {
    std::string user_id = ctx.params[0];
    return [user_id](Database& db) {
        auto user = canvas::read_user(db, user_id);
        if (!user)
            throw RequestError(404, "User not found");
        Json::Value out;
        out["user_id"] = user_id;
        out["paint_balance"] = static_cast<Json::Int64>(user->paint_balance);
        return out;
    };
}

StoreCall get_user(const RequestContext& ctx) {
    std::string user_id = ctx.params[0];
    return [user_id](Database& db) {
        auto user = canvas::read_user(db, user_id);
        if (!user)
            throw RequestError(404, "User not found");
        Json::Value out;
        out["user_id"] = user_id;
        out["username"] = user->username;
        out["created_at"] = user->created_at;
        return out;
    };
}

const std::vector<Endpoint>& endpoints() {
    static const std::vector<Endpoint> table{
        {{"GET", "/canvas", Access::Read, false}, get_canvas},
        {{"GET", "/pixel/{x}/{y}", Access::Read, false}, get_pixel},
        {{"POST", "/paint", Access::Write, false}, post_paint},
        {{"POST", "/user", Access::Write, false}, post_user},
        {{"POST", "/submit-reviews", Access::Write, true}, post_submit_reviews},
        {{"GET", "/user/{user_id}/balance", Access::Read, false}, get_balance},
        {{"GET", "/user/{user_id}", Access::Read, false}, get_user},
    };
    return table;
}


std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;
    if (!path.empty() && path.front() == '/')
        path.remove_prefix(1);
    size_t pos = 0;
    while (true) {
        size_t slash = path.find('/', pos);
        segments.push_back(path.substr(pos, slash == std::string_view::npos ? slash : slash - pos));
        if (slash == std::string_view::npos)
            break;
        pos = slash + 1;
    }
    return segments;
}

bool match(std::string_view pattern, std::string_view path, std::vector<std::string>& params) {
    auto expected = split_path(pattern);
    auto actual = split_path(path);
    if (expected.size() != actual.size())
        return false;

    std::vector<std::string> captured;
    for (size_t i = 0; i < expected.size(); i++) {
        if (expected[i].size() > 2 && expected[i].front() == '{' && expected[i].back() == '}') {
            if (actual[i].empty())
                return false;
            captured.emplace_back(actual[i]);
        } else if (expected[i] != actual[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

} // namespace


Gateway::Gateway(Reader& reader, Writer& writer, std::string secret,
                 std::chrono::milliseconds request_timeout)
    : reader_(reader), writer_(writer), secret_(std::move(secret)),
      request_timeout_(request_timeout) {}

HttpResponse Gateway::error(int status, const std::string& detail) {
    return error_response(status, detail);
}

const std::vector<Route>& Gateway::routes() {
    static const std::vector<Route> table = [] {
        std::vector<Route> out;
        for (const auto& endpoint : endpoints())
            out.push_back(endpoint.route);
        return out;
    }();
    return table;
}

HttpResponse Gateway::handle(const HttpRequest& request) {
    const std::string id = request_id(request);
    HttpResponse response;

    try {
        const Endpoint* endpoint = nullptr;
        std::vector<std::string> params;
        std::string allowed;
        for (const auto& candidate : endpoints()) {
            std::vector<std::string> captured;
            if (!match(candidate.route.pattern, request.path, captured))
                continue;
            if (candidate.route.method == request.method) {
                endpoint = &candidate;
                params = std::move(captured);
                break;
            }
            allowed += allowed.empty() ? candidate.route.method : ", " + candidate.route.method;
        }

        if (!endpoint && allowed.empty()) {
            response = error_response(404, "Not Found");
        } else if (!endpoint) {
            response = error_response(405, "Method Not Allowed");
            response.headers.emplace_back("Allow", allowed);
        } else {
            // Before the body is even parsed
            if (endpoint->route.privileged)
                authenticate(request);

            StoreCall call = endpoint->bind(RequestContext{request, std::move(params)});
            Json::Value body;
            if (endpoint->route.access == Access::Read) {
                reader_.query(ReadOperation{id, deadline_for(request),
                                            [&](Database& db) { body = call(db); }});
            } else {
                writer_.submit(WriteOperation{id, deadline_for(request),
                                              [&](Database& db) { body = call(db); }});
            }
            response = json_response(200, body);
        }
    } catch (const Unauthorized& e) {
        response = error_response(403, e.what());
    } catch (const RequestError& e) {
        response = error_response(e.status(), e.what());
    } catch (const Unavailable& e) {
        log_warn("Gateway", "request " + id + " unavailable: " + e.what());
        response = error_response(503, e.what());
        response.headers.emplace_back("Retry-After", "1");
    } catch (const DeadlineExceeded& e) {
        log_warn("Gateway", "request " + id + " deadline exceeded: " + e.what());
        response = error_response(504, e.what());
    } catch (const StoreError& e) {
        log_error("Gateway", "request " + id + " store error: " + e.what());
        response = error_response(500, std::string{"Store error: "} + e.what());
    } catch (const std::exception& e) {
        log_error("Gateway", "request " + id + " failed: " + e.what());
        response = error_response(500, "Internal Server Error");
    }

    log_info("Gateway", request.method + " " + request.path + " -> " +
                        std::to_string(response.status) + " [" + id + "]");
    return response;
}

void Gateway::authenticate(const HttpRequest& request) const {
    auto presented = request.header("x-ankiplace-secret");
    if (!presented || !constant_time_equals(*presented, secret_))
        throw Unauthorized("Invalid or missing secret key");
}

Clock::time_point Gateway::deadline_for(const HttpRequest& request) const {
    // Time spent queued for a worker counts against the request
    auto start = request.received == Clock::time_point{} ? Clock::now() : request.received;
    auto timeout = request_timeout_;
    if (auto header = request.header("x-request-timeout-ms")) {
        long long ms = 0;
        auto [ptr, ec] = std::from_chars(header->data(), header->data() + header->size(), ms);
        if (ec != std::errc{} || ptr != header->data() + header->size() || ms <= 0)
            throw RequestError(400, "Invalid X-Request-Timeout-Ms header");
        // A caller may shorten the deadline, never extend it
        timeout = std::min(timeout, std::chrono::milliseconds(ms));
    }
    return start + timeout;
}

std::string Gateway::request_id(const HttpRequest& request) {
    if (auto id = request.header("x-request-id"); id && !id->empty())
        return id->substr(0, 64);
    return "req-" + std::to_string(next_request_.fetch_add(1));
}

} // namespace ankiplace
