#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ankiplace {

// Malformed request; status is the HTTP status to answer with before closing
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg, int status = 400)
        : std::runtime_error(msg), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

struct HttpRequest {
    std::string method;
    std::string target; // as sent, including any query string
    std::string path;   // percent-decoded, without query string
    std::string query;
    int version_minor{1};
    std::map<std::string, std::string> headers; // names lower-cased
    std::string body;
    // Set by the server when the request is queued; zero when never queued
    std::chrono::steady_clock::time_point received{};

    // name must be lower-case
    std::optional<std::string> header(const std::string& name) const;

    // HTTP/1.1 keeps the connection unless told to close; HTTP/1.0 the opposite
    bool keep_alive() const;
};

struct HttpResponse {
    int status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

/*
 * HTTP/1.1 request parsing and response formatting.
 * Only Content-Length bodies are accepted; chunked uploads are refused.
 */
class Protocol {
public:
    static constexpr size_t MAX_HEAD_SIZE = 16 * 1024;
    static constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

    // Size of the first complete request in buffer, or nullopt if more
    // bytes are needed. Throws ProtocolError when it can never complete.
    static std::optional<size_t> message_length(std::string_view buffer);

    // Parses exactly one complete request as delimited by message_length()
    static HttpRequest parse(std::string_view message);

    static std::string format(const HttpResponse& response, bool keep_alive);

    static std::string_view reason_phrase(int status);

    // Decodes %XX escapes; throws ProtocolError on a broken escape
    static std::string percent_decode(std::string_view text);

private:
    // Offset just past the blank line ending the head, and its length
    static std::optional<std::pair<size_t, size_t>> find_head_end(std::string_view buffer);
    static size_t content_length(std::string_view head);

    static void parse_request_line(std::string_view line, HttpRequest& request);
    static void parse_header_line(std::string_view line, HttpRequest& request);
};

} // namespace ankiplace
