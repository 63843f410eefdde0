#include "ankiplace/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ankiplace {

namespace {

std::string to_lower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

// Calls fn for each line, without the line ending
// CRLF tolerance: bare LF is accepted too
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos)
            end = text.size();
        std::string_view line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        fn(line);
        pos = end + 1;
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace


std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

bool HttpRequest::keep_alive() const {
    auto connection = header("connection");
    if (connection) {
        std::string value = to_lower(*connection);
        if (value.find("close") != std::string::npos)
            return false;
        if (value.find("keep-alive") != std::string::npos)
            return true;
    }
    return version_minor >= 1;
}


std::optional<std::pair<size_t, size_t>> Protocol::find_head_end(std::string_view buffer) {
    size_t crlf = buffer.find("\r\n\r\n");
    size_t lf = buffer.find("\n\n");
    if (crlf == std::string_view::npos && lf == std::string_view::npos)
        return std::nullopt;
    if (lf < crlf)
        return std::make_pair(lf, lf + 2);
    return std::make_pair(crlf, crlf + 4);
}

size_t Protocol::content_length(std::string_view head) {
    std::optional<size_t> length;
    bool first = true;
    for_each_line(head, [&](std::string_view line) {
        if (first) {
            first = false;
            return;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos)
            return; // reported by parse()
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string_view value = trim(line.substr(colon + 1));

        if (name == "transfer-encoding")
            throw ProtocolError{"Transfer-Encoding is not supported", 501};
        if (name != "content-length")
            return;

        size_t parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size())
            throw ProtocolError{"invalid Content-Length"};
        if (length && *length != parsed)
            throw ProtocolError{"conflicting Content-Length headers"};
        length = parsed;
    });

    size_t result = length.value_or(0);
    if (result > MAX_BODY_SIZE)
        throw ProtocolError{"request body too large", 413};
    return result;
}

std::optional<size_t> Protocol::message_length(std::string_view buffer) {
    auto head_end = find_head_end(buffer);
    if (!head_end) {
        if (buffer.size() > MAX_HEAD_SIZE)
            throw ProtocolError{"request head too large", 431};
        return std::nullopt;
    }
    if (head_end->first > MAX_HEAD_SIZE)
        throw ProtocolError{"request head too large", 431};

    size_t total = head_end->second + content_length(buffer.substr(0, head_end->first));
    if (buffer.size() < total)
        return std::nullopt; // Body not fully received yet
    return total;
}

HttpRequest Protocol::parse(std::string_view message) {
    auto head_end = find_head_end(message);
    if (!head_end)
        throw ProtocolError{"incomplete request head"};

    std::string_view head = message.substr(0, head_end->first);
    HttpRequest request;
    bool first = true;
    for_each_line(head, [&](std::string_view line) {
        if (first) {
            parse_request_line(line, request);
            first = false;
        } else {
            parse_header_line(line, request);
        }
    });

    request.body = std::string{message.substr(head_end->second)};
    return request;
}

void Protocol::parse_request_line(std::string_view line, HttpRequest& request) {
    auto first_space = line.find(' ');
    auto last_space = line.rfind(' ');
    if (first_space == std::string_view::npos || first_space == last_space)
        throw ProtocolError{"malformed request line"};

    std::string_view method = line.substr(0, first_space);
    std::string_view target = trim(line.substr(first_space + 1, last_space - first_space - 1));
    std::string_view version = line.substr(last_space + 1);

    if (method.empty() || !std::all_of(method.begin(), method.end(), [](unsigned char c) {
            return std::isupper(c);
        }))
        throw ProtocolError{"malformed method"};
    if (target.empty() || target.front() != '/')
        throw ProtocolError{"malformed request target"};

    if (version == "HTTP/1.1")
        request.version_minor = 1;
    else if (version == "HTTP/1.0")
        request.version_minor = 0;
    else
        throw ProtocolError{"unsupported HTTP version", 505};

    request.method = std::string{method};
    request.target = std::string{target};

    auto question = target.find('?');
    if (question != std::string_view::npos) {
        request.query = std::string{target.substr(question + 1)};
        target = target.substr(0, question);
    }
    request.path = percent_decode(target);
}

void Protocol::parse_header_line(std::string_view line, HttpRequest& request) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0)
        throw ProtocolError{"malformed header line"};

    std::string_view name = line.substr(0, colon);
    if (name.find_first_of(" \t") != std::string_view::npos)
        throw ProtocolError{"malformed header name"};

    std::string key = to_lower(name);
    std::string_view value = trim(line.substr(colon + 1));
    auto it = request.headers.find(key);
    if (it == request.headers.end())
        request.headers.emplace(std::move(key), std::string{value});
    else
        it->second += ", " + std::string{value}; // Repeated headers fold into one list
}

std::string Protocol::percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size())
            throw ProtocolError{"broken percent escape"};
        int hi = hex_value(text[i + 1]);
        int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0)
            throw ProtocolError{"broken percent escape"};
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

std::string Protocol::format(const HttpResponse& response, bool keep_alive) {
    std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " +
                      std::string{reason_phrase(response.status)} + "\r\n";
    for (const auto& [name, value] : response.headers)
        out += name + ": " + value + "\r\n";
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";
    out += response.body;
    return out;
}

std::string_view Protocol::reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

} // namespace ankiplace
