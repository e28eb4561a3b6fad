#include "http_wire.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdlib>

namespace cronkit {

bool parse_endpoint(const std::string& url, Endpoint& ep, std::string& error) {
    error = "URL using bad/illegal format: " + url;
    size_t sep = url.find("://");
    if (sep == std::string::npos) return false;

    std::string scheme = to_lower(url.substr(0, sep));
    if (scheme != "http" && scheme != "https") {
        error = "Unsupported protocol: " + scheme;
        return false;
    }
    ep.https = scheme == "https";

    size_t authority_start = sep + 3;
    size_t target_start = url.find_first_of("/?", authority_start);
    std::string authority = url.substr(authority_start, target_start == std::string::npos
                                                            ? std::string::npos
                                                            : target_start - authority_start);
    ep.target = target_start == std::string::npos ? "/" : url.substr(target_start);
    if (ep.target[0] == '?') ep.target.insert(0, "/");

    std::string port_part;
    bool has_port = false;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) return false;
        ep.host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') return false;
            port_part = after.substr(1);
            has_port = true;
        }
    } else {
        size_t colon = authority.find(':');
        ep.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_part = authority.substr(colon + 1);
            has_port = true;
        }
    }

    if (has_port) {
        if (!is_digits(port_part) || port_part.size() > 5 ||
            std::stol(port_part) < 1 || std::stol(port_part) > 65535) {
            return false;
        }
        ep.port = port_part;
    } else {
        ep.port = ep.https ? "443" : "80";
    }
    if (ep.host.empty()) return false;

    error.clear();
    return true;
}

std::string authority_of(const Endpoint& ep) {
    std::string host = ep.host.find(':') != std::string::npos ? "[" + ep.host + "]" : ep.host;
    bool default_port = ep.port == (ep.https ? "443" : "80");
    return default_port ? host : host + ":" + ep.port;
}

std::string decode_chunked(const std::string& raw) {
    std::string body;
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t eol = raw.find("\r\n", pos);
        if (eol == std::string::npos) break;

        const char* start = raw.c_str() + pos;
        char* end = nullptr;
        errno = 0;
        unsigned long long size = std::strtoull(start, &end, 16);
        if (end == start || errno == ERANGE || size == 0) break;

        pos = eol + 2;
        size_t available = raw.size() - pos;
        size_t take = size < available ? static_cast<size_t>(size) : available;
        body.append(raw, pos, take);
        if (take < size) break;
        pos += take;
        // Chunk data is followed by CRLF
        if (raw.compare(pos, 2, "\r\n") != 0) break;
        pos += 2;
    }
    return body;
}

bool parse_response(const std::string& raw, WireResponse& resp) {
    size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos || raw.compare(0, 5, "HTTP/") != 0) return false;

    size_t sp = raw.find(' ');
    if (sp == std::string::npos || sp > head_end) return false;
    std::string code = raw.substr(sp + 1, 3);
    if (!is_digits(code) || code.size() != 3) return false;
    long status = std::stol(code);
    if (status < 100) return false;

    bool chunked = false;
    std::string location;
    std::string head = raw.substr(0, head_end);
    for (const auto& line : split(head, '\n')) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (name == "transfer-encoding" && to_lower(value).find("chunked") != std::string::npos) {
            chunked = true;
        } else if (name == "location") {
            location = value;
        }
    }

    std::string body = raw.substr(head_end + 4);
    resp.status_code = status;
    resp.location = location;
    resp.body = chunked ? decode_chunked(body) : body;
    return true;
}

std::string build_post(const Endpoint& ep, const std::string& body,
                       const std::vector<Header>& headers) {
    std::string req = "POST " + ep.target + " HTTP/1.1\r\n";
    req += "Host: " + authority_of(ep) + "\r\n";
    req += "User-Agent: cronkit\r\n";
    for (const auto& [name, value] : headers) {
        req += name + ": " + value + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

std::string resolve_location(const Endpoint& from, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;

    std::string origin = std::string(from.https ? "https" : "http") + "://";
    if (location.compare(0, 2, "//") == 0) {
        return std::string(from.https ? "https:" : "http:") + location;
    }
    origin += authority_of(from);
    if (!location.empty() && location[0] == '/') return origin + location;

    // Relative to the directory of the current path
    std::string path = from.target.substr(0, from.target.find('?'));
    return origin + path.substr(0, path.rfind('/') + 1) + location;
}

} // namespace cronkit
