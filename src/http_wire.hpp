#pragma once
#include "http.hpp"
#include <string>
#include <vector>

// HTTP/1.1 message handling for the socket client, kept free of I/O.
namespace cronkit {

struct Endpoint {
    bool https = false;
    std::string host;   // without IPv6 brackets
    std::string port;
    std::string target; // path plus query
};

// Accepts http:// and https:// URLs, including bracketed IPv6 hosts.
bool parse_endpoint(const std::string& url, Endpoint& ep, std::string& error);

// "host:port" as written in a Host header or a Location URL
std::string authority_of(const Endpoint& ep);

// Undo chunked transfer coding. Stops at the zero-size chunk or where the
// input runs out; a chunk size larger than what remains is clamped.
std::string decode_chunked(const std::string& raw);

struct WireResponse {
    long status_code = 0;
    std::string location; // Location header, empty if absent
    std::string body;
};

// Split a complete response into status, Location and decoded body.
// False when the head is missing or the status line is malformed.
bool parse_response(const std::string& raw, WireResponse& resp);

std::string build_post(const Endpoint& ep, const std::string& body,
                       const std::vector<Header>& headers);

// Resolve a Location value against the URL that produced it
std::string resolve_location(const Endpoint& from, const std::string& location);

constexpr int kMaxRedirects = 5;

inline bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

} // namespace cronkit
