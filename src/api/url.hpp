#pragma once

#include <string>
#include <core/types.hpp>

// Parsed http:// or https:// URL. Only the parts the HTTP client needs are kept.
struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    int port = 80;
    std::string path;     // begins with '/', never empty
    std::string query;    // without the leading '?'

    // Request target for the HTTP request line: path[?query]
    std::string target() const;

    bool is_tls() const;

    // Host header value: host[:port] (port omitted when it is the scheme default)
    std::string host_header() const;

    std::string to_string() const;
};

// 80 for http, 443 for https.
int default_port(const std::string& scheme);

// Parse "http[s]://host[:port][/path][?query][#fragment]".
// Relative URLs and other schemes are rejected.
Result<Url> parse_url(const std::string& text);
