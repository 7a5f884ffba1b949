#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// True if id is non-empty and only contains [A-Za-z0-9-._].
bool valid_string_id(const std::string& id);

// Percent-encode a value for use in a URL path segment or query value.
// Unreserved characters (RFC 3986) pass through; space becomes '+'.
std::string query_escape(const std::string& value);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
