#include "utils.hpp"
#include <cctype>
#include <cstdio>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (...) {
        return fallback;
    }
}

bool valid_string_id(const std::string& id) {
    if (id.empty()) return false;
    for (char c : id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '.' || c == '_') continue;
        return false;
    }
    return true;
}

std::string query_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += c;
        } else if (c == ' ') {
            out += '+';
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", uc);
            out += hex;
        }
    }
    return out;
}
