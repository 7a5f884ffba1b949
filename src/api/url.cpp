#include "url.hpp"
#include <core/utils.hpp>
#include <cctype>

std::string Url::target() const {
    return query.empty() ? path : path + "?" + query;
}

int default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

bool Url::is_tls() const {
    return scheme == "https";
}

std::string Url::host_header() const {
    return port == default_port(scheme) ? host : host + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target();
}

Result<Url> parse_url(const std::string& input) {
    std::string text = input;
    trim(text);

    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Result<Url>::Err(ErrorKind::InvalidLogUrl, "URL has no scheme: " + input);
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    for (auto& c : url.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (url.scheme != "http" && url.scheme != "https") {
        return Result<Url>::Err(ErrorKind::InvalidLogUrl,
                                "Unsupported URL scheme '" + url.scheme + "': " + input);
    }

    std::string rest = text.substr(scheme_end + 3);

    // Drop any fragment
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest.erase(hash);

    auto authority_end = rest.find_first_of("/?");
    std::string authority = rest.substr(0, authority_end);
    std::string path_and_query = authority_end == std::string::npos ? "" : rest.substr(authority_end);

    if (authority.find('@') != std::string::npos) {
        return Result<Url>::Err(ErrorKind::InvalidLogUrl, "URL user info is not supported: " + input);
    }

    url.port = default_port(url.scheme);
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port_str = authority.substr(colon + 1);
        url.host = authority.substr(0, colon);
        if (!port_str.empty()) {
            for (char c : port_str) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return Result<Url>::Err(ErrorKind::InvalidLogUrl, "Invalid port in URL: " + input);
                }
            }
            url.port = safe_stoi(port_str, -1);
            if (url.port <= 0 || url.port > 65535) {
                return Result<Url>::Err(ErrorKind::InvalidLogUrl, "Invalid port in URL: " + input);
            }
        }
    } else {
        url.host = authority;
    }

    if (url.host.empty()) {
        return Result<Url>::Err(ErrorKind::InvalidLogUrl, "URL has no host: " + input);
    }

    auto qmark = path_and_query.find('?');
    if (qmark != std::string::npos) {
        url.path = path_and_query.substr(0, qmark);
        url.query = path_and_query.substr(qmark + 1);
    } else {
        url.path = path_and_query;
    }
    if (url.path.empty()) url.path = "/";

    return Result<Url>::Ok(url);
}
