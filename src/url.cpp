#include "classnote/url.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace classnote {

bool parse_url(const std::string & url, url_parts & parts) {
    const size_t p_scheme = url.find("://");
    if (p_scheme == std::string::npos || p_scheme == 0) {
        return false;
    }

    parts.scheme = url.substr(0, p_scheme);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
            [](unsigned char c) { return (char) std::tolower(c); });

    if (parts.scheme != "http" && parts.scheme != "https" && parts.scheme != "ws" && parts.scheme != "wss") {
        return false;
    }

    const size_t p_host = p_scheme + 3;
    size_t p_target = url.find_first_of("/?", p_host);
    if (p_target == std::string::npos) {
        p_target = url.size();
    }

    std::string authority = url.substr(p_host, p_target - p_host);
    const size_t p_at = authority.rfind('@');
    if (p_at != std::string::npos) {
        authority = authority.substr(p_at + 1);
    }

    const size_t p_port = authority.rfind(':');
    if (p_port != std::string::npos && authority.find(']', p_port) == std::string::npos) {
        parts.host = authority.substr(0, p_port);
        parts.port = authority.substr(p_port + 1);
        if (parts.port.empty() || !std::all_of(parts.port.begin(), parts.port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
    } else {
        parts.host = authority;
        parts.port = parts.tls() ? "443" : "80";
    }

    if (parts.host.empty()) {
        return false;
    }

    parts.target = url.substr(p_target);
    if (parts.target.empty() || parts.target[0] != '/') {
        parts.target = "/" + parts.target;
    }

    return true;
}

std::string url_host_header(const url_parts & parts) {
    if (parts.port == (parts.tls() ? "443" : "80")) {
        return parts.host;
    }
    return parts.host + ":" + parts.port;
}

std::string url_encode(const std::string & s) {
    std::string result;
    result.reserve(s.size());

    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += (char) c;
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }

    return result;
}

std::string url_join(const std::string & base, const std::string & path) {
    std::string result = base;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    size_t first = 0;
    while (first < path.size() && path[first] == '/') {
        ++first;
    }
    return result + "/" + path.substr(first);
}

} // namespace classnote
