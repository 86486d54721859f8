#pragma once

#include <string>

namespace classnote {

struct url_parts {
    std::string scheme; // lowercase: http, https, ws, wss
    std::string host;
    std::string port;   // defaulted from the scheme when absent
    std::string target; // path and query, at least "/"

    bool tls() const { return scheme == "https" || scheme == "wss"; }
};

bool parse_url(const std::string & url, url_parts & parts);

// value of the Host header: the port is included only when it is not the scheme default
std::string url_host_header(const url_parts & parts);

// RFC 3986 unreserved characters are kept, everything else is %XX
std::string url_encode(const std::string & s);

// joins a base URL and a relative path with exactly one '/'
std::string url_join(const std::string & base, const std::string & path);

} // namespace classnote
