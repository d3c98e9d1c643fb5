#pragma once
#include <cstdint>
#include <string>

namespace tollgate {

struct Url {
    std::string scheme;   // lowercase, "http" | "https"
    std::string host;     // lowercase; IPv6 literals keep their brackets
    uint16_t    port{0};  // explicit or scheme default
    std::string target;   // path + query, at least "/"

    std::string origin() const;       // scheme://host[:port]
    std::string host_header() const;  // host[:port] when non-default
};

// http and https only; userinfo and fragments are dropped.
bool parse_url(const std::string& s, Url& out, std::string& err);

// Resolve `ref` (absolute URL or absolute path) against `base`.
std::string resolve_url(const Url& base, const std::string& ref);

// HTTPS only, and the host must not be loopback, private, link-local or an
// IPv4-mapped form of one. Throws EngineError(INVALID_URL) prefixed with `label`.
void assert_allowed_url(const std::string& url, const std::string& label);
bool is_allowed_url(const std::string& url);

// Host is a blocked name or address literal (brackets allowed).
bool is_private_host(const std::string& host);

}
