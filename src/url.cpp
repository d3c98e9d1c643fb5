#include "url.h"
#include "errors.h"
#include "hex.h"

#include <cstdlib>

namespace tollgate {

std::string Url::host_header() const {
    const bool def = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
    return def ? host : host + ":" + std::to_string(port);
}

std::string Url::origin() const {
    return scheme + "://" + host_header();
}

bool parse_url(const std::string& s, Url& out, std::string& err) {
    const size_t sep = s.find("://");
    if (sep == std::string::npos) { err = "missing scheme"; return false; }
    out.scheme = to_lower(s.substr(0, sep));
    if (out.scheme != "http" && out.scheme != "https") { err = "unsupported scheme " + out.scheme; return false; }

    std::string rest = s.substr(sep + 3);
    const size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.resize(hash);

    const size_t path_start = rest.find_first_of("/?");
    std::string authority = path_start == std::string::npos ? rest : rest.substr(0, path_start);
    out.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (!out.target.empty() && out.target[0] == '?') out.target.insert(0, "/");

    const size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    if (authority.empty()) { err = "missing host"; return false; }

    std::string port_str;
    if (authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) { err = "unterminated IPv6 literal"; return false; }
        out.host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') { err = "bad authority"; return false; }
            port_str = authority.substr(close + 2);
        }
    } else {
        const size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            port_str = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }
    out.host = to_lower(out.host);
    if (out.host.empty() || out.host == "[]") { err = "missing host"; return false; }

    if (port_str.empty()) {
        out.port = out.scheme == "https" ? 443 : 80;
    } else {
        for (char c : port_str) {
            if (c < '0' || c > '9') { err = "bad port"; return false; }
        }
        const long p = std::strtol(port_str.c_str(), nullptr, 10);
        if (p <= 0 || p > 65535) { err = "bad port"; return false; }
        out.port = static_cast<uint16_t>(p);
    }
    return true;
}

std::string resolve_url(const Url& base, const std::string& ref) {
    if (ref.find("://") != std::string::npos) return ref;
    if (!ref.empty() && ref[0] == '/') return base.origin() + ref;
    std::string dir = base.target.substr(0, base.target.find('?'));
    dir = dir.substr(0, dir.rfind('/') + 1);
    return base.origin() + dir + ref;
}

static bool is_private_ipv4(int a, int b) {
    if (a == 10) return true;                       // 10.0.0.0/8
    if (a == 172 && b >= 16 && b <= 31) return true; // 172.16.0.0/12
    if (a == 192 && b == 168) return true;          // 192.168.0.0/16
    if (a == 169 && b == 254) return true;          // link-local
    if (a == 127) return true;                       // loopback
    if (a == 0) return true;                         // 0.0.0.0/8
    return false;
}

// Strict dotted quad; fills the first two octets.
static bool parse_dotted_quad(const std::string& s, int& a, int& b) {
    int parts[4];
    size_t i = 0;
    for (int k = 0; k < 4; ++k) {
        if (i >= s.size() || s[i] < '0' || s[i] > '9') return false;
        int v = 0, digits = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
            v = v * 10 + (s[i] - '0');
            if (++digits > 3) return false;
            ++i;
        }
        if (v > 255) return false;
        parts[k] = v;
        if (k < 3) {
            if (i >= s.size() || s[i] != '.') return false;
            ++i;
        }
    }
    if (i != s.size()) return false;
    a = parts[0];
    b = parts[1];
    return true;
}

static bool parse_hex_group(const std::string& s, unsigned& out) {
    if (s.empty() || s.size() > 4 || !is_hex_string(s)) return false;
    out = static_cast<unsigned>(std::strtoul(s.c_str(), nullptr, 16));
    return true;
}

bool is_private_host(const std::string& raw) {
    std::string host = to_lower(raw);
    if (host == "localhost" || host == "127.0.0.1" || host == "::1") return true;

    int a = 0, b = 0;
    if (parse_dotted_quad(host, a, b)) return is_private_ipv4(a, b);

    if (host.find(':') != std::string::npos) {
        if (!host.empty() && host.front() == '[') host.erase(0, 1);
        if (!host.empty() && host.back() == ']') host.pop_back();

        if (host == "::1") return true;
        if (host.compare(0, 5, "fe80:") == 0 || host.compare(0, 5, "fc00:") == 0 ||
            host.compare(0, 5, "fd00:") == 0) {
            return true;
        }

        static const std::string mapped = "::ffff:";
        if (host.compare(0, mapped.size(), mapped) == 0) {
            const std::string tail = host.substr(mapped.size());
            // dotted form: ::ffff:192.168.1.1
            if (parse_dotted_quad(tail, a, b)) return is_private_ipv4(a, b);
            // hex form: ::ffff:7f00:1
            const size_t colon = tail.find(':');
            unsigned hi = 0, lo = 0;
            if (colon != std::string::npos &&
                parse_hex_group(tail.substr(0, colon), hi) &&
                parse_hex_group(tail.substr(colon + 1), lo)) {
                return is_private_ipv4(static_cast<int>((hi >> 8) & 0xff), static_cast<int>(hi & 0xff));
            }
        }
    }
    return false;
}

bool is_allowed_url(const std::string& url) {
    Url u;
    std::string err;
    if (!parse_url(url, u, err)) return false;
    if (u.scheme != "https") return false;
    return !is_private_host(u.host);
}

void assert_allowed_url(const std::string& url, const std::string& label) {
    if (!is_allowed_url(url)) {
        throw EngineError(ErrorCode::INVALID_URL,
                          label + " must be HTTPS and cannot be a private IP address: " + url);
    }
}

}
