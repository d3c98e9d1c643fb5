#include "http_client.h"
#include "hex.h"
#include "log.h"
#include "url.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace tollgate {

static constexpr int MAX_REDIRECTS = 5;
static constexpr size_t MAX_RESPONSE_BYTES = 32u * 1024u * 1024u;

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

bool is_timeout_error(const std::string& err) {
    return err.compare(0, 7, "timeout") == 0;
}

static std::string ssl_error_string() {
    unsigned long e = ERR_get_error();
    if (e == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

static bool set_timeout(int fd, int ms) {
    timeval tv; tv.tv_sec = ms / 1000; tv.tv_usec = (ms % 1000) * 1000;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0
        && setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

// Non-blocking connect bounded by timeout_ms, then back to blocking mode.
static bool connect_with_timeout(int fd, const sockaddr* addr, socklen_t len, int timeout_ms, bool& timed_out) {
    timed_out = false;
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;
    int rc = ::connect(fd, addr, len);
    if (rc != 0) {
        if (errno != EINPROGRESS) return false;
        pollfd p{}; p.fd = fd; p.events = POLLOUT;
        rc = ::poll(&p, 1, timeout_ms);
        if (rc == 0) { timed_out = true; return false; }
        if (rc < 0) return false;
        int so_err = 0; socklen_t sl = sizeof(so_err);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &sl) != 0 || so_err != 0) return false;
    }
    return fcntl(fd, F_SETFL, flags) == 0;
}

static int open_socket(const std::string& host, uint16_t port, int timeout_ms, std::string& err) {
    std::string h = host;
    if (!h.empty() && h.front() == '[') h = h.substr(1, h.size() - 2);

    addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM;
    char portbuf[16]; std::snprintf(portbuf, sizeof(portbuf), "%u", (unsigned)port);
    addrinfo* res = nullptr;
    int gai = getaddrinfo(h.c_str(), portbuf, &hints, &res);
    if (gai != 0) { err = "resolve " + h + ": " + gai_strerror(gai); return -1; }

    int fd = -1;
    bool any_timeout = false;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        bool timed_out = false;
        if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms, timed_out) &&
            set_timeout(fd, timeout_ms)) {
            break;
        }
        any_timeout = any_timeout || timed_out;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(res);
    if (fd < 0) err = any_timeout ? "timeout connecting to " + h : "connect to " + h + " failed";
    return fd;
}

namespace {

// One connection, plain or TLS. Owns the socket and the SSL object.
class Conn {
public:
    Conn(int fd, SSL* ssl) : fd_(fd), ssl_(ssl) {}
    ~Conn() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (fd_ >= 0) ::close(fd_);
    }
    Conn(const Conn&) = delete;
    Conn& operator=(const Conn&) = delete;

    bool write_all(const std::string& data, std::string& err) {
        size_t off = 0;
        while (off < data.size()) {
            int n;
            if (ssl_) {
                n = SSL_write(ssl_, data.data() + off, (int)std::min<size_t>(data.size() - off, 1 << 20));
            } else {
                n = (int)::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            }
            if (n <= 0) {
                err = (errno == EAGAIN || errno == EWOULDBLOCK) ? "timeout sending request" : "send failed";
                return false;
            }
            off += (size_t)n;
        }
        return true;
    }

    // Returns bytes read, 0 on orderly close, -1 on error.
    int read_some(char* buf, size_t cap, std::string& err) {
        errno = 0;
        if (ssl_) {
            int n = SSL_read(ssl_, buf, (int)cap);
            if (n > 0) return n;
            int e = SSL_get_error(ssl_, n);
            if (e == SSL_ERROR_ZERO_RETURN) return 0;
            if (e == SSL_ERROR_SYSCALL && errno == 0) return 0; // peer closed without close_notify
            if (errno == EAGAIN || errno == EWOULDBLOCK) { err = "timeout reading response"; return -1; }
            err = "TLS read failed: " + ssl_error_string();
            return -1;
        }
        ssize_t n = ::recv(fd_, buf, cap, 0);
        if (n >= 0) return (int)n;
        err = (errno == EAGAIN || errno == EWOULDBLOCK) ? "timeout reading response" : "recv failed";
        return -1;
    }

private:
    int fd_;
    SSL* ssl_;
};

}

static bool decode_chunked(const std::string& in, std::string& out) {
    out.clear();
    size_t pos = 0;
    for (;;) {
        size_t nl = in.find("\r\n", pos);
        if (nl == std::string::npos) return false;
        std::string size_line = in.substr(pos, nl - pos);
        size_t semi = size_line.find(';');
        if (semi != std::string::npos) size_line.resize(semi);
        if (size_line.empty() || !is_hex_string(size_line)) return false;
        size_t len = std::strtoul(size_line.c_str(), nullptr, 16);
        pos = nl + 2;
        if (len == 0) return true;
        if (pos + len > in.size()) return false;
        out.append(in, pos, len);
        pos += len + 2;
    }
}

static bool parse_response(const std::string& buf, HttpResponse& out, std::string& err) {
    size_t pos = buf.find("\r\n");
    size_t hdr_end = buf.find("\r\n\r\n");
    if (pos == std::string::npos || hdr_end == std::string::npos) { err = "malformed HTTP response"; return false; }
    const std::string status = buf.substr(0, pos);
    if (status.compare(0, 5, "HTTP/") != 0) { err = "malformed status line"; return false; }
    size_t sp = status.find(' ');
    out.code = sp == std::string::npos ? 0 : std::atoi(status.c_str() + sp + 1);
    if (out.code <= 0) { err = "malformed status line"; return false; }

    out.headers.clear();
    size_t cur = pos + 2;
    while (cur < hdr_end) {
        size_t nl = buf.find("\r\n", cur);
        if (nl == std::string::npos || nl > hdr_end) break;
        std::string line = buf.substr(cur, nl - cur);
        cur = nl + 2;
        size_t c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = to_lower(line.substr(0, c));
        std::string v = line.substr(c + 1);
        while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
        while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
        out.headers[k] = v;
    }

    std::string raw = buf.substr(hdr_end + 4);
    if (to_lower(out.header("transfer-encoding")).find("chunked") != std::string::npos) {
        if (!decode_chunked(raw, out.body)) { err = "malformed chunked body"; return false; }
    } else {
        const std::string cl = out.header("content-length");
        if (!cl.empty()) {
            size_t n = std::strtoul(cl.c_str(), nullptr, 10);
            if (raw.size() < n) { err = "truncated response body"; return false; }
            raw.resize(n);
        }
        out.body = std::move(raw);
    }
    return true;
}

HttpClient::HttpClient() {
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        log_error(LogCategory::NET, "SSL_CTX_new failed: " + ssl_error_string());
        return;
    }
    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        log_warn(LogCategory::NET, "could not load system CA store: " + ssl_error_string());
    }
}

HttpClient::~HttpClient() {
    if (ctx_) SSL_CTX_free(ctx_);
}

bool HttpClient::send(const HttpRequest& req, HttpResponse& out, std::string& err) {
    HttpRequest cur = req;
    for (int hop = 0; hop <= MAX_REDIRECTS; ++hop) {
        if (!send_once(cur, out, err)) return false;
        const bool redirect = out.code == 301 || out.code == 302 || out.code == 303 ||
                              out.code == 307 || out.code == 308;
        const std::string location = out.header("location");
        if (!redirect || location.empty() || cur.method != "GET") return true;

        Url base;
        if (!parse_url(cur.url, base, err)) return false;
        cur.url = resolve_url(base, location);
        TOLLGATE_LOG_DEBUG(LogCategory::NET, "redirect " + std::to_string(out.code) + " -> " + cur.url);
    }
    err = "too many redirects";
    return false;
}

bool HttpClient::send_once(const HttpRequest& req, HttpResponse& out, std::string& err) {
    Url u;
    if (!parse_url(req.url, u, err)) { err = "invalid url: " + err; return false; }
    const int timeout_ms = req.timeout_ms > 0 ? req.timeout_ms : 30000;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    int fd = open_socket(u.host, u.port, timeout_ms, err);
    if (fd < 0) return false;

    SSL* ssl = nullptr;
    if (u.scheme == "https") {
        if (!ctx_) { ::close(fd); err = "TLS unavailable"; return false; }
        ssl = SSL_new(ctx_);
        if (!ssl) { ::close(fd); err = "SSL_new failed: " + ssl_error_string(); return false; }
    }
    Conn conn(fd, ssl);

    if (ssl) {
        std::string sni = u.host;
        const bool literal = !sni.empty() && (sni.front() == '[' || sni.find_first_not_of("0123456789.") == std::string::npos);
        if (!literal) SSL_set_tlsext_host_name(ssl, sni.c_str());
        if (literal) {
            if (sni.front() == '[') sni = sni.substr(1, sni.size() - 2);
            X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), sni.c_str());
        } else {
            SSL_set1_host(ssl, sni.c_str());
        }
        SSL_set_fd(ssl, fd);
        errno = 0;
        if (SSL_connect(ssl) != 1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) err = "timeout during TLS handshake";
            else err = "TLS handshake with " + u.host + " failed: " + ssl_error_string();
            return false;
        }
    }

    std::string wire;
    wire.reserve(256 + req.body.size());
    wire += req.method + " " + u.target + " HTTP/1.1\r\n";
    wire += "Host: " + u.host_header() + "\r\n";
    bool has_ua = false, has_ct = false;
    for (const auto& h : req.headers) {
        const std::string k = to_lower(h.first);
        has_ua = has_ua || k == "user-agent";
        has_ct = has_ct || k == "content-type";
        wire += h.first + ": " + h.second + "\r\n";
    }
    if (!has_ua) wire += "User-Agent: tollgate/1.0\r\n";
    if (!req.body.empty() || req.method == "POST") {
        if (!has_ct) wire += "Content-Type: application/json\r\n";
        wire += "Content-Length: " + std::to_string(req.body.size()) + "\r\n";
    }
    wire += "Accept-Encoding: identity\r\n";
    wire += "Connection: close\r\n\r\n";
    wire += req.body;

    if (!conn.write_all(wire, err)) return false;

    std::string buf;
    buf.reserve(8192);
    char tmp[8192];
    for (;;) {
        if (std::chrono::steady_clock::now() > deadline) { err = "timeout reading response"; return false; }
        int n = conn.read_some(tmp, sizeof(tmp), err);
        if (n < 0) return false;
        if (n == 0) break;
        buf.append(tmp, (size_t)n);
        if (buf.size() > MAX_RESPONSE_BYTES) { err = "response too large"; return false; }
    }

    out = HttpResponse{};
    if (!parse_response(buf, out, err)) return false;
    out.url = req.url;
    TOLLGATE_LOG_TRACE(LogCategory::NET, req.method + " " + req.url + " -> " + std::to_string(out.code));
    return true;
}

}
