#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

struct ssl_ctx_st;

namespace tollgate {

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::pair<std::string,std::string>> headers;
    std::string body;
    int timeout_ms{30000};
};

struct HttpResponse {
    int code{0};
    std::string body;
    std::map<std::string,std::string> headers; // lowercased keys
    std::string url;                           // final URL after redirects

    // Case-insensitive lookup; empty when absent.
    std::string header(const std::string& name) const;
};

// Seam for the engine's network access. `err` starting with "timeout" marks
// a send/receive deadline expiry; any other failure is a plain transport error.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual bool send(const HttpRequest& req, HttpResponse& out, std::string& err) = 0;
};

// HTTP/1.1 over blocking sockets, TLS through OpenSSL with peer and hostname
// verification against the system trust store. GET follows up to five redirects.
class HttpClient : public HttpTransport {
public:
    HttpClient();
    ~HttpClient() override;
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    bool send(const HttpRequest& req, HttpResponse& out, std::string& err) override;

private:
    bool send_once(const HttpRequest& req, HttpResponse& out, std::string& err);

    ::ssl_ctx_st* ctx_{nullptr};
};

bool is_timeout_error(const std::string& err);

}
