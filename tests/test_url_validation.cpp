#include "test_support.h"

#include "errors.h"
#include "url.h"

#include <string>

using namespace tollgate;

int main(){
    Url u;
    std::string err;
    TEST_CHECK(parse_url("https://Facilitator.Example:8443/v1/x?y=1#frag", u, err), "parse full url");
    TEST_CHECK(u.scheme == "https" && u.host == "facilitator.example" && u.port == 8443, "scheme, host, port");
    TEST_CHECK(u.target == "/v1/x?y=1", "target drops fragment");
    TEST_CHECK(u.origin() == "https://facilitator.example:8443", "origin keeps explicit port");
    TEST_CHECK(parse_url("http://example.com", u, err) && u.port == 80 && u.target == "/", "http defaults");
    TEST_CHECK(parse_url("https://[2001:db8::1]/p", u, err) && u.host == "[2001:db8::1]" && u.port == 443, "ipv6 literal");
    TEST_CHECK(!parse_url("ftp://example.com/", u, err), "ftp rejected");
    TEST_CHECK(!parse_url("not a url", u, err), "garbage rejected");

    TEST_CHECK(parse_url("https://a.example/dir/page", u, err), "base");
    TEST_CHECK(resolve_url(u, "/other") == "https://a.example/other", "absolute path reference");
    TEST_CHECK(resolve_url(u, "https://b.example/x") == "https://b.example/x", "absolute url reference");

    TEST_CHECK(is_allowed_url("https://facilitator.example"), "public https allowed");
    TEST_CHECK(is_allowed_url("https://8.8.8.8/settle"), "public ip allowed");

    const char* blocked[] = {
        "http://facilitator.example",          // not https
        "https://localhost/settle",
        "https://127.0.0.1/",
        "https://10.1.2.3/",
        "https://172.16.0.1/",
        "https://172.31.255.255/",
        "https://192.168.1.10/",
        "https://169.254.169.254/latest",
        "https://0.0.0.0/",
        "https://[::1]/",
        "https://[fe80::1]/",
        "https://[fd00::5]/",
        "https://[::ffff:192.168.1.1]/",
        "https://[::ffff:7f00:1]/",
        "https://[::ffff:a00:1]/",
        nullptr
    };
    for (const char** b = blocked; *b; ++b) {
        TEST_CHECK(!is_allowed_url(*b), *b);
    }
    TEST_CHECK(is_allowed_url("https://172.32.0.1/"), "172.32/16 is public");
    TEST_CHECK(is_allowed_url("https://[::ffff:808:808]/"), "mapped public address");

    bool threw = false;
    try {
        assert_allowed_url("https://192.168.0.1", "Facilitator URL");
    } catch (const EngineError& e) {
        threw = e.code() == ErrorCode::INVALID_URL &&
                e.detail() == "Facilitator URL must be HTTPS and cannot be a private IP address: https://192.168.0.1";
    }
    TEST_CHECK(threw, "assert_allowed_url message");

    std::printf("test_url_validation: OK\n");
    return 0;
}
