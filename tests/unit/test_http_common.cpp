#include <catch2/catch.hpp>
#include <h2bridge/http/http2_adapter.hpp>
#include <h2bridge/http/http_common.hpp>

#include <string>

using namespace h2bridge::http;

TEST_CASE("headers are case-insensitive", "[http][headers]") {
    headers h{{"Content-Type", "text/plain"}};

    REQUIRE(h.get("content-type") == "text/plain");
    REQUIRE(h.contains("CONTENT-TYPE"));
    REQUIRE(h.content_type() == "text/plain");
    REQUIRE_FALSE(h.find("Accept").has_value());

    h.add("accept", "text/html");
    h.add("Accept", "application/json");
    REQUIRE(h.get("Accept") == "text/html, application/json");
    REQUIRE(h.size() == 2);

    h.set("ACCEPT", "*/*");
    REQUIRE(h.get("accept") == "*/*");

    h.set("Content-Length", "42");
    REQUIRE(h.content_length() == 42u);
    h.set("Content-Length", "abc");
    REQUIRE_FALSE(h.content_length().has_value());

    h.remove("content-length");
    REQUIRE_FALSE(h.contains("Content-Length"));
}

TEST_CASE("url parsing", "[http][url]") {
    SECTION("full URL") {
        auto u = url::parse("HTTPS://user:pw@Example.COM:8443/a/b?x=1#frag");
        REQUIRE(u.has_value());
        REQUIRE(u->scheme == "https");
        REQUIRE(u->host == "example.com");
        REQUIRE(u->port == 8443);
        REQUIRE(u->path == "/a/b");
        REQUIRE(u->query == "x=1");
        REQUIRE(u->fragment == "frag");
        REQUIRE(u->userinfo == "user:pw");
        REQUIRE(u->host_port() == "example.com:8443");
        REQUIRE(u->authority() == "user:pw@example.com:8443");
    }

    SECTION("default ports are omitted from host_port") {
        REQUIRE(url::parse("https://example.com:443/")->host_port() == "example.com");
        REQUIRE(url::parse("http://example.com")->effective_port() == 80);
        REQUIRE(url::parse("https://example.com")->effective_port() == 443);
    }

    SECTION("IPv6 literals") {
        auto u = url::parse("http://[::1]:8080/");
        REQUIRE(u.has_value());
        REQUIRE(u->host == "::1");
        REQUIRE(u->host_port() == "[::1]:8080");
        REQUIRE_FALSE(url::parse("http://[::1/").has_value());
    }

    SECTION("malformed ports") {
        REQUIRE_FALSE(url::parse("http://example.com:http/").has_value());
        REQUIRE_FALSE(url::parse("http://example.com:99999/").has_value());
    }

    SECTION("missing scheme") {
        auto u = url::parse("proxy.local:3128");
        REQUIRE(u->scheme.empty());
        REQUIRE(u->host == "proxy.local");
        REQUIRE(u->port == 3128);
    }
}

TEST_CASE("percent_decode", "[http][url]") {
    REQUIRE(percent_decode("a%20b") == "a b");
    REQUIRE(percent_decode("%41%42") == "AB");
    REQUIRE(percent_decode("100%") == "100%");
    REQUIRE(percent_decode("%zz") == "%zz");
    REQUIRE(percent_decode("a+b") == "a+b");
}

TEST_CASE("status reasons", "[http]") {
    REQUIRE(status_reason(200) == "OK");
    REQUIRE(status_reason(404) == "Not Found");
    REQUIRE(status_reason(799).empty());
}

TEST_CASE("response header decoding", "[http][headers]") {
    SECTION("plain ASCII, repeated names joined") {
        auto h = decode_headers({{"Set-Cookie", "a=1"}, {"set-cookie", "b=2"}, {"Server", "fake"}});
        REQUIRE(h.get("Set-Cookie") == "a=1, b=2");
        REQUIRE(h.get("server") == "fake");
    }

    SECTION("UTF-8 values are kept") {
        auto h = decode_headers({{"X-Name", "caf\xc3\xa9"}});
        REQUIRE(h.get("X-Name") == "caf\xc3\xa9");
    }

    SECTION("invalid UTF-8 falls back to ISO-8859-1 for every header") {
        auto h = decode_headers({{"X-A", "caf\xc3\xa9"}, {"X-B", "na\xefve"}});
        // Both values were decoded as Latin-1, then re-encoded as UTF-8
        REQUIRE(h.get("X-A") == "caf\xc3\x83\xc2\xa9");
        REQUIRE(h.get("X-B") == "na\xc3\xafve");
    }

    SECTION("overlong UTF-8 is rejected") {
        auto h = decode_headers({{"X-A", "\xc0\xaf"}});
        REQUIRE(h.get("X-A") == "\xc3\x80\xc2\xaf");
    }
}

TEST_CASE("encoding from Content-Type", "[http][encoding]") {
    auto encoding_of = [](const char* content_type) {
        headers h;
        if (content_type) h.set("Content-Type", content_type);
        return encoding_from_content_type(h);
    };

    REQUIRE(encoding_of("text/html; charset=ISO-8859-1") == "ISO-8859-1");
    REQUIRE(encoding_of("text/html; charset=\"utf-8\"") == "utf-8");
    REQUIRE(encoding_of("application/xml;charset='latin1' ") == "latin1");
    REQUIRE_FALSE(encoding_of("text/plain").has_value());
    REQUIRE(encoding_of("application/json") == "utf-8");
    REQUIRE_FALSE(encoding_of("application/octet-stream").has_value());
    REQUIRE_FALSE(encoding_of(nullptr).has_value());
}
