#include <catch2/catch.hpp>
#include <h2bridge/pool/pool_key.hpp>

#include <chrono>
#include <map>
#include <string>

using namespace h2bridge::pool;
using namespace std::chrono_literals;

TEST_CASE("pool keys are deterministic", "[pool][key]") {
    pool_context a;
    a.verify = true;
    a.max_connections = 100;
    a.keepalive_expiry = 10s;

    // Same settings, supplied in a different order
    pool_context b;
    b.keepalive_expiry = 10000ms;
    b.max_connections = 100;
    b.verify = true;

    auto ka = make_pool_key(a);
    auto kb = make_pool_key(b);
    REQUIRE(ka == kb);
    REQUIRE(pool_key_hash{}(ka) == pool_key_hash{}(kb));
}

TEST_CASE("every field distinguishes pool keys", "[pool][key]") {
    pool_context base;
    base.verify = true;
    const auto key = make_pool_key(base);

    SECTION("trust_env") {
        auto ctx = base;
        ctx.trust_env = false;
        REQUIRE_FALSE(make_pool_key(ctx) == key);
    }

    SECTION("verify kind") {
        auto ctx = base;
        ctx.verify = std::string("/etc/ssl/certs");
        REQUIRE_FALSE(make_pool_key(ctx) == key);
    }

    SECTION("client certificate") {
        auto ctx = base;
        ctx.cert = h2bridge::tls::client_cert{"client.pem", "client.key", std::nullopt};
        REQUIRE_FALSE(make_pool_key(ctx) == key);

        auto other = ctx;
        other.cert->key_file = std::nullopt;
        REQUIRE_FALSE(make_pool_key(other) == make_pool_key(ctx));
    }

    SECTION("protocol") {
        auto ctx = base;
        ctx.protocol = protocol_preference::http1_only;
        REQUIRE_FALSE(make_pool_key(ctx) == key);
    }

    SECTION("proxy and proxy headers") {
        auto proxied = make_pool_key(base, std::string("http://proxy:3128"));
        REQUIRE_FALSE(proxied == key);

        auto with_headers = make_pool_key(base, std::string("http://proxy:3128"),
                                          std::map<std::string, std::string>{{"X-Tag", "1"}});
        REQUIRE_FALSE(with_headers == proxied);
    }
}

TEST_CASE("protocol preference gates HTTP versions", "[pool][key]") {
    REQUIRE(allows_http1(protocol_preference::negotiate));
    REQUIRE(allows_http2(protocol_preference::negotiate));
    REQUIRE_FALSE(allows_http2(protocol_preference::http1_only));
    REQUIRE_FALSE(allows_http1(protocol_preference::http2_only));
}
