#include <catch2/catch.hpp>
#include <h2bridge/error/exception_mapper.hpp>
#include <h2bridge/error/exceptions.hpp>
#include <h2bridge/transport/transport_error.hpp>

#include <stdexcept>
#include <string>

using namespace h2bridge::error;
using h2bridge::transport::errc;
using h2bridge::transport::transport_error;

TEST_CASE("error kinds mirror the class hierarchy", "[error]") {
    REQUIRE(is_subkind(error_kind::proxy, error_kind::connection));
    REQUIRE(is_subkind(error_kind::proxy, error_kind::network));
    REQUIRE(is_subkind(error_kind::connect_timeout, error_kind::timeout));
    REQUIRE(is_subkind(error_kind::invalid_ca_bundle, error_kind::config));
    REQUIRE(is_subkind(error_kind::tls, error_kind::request));
    REQUIRE_FALSE(is_subkind(error_kind::timeout, error_kind::connect_timeout));
    REQUIRE_FALSE(is_subkind(error_kind::read, error_kind::timeout));

    REQUIRE_THROWS_AS(throw_error(error_kind::proxy, "x"), connection_error);
    REQUIRE_THROWS_AS(throw_error(error_kind::read_timeout, "x"), timeout_error);
    REQUIRE_THROWS_AS(throw_error(error_kind::proxy_scheme_unknown, "x"), config_error);
}

TEST_CASE("thrown classes report their kind", "[error]") {
    try {
        throw_error(error_kind::remote_protocol, "bad frame");
    } catch (const request_error& e) {
        REQUIRE(e.kind() == error_kind::remote_protocol);
        REQUIRE(std::string(e.what()) == "bad frame");
    }
}

TEST_CASE("resolve picks the most specific mapping", "[error][mapper]") {
    REQUIRE(resolve(errc::timeout) == error_kind::timeout);
    REQUIRE(resolve(errc::connect_timeout) == error_kind::connect_timeout);
    REQUIRE(resolve(errc::pool_timeout) == error_kind::pool_timeout);
    REQUIRE(resolve(errc::network) == error_kind::network);
    REQUIRE(resolve(errc::write) == error_kind::write);
    REQUIRE(resolve(errc::proxy) == error_kind::proxy);
    REQUIRE(resolve(errc::local_protocol) == error_kind::local_protocol);
    REQUIRE(resolve(errc::unsupported_protocol) == error_kind::unsupported_protocol);
    REQUIRE_FALSE(resolve(errc::other).has_value());
}

TEST_CASE("map_transport_errors translates and nests", "[error][mapper]") {
    SECTION("value is returned untouched") {
        REQUIRE(map_transport_errors([] { return 42; }) == 42);
    }

    SECTION("kind under two mapped ancestors maps to the specific one") {
        bool caught = false;
        try {
            map_transport_errors([]() -> int {
                throw transport_error(errc::read_timeout, "read timed out");
            });
        } catch (const read_timeout& e) {
            caught = true;
            REQUIRE(std::string(e.what()) == "read timed out");
            REQUIRE(e.kind() == error_kind::read_timeout);
            // The transport error is kept as the cause
            REQUIRE_THROWS_AS(std::rethrow_if_nested(e), transport_error);
        }
        REQUIRE(caught);
    }

    SECTION("connect maps to connection_error") {
        REQUIRE_THROWS_AS(map_transport_errors([] { throw transport_error(errc::connect, "refused"); }),
                          connection_error);
    }

    SECTION("unmapped kinds are rethrown unchanged") {
        try {
            map_transport_errors([] { throw transport_error(errc::other, "odd"); });
            FAIL("expected an exception");
        } catch (const request_error&) {
            FAIL("unmapped kind must not be translated");
        } catch (const transport_error& e) {
            REQUIRE(e.kind() == errc::other);
        }
    }

    SECTION("other exceptions pass through") {
        REQUIRE_THROWS_AS(map_transport_errors([] { throw std::logic_error("bug"); }), std::logic_error);
        REQUIRE_THROWS_AS(map_transport_errors([] { throw config_error("cfg"); }), config_error);
    }
}
