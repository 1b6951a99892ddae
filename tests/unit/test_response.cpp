#include <catch2/catch.hpp>
#include <h2bridge/error/exceptions.hpp>
#include <h2bridge/http/response.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "../test_main.cpp"

using namespace h2bridge;
using namespace h2bridge::http;
using namespace h2bridge::test;

namespace {

struct body_fixture {
    std::shared_ptr<std::atomic<int>> closes = std::make_shared<std::atomic<int>>(0);

    std::unique_ptr<raw_response> make(std::vector<std::string> fragments,
                                       const char* content_encoding = nullptr,
                                       std::optional<transport::errc> fail_with = std::nullopt) {
        headers h;
        if (content_encoding) h.set("Content-Encoding", content_encoding);
        auto stream = std::make_unique<fake_stream>(std::move(fragments), fail_with, closes);
        return std::make_unique<raw_response>(std::move(stream), h);
    }
};

std::vector<std::string> drain(body_reader reader) {
    std::vector<std::string> out;
    while (auto chunk = reader.next()) {
        out.push_back(std::move(*chunk));
    }
    return out;
}

/// Stream whose transport throws something that is not a std::exception
class throwing_stream : public transport::byte_stream {
public:
    explicit throwing_stream(std::shared_ptr<std::atomic<int>> closes) : closes_(std::move(closes)) {}

    std::optional<std::string> read() override {
        if (reads_++ == 0) {
            return std::string("first");
        }
        throw 42;
    }

    void close() override { closes_->fetch_add(1); }

private:
    int reads_ = 0;
    std::shared_ptr<std::atomic<int>> closes_;
};

} // namespace

TEST_CASE("raw_response streams re-chunked bodies", "[response]") {
    body_fixture f;

    SECTION("fixed chunk size") {
        auto raw = f.make({"abc", "defgh", "ij"});
        auto chunks = drain(raw->stream(4));
        REQUIRE(chunks == std::vector<std::string>{"abcd", "efgh", "ij"});
        REQUIRE(raw->closed());
        REQUIRE(f.closes->load() == 1);
    }

    SECTION("transport framing kept without a size") {
        auto raw = f.make({"abc", "", "defgh"});
        REQUIRE(drain(raw->iter_raw()) == std::vector<std::string>{"abc", "defgh"});
    }

    SECTION("read collects everything") {
        auto raw = f.make({"hello ", "world"});
        REQUIRE(raw->read(false) == "hello world");
    }

    SECTION("close is idempotent") {
        auto raw = f.make({"x"});
        raw->close();
        raw->release_conn();
        raw->close();
        REQUIRE(f.closes->load() == 1);
    }

    SECTION("reading after an early close fails") {
        auto raw = f.make({"abcdef", "ghij"});
        auto reader = raw->stream(4);
        REQUIRE(reader.next() == "abcd");
        raw->close();
        // The buffered "ef" must not pass for the end of the body
        REQUIRE_THROWS_AS(reader.next(), error::read_error);
        REQUIRE_THROWS_AS(raw->read(false), error::read_error);
    }

    SECTION("a fully read body stays readable as empty") {
        auto raw = f.make({"done"});
        REQUIRE(raw->read(false) == "done");
        raw->close();
        REQUIRE(raw->read(false).empty());
    }

    SECTION("destruction closes an unread body") {
        auto raw = f.make({"unread"});
        raw.reset();
        REQUIRE(f.closes->load() == 1);
    }

    SECTION("null stream is an empty body") {
        raw_response raw(nullptr, headers{});
        REQUIRE(raw.read(true).empty());
    }
}

TEST_CASE("raw_response decodes on request", "[response][codec]") {
    body_fixture f;
    const auto payload = make_payload(10000);

    SECTION("decoded stream") {
        auto raw = f.make(fragment(gzip_compress(payload), 1000), "gzip");
        REQUIRE(raw->content_encoding() == "gzip");
        std::string joined;
        for (auto& c : drain(raw->stream(4096, true))) joined += c;
        REQUIRE(joined == payload);
    }

    SECTION("decode_content defaults to off") {
        const auto compressed = gzip_compress(payload);
        auto raw = f.make({compressed}, "gzip");
        REQUIRE(raw->stream(std::nullopt).read_all() == compressed);
    }
}

TEST_CASE("body errors are sticky", "[response][errors]") {
    body_fixture f;

    SECTION("decode failure surfaces at the offending chunk") {
        const auto compressed = brotli_compress("complete stream");
        auto raw = f.make({compressed, "trailing"}, "br");
        auto reader = raw->stream(std::nullopt, true);
        REQUIRE(reader.next() == "complete stream");
        REQUIRE_THROWS_AS(reader.next(), error::content_decoding_error);
        REQUIRE(f.closes->load() == 1);
        // Later pulls rethrow instead of resuming
        REQUIRE_THROWS_AS(reader.next(), error::content_decoding_error);
        REQUIRE(reader.done());
    }

    SECTION("transport failure mid-body is mapped") {
        auto raw = f.make({"0123456789"}, nullptr, transport::errc::read);
        auto reader = raw->stream(4);
        REQUIRE(reader.next() == "0123");
        REQUIRE(reader.next() == "4567");
        REQUIRE_THROWS_AS(reader.next(), error::read_error);
        REQUIRE_THROWS_AS(reader.next(), error::read_error);
    }

    SECTION("unmapped transport failures pass through unchanged") {
        auto raw = f.make({}, nullptr, transport::errc::other);
        auto reader = raw->stream();
        REQUIRE_THROWS_AS(reader.next(), transport::transport_error);
    }

    SECTION("non-standard exceptions also end the stream") {
        raw_response raw(std::make_unique<throwing_stream>(f.closes), headers{});
        auto reader = raw.iter_raw();
        REQUIRE(reader.next() == "first");
        REQUIRE_THROWS_AS(reader.next(), int);
        REQUIRE(raw.closed());
        REQUIRE(f.closes->load() == 1);
        REQUIRE_THROWS_AS(reader.next(), int);
    }

    SECTION("new readers rethrow an earlier failure") {
        auto raw = f.make({"not gzip"}, "gzip");
        REQUIRE_THROWS_AS(raw->read(true), error::content_decoding_error);
        REQUIRE_THROWS_AS(raw->read(true), error::content_decoding_error);
        REQUIRE_THROWS_AS(raw->stream(4, true).next(), error::content_decoding_error);
        REQUIRE_THROWS_AS(raw->iter_raw().next(), error::content_decoding_error);
    }

    SECTION("transport failures are remembered across readers") {
        auto raw = f.make({"0123"}, nullptr, transport::errc::read);
        REQUIRE_THROWS_AS(raw->read(false), error::read_error);
        REQUIRE_THROWS_AS(raw->read(false), error::read_error);
    }
}

TEST_CASE("response helpers", "[response]") {
    body_fixture f;
    response r;
    r.headers.set("Content-Encoding", "gzip");
    r.raw = f.make(fragment(gzip_compress("cached body"), 3), "gzip");
    r.default_chunk_size = 4;

    SECTION("content is decoded once and cached") {
        REQUIRE(r.content() == "cached body");
        REQUIRE(r.content() == "cached body");
    }

    SECTION("failed content is not cached as empty") {
        r.raw = f.make({"not gzip"}, "gzip");
        REQUIRE_THROWS_AS(r.content(), error::content_decoding_error);
        REQUIRE_THROWS_AS(r.content(), error::content_decoding_error);
        REQUIRE_THROWS_AS(drain(r.iter_content()), error::content_decoding_error);
    }

    SECTION("iter_content uses the default chunk size") {
        REQUIRE(drain(r.iter_content()) == std::vector<std::string>{"cach", "ed b", "ody"});
    }

    SECTION("status classes") {
        r.status_code = 204;
        REQUIRE(r.ok());
        r.status_code = 302;
        REQUIRE(r.ok());
        r.status_code = 404;
        REQUIRE_FALSE(r.ok());
    }
}
