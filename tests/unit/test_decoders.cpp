#include <catch2/catch.hpp>
#include <h2bridge/codec/decoder_factory.hpp>
#include <h2bridge/error/exceptions.hpp>

#include <string>

#include "../test_main.cpp"

using namespace h2bridge::codec;
using namespace h2bridge::test;
using h2bridge::error::content_decoding_error;

namespace {

// Feed `data` to a decoder in `step`-byte slices, then flush
std::string decode_in_steps(content_decoder& d, std::string_view data, size_t step) {
    std::string out;
    for (size_t i = 0; i < data.size(); i += step) {
        out += d.decode(data.substr(i, step));
    }
    out += d.flush();
    return out;
}

} // namespace

TEST_CASE("gzip decoder inflates across fragment boundaries", "[codec][gzip]") {
    const auto payload = make_payload(100000);
    const auto compressed = gzip_compress(payload);

    for (size_t step : {1u, 17u, 4096u, 1000000u}) {
        gzip_decoder d;
        REQUIRE(decode_in_steps(d, compressed, step) == payload);
    }
}

TEST_CASE("inflate_stream feeds long input to zlib in slices", "[codec][zlib]") {
    const auto payload = make_payload(50000);
    const auto compressed = gzip_compress(payload);
    const std::string tail = "next member";

    for (size_t slice : {1u, 7u, 4096u}) {
        inflate_stream s(16 + MAX_WBITS, slice);
        const std::string input = compressed + tail;
        auto r = s.inflate(input);
        REQUIRE(r.output == payload);
        REQUIRE(s.finished());
        // Bytes past the end of the stream come back whatever slice they sat in
        REQUIRE(r.unused == tail);
    }
}

TEST_CASE("gzip decoder handles concatenated members", "[codec][gzip]") {
    const auto compressed = gzip_compress("first ") + gzip_compress("second");

    gzip_decoder d;
    REQUIRE(d.decode(compressed) == "first second");
    REQUIRE(d.current_state() == gzip_decoder::state::other_members);
}

TEST_CASE("gzip decoder tolerates trailing garbage", "[codec][gzip]") {
    const auto compressed = gzip_compress("payload") + std::string("\x00\x01garbage", 9);

    gzip_decoder d;
    REQUIRE(d.decode(compressed) == "payload");
    REQUIRE(d.current_state() == gzip_decoder::state::swallow_data);
    // Everything after the garbage is dropped too
    REQUIRE(d.decode(gzip_compress("more")).empty());
    REQUIRE(d.flush().empty());
}

TEST_CASE("gzip decoder rejects a malformed first member", "[codec][gzip]") {
    gzip_decoder d;
    REQUIRE_THROWS_AS(d.decode("this is not gzip at all"), content_decoding_error);
}

TEST_CASE("deflate decoder accepts zlib framing and raw deflate", "[codec][deflate]") {
    const auto payload = make_payload(20000);

    SECTION("zlib wrapper") {
        deflate_decoder d;
        REQUIRE(decode_in_steps(d, zlib_compress(payload, 15), 512) == payload);
    }

    SECTION("raw stream is retried without the wrapper") {
        deflate_decoder d;
        REQUIRE(d.decode(zlib_compress(payload, -15)) == payload);
    }

    SECTION("second failure propagates") {
        deflate_decoder d;
        REQUIRE_THROWS_AS(d.decode(std::string(64, '\xff')), content_decoding_error);
    }
}

TEST_CASE("brotli decoder", "[codec][brotli]") {
    const auto payload = make_payload(70000);
    const auto compressed = brotli_compress(payload);

    SECTION("stream in slices") {
        brotli_decoder d;
        REQUIRE(decode_in_steps(d, compressed, 333) == payload);
    }

    SECTION("truncated stream fails at flush") {
        brotli_decoder d;
        std::string out = d.decode(std::string_view(compressed).substr(0, compressed.size() / 2));
        REQUIRE(out.size() < payload.size());
        REQUIRE_THROWS_AS(d.flush(), content_decoding_error);
    }

    SECTION("data after the end of the stream") {
        brotli_decoder d;
        REQUIRE_THROWS_AS(d.decode(compressed + "xyz"), content_decoding_error);
    }

    SECTION("corrupt input") {
        brotli_decoder d;
        REQUIRE_THROWS_AS(d.decode(std::string(32, '\xff')), content_decoding_error);
    }

    SECTION("no input flushes cleanly") {
        brotli_decoder d;
        REQUIRE(d.flush().empty());
    }
}

TEST_CASE("make_decoder selects by Content-Encoding", "[codec][factory]") {
    const std::string payload = "hello decoder";

    SECTION("case and whitespace are ignored") {
        auto d = make_decoder(" GZip ");
        REQUIRE(d->decode(gzip_compress(payload)) == payload);
    }

    SECTION("aliases") {
        REQUIRE(make_decoder("x-gzip")->decode(gzip_compress(payload)) == payload);
        REQUIRE(make_decoder("brotli")->decode(brotli_compress(payload)) == payload);
    }

    SECTION("unknown codings pass bytes through") {
        auto d = make_decoder("zstd");
        REQUIRE(d->decode("raw bytes") == "raw bytes");
        REQUIRE(make_decoder("")->decode("x") == "x");
    }

    SECTION("multiple codings are undone in reverse order") {
        // gzip applied first, then br
        const auto encoded = brotli_compress(gzip_compress(payload));
        auto d = make_decoder("gzip, br");
        auto* multi = dynamic_cast<multi_decoder*>(d.get());
        REQUIRE(multi != nullptr);
        REQUIRE(multi->stages() == 2);
        REQUIRE(decode_in_steps(*d, encoded, 5) == payload);
    }
}
