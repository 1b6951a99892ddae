/// @file loopback_transport.cpp
/// @brief Plugging a transport into http2_adapter
///
/// h2bridge leaves the wire protocol to a transport library. This example
/// implements the smallest possible transport, one that answers every
/// request in-process from a route table, and drives it through the
/// adapter: pooled sends, streamed gzip bodies and mapped errors.
///
/// Usage: ./loopback_transport [chunk_size]

#include <h2bridge/h2bridge.hpp>

#include <zlib.h>

#include <cstdlib>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

using namespace h2bridge;

namespace {

std::string gzip(const std::string& data) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_SPEED, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out(deflateBound(&zs, static_cast<uLong>(data.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate did not finish");
    }
    out.resize(zs.total_out);
    return out;
}

/// Serves one body in fixed-size fragments
class string_stream : public transport::byte_stream {
public:
    explicit string_stream(std::string body) : body_(std::move(body)) {}

    std::optional<std::string> read() override {
        if (offset_ >= body_.size()) {
            return std::nullopt;
        }
        auto piece = body_.substr(offset_, 8192);
        offset_ += piece.size();
        return piece;
    }

    void close() override {}

private:
    std::string body_;
    size_t offset_ = 0;
};

/// Answers from a path -> body table; unknown paths fail to connect
class loopback_pool : public transport::connection_pool {
public:
    explicit loopback_pool(const std::map<std::string, std::string>& routes) : routes_(routes) {}

    transport::response handle_request(const transport::request& req) override {
        auto target = http::url::parse(req.url);
        auto it = target ? routes_.find(target->path) : routes_.end();
        if (it == routes_.end()) {
            throw transport::transport_error(transport::errc::connect, "no route to " + req.url);
        }

        transport::response resp;
        resp.status = 200;
        resp.headers = {{"Content-Type", "text/plain; charset=utf-8"}, {"Content-Encoding", "gzip"}};
        resp.extensions["http_version"] = "HTTP/2";
        resp.stream = std::make_unique<string_stream>(gzip(it->second));
        return resp;
    }

    void close() override {
        H2BRIDGE_LOG_INFO("loopback pool closed");
    }

private:
    const std::map<std::string, std::string>& routes_;
};

class loopback_transport : public transport::transport_factory {
public:
    std::map<std::string, std::string> routes;

    std::shared_ptr<transport::connection_pool> create_pool(const transport::pool_options& options) override {
        H2BRIDGE_LOG_INFO("new pool: http1={} http2={} verify={}",
                          options.http1, options.http2, options.ssl_context->verify());
        return std::make_shared<loopback_pool>(routes);
    }

    std::shared_ptr<transport::connection_pool> create_proxy_pool(const transport::proxy_options& proxy,
                                                                  const transport::pool_options& options) override {
        H2BRIDGE_LOG_INFO("new pool via proxy {}", proxy.proxy_url);
        return create_pool(options);
    }
};

} // namespace

int main(int argc, char* argv[]) {
    log::logger::instance().set_level(log::level::info);

    size_t chunk_size = 16384;
    if (argc > 1) {
        chunk_size = std::strtoul(argv[1], nullptr, 10);
        if (chunk_size == 0) {
            H2BRIDGE_LOG_ERROR("chunk size must be a positive number");
            return 1;
        }
    }

    auto transport = std::make_shared<loopback_transport>();
    transport->routes["/hello"] = "Hello from the loopback transport!";
    transport->routes["/big"] = std::string(100000, 'x');

    http::http2_adapter adapter(transport);

    http::send_options options;
    options.verify = false;
    options.timeout = 5.0;
    options.stream_chunk_size = chunk_size;

    try {
        http::request hello;
        hello.url = "https://example.test/hello";
        auto resp = adapter.send(hello, options);
        H2BRIDGE_LOG_INFO("{} {} {} (encoding {})", resp.version, resp.status_code, resp.reason,
                          resp.encoding.value_or("unknown"));
        H2BRIDGE_LOG_INFO("Body: {}", resp.content());

        http::request big;
        big.url = "https://example.test/big";
        auto big_resp = adapter.send(big, options);
        auto reader = big_resp.iter_content();
        size_t chunks = 0, total = 0;
        while (auto chunk = reader.next()) {
            ++chunks;
            total += chunk->size();
        }
        H2BRIDGE_LOG_INFO("Streamed {} bytes in {} chunks of up to {}", total, chunks, chunk_size);
    } catch (const error::request_error& e) {
        H2BRIDGE_LOG_ERROR("request failed: {}", e.what());
        return 1;
    }

    try {
        http::request missing;
        missing.url = "https://example.test/missing";
        adapter.send(missing, options);
    } catch (const error::connection_error& e) {
        H2BRIDGE_LOG_INFO("expected failure mapped to connection_error: {}", e.what());
    }

    return 0;
}
