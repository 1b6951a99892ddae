#pragma once

/// @file transport.hpp
/// @brief Contract of the HTTP/1.1 + HTTP/2 transport library
///
/// h2bridge does not speak the wire protocol. An application plugs in a
/// `transport_factory` whose pools perform the actual I/O; every call below
/// may block and reports failures by throwing `transport_error`.

#include "transport_error.hpp"

#include <h2bridge/tls/tls_context.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace h2bridge::transport {

/// Raw header list, names and values as received (not decoded)
using header_list = std::vector<std::pair<std::string, std::string>>;

/// Per-request timeouts in seconds (nullopt = no limit)
struct timeouts {
    std::optional<double> connect;
    std::optional<double> read;
    std::optional<double> write;
    std::optional<double> pool;
};

/// Request as handed to a pool
struct request {
    std::string method;
    std::string url;
    header_list headers;
    std::string body;
    timeouts timeout;
};

/// Body of a response, pulled fragment by fragment
class byte_stream {
public:
    virtual ~byte_stream() = default;

    /// Next fragment, or nullopt at end of body
    virtual std::optional<std::string> read() = 0;

    /// Release the underlying connection. Called at most once.
    virtual void close() = 0;
};

/// Response head plus a body stream
struct response {
    int status = 0;
    header_list headers;
    std::unique_ptr<byte_stream> stream;
    /// Optional metadata, e.g. "http_version" ("HTTP/2") and "reason_phrase"
    std::map<std::string, std::string> extensions;
};

/// A pool of connections to any origin, owned by the transport library
class connection_pool {
public:
    virtual ~connection_pool() = default;

    virtual response handle_request(const request& req) = 0;

    /// Close every connection. Requests issued afterwards may fail.
    virtual void close() = 0;
};

/// Settings for a new pool
struct pool_options {
    std::shared_ptr<tls::tls_context> ssl_context;
    bool http1 = true;
    bool http2 = true;
    std::optional<size_t> max_connections;
    std::optional<size_t> max_keepalive_connections;
    std::optional<std::chrono::milliseconds> keepalive_expiry;
    size_t retries = 0;
    std::optional<std::string> local_address;
    std::optional<std::string> uds;
};

/// Settings of a pool that tunnels through a proxy
struct proxy_options {
    std::string proxy_url;
    /// Basic-auth credentials taken from the proxy URL
    std::optional<std::pair<std::string, std::string>> proxy_auth;
    std::map<std::string, std::string> proxy_headers;
};

/// Creates pools; implemented by the transport library
class transport_factory {
public:
    virtual ~transport_factory() = default;

    virtual std::shared_ptr<connection_pool> create_pool(const pool_options& options) = 0;

    virtual std::shared_ptr<connection_pool> create_proxy_pool(const proxy_options& proxy,
                                                               const pool_options& options) = 0;
};

} // namespace h2bridge::transport
