#pragma once

/// @file http2_adapter.hpp
/// @brief Blocking request/response bridge over a pooled HTTP/2 transport

#include "http_common.hpp"
#include "proxy.hpp"
#include "request.hpp"
#include "response.hpp"
#include "timeout.hpp"

#include <h2bridge/error/exception_mapper.hpp>
#include <h2bridge/error/exceptions.hpp>
#include <h2bridge/log/macros.hpp>
#include <h2bridge/pool/pool_manager.hpp>
#include <h2bridge/tls/context_factory.hpp>
#include <h2bridge/transport/transport.hpp>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace h2bridge::http {

/// Adapter-wide pool settings
struct adapter_config {
    size_t num_pools = 10;                   ///< Pools kept per manager
    size_t pool_connections = 100;           ///< Idle connections kept per pool
    size_t pool_maxsize = 100;               ///< Connections per pool
    std::chrono::milliseconds keepalive_expiry{10000};
    size_t max_retries = 0;
    pool::protocol_preference protocol = pool::protocol_preference::negotiate;
};

/// Per-call options of send()
struct send_options {
    timeout_option timeout;
    tls::verify_option verify = true;
    std::optional<tls::client_cert> cert;
    proxy_map proxies;
    bool trust_env = true;
    /// Default chunk size of response::iter_content()
    size_t stream_chunk_size = 65536;
};

namespace detail {

enum class text_encoding {
    ascii,
    utf8,
    latin1
};

inline bool valid_ascii(std::string_view s) noexcept {
    for (unsigned char c : s) {
        if (c >= 0x80) return false;
    }
    return true;
}

inline bool valid_utf8(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

/// ISO-8859-1 bytes transcoded to UTF-8
inline std::string latin1_to_utf8(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c < 0x80) {
            out += static_cast<char>(c);
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

inline std::optional<std::string> decode_text(std::string_view s, text_encoding enc) {
    switch (enc) {
        case text_encoding::ascii:
            if (!valid_ascii(s)) return std::nullopt;
            return std::string(s);
        case text_encoding::utf8:
            if (!valid_utf8(s)) return std::nullopt;
            return std::string(s);
        case text_encoding::latin1:
            return latin1_to_utf8(s);
    }
    return std::nullopt;
}

inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace detail

/// Decode raw header pairs. The first of ASCII, UTF-8 and ISO-8859-1 under
/// which every name and value decodes is used for all of them; repeated
/// names are joined with ", ".
inline http::headers decode_headers(const transport::header_list& raw) {
    using detail::text_encoding;
    for (auto enc : {text_encoding::ascii, text_encoding::utf8, text_encoding::latin1}) {
        http::headers result;
        bool ok = true;
        for (const auto& [name, value] : raw) {
            auto k = detail::decode_text(name, enc);
            auto v = detail::decode_text(value, enc);
            if (!k || !v) {
                ok = false;
                break;
            }
            result.add(*k, *v);
        }
        if (ok) {
            return result;
        }
    }
    // ISO-8859-1 accepts every byte sequence
    return {};
}

/// Text encoding of a body from its Content-Type: the charset parameter if
/// any, utf-8 for JSON, otherwise undetermined
inline std::optional<std::string> encoding_from_content_type(const http::headers& headers) {
    std::string_view content_type = headers.get("Content-Type");
    if (content_type.empty()) {
        return std::nullopt;
    }

    size_t start = 0;
    while (start < content_type.size()) {
        size_t end = content_type.find(';', start);
        if (end == std::string_view::npos) end = content_type.size();
        auto param = detail::trim(content_type.substr(start, end - start));
        if (param.find("charset") != std::string_view::npos) {
            auto eq = param.rfind('=');
            auto value = detail::trim(eq == std::string_view::npos ? param : param.substr(eq + 1));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }
        start = end + 1;
    }

    if (content_type.find("text") != std::string_view::npos) {
        return std::nullopt;
    }
    if (content_type.find(mime::application_json) != std::string_view::npos) {
        return std::string("utf-8");
    }
    return std::nullopt;
}

/// Blocking HTTP adapter.
///
/// Each send() resolves a pool (direct or through a proxy), hands the
/// request to the transport and wraps the reply in a lazily streamed
/// response. Safe to share between threads.
class http2_adapter {
public:
    explicit http2_adapter(std::shared_ptr<transport::transport_factory> factory,
                           adapter_config config = {})
        : factory_(std::move(factory))
        , config_(config)
        , pool_manager_(factory_, config_.num_pools) {
        base_context_.max_connections = config_.pool_maxsize;
        base_context_.max_keepalive_connections = config_.pool_connections;
        base_context_.keepalive_expiry = config_.keepalive_expiry;
        base_context_.retries = config_.max_retries;
        base_context_.protocol = config_.protocol;
    }

    ~http2_adapter() {
        try {
            close();
        } catch (const std::exception& e) {
            H2BRIDGE_LOG_ERROR("error closing adapter pools: {}", e.what());
        }
    }

    http2_adapter(const http2_adapter&) = delete;
    http2_adapter& operator=(const http2_adapter&) = delete;

    /// Send `req` and return its response with the body still unread.
    /// `req` gains Host and, for bodiless POST/PUT/PATCH, Content-Length.
    response send(request& req, const send_options& options = {}) {
        auto target = url::parse(req.url);
        if (!target || target->host.empty()) {
            throw error::config_error("Invalid URL '" + req.url + "': no host supplied");
        }

        if (!req.headers.contains("Host")) {
            req.headers.set("Host", target->host_port());
        }
        const bool has_content_length =
            req.headers.contains("Content-Length") || req.headers.contains("Transfer-Encoding");
        if (!has_content_length && req.expects_body()) {
            req.headers.set("Content-Length", "0");
        }

        const timeout t = normalize_timeout(options.timeout);

        transport::request treq;
        treq.method = req.method;
        treq.url = req.url;
        treq.body = req.body;
        treq.timeout.connect = t.connect;
        treq.timeout.read = t.read;
        for (const auto& [name, value] : req.headers) {
            treq.headers.emplace_back(name, value);
        }

        auto conn = get_connection(req.url, options.proxies, options.verify, options.cert, options.trust_env);

        auto resp = error::map_transport_errors([&] { return conn->handle_request(treq); });
        H2BRIDGE_LOG_DEBUG("{} {} -> {}", req.method, req.url, resp.status);

        return build_response(req, std::move(resp), options.stream_chunk_size);
    }

    /// Pool serving `target` with the given TLS and proxy settings
    std::shared_ptr<transport::connection_pool> get_connection(std::string_view target,
                                                               const proxy_map& proxies,
                                                               const tls::verify_option& verify,
                                                               const std::optional<tls::client_cert>& cert,
                                                               bool trust_env) {
        pool::pool_context ctx = base_context_;
        ctx.verify = verify;
        ctx.cert = cert;
        ctx.trust_env = trust_env;

        auto proxy = resolve_proxy(target, proxies, trust_env);
        if (!proxy) {
            return pool_manager_.connection_from_context(ctx);
        }

        auto proxy_url = prepend_scheme_if_needed(*proxy, "http");
        auto parsed = url::parse(proxy_url);
        if (!parsed || parsed->host.empty()) {
            throw error::invalid_proxy_url(
                "Please check proxy URL. It is malformed and could be missing the host.");
        }
        H2BRIDGE_LOG_DEBUG("routing {} through proxy {}", target, parsed->host_port());
        return proxy_manager_for(proxy_url).connection_from_context(ctx);
    }

    /// The manager for one proxy URL, created on first use
    pool::proxy_manager& proxy_manager_for(const std::string& proxy_url) {
        std::lock_guard<std::mutex> lock(proxy_mutex_);
        auto it = proxy_managers_.find(proxy_url);
        if (it != proxy_managers_.end()) {
            return *it->second;
        }
        if (to_lower(proxy_url).rfind("http", 0) != 0) {
            throw error::proxy_scheme_unknown("socks proxy is not supported for now.");
        }
        auto manager = std::make_unique<pool::proxy_manager>(factory_, proxy_url,
                                                             std::map<std::string, std::string>{},
                                                             config_.num_pools);
        auto& ref = *manager;
        proxy_managers_.emplace(proxy_url, std::move(manager));
        return ref;
    }

    /// Close every pool, direct and proxied
    void close() {
        pool_manager_.clear();
        std::lock_guard<std::mutex> lock(proxy_mutex_);
        for (auto& [url, manager] : proxy_managers_) {
            manager->clear();
        }
    }

    pool::pool_manager& pool_manager() noexcept { return pool_manager_; }

    size_t proxy_manager_count() const {
        std::lock_guard<std::mutex> lock(proxy_mutex_);
        return proxy_managers_.size();
    }

    const adapter_config& config() const noexcept { return config_; }

private:
    response build_response(const request& req, transport::response resp, size_t chunk_size) {
        response r;
        r.status_code = resp.status;
        r.headers = decode_headers(resp.headers);
        r.encoding = encoding_from_content_type(r.headers);

        if (auto it = resp.extensions.find("http_version"); it != resp.extensions.end()) {
            r.version = it->second;
        } else {
            r.version = "HTTP/1.1";
        }
        if (auto it = resp.extensions.find("reason_phrase"); it != resp.extensions.end()) {
            r.reason = it->second;
        } else {
            r.reason = std::string(status_reason(resp.status));
        }

        r.raw = std::make_unique<raw_response>(std::move(resp.stream), r.headers);
        r.url = req.url;
        r.default_chunk_size = chunk_size;
        return r;
    }

    std::shared_ptr<transport::transport_factory> factory_;
    adapter_config config_;
    pool::pool_context base_context_;
    pool::pool_manager pool_manager_;
    mutable std::mutex proxy_mutex_;
    std::map<std::string, std::unique_ptr<pool::proxy_manager>> proxy_managers_;
};

} // namespace h2bridge::http
