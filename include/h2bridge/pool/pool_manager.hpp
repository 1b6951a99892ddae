#pragma once

/// @file pool_manager.hpp
/// @brief Keyed cache of transport pools

#include "lru_cache.hpp"
#include "pool_key.hpp"

#include <h2bridge/error/exceptions.hpp>
#include <h2bridge/http/http_common.hpp>
#include <h2bridge/log/macros.hpp>
#include <h2bridge/tls/context_factory.hpp>
#include <h2bridge/transport/transport.hpp>

#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace h2bridge::pool {

/// Hands out one transport pool per distinct pool_key.
///
/// At most `num_pools` pools are kept; the least recently used one is closed
/// when a new key would exceed that. A pool is built at most once per key:
/// concurrent callers asking for a key that is being built wait for that
/// build, while builds for different keys run in parallel outside the lock.
class pool_manager {
public:
    using pool_ptr = std::shared_ptr<transport::connection_pool>;

    explicit pool_manager(std::shared_ptr<transport::transport_factory> factory, size_t num_pools = 10)
        : factory_(std::move(factory))
        , pools_(num_pools, [](pool_ptr& pool) {
              H2BRIDGE_LOG_DEBUG("closing evicted pool");
              pool->close();
          }) {
        if (!factory_) {
            throw std::invalid_argument("pool_manager: transport factory is required");
        }
    }

    virtual ~pool_manager() = default;

    pool_manager(const pool_manager&) = delete;
    pool_manager& operator=(const pool_manager&) = delete;

    /// Pool for the given connection settings, created on first use
    pool_ptr connection_from_context(const pool_context& ctx) {
        return connection_from_pool_key(key_for(ctx), ctx);
    }

    pool_ptr connection_from_pool_key(const pool_key& key, const pool_context& ctx) {
        std::promise<pool_ptr> promise;
        std::shared_future<pool_ptr> in_flight;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto pool = pools_.get(key)) {
                return *pool;
            }
            auto it = pending_.find(key);
            if (it != pending_.end()) {
                in_flight = it->second;
            } else {
                pending_.emplace(key, promise.get_future().share());
            }
        }

        if (in_flight.valid()) {
            // Rethrows the builder's exception if the build failed
            return in_flight.get();
        }

        pool_ptr pool;
        try {
            pool = new_pool(ctx);
            if (!pool) {
                throw error::request_error("transport factory returned no pool");
            }
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                pending_.erase(key);
            }
            promise.set_exception(std::current_exception());
            throw;
        }

        // Visible in the cache before leaving pending_, so no lookup can
        // miss both and start a second build
        pools_.insert(key, pool);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(key);
        }
        promise.set_value(pool);
        return pool;
    }

    /// Close and forget every pool
    void clear() {
        pools_.clear();
    }

    size_t size() const { return pools_.size(); }

    bool contains(const pool_key& key) const { return pools_.contains(key); }

    size_t num_pools() const noexcept { return pools_.capacity(); }

protected:
    virtual pool_key key_for(const pool_context& ctx) const {
        return make_pool_key(ctx);
    }

    virtual pool_ptr new_pool(const pool_context& ctx) {
        H2BRIDGE_LOG_INFO("creating connection pool");
        return factory_->create_pool(pool_options_for(ctx));
    }

    /// Transport settings for a context. verify / cert / trust_env only
    /// shape the TLS context; the rest configures the pool itself.
    static transport::pool_options pool_options_for(const pool_context& ctx) {
        transport::pool_options options;
        options.ssl_context = tls::create_ssl_context(ctx.verify, ctx.cert, ctx.trust_env,
                                                      allows_http2(ctx.protocol));
        options.http1 = allows_http1(ctx.protocol);
        options.http2 = allows_http2(ctx.protocol);
        options.max_connections = ctx.max_connections;
        options.max_keepalive_connections = ctx.max_keepalive_connections;
        options.keepalive_expiry = ctx.keepalive_expiry;
        options.retries = ctx.retries.value_or(0);
        options.local_address = ctx.local_address;
        options.uds = ctx.uds;
        return options;
    }

    std::shared_ptr<transport::transport_factory> factory_;

private:
    mutable std::mutex mutex_;
    lru_cache<pool_key, pool_ptr, pool_key_hash> pools_;
    std::unordered_map<pool_key, std::shared_future<pool_ptr>, pool_key_hash> pending_;
};

/// pool_manager whose pools tunnel through one HTTP(S) proxy
class proxy_manager : public pool_manager {
public:
    proxy_manager(std::shared_ptr<transport::transport_factory> factory,
                  std::string_view proxy_url,
                  std::map<std::string, std::string> proxy_headers = {},
                  size_t num_pools = 10)
        : pool_manager(std::move(factory), num_pools)
        , proxy_headers_(std::move(proxy_headers)) {
        auto parsed = http::url::parse(proxy_url);
        if (!parsed || parsed->host.empty()) {
            throw error::invalid_proxy_url(
                "Please check proxy URL. It is malformed and could be missing the host.");
        }
        if (parsed->scheme.empty()) {
            throw error::proxy_scheme_unknown(
                "Proxy URL had no scheme, should start with http:// or https://");
        }
        if (parsed->scheme != "http" && parsed->scheme != "https") {
            throw error::proxy_scheme_unknown(
                "Proxy URL had unsupported scheme " + parsed->scheme + ", should use http:// or https://");
        }
        if (parsed->port == 0) {
            parsed->port = parsed->default_port();
        }

        if (!parsed->userinfo.empty()) {
            auto colon = parsed->userinfo.find(':');
            std::string user = parsed->userinfo.substr(0, colon);
            std::string pass = colon == std::string::npos ? "" : parsed->userinfo.substr(colon + 1);
            proxy_auth_ = std::make_pair(http::percent_decode(user), http::percent_decode(pass));
        }

        proxy_url_ = std::string(proxy_url);
        const std::string host = parsed->host.find(':') != std::string::npos
            ? "[" + parsed->host + "]" : parsed->host;
        proxy_ = parsed->scheme + "://" + host + ":" + std::to_string(parsed->port);
    }

    /// Normalized scheme://host:port of the proxy
    const std::string& proxy() const noexcept { return proxy_; }

    /// The proxy URL as configured
    const std::string& proxy_url() const noexcept { return proxy_url_; }

    const std::optional<std::pair<std::string, std::string>>& proxy_auth() const noexcept {
        return proxy_auth_;
    }

    const std::map<std::string, std::string>& proxy_headers() const noexcept { return proxy_headers_; }

protected:
    pool_key key_for(const pool_context& ctx) const override {
        return make_pool_key(ctx, proxy_, proxy_headers_);
    }

    pool_ptr new_pool(const pool_context& ctx) override {
        H2BRIDGE_LOG_INFO("creating proxy connection pool via {}", proxy_);
        transport::proxy_options proxy;
        proxy.proxy_url = proxy_url_;
        proxy.proxy_auth = proxy_auth_;
        proxy.proxy_headers = proxy_headers_;
        return factory_->create_proxy_pool(proxy, pool_options_for(ctx));
    }

private:
    std::string proxy_url_;
    std::string proxy_;
    std::optional<std::pair<std::string, std::string>> proxy_auth_;
    std::map<std::string, std::string> proxy_headers_;
};

} // namespace h2bridge::pool
