#pragma once

/// @file pool_key.hpp
/// @brief Identity of a transport pool

#include <h2bridge/tls/context_factory.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace h2bridge::pool {

/// Which HTTP versions a pool may speak
enum class protocol_preference {
    http1_only,
    http2_only,
    negotiate
};

constexpr bool allows_http1(protocol_preference p) noexcept {
    return p != protocol_preference::http2_only;
}

constexpr bool allows_http2(protocol_preference p) noexcept {
    return p != protocol_preference::http1_only;
}

/// Per-request connection settings, before normalization
struct pool_context {
    tls::verify_option verify = false;
    std::optional<tls::client_cert> cert;
    bool trust_env = true;
    protocol_preference protocol = protocol_preference::negotiate;
    std::optional<size_t> max_connections;
    std::optional<size_t> max_keepalive_connections;
    std::optional<std::chrono::milliseconds> keepalive_expiry;
    std::optional<size_t> retries;
    std::optional<std::string> local_address;
    std::optional<std::string> uds;
    std::optional<bool> async_mode;
};

/// Normalized, hashable pool identity. Two requests share a pool iff their
/// keys compare equal; every field takes part in both comparison and hash.
struct pool_key {
    tls::verify_option verify;
    std::optional<tls::client_cert> cert;
    bool trust_env = true;
    protocol_preference protocol = protocol_preference::negotiate;
    std::optional<size_t> max_connections;
    std::optional<size_t> max_keepalive_connections;
    std::optional<std::chrono::milliseconds> keepalive_expiry;
    std::optional<size_t> retries;
    std::optional<std::string> local_address;
    std::optional<std::string> uds;
    std::optional<bool> async_mode;
    std::optional<std::string> proxy;
    std::optional<std::map<std::string, std::string>> proxy_headers;

    bool operator==(const pool_key&) const = default;
};

/// Build the key of a context, optionally routed through `proxy`
inline pool_key make_pool_key(const pool_context& ctx,
                              std::optional<std::string> proxy = std::nullopt,
                              std::optional<std::map<std::string, std::string>> proxy_headers = std::nullopt) {
    return pool_key{
        ctx.verify,
        ctx.cert,
        ctx.trust_env,
        ctx.protocol,
        ctx.max_connections,
        ctx.max_keepalive_connections,
        ctx.keepalive_expiry,
        ctx.retries,
        ctx.local_address,
        ctx.uds,
        ctx.async_mode,
        std::move(proxy),
        std::move(proxy_headers),
    };
}

namespace detail {

inline void hash_combine(size_t& seed, size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

// Overloads are declared up front so the templates below see them
inline size_t hash_value(const std::chrono::milliseconds& v);
inline size_t hash_value(const tls::client_cert& c);
inline size_t hash_value(const std::map<std::string, std::string>& m);

template<typename T>
size_t hash_value(const T& v) {
    return std::hash<T>{}(v);
}

template<typename T>
size_t hash_value(const std::optional<T>& v) {
    return v ? hash_value(*v) + 1 : 0;
}

inline size_t hash_value(const std::chrono::milliseconds& v) {
    return std::hash<std::chrono::milliseconds::rep>{}(v.count());
}

inline size_t hash_value(const tls::client_cert& c) {
    size_t seed = hash_value(c.cert_file);
    hash_combine(seed, hash_value(c.key_file));
    hash_combine(seed, hash_value(c.password));
    return seed;
}

inline size_t hash_value(const std::map<std::string, std::string>& m) {
    size_t seed = m.size();
    for (const auto& [name, value] : m) {
        hash_combine(seed, hash_value(name));
        hash_combine(seed, hash_value(value));
    }
    return seed;
}

} // namespace detail

struct pool_key_hash {
    size_t operator()(const pool_key& k) const {
        using detail::hash_combine;
        using detail::hash_value;
        size_t seed = std::hash<tls::verify_option>{}(k.verify);
        hash_combine(seed, hash_value(k.cert));
        hash_combine(seed, hash_value(k.trust_env));
        hash_combine(seed, hash_value(k.protocol));
        hash_combine(seed, hash_value(k.max_connections));
        hash_combine(seed, hash_value(k.max_keepalive_connections));
        hash_combine(seed, hash_value(k.keepalive_expiry));
        hash_combine(seed, hash_value(k.retries));
        hash_combine(seed, hash_value(k.local_address));
        hash_combine(seed, hash_value(k.uds));
        hash_combine(seed, hash_value(k.async_mode));
        hash_combine(seed, hash_value(k.proxy));
        hash_combine(seed, hash_value(k.proxy_headers));
        return seed;
    }
};

} // namespace h2bridge::pool
