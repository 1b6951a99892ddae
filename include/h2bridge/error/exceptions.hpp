#pragma once

/// @file exceptions.hpp
/// @brief Caller-facing exception hierarchy
///
/// Every exception thrown by h2bridge derives from `request_error`. The
/// hierarchy is mirrored by `error_kind` and its static parent table so the
/// exception mapper can compare specificity without RTTI.

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace h2bridge::error {

/// Error kinds, one per exception class
enum class error_kind {
    request,
    network,
    connection,
    proxy,
    read,
    write,
    timeout,
    connect_timeout,
    read_timeout,
    write_timeout,
    pool_timeout,
    protocol,
    local_protocol,
    remote_protocol,
    unsupported_protocol,
    content_decoding,
    config,
    invalid_timeout,
    invalid_proxy_url,
    proxy_scheme_unknown,
    invalid_ca_bundle,
    tls
};

/// Parent of a kind; `request` is the root and its own parent
constexpr error_kind parent(error_kind kind) noexcept {
    using k = error_kind;
    switch (kind) {
        case k::connection:
        case k::read:
        case k::write:                return k::network;
        case k::proxy:                return k::connection;
        case k::connect_timeout:
        case k::read_timeout:
        case k::write_timeout:
        case k::pool_timeout:         return k::timeout;
        case k::local_protocol:
        case k::remote_protocol:      return k::protocol;
        case k::invalid_timeout:
        case k::invalid_proxy_url:
        case k::proxy_scheme_unknown:
        case k::invalid_ca_bundle:    return k::config;
        default:                      return k::request;
    }
}

/// True if `kind` is `base` or derives from it
constexpr bool is_subkind(error_kind kind, error_kind base) noexcept {
    for (;;) {
        if (kind == base) return true;
        if (kind == error_kind::request) return false;
        kind = parent(kind);
    }
}

/// Base of all h2bridge exceptions
class request_error : public std::runtime_error {
public:
    explicit request_error(const std::string& message) : std::runtime_error(message) {}
    virtual error_kind kind() const noexcept { return error_kind::request; }
};

// -- transport failures ------------------------------------------------------

class network_error : public request_error {
public:
    explicit network_error(const std::string& message) : request_error(message) {}
    error_kind kind() const noexcept override { return error_kind::network; }
};

class connection_error : public network_error {
public:
    explicit connection_error(const std::string& message) : network_error(message) {}
    error_kind kind() const noexcept override { return error_kind::connection; }
};

class proxy_error : public connection_error {
public:
    explicit proxy_error(const std::string& message) : connection_error(message) {}
    error_kind kind() const noexcept override { return error_kind::proxy; }
};

class read_error : public network_error {
public:
    explicit read_error(const std::string& message) : network_error(message) {}
    error_kind kind() const noexcept override { return error_kind::read; }
};

class write_error : public network_error {
public:
    explicit write_error(const std::string& message) : network_error(message) {}
    error_kind kind() const noexcept override { return error_kind::write; }
};

class timeout_error : public request_error {
public:
    explicit timeout_error(const std::string& message) : request_error(message) {}
    error_kind kind() const noexcept override { return error_kind::timeout; }
};

class connect_timeout : public timeout_error {
public:
    explicit connect_timeout(const std::string& message) : timeout_error(message) {}
    error_kind kind() const noexcept override { return error_kind::connect_timeout; }
};

class read_timeout : public timeout_error {
public:
    explicit read_timeout(const std::string& message) : timeout_error(message) {}
    error_kind kind() const noexcept override { return error_kind::read_timeout; }
};

class write_timeout : public timeout_error {
public:
    explicit write_timeout(const std::string& message) : timeout_error(message) {}
    error_kind kind() const noexcept override { return error_kind::write_timeout; }
};

class pool_timeout : public timeout_error {
public:
    explicit pool_timeout(const std::string& message) : timeout_error(message) {}
    error_kind kind() const noexcept override { return error_kind::pool_timeout; }
};

class protocol_error : public request_error {
public:
    explicit protocol_error(const std::string& message) : request_error(message) {}
    error_kind kind() const noexcept override { return error_kind::protocol; }
};

/// Protocol violation detected on our side (malformed request)
class local_protocol_error : public protocol_error {
public:
    explicit local_protocol_error(const std::string& message) : protocol_error(message) {}
    error_kind kind() const noexcept override { return error_kind::local_protocol; }
};

/// Protocol violation by the peer
class remote_protocol_error : public protocol_error {
public:
    explicit remote_protocol_error(const std::string& message) : protocol_error(message) {}
    error_kind kind() const noexcept override { return error_kind::remote_protocol; }
};

class unsupported_protocol : public request_error {
public:
    explicit unsupported_protocol(const std::string& message) : request_error(message) {}
    error_kind kind() const noexcept override { return error_kind::unsupported_protocol; }
};

// -- body decoding -----------------------------------------------------------

class content_decoding_error : public request_error {
public:
    explicit content_decoding_error(const std::string& message) : request_error(message) {}
    error_kind kind() const noexcept override { return error_kind::content_decoding; }
};

// -- configuration -----------------------------------------------------------

class config_error : public request_error {
public:
    explicit config_error(const std::string& message) : request_error(message) {}
    error_kind kind() const noexcept override { return error_kind::config; }
};

class invalid_timeout : public config_error {
public:
    explicit invalid_timeout(const std::string& message) : config_error(message) {}
    error_kind kind() const noexcept override { return error_kind::invalid_timeout; }
};

class invalid_proxy_url : public config_error {
public:
    explicit invalid_proxy_url(const std::string& message) : config_error(message) {}
    error_kind kind() const noexcept override { return error_kind::invalid_proxy_url; }
};

class proxy_scheme_unknown : public config_error {
public:
    explicit proxy_scheme_unknown(const std::string& message) : config_error(message) {}
    error_kind kind() const noexcept override { return error_kind::proxy_scheme_unknown; }
};

/// Verify path does not exist
class invalid_ca_bundle : public config_error {
public:
    explicit invalid_ca_bundle(const std::string& message) : config_error(message) {}
    error_kind kind() const noexcept override { return error_kind::invalid_ca_bundle; }
};

/// OpenSSL refused part of the context setup (bad cert, key, cipher list)
class tls_error : public request_error {
public:
    explicit tls_error(const std::string& message) : request_error(message) {}
    error_kind kind() const noexcept override { return error_kind::tls; }
};

namespace detail {

template<typename E>
[[noreturn]] void raise(const std::string& message, bool nested) {
    if (nested) {
        std::throw_with_nested(E(message));
    }
    throw E(message);
}

} // namespace detail

/// Throw the exception class matching `kind`.
/// With `nested`, the exception currently being handled is attached as the
/// cause (retrievable with std::rethrow_if_nested).
[[noreturn]] inline void throw_error(error_kind kind, const std::string& message, bool nested = false) {
    using k = error_kind;
    switch (kind) {
        case k::network:              detail::raise<network_error>(message, nested);
        case k::connection:           detail::raise<connection_error>(message, nested);
        case k::proxy:                detail::raise<proxy_error>(message, nested);
        case k::read:                 detail::raise<read_error>(message, nested);
        case k::write:                detail::raise<write_error>(message, nested);
        case k::timeout:              detail::raise<timeout_error>(message, nested);
        case k::connect_timeout:      detail::raise<connect_timeout>(message, nested);
        case k::read_timeout:         detail::raise<read_timeout>(message, nested);
        case k::write_timeout:        detail::raise<write_timeout>(message, nested);
        case k::pool_timeout:         detail::raise<pool_timeout>(message, nested);
        case k::protocol:             detail::raise<protocol_error>(message, nested);
        case k::local_protocol:       detail::raise<local_protocol_error>(message, nested);
        case k::remote_protocol:      detail::raise<remote_protocol_error>(message, nested);
        case k::unsupported_protocol: detail::raise<unsupported_protocol>(message, nested);
        case k::content_decoding:     detail::raise<content_decoding_error>(message, nested);
        case k::config:               detail::raise<config_error>(message, nested);
        case k::invalid_timeout:      detail::raise<invalid_timeout>(message, nested);
        case k::invalid_proxy_url:    detail::raise<invalid_proxy_url>(message, nested);
        case k::proxy_scheme_unknown: detail::raise<proxy_scheme_unknown>(message, nested);
        case k::invalid_ca_bundle:    detail::raise<invalid_ca_bundle>(message, nested);
        case k::tls:                  detail::raise<tls_error>(message, nested);
        case k::request:              break;
    }
    detail::raise<request_error>(message, nested);
}

} // namespace h2bridge::error
