#pragma once

/// @file transport_error.hpp
/// @brief Error kinds raised by a transport implementation
///
/// A transport library reports failures by throwing `transport_error` tagged
/// with one of the kinds below. The kinds form a hierarchy (a connect timeout
/// is a timeout, a read error is a network error, ...) described by
/// `parent()`; the adapter never looks at the dynamic type of the exception.

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace h2bridge::transport {

/// Transport error kinds
enum class errc {
    other,              ///< Anything the transport could not classify
    timeout,
    connect_timeout,
    read_timeout,
    write_timeout,
    pool_timeout,
    network,
    connect,
    read,
    write,
    proxy,
    unsupported_protocol,
    protocol,
    local_protocol,
    remote_protocol
};

/// Immediate parent of a kind, if any
constexpr std::optional<errc> parent(errc kind) noexcept {
    switch (kind) {
        case errc::connect_timeout:
        case errc::read_timeout:
        case errc::write_timeout:
        case errc::pool_timeout:
            return errc::timeout;
        case errc::connect:
        case errc::read:
        case errc::write:
            return errc::network;
        case errc::local_protocol:
        case errc::remote_protocol:
            return errc::protocol;
        default:
            return std::nullopt;
    }
}

/// True if `kind` is `ancestor` or one of its descendants
constexpr bool is_a(errc kind, errc ancestor) noexcept {
    for (std::optional<errc> k = kind; k; k = parent(*k)) {
        if (*k == ancestor) return true;
    }
    return false;
}

constexpr std::string_view errc_to_string(errc kind) noexcept {
    switch (kind) {
        case errc::other:                return "other";
        case errc::timeout:              return "timeout";
        case errc::connect_timeout:      return "connect_timeout";
        case errc::read_timeout:         return "read_timeout";
        case errc::write_timeout:        return "write_timeout";
        case errc::pool_timeout:         return "pool_timeout";
        case errc::network:              return "network";
        case errc::connect:              return "connect";
        case errc::read:                 return "read";
        case errc::write:                return "write";
        case errc::proxy:                return "proxy";
        case errc::unsupported_protocol: return "unsupported_protocol";
        case errc::protocol:             return "protocol";
        case errc::local_protocol:       return "local_protocol";
        case errc::remote_protocol:      return "remote_protocol";
    }
    return "unknown";
}

/// Exception thrown by transport implementations
class transport_error : public std::runtime_error {
public:
    transport_error(errc kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    errc kind() const noexcept { return kind_; }

private:
    errc kind_;
};

} // namespace h2bridge::transport
