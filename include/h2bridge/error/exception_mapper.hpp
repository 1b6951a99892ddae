#pragma once

/// @file exception_mapper.hpp
/// @brief Translation of transport errors into the caller taxonomy

#include "exceptions.hpp"

#include <h2bridge/transport/transport_error.hpp>
#include <h2bridge/log/macros.hpp>

#include <array>
#include <optional>
#include <type_traits>
#include <utility>

namespace h2bridge::error {

/// One row of the exception map
struct mapping_entry {
    transport::errc from;
    error_kind to;
};

/// Transport kind → caller kind, in declaration order.
/// A transport kind matches every row whose `from` is itself or an ancestor.
inline constexpr std::array<mapping_entry, 14> exception_map{{
    {transport::errc::timeout,              error_kind::timeout},
    {transport::errc::connect_timeout,      error_kind::connect_timeout},
    {transport::errc::read_timeout,         error_kind::read_timeout},
    {transport::errc::write_timeout,        error_kind::write_timeout},
    {transport::errc::pool_timeout,         error_kind::pool_timeout},
    {transport::errc::network,              error_kind::network},
    {transport::errc::connect,              error_kind::connection},
    {transport::errc::read,                 error_kind::read},
    {transport::errc::write,                error_kind::write},
    {transport::errc::proxy,                error_kind::proxy},
    {transport::errc::unsupported_protocol, error_kind::unsupported_protocol},
    {transport::errc::protocol,             error_kind::protocol},
    {transport::errc::local_protocol,       error_kind::local_protocol},
    {transport::errc::remote_protocol,      error_kind::remote_protocol},
}};

/// Pick the most specific caller kind for a transport kind.
/// Later matches replace the current pick only when their target is a
/// subkind of it, so the result does not depend on where a row sits in the
/// table relative to its ancestors.
constexpr std::optional<error_kind> resolve(transport::errc kind) noexcept {
    std::optional<error_kind> mapped;
    for (const auto& entry : exception_map) {
        if (!transport::is_a(kind, entry.from)) {
            continue;
        }
        if (!mapped || is_subkind(entry.to, *mapped)) {
            mapped = entry.to;
        }
    }
    return mapped;
}

static_assert(resolve(transport::errc::read_timeout) == error_kind::read_timeout);
static_assert(resolve(transport::errc::connect) == error_kind::connection);
static_assert(!resolve(transport::errc::other));

/// Rethrow the transport error currently being handled as its caller kind.
/// Must be called from inside a catch block. The transport error stays
/// attached as the nested cause. Unmapped kinds are rethrown unchanged.
[[noreturn]] inline void rethrow_mapped(const transport::transport_error& e) {
    auto mapped = resolve(e.kind());
    if (!mapped) {
        throw;
    }
    H2BRIDGE_LOG_DEBUG("mapped transport error {} -> kind {}",
                       transport::errc_to_string(e.kind()), static_cast<int>(*mapped));
    throw_error(*mapped, e.what(), true);
}

/// Run `fn`, translating any transport_error it throws
template<typename F>
decltype(auto) map_transport_errors(F&& fn) {
    try {
        return std::forward<F>(fn)();
    } catch (const transport::transport_error& e) {
        rethrow_mapped(e);
    }
}

} // namespace h2bridge::error
