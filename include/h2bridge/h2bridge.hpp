#pragma once

/// h2bridge - blocking HTTP/2 adapter over a pluggable transport
///
/// Include this file to use the whole library.

#define H2BRIDGE_VERSION_MAJOR 0
#define H2BRIDGE_VERSION_MINOR 1
#define H2BRIDGE_VERSION_PATCH 0

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Errors
#include "error/exceptions.hpp"
#include "error/exception_mapper.hpp"

// Body pipeline
#include "io/byte_slicer.hpp"
#include "codec/content_decoder.hpp"
#include "codec/zlib_decoder.hpp"
#include "codec/brotli_decoder.hpp"
#include "codec/decoder_factory.hpp"

// TLS
#include "tls/tls_context.hpp"
#include "tls/context_factory.hpp"

// Transport contract and pooling
#include "transport/transport_error.hpp"
#include "transport/transport.hpp"
#include "pool/lru_cache.hpp"
#include "pool/pool_key.hpp"
#include "pool/pool_manager.hpp"

// Adapter
#include "http/http_common.hpp"
#include "http/timeout.hpp"
#include "http/proxy.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "http/http2_adapter.hpp"

#include <tuple>

namespace h2bridge {

inline const char* version() noexcept {
    return "0.1.0";
}

inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(H2BRIDGE_VERSION_MAJOR, H2BRIDGE_VERSION_MINOR, H2BRIDGE_VERSION_PATCH);
}

} // namespace h2bridge
