#pragma once

#include "http_common.hpp"

#include <string>

namespace h2bridge::http {

/// Outgoing request as built by the caller
struct request {
    std::string method = "GET";
    std::string url;
    http::headers headers;
    std::string body;

    /// True for methods whose missing body still needs Content-Length: 0
    bool expects_body() const {
        return method == "POST" || method == "PUT" || method == "PATCH";
    }
};

} // namespace h2bridge::http
