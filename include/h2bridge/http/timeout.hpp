#pragma once

#include <h2bridge/error/exceptions.hpp>

#include <fmt/format.h>

#include <cmath>
#include <optional>
#include <utility>
#include <variant>

namespace h2bridge::http {

/// Connect and read limits in seconds (nullopt = wait forever)
struct timeout {
    std::optional<double> connect;
    std::optional<double> read;

    bool operator==(const timeout&) const = default;
};

/// Accepted timeout shapes:
/// - none
/// - a single value used for both phases
/// - a {connect, read} pair
/// - a timeout object
using timeout_option = std::variant<std::monostate,
                                    double,
                                    std::pair<std::optional<double>, std::optional<double>>,
                                    timeout>;

namespace detail {

inline void check_timeout_value(const std::optional<double>& value, const char* phase) {
    if (value && (!std::isfinite(*value) || *value < 0)) {
        throw error::invalid_timeout(fmt::format(
            "Invalid {} timeout {}. Pass a (connect, read) timeout pair, or a single "
            "non-negative number to set both timeouts to the same value.", phase, *value));
    }
}

} // namespace detail

/// Resolve any accepted shape into a validated timeout
inline timeout normalize_timeout(const timeout_option& option) {
    timeout result;
    if (auto* single = std::get_if<double>(&option)) {
        result = {*single, *single};
    } else if (auto* pair = std::get_if<std::pair<std::optional<double>, std::optional<double>>>(&option)) {
        result = {pair->first, pair->second};
    } else if (auto* object = std::get_if<timeout>(&option)) {
        result = *object;
    }
    detail::check_timeout_value(result.connect, "connect");
    detail::check_timeout_value(result.read, "read");
    return result;
}

} // namespace h2bridge::http
