#pragma once

/// @file proxy.hpp
/// @brief Proxy selection for a request URL

#include "http_common.hpp"

#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace h2bridge::http {

/// Proxy URLs keyed by "scheme://host", "scheme", "all://host" or "all"
using proxy_map = std::map<std::string, std::string>;

/// Pick the proxy for `target` from an explicit mapping.
/// Keys are tried from most to least specific.
inline std::optional<std::string> select_proxy(std::string_view target, const proxy_map& proxies) {
    if (proxies.empty()) {
        return std::nullopt;
    }
    auto parts = url::parse(target);
    if (!parts || parts->host.empty()) {
        std::string scheme = parts ? parts->scheme : std::string();
        if (auto it = proxies.find(scheme); it != proxies.end()) return it->second;
        if (auto it = proxies.find("all"); it != proxies.end()) return it->second;
        return std::nullopt;
    }

    const std::string keys[] = {
        parts->scheme + "://" + parts->host,
        parts->scheme,
        "all://" + parts->host,
        "all",
    };
    for (const auto& key : keys) {
        if (auto it = proxies.find(key); it != proxies.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

namespace detail {

inline const char* getenv_any_case(const std::string& name) {
    if (const char* v = std::getenv(to_lower(name).c_str()); v && *v) {
        return v;
    }
    std::string upper(name);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (const char* v = std::getenv(upper.c_str()); v && *v) {
        return v;
    }
    return nullptr;
}

} // namespace detail

/// Proxies configured through <scheme>_proxy / all_proxy (either case)
inline proxy_map environment_proxies() {
    proxy_map result;
    for (const char* scheme : {"http", "https", "all"}) {
        if (const char* value = detail::getenv_any_case(std::string(scheme) + "_proxy")) {
            result.emplace(scheme, value);
        }
    }
    return result;
}

/// True if `no_proxy` (comma-separated hosts or domain suffixes, "*" for
/// everything) exempts the URL's host
inline bool should_bypass_proxy(const url& target, std::string_view no_proxy) {
    const std::string host = to_lower(target.host);
    const std::string host_with_port = host + ":" + std::to_string(target.effective_port());

    size_t start = 0;
    while (start <= no_proxy.size()) {
        size_t end = no_proxy.find(',', start);
        if (end == std::string_view::npos) end = no_proxy.size();

        std::string_view entry = no_proxy.substr(start, end - start);
        while (!entry.empty() && entry.front() == ' ') entry.remove_prefix(1);
        while (!entry.empty() && entry.back() == ' ') entry.remove_suffix(1);
        if (!entry.empty() && entry.front() == '.') entry.remove_prefix(1);

        if (entry == "*") {
            return true;
        }
        if (!entry.empty()) {
            const std::string pattern = to_lower(entry);
            for (const std::string& candidate : {host, host_with_port}) {
                if (candidate == pattern) return true;
                if (candidate.size() > pattern.size() &&
                    candidate.compare(candidate.size() - pattern.size(), pattern.size(), pattern) == 0 &&
                    candidate[candidate.size() - pattern.size() - 1] == '.') {
                    return true;
                }
            }
        }
        start = end + 1;
    }
    return false;
}

/// Proxy for `target`: the explicit mapping wins; with `trust_env` the
/// environment is consulted next, honoring no_proxy
inline std::optional<std::string> resolve_proxy(std::string_view target, const proxy_map& proxies,
                                                bool trust_env) {
    if (auto proxy = select_proxy(target, proxies)) {
        return proxy;
    }
    if (!trust_env) {
        return std::nullopt;
    }

    auto parts = url::parse(target);
    if (!parts) {
        return std::nullopt;
    }
    std::string no_proxy;
    if (auto it = proxies.find("no_proxy"); it != proxies.end()) {
        no_proxy = it->second;
    } else if (const char* env = detail::getenv_any_case("no_proxy")) {
        no_proxy = env;
    }
    if (!parts->host.empty() && should_bypass_proxy(*parts, no_proxy)) {
        return std::nullopt;
    }
    return select_proxy(target, environment_proxies());
}

/// Add `scheme://` to a URL that has none
inline std::string prepend_scheme_if_needed(std::string_view target, std::string_view scheme) {
    if (target.find("://") != std::string_view::npos) {
        return std::string(target);
    }
    std::string result(scheme);
    result += "://";
    result += target;
    return result;
}

} // namespace h2bridge::http
