#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace h2bridge::http {

/// Standard reason phrase for a status code, or "" when the code is not
/// registered
inline constexpr std::string_view status_reason(int code) noexcept {
    switch (code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 102: return "Processing";
        case 103: return "Early Hints";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non-Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 207: return "Multi-Status";
        case 208: return "Already Reported";
        case 226: return "IM Used";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 305: return "Use Proxy";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Request Entity Too Large";
        case 414: return "Request-URI Too Long";
        case 415: return "Unsupported Media Type";
        case 416: return "Requested Range Not Satisfiable";
        case 417: return "Expectation Failed";
        case 418: return "I'm a Teapot";
        case 421: return "Misdirected Request";
        case 422: return "Unprocessable Entity";
        case 423: return "Locked";
        case 424: return "Failed Dependency";
        case 425: return "Too Early";
        case 426: return "Upgrade Required";
        case 428: return "Precondition Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 451: return "Unavailable For Legal Reasons";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        case 506: return "Variant Also Negotiates";
        case 507: return "Insufficient Storage";
        case 508: return "Loop Detected";
        case 510: return "Not Extended";
        case 511: return "Network Authentication Required";
        default:  return "";
    }
}

inline std::string to_lower(std::string_view s) {
    std::string result(s);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

/// Case-insensitive string comparison for headers
struct case_insensitive_hash {
    size_t operator()(std::string_view s) const noexcept {
        size_t hash = 0;
        for (char c : s) {
            hash = hash * 31 + static_cast<size_t>(std::tolower(static_cast<unsigned char>(c)));
        }
        return hash;
    }
};

struct case_insensitive_equal {
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
};

/// HTTP headers collection (case-insensitive keys).
/// The first spelling of a name is the one kept.
class headers {
public:
    using map_type = std::unordered_map<std::string, std::string, case_insensitive_hash, case_insensitive_equal>;
    using iterator = map_type::iterator;
    using const_iterator = map_type::const_iterator;

    headers() = default;
    headers(std::initializer_list<std::pair<const std::string, std::string>> init) {
        for (const auto& [name, value] : init) {
            add(name, value);
        }
    }

    /// Set a header (overwrites existing)
    void set(std::string_view name, std::string_view value) {
        auto it = headers_.find(std::string(name));
        if (it != headers_.end()) {
            it->second = std::string(value);
        } else {
            headers_.emplace(std::string(name), std::string(value));
        }
    }

    /// Add a header (appends with ", " if it exists)
    void add(std::string_view name, std::string_view value) {
        auto it = headers_.find(std::string(name));
        if (it != headers_.end()) {
            it->second += ", ";
            it->second += value;
        } else {
            headers_.emplace(std::string(name), std::string(value));
        }
    }

    /// Get a header value (or empty if not found)
    std::string_view get(std::string_view name) const {
        auto it = headers_.find(std::string(name));
        if (it != headers_.end()) {
            return it->second;
        }
        return {};
    }

    /// Get a header value if present
    std::optional<std::string_view> find(std::string_view name) const {
        auto it = headers_.find(std::string(name));
        if (it != headers_.end()) {
            return std::string_view(it->second);
        }
        return std::nullopt;
    }

    /// Check if header exists
    bool contains(std::string_view name) const {
        return headers_.find(std::string(name)) != headers_.end();
    }

    /// Remove a header
    void remove(std::string_view name) {
        headers_.erase(std::string(name));
    }

    /// Get Content-Length header value
    std::optional<size_t> content_length() const {
        auto val = get("Content-Length");
        if (val.empty()) return std::nullopt;
        size_t len = 0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), len);
        if (ec == std::errc{}) return len;
        return std::nullopt;
    }

    /// Get Content-Type header
    std::string_view content_type() const {
        return get("Content-Type");
    }

    void clear() { headers_.clear(); }
    size_t size() const noexcept { return headers_.size(); }
    bool empty() const noexcept { return headers_.empty(); }

    iterator begin() { return headers_.begin(); }
    iterator end() { return headers_.end(); }
    const_iterator begin() const { return headers_.begin(); }
    const_iterator end() const { return headers_.end(); }

private:
    map_type headers_;
};

/// URL components
struct url {
    std::string scheme;     ///< lower-cased scheme
    std::string host;       ///< hostname (IPv6 without brackets)
    uint16_t port = 0;      ///< port (0 = default)
    std::string path;       ///< path including leading /
    std::string query;      ///< query string (without ?)
    std::string fragment;   ///< fragment (without #)
    std::string userinfo;   ///< username:password

    /// Host and non-default port, as sent in the Host header
    std::string host_port() const {
        std::string result = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port != 0 && port != default_port()) {
            result += ":" + std::to_string(port);
        }
        return result;
    }

    /// Get the authority ([userinfo@]host[:port])
    std::string authority() const {
        std::string result;
        if (!userinfo.empty()) {
            result = userinfo + "@";
        }
        return result + host_port();
    }

    /// Get effective port
    uint16_t effective_port() const {
        return port != 0 ? port : default_port();
    }

    /// Get default port for scheme
    uint16_t default_port() const {
        if (scheme == "https") return 443;
        return 80;
    }

    bool is_secure() const {
        return scheme == "https";
    }

    /// Parse URL from string.
    /// A missing scheme is left empty; returns nullopt for a malformed
    /// IPv6 literal or a bad port.
    static std::optional<url> parse(std::string_view str) {
        url result;

        auto scheme_end = str.find("://");
        if (scheme_end != std::string_view::npos) {
            result.scheme = to_lower(str.substr(0, scheme_end));
            str = str.substr(scheme_end + 3);
        }

        auto frag_pos = str.find('#');
        if (frag_pos != std::string_view::npos) {
            result.fragment = str.substr(frag_pos + 1);
            str = str.substr(0, frag_pos);
        }

        auto query_pos = str.find('?');
        if (query_pos != std::string_view::npos) {
            result.query = str.substr(query_pos + 1);
            str = str.substr(0, query_pos);
        }

        auto path_pos = str.find('/');
        if (path_pos != std::string_view::npos) {
            result.path = str.substr(path_pos);
            str = str.substr(0, path_pos);
        } else {
            result.path = "/";
        }

        auto at_pos = str.rfind('@');
        if (at_pos != std::string_view::npos) {
            result.userinfo = str.substr(0, at_pos);
            str = str.substr(at_pos + 1);
        }

        std::string_view port_str;
        if (!str.empty() && str[0] == '[') {
            auto bracket_end = str.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::nullopt;
            }
            result.host = str.substr(1, bracket_end - 1);
            str = str.substr(bracket_end + 1);
            if (!str.empty()) {
                if (str[0] != ':') return std::nullopt;
                port_str = str.substr(1);
            }
        } else {
            auto colon_pos = str.rfind(':');
            if (colon_pos != std::string_view::npos) {
                result.host = str.substr(0, colon_pos);
                port_str = str.substr(colon_pos + 1);
            } else {
                result.host = str;
            }
        }

        if (!port_str.empty()) {
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
            if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
                return std::nullopt;
            }
            result.port = port;
        }

        result.host = to_lower(result.host);
        return result;
    }
};

/// Percent-decode a URL component ('+' is left alone)
inline std::string percent_decode(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = 0, lo = 0;
            auto [p1, e1] = std::from_chars(&str[i + 1], &str[i + 2], hi, 16);
            auto [p2, e2] = std::from_chars(&str[i + 2], &str[i + 3], lo, 16);
            if (e1 == std::errc{} && e2 == std::errc{}) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += str[i];
    }

    return result;
}

namespace mime {
    inline constexpr std::string_view application_json = "application/json";
}

} // namespace h2bridge::http
