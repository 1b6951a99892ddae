#pragma once

/// @file context_factory.hpp
/// @brief Builds client TLS contexts from request options

#include "tls_context.hpp"

#include <h2bridge/error/exceptions.hpp>
#include <h2bridge/log/macros.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace h2bridge::tls {

/// Certificate verification setting:
/// - `false`: no verification
/// - `true`: verify against the default (or environment) CA bundle
/// - path: verify against a CA file or directory
/// - context: use a caller-configured context
using verify_option = std::variant<bool, std::string, std::shared_ptr<tls_context>>;

/// Client certificate. Without `key_file` the key is read from `cert_file`.
struct client_cert {
    std::string cert_file;
    std::optional<std::string> key_file;
    std::optional<std::string> password;

    bool operator==(const client_cert&) const = default;
};

/// Cipher preference applied to every context
inline constexpr std::string_view default_ciphers =
    "ECDHE+AESGCM:ECDHE+CHACHA20:DHE+AESGCM:DHE+CHACHA20:ECDH+AESGCM:"
    "DH+AESGCM:ECDH+AES:DH+AES:RSA+AESGCM:RSA+AES:!aNULL:!eNULL:!MD5:!DSS";

/// CA bundle named by SSL_CERT_FILE (a file) or SSL_CERT_DIR (a directory)
inline std::optional<std::string> ca_bundle_from_env() {
    std::error_code ec;
    if (const char* file = std::getenv("SSL_CERT_FILE")) {
        if (std::filesystem::is_regular_file(file, ec)) {
            return std::string(file);
        }
    }
    if (const char* dir = std::getenv("SSL_CERT_DIR")) {
        if (std::filesystem::is_directory(dir, ec)) {
            return std::string(dir);
        }
    }
    return std::nullopt;
}

inline std::string describe(const verify_option& verify) {
    if (auto* b = std::get_if<bool>(&verify)) return *b ? "true" : "false";
    if (auto* s = std::get_if<std::string>(&verify)) return fmt::format("'{}'", *s);
    return "<tls_context>";
}

/// Builds one TLS client context from verify / cert / trust_env / http2
class context_factory {
public:
    context_factory(verify_option verify = true,
                    std::optional<client_cert> cert = std::nullopt,
                    bool trust_env = true,
                    bool http2 = false)
        : verify_(std::move(verify))
        , cert_(std::move(cert))
        , trust_env_(trust_env)
        , http2_(http2) {}

    std::shared_ptr<tls_context> get_context() {
        H2BRIDGE_LOG_DEBUG("create ssl context => verify={} cert={} trust_env={} http2={}",
                           describe(verify_), cert_ ? cert_->cert_file : "none",
                           trust_env_, http2_);
        if (auto* b = std::get_if<bool>(&verify_); b && !*b) {
            return load_no_verify();
        }
        return load_verify();
    }

private:
    std::shared_ptr<tls_context> create_default_context() {
        auto ctx = std::make_shared<tls_context>();
        ctx->set_ciphers(std::string(default_ciphers));
        ctx->set_alpn_protocols(http2_ ? "http/1.1,h2" : "http/1.1");

        if (trust_env_) {
            const char* keylog = std::getenv("SSLKEYLOGFILE");
            if (keylog && *keylog) {
                ctx->set_keylog_file(keylog);
            }
        }
        return ctx;
    }

    std::shared_ptr<tls_context> load_no_verify() {
        auto ctx = create_default_context();
        ctx->set_check_hostname(false);
        ctx->set_verify(false);
        load_client_certs(*ctx);
        return ctx;
    }

    std::shared_ptr<tls_context> load_verify() {
        if (trust_env_ && std::holds_alternative<bool>(verify_)) {
            if (auto bundle = ca_bundle_from_env()) {
                verify_ = *bundle;
            }
        }

        if (auto* prebuilt = std::get_if<std::shared_ptr<tls_context>>(&verify_)) {
            if (!*prebuilt) {
                throw error::config_error("verify: null TLS context");
            }
            load_client_certs(**prebuilt);
            return *prebuilt;
        }

        std::filesystem::path ca_bundle;
        bool explicit_bundle = false;
        if (std::holds_alternative<bool>(verify_)) {
            ca_bundle = default_ca_bundle();
        } else {
            const auto& path = std::get<std::string>(verify_);
            std::error_code ec;
            if (path.empty() || !std::filesystem::exists(path, ec)) {
                throw error::invalid_ca_bundle(
                    "Could not find a suitable TLS CA certificate bundle, invalid path: " + path);
            }
            ca_bundle = path;
            explicit_bundle = true;
        }

        auto ctx = create_default_context();
        ctx->set_verify(true);
        ctx->set_check_hostname(true);
        ctx->enable_post_handshake_auth();
        ctx->disable_common_name_fallback();

        std::error_code ec;
        if (std::filesystem::is_regular_file(ca_bundle, ec)) {
            ctx->load_verify_locations(ca_bundle.string());
        } else if (std::filesystem::is_directory(ca_bundle, ec)) {
            ctx->load_verify_locations({}, ca_bundle.string());
        } else if (!explicit_bundle) {
            H2BRIDGE_LOG_WARNING("Default CA bundle {} not found, using OpenSSL default paths",
                                 ca_bundle.string());
            ctx->use_default_verify_paths();
        }

        load_client_certs(*ctx);
        return ctx;
    }

    void load_client_certs(tls_context& ctx) {
        if (cert_) {
            ctx.load_cert_chain(cert_->cert_file, cert_->key_file, cert_->password);
        }
    }

    verify_option verify_;
    std::optional<client_cert> cert_;
    bool trust_env_;
    bool http2_;
};

/// Convenience wrapper around context_factory
inline std::shared_ptr<tls_context> create_ssl_context(verify_option verify = true,
                                                       std::optional<client_cert> cert = std::nullopt,
                                                       bool trust_env = true,
                                                       bool http2 = false) {
    return context_factory(std::move(verify), std::move(cert), trust_env, http2).get_context();
}

} // namespace h2bridge::tls
