#pragma once

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/x509_vfy.h>

#include <h2bridge/error/exceptions.hpp>
#include <h2bridge/log/macros.hpp>

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace h2bridge::tls {

/// RAII wrapper for OpenSSL initialization
class openssl_init {
public:
    openssl_init() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    }

    static openssl_init& instance() {
        static openssl_init init;
        return init;
    }
};

/// Most recent OpenSSL error as text
inline std::string last_ssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return std::string(buf);
}

/// Default CA bundle, resolved once per process.
/// Known distribution locations are probed first, then OpenSSL's
/// compiled-in default file.
inline const std::string& default_ca_bundle() {
    static const std::string bundle = [] {
        static const char* const ca_locations[] = {
            "/etc/ssl/certs/ca-certificates.crt",   // Debian/Ubuntu
            "/etc/pki/tls/certs/ca-bundle.crt",     // Fedora/RHEL
            "/etc/ssl/ca-bundle.pem",               // OpenSUSE
            "/etc/ssl/cert.pem",                    // Alpine/macOS
        };
        std::error_code ec;
        for (const char* loc : ca_locations) {
            if (std::filesystem::is_regular_file(loc, ec)) {
                return std::string(loc);
            }
        }
        return std::string(X509_get_default_cert_file());
    }();
    return bundle;
}

/// Client-side SSL_CTX wrapper.
///
/// Handed to the transport as-is; the transport creates its SSL objects
/// from `native_handle()`. Hostname verification happens per connection in
/// the transport, so `check_hostname()` only records whether it should.
class tls_context {
public:
    /// Create a client context with a TLS 1.2 floor and TLS compression off
    tls_context() {
        openssl_init::instance();

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            throw error::tls_error("Failed to create SSL context: " + last_ssl_error());
        }

        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_options(ctx_, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3 | SSL_OP_NO_COMPRESSION);
        SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_CLIENT);
        SSL_CTX_set_app_data(ctx_, this);

        H2BRIDGE_LOG_DEBUG("TLS client context created");
    }

    ~tls_context() {
        if (ctx_) {
            SSL_CTX_free(ctx_);
        }
        if (keylog_) {
            std::fclose(keylog_);
        }
    }

    // Pinned: the SSL_CTX app data points back at this object
    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    /// Load a client certificate chain and its private key.
    /// Without `key_file` the key is read from `cert_file`.
    void load_cert_chain(const std::string& cert_file,
                         const std::optional<std::string>& key_file = std::nullopt,
                         const std::optional<std::string>& password = std::nullopt) {
        if (password) {
            // PEM_def_callback reads the password from the userdata pointer
            password_ = *password;
            SSL_CTX_set_default_passwd_cb_userdata(ctx_, password_.data());
        }

        if (SSL_CTX_use_certificate_chain_file(ctx_, cert_file.c_str()) != 1) {
            throw error::tls_error("Failed to load certificate " + cert_file + ": " + last_ssl_error());
        }

        const std::string& key = key_file ? *key_file : cert_file;
        if (SSL_CTX_use_PrivateKey_file(ctx_, key.c_str(), SSL_FILETYPE_PEM) != 1) {
            throw error::tls_error("Failed to load private key " + key + ": " + last_ssl_error());
        }

        if (SSL_CTX_check_private_key(ctx_) != 1) {
            throw error::tls_error("Private key does not match certificate: " + last_ssl_error());
        }

        H2BRIDGE_LOG_INFO("Loaded client certificate from {}", cert_file);
    }

    /// Load CA certificates for verification (either argument may be empty)
    void load_verify_locations(const std::string& ca_file, const std::string& ca_path = {}) {
        const char* file = ca_file.empty() ? nullptr : ca_file.c_str();
        const char* path = ca_path.empty() ? nullptr : ca_path.c_str();

        if (SSL_CTX_load_verify_locations(ctx_, file, path) != 1) {
            throw error::tls_error("Failed to load CA certificates: " + last_ssl_error());
        }
        H2BRIDGE_LOG_DEBUG("load_verify_locations cafile={} capath={}",
                           file ? file : "(none)", path ? path : "(none)");
    }

    /// Fall back to OpenSSL's default CA locations
    void use_default_verify_paths() {
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
            throw error::tls_error("Failed to load default CA paths: " + last_ssl_error());
        }
    }

    /// Require (or stop requiring) a valid peer certificate
    void set_verify(bool verify) {
        SSL_CTX_set_verify(ctx_, verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
        if (verify) {
            SSL_CTX_set_verify_depth(ctx_, 10);
        }
    }

    bool verify() const noexcept {
        return (SSL_CTX_get_verify_mode(ctx_) & SSL_VERIFY_PEER) != 0;
    }

    void set_check_hostname(bool check) noexcept { check_hostname_ = check; }
    bool check_hostname() const noexcept { return check_hostname_; }

    /// Never fall back to the subject CN when the certificate has no SAN
    void disable_common_name_fallback() {
        X509_VERIFY_PARAM* param = SSL_CTX_get0_param(ctx_);
        if (param) {
            X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NEVER_CHECK_SUBJECT);
            hostname_checks_common_name_ = false;
        }
    }

    bool hostname_checks_common_name() const noexcept { return hostname_checks_common_name_; }

    /// Signal TLS 1.3 post-handshake authentication support
    void enable_post_handshake_auth() {
#if OPENSSL_VERSION_NUMBER >= 0x10101000L
        SSL_CTX_set_post_handshake_auth(ctx_, 1);
        post_handshake_auth_ = true;
#endif
    }

    bool post_handshake_auth() const noexcept { return post_handshake_auth_; }

    /// Set ALPN protocols
    /// @param protocols Comma-separated protocol list (e.g., "http/1.1,h2")
    void set_alpn_protocols(std::string_view protocols) {
        // Wire format: each protocol prefixed by its length
        std::string wire;
        std::vector<std::string> list;
        size_t start = 0;
        while (start < protocols.size()) {
            size_t end = protocols.find(',', start);
            if (end == std::string_view::npos) end = protocols.size();

            size_t len = end - start;
            if (len > 0 && len <= 255) {
                wire += static_cast<char>(len);
                wire += protocols.substr(start, len);
                list.emplace_back(protocols.substr(start, len));
            }
            start = end + 1;
        }

        // Note: returns 0 on success, unlike most of the API
        if (SSL_CTX_set_alpn_protos(ctx_,
                reinterpret_cast<const unsigned char*>(wire.data()),
                static_cast<unsigned>(wire.size())) != 0) {
            throw error::tls_error("Failed to set ALPN protocols");
        }
        alpn_protocols_ = std::move(list);
    }

    const std::vector<std::string>& alpn_protocols() const noexcept { return alpn_protocols_; }

    /// Set cipher list (TLS 1.2 and below)
    void set_ciphers(const std::string& ciphers) {
        if (SSL_CTX_set_cipher_list(ctx_, ciphers.c_str()) != 1) {
            throw error::tls_error("Failed to set ciphers: " + last_ssl_error());
        }
    }

    /// Append NSS key log lines to `path` for every connection made with
    /// this context
    void set_keylog_file(const std::string& path) {
        std::FILE* f = std::fopen(path.c_str(), "a");
        if (!f) {
            H2BRIDGE_LOG_WARNING("Cannot open key log file {}", path);
            return;
        }
        std::lock_guard<std::mutex> lock(keylog_mutex_);
        if (keylog_) {
            std::fclose(keylog_);
        }
        keylog_ = f;
        keylog_path_ = path;
        SSL_CTX_set_keylog_callback(ctx_, keylog_callback);
    }

    const std::string& keylog_file() const noexcept { return keylog_path_; }

    SSL_CTX* native_handle() noexcept { return ctx_; }
    const SSL_CTX* native_handle() const noexcept { return ctx_; }

private:
    static void keylog_callback(const SSL* ssl, const char* line) {
        auto* self = static_cast<tls_context*>(SSL_CTX_get_app_data(SSL_get_SSL_CTX(ssl)));
        if (!self) return;
        std::lock_guard<std::mutex> lock(self->keylog_mutex_);
        if (self->keylog_) {
            std::fprintf(self->keylog_, "%s\n", line);
            std::fflush(self->keylog_);
        }
    }

    SSL_CTX* ctx_ = nullptr;
    bool check_hostname_ = false;
    bool hostname_checks_common_name_ = true;
    bool post_handshake_auth_ = false;
    std::vector<std::string> alpn_protocols_;
    std::string password_;
    std::mutex keylog_mutex_;
    std::FILE* keylog_ = nullptr;
    std::string keylog_path_;
};

} // namespace h2bridge::tls
