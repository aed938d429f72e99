#include "ssl_context.hpp"
#include "logger.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mailfwd {

std::string openssl_error_string() {
    std::string out;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!out.empty()) out += ' ';
        out += std::string("[") + buf + "]";
    }
    return out;
}

SSLContext::SSLContext(Role role)
    : context_(std::make_unique<ssl::context>(
          role == Role::Server ? ssl::context::tls_server : ssl::context::tls_client))
    , role_(role) {
    context_->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );
    context_->set_verify_mode(ssl::verify_none);
}

SSLContext::~SSLContext() = default;

SSLContext::SSLContext(SSLContext&& other) noexcept
    : context_(std::move(other.context_))
    , role_(other.role_)
    , verify_peer_(other.verify_peer_) {
}

SSLContext& SSLContext::operator=(SSLContext&& other) noexcept {
    if (this != &other) {
        context_ = std::move(other.context_);
        role_ = other.role_;
        verify_peer_ = other.verify_peer_;
    }
    return *this;
}

void SSLContext::require_peer_certificate() {
    context_->set_verify_mode(ssl::verify_peer);
    verify_peer_ = true;
}

bool SSLContext::apply_ciphers(const std::string& cipher_list) {
    if (cipher_list.empty()) return true;
    if (SSL_CTX_set_cipher_list(context_->native_handle(), cipher_list.c_str()) != 1) {
        LOG_WARNING_FMT("Ignoring invalid cipher list '{}' {}", cipher_list, openssl_error_string());
        return false;
    }
    return true;
}

std::optional<SSLContext> SSLContext::for_inbound(const TLSConfig& config) {
    if (config.certificate_file.empty() || config.private_key_file.empty()) {
        return std::nullopt;
    }

    SSLContext ctx(Role::Server);
    try {
        ctx.context_->use_certificate_chain_file(config.certificate_file.string());
        ctx.context_->use_private_key_file(config.private_key_file.string(), ssl::context::pem);
    } catch (const boost::system::system_error& e) {
        LOG_ERROR_FMT("Cannot load TLS certificate {}: {} {}", config.certificate_file.string(),
                      e.what(), openssl_error_string());
        return std::nullopt;
    }

    if (SSL_CTX_check_private_key(ctx.context_->native_handle()) != 1) {
        LOG_ERROR_FMT("TLS private key {} does not match the certificate {}",
                      config.private_key_file.string(), openssl_error_string());
        return std::nullopt;
    }

    ctx.apply_ciphers(config.ciphers);
    return ctx;
}

SSLContext SSLContext::for_mx_delivery() {
    return SSLContext(Role::Client);
}

SSLContext SSLContext::for_relay(const TLSConfig& config, bool verify_peer) {
    SSLContext ctx(Role::Client);
    if (!verify_peer) {
        return ctx;
    }

    boost::system::error_code ec;
    if (!config.ca_file.empty()) {
        ctx.context_->load_verify_file(config.ca_file.string(), ec);
        if (ec) {
            LOG_WARNING_FMT("Cannot load CA file {} ({}), using the system store",
                            config.ca_file.string(), ec.message());
        }
    }
    if (config.ca_file.empty() || ec) {
        ctx.context_->set_default_verify_paths(ec);
        if (ec) {
            LOG_ERROR_FMT("Cannot load the system CA store: {}", ec.message());
        }
    }

    ctx.require_peer_certificate();
    return ctx;
}

}  // namespace mailfwd
