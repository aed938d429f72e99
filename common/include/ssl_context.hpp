#pragma once

#include <memory>
#include <optional>
#include <string>
#include <boost/asio/ssl.hpp>

#include "config.hpp"

namespace mailfwd {

namespace ssl = boost::asio::ssl;

// A boost::asio::ssl::context built for one of the three TLS roles the
// forwarder plays: inbound STARTTLS, opportunistic MX delivery and the
// authenticated smart host. TLS 1.2 is the floor for all of them.
class SSLContext {
public:
    enum class Role {
        Server,
        Client
    };

    explicit SSLContext(Role role);
    ~SSLContext();

    SSLContext(const SSLContext&) = delete;
    SSLContext& operator=(const SSLContext&) = delete;
    SSLContext(SSLContext&&) noexcept;
    SSLContext& operator=(SSLContext&&) noexcept;

    // nullopt when the certificate or key cannot be loaded.
    static std::optional<SSLContext> for_inbound(const TLSConfig& config);

    // MX hosts rarely present certificates matching their names, so the
    // peer is not verified; encryption is still negotiated when offered.
    static SSLContext for_mx_delivery();

    // Verifies against config.ca_file, or the system store when unset.
    static SSLContext for_relay(const TLSConfig& config, bool verify_peer);

    Role role() const { return role_; }
    bool verifies_peer() const { return verify_peer_; }

    ssl::context& native() { return *context_; }
    const ssl::context& native() const { return *context_; }

private:
    void require_peer_certificate();
    bool apply_ciphers(const std::string& cipher_list);

    std::unique_ptr<ssl::context> context_;
    Role role_;
    bool verify_peer_ = false;
};

// Drains the OpenSSL error queue into "[reason] [reason]".
std::string openssl_error_string();

}  // namespace mailfwd
