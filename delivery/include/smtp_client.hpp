#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "ssl_context.hpp"

namespace mailfwd::delivery {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Client side of an SMTP conversation. Reply failures surface as
// PermanentSmtpError (5xx) or TemporarySmtpError (4xx, timeout, transport).
class SmtpClient {
public:
    virtual ~SmtpClient() = default;

    // Opens the connection and consumes the 220 greeting.
    virtual void connect(const std::string& host, uint16_t port) = 0;
    // EHLO, falling back to HELO when the server does not speak ESMTP.
    virtual void ehlo(const std::string& hostname) = 0;
    virtual bool supports(std::string_view extension) const = 0;
    virtual void starttls() = 0;
    virtual void login(const std::string& username, const std::string& password) = 0;

    // Returns the recipients the server refused. Throws PermanentSmtpError
    // with recipient_refused() when nobody was accepted.
    virtual std::vector<std::string> send_mail(const std::string& from,
                                               const std::vector<std::string>& recipients,
                                               const std::string& data) = 0;

    virtual bool noop() = 0;
    virtual void quit() = 0;

    virtual bool is_connected() const = 0;
    virtual const std::string& host() const = 0;
};

using SmtpClientFactory = std::function<std::unique_ptr<SmtpClient>()>;

// CRLF line endings, leading dots doubled, terminated by "<CRLF>.<CRLF>".
std::string encode_data(std::string_view message);

class AsioSmtpClient : public SmtpClient {
public:
    AsioSmtpClient(std::shared_ptr<SSLContext> tls_context,
                   std::chrono::seconds timeout = std::chrono::seconds(30));
    ~AsioSmtpClient() override;

    AsioSmtpClient(const AsioSmtpClient&) = delete;
    AsioSmtpClient& operator=(const AsioSmtpClient&) = delete;

    void connect(const std::string& host, uint16_t port) override;
    void ehlo(const std::string& hostname) override;
    bool supports(std::string_view extension) const override;
    void starttls() override;
    void login(const std::string& username, const std::string& password) override;
    std::vector<std::string> send_mail(const std::string& from,
                                       const std::vector<std::string>& recipients,
                                       const std::string& data) override;
    bool noop() override;
    void quit() override;

    bool is_connected() const override { return connected_; }
    const std::string& host() const override { return host_; }
    bool is_tls() const { return tls_.has_value(); }

private:
    struct Reply {
        int code = 0;
        std::string text;
    };

    Reply command(const std::string& line, bool sensitive = false);
    Reply read_reply();
    void write(const std::string& data);

    // Runs the io_context until the pending operation completes or the
    // deadline passes; returns false on timeout.
    bool run_pending(const std::function<void()>& cancel = {});
    [[noreturn]] void fail_transport(const std::string& stage, const boost::system::error_code& ec);
    [[noreturn]] void fail_reply(const std::string& stage, const Reply& reply,
                                 bool recipient_refused = false);
    void close();

    tcp::socket::lowest_layer_type& lowest_layer();

    template<typename Fn>
    void with_stream(Fn&& fn) {
        if (tls_) {
            fn(*tls_);
        } else {
            fn(socket_);
        }
    }

    asio::io_context io_context_;
    tcp::socket socket_;
    std::optional<asio::ssl::stream<tcp::socket>> tls_;
    asio::streambuf buffer_;

    std::shared_ptr<SSLContext> tls_context_;
    std::chrono::seconds timeout_;

    std::string host_;
    bool connected_ = false;
    std::set<std::string> extensions_;       // upper-case keywords
    std::set<std::string> auth_mechanisms_;  // upper-case
};

}  // namespace mailfwd::delivery
