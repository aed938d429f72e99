#pragma once

#include "net/session.hpp"
#include "config.hpp"
#include "smtp_commands.hpp"
#include "inbound_handler.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace mailfwd::smtp {

enum class SessionState {
    CONNECTED,      // Initial state
    GREETED,        // After HELO/EHLO
    MAIL,           // After MAIL FROM
    RCPT,           // After at least one RCPT TO
    DATA,           // During DATA reception
    QUIT            // After QUIT
};

struct Envelope {
    std::string mail_from;
    std::vector<std::string> rcpt_to;
    std::string data;

    void clear() {
        mail_from.clear();
        rcpt_to.clear();
        data.clear();
    }
};

// One inbound connection. Completed messages are handed to the
// MessageHandler on the worker executor so forwarding never blocks the
// I/O threads; commands pipelined meanwhile are held until the reply is out.
class SMTPSession : public Session {
public:
    SMTPSession(asio::io_context& io_context, tcp::socket socket,
                std::shared_ptr<MessageHandler> handler,
                asio::thread_pool::executor_type workers,
                const SMTPConfig& config,
                ssl::context* ssl_ctx = nullptr);

    ~SMTPSession() override = default;

    SessionState state() const { return state_; }
    void set_state(SessionState state) { state_ = state; }

    Envelope& envelope() { return envelope_; }
    const Envelope& envelope() const { return envelope_; }

    const std::string& client_hostname() const { return client_hostname_; }
    void set_client_hostname(const std::string& hostname) { client_hostname_ = hostname; }

    MessageHandler& handler() { return *handler_; }

    const std::string& hostname() const { return hostname_; }
    size_t max_message_size() const { return max_message_size_; }
    size_t max_recipients() const { return max_recipients_; }

    bool starttls_available() const { return starttls_enabled_ && ssl_context_ && !is_tls(); }
    ssl::context* ssl_context() { return ssl_context_; }

protected:
    void on_connect() override;
    void on_data(const std::string& data) override;
    void on_tls_handshake_complete() override;
    void on_line_too_long() override;

private:
    void dispatch_line(const std::string& line);
    void process_command(const std::string& line);
    void process_data_line(const std::string& line);
    void finish_message();
    void replay_pending();
    void reject_overlong_line();
    std::string received_header() const;

    SessionState state_ = SessionState::CONNECTED;
    Envelope envelope_;
    std::string client_hostname_;

    std::shared_ptr<MessageHandler> handler_;
    asio::thread_pool::executor_type workers_;
    std::string hostname_;
    size_t max_message_size_;
    size_t max_recipients_;
    size_t max_line_length_;
    bool starttls_enabled_;
    ssl::context* ssl_context_;

    // Reply owed at the end of DATA for a message that will not be taken
    std::optional<std::string> data_rejection_;
    bool processing_ = false;
    // nullopt marks an overlong line received while a message was processing
    std::deque<std::optional<std::string>> pending_lines_;
};

}  // namespace mailfwd::smtp
