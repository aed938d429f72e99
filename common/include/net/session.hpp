#pragma once

#include <memory>
#include <string>
#include <deque>
#include <functional>
#include <chrono>
#include <variant>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

namespace mailfwd {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
namespace ssl = asio::ssl;

// Line-oriented server-side connection. Starts in plaintext and can be
// upgraded in place with start_tls(). All handlers run on the session strand.
// A line longer than max_line_length (CRLF included) is reported once through
// on_line_too_long() and its remainder is discarded.
class Session : public std::enable_shared_from_this<Session> {
public:
    using PlainSocket = tcp::socket;
    using SSLSocket = ssl::stream<tcp::socket>;
    using Socket = std::variant<PlainSocket, SSLSocket>;

    static constexpr size_t kDefaultMaxLineLength = 4096;

    Session(asio::io_context& io_context, tcp::socket socket,
            size_t max_line_length = kDefaultMaxLineLength);
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    virtual void start();
    virtual void stop();

    void send(const std::string& data);
    void send_line(const std::string& line);

    // Stops reading and closes once every queued reply has been written.
    void close_after_flush();

    bool is_tls() const { return is_tls_; }
    std::string remote_address() const;
    uint16_t remote_port() const;

    void set_timeout(std::chrono::seconds timeout);
    void reset_timeout();

    // The idle timer does not run between these two calls, whatever the peer
    // sends; resume re-arms it with the full timeout.
    void suspend_timeout();
    void resume_timeout();

    // Invoked once from stop(); the owning server uses it to forget the session.
    void set_close_handler(std::function<void()> handler) { close_handler_ = std::move(handler); }

    // Queues the handshake behind any pending writes so the "220 Ready" reply
    // goes out in plaintext first.
    void start_tls(ssl::context& ssl_ctx);

protected:
    virtual void on_connect();
    virtual void on_data(const std::string& data) = 0;
    virtual void on_line(const std::string& line);
    virtual void on_disconnect();
    virtual void on_error(const boost::system::error_code& ec);
    virtual void on_tls_handshake_complete();
    virtual void on_line_too_long();

    void do_read();
    void do_write();

    void close_socket();

    asio::io_context& io_context_;
    asio::strand<asio::io_context::executor_type> strand_;
    Socket socket_;
    bool is_tls_ = false;

    asio::streambuf read_buffer_;
    std::deque<std::string> write_queue_;

    asio::steady_timer timeout_timer_;
    std::chrono::seconds timeout_{300};
    bool timeout_suspended_ = false;

    bool stopped_ = false;
    bool closing_ = false;
    bool discarding_ = false;

private:
    void handle_read(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_write(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_timeout(const boost::system::error_code& ec);
    void do_handshake();

    template<typename SocketType>
    void do_read_impl(SocketType& socket);

    template<typename SocketType>
    void do_write_impl(SocketType& socket);

    ssl::context* pending_tls_ = nullptr;
    std::function<void()> close_handler_;
};

}  // namespace mailfwd
