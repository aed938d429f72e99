#include "net/session.hpp"
#include "logger.hpp"

namespace mailfwd {

Session::Session(asio::io_context& io_context, tcp::socket socket, size_t max_line_length)
    : io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , socket_(std::in_place_type<PlainSocket>, std::move(socket))
    , read_buffer_(max_line_length)
    , timeout_timer_(io_context) {
}

void Session::start() {
    auto self = shared_from_this();
    asio::dispatch(strand_, [this, self]() {
        on_connect();
        reset_timeout();
        do_read();
    });
}

void Session::stop() {
    if (stopped_) return;
    stopped_ = true;

    timeout_timer_.cancel();
    on_disconnect();
    close_socket();

    if (close_handler_) {
        auto handler = std::move(close_handler_);
        close_handler_ = nullptr;
        handler();
    }
}

void Session::close_socket() {
    boost::system::error_code ec;

    if (is_tls_) {
        std::get<SSLSocket>(socket_).lowest_layer().close(ec);
    } else {
        std::get<PlainSocket>(socket_).close(ec);
    }
}

std::string Session::remote_address() const {
    boost::system::error_code ec;
    auto endpoint = is_tls_
        ? std::get<SSLSocket>(socket_).lowest_layer().remote_endpoint(ec)
        : std::get<PlainSocket>(socket_).remote_endpoint(ec);
    return ec ? "unknown" : endpoint.address().to_string();
}

uint16_t Session::remote_port() const {
    boost::system::error_code ec;
    auto endpoint = is_tls_
        ? std::get<SSLSocket>(socket_).lowest_layer().remote_endpoint(ec)
        : std::get<PlainSocket>(socket_).remote_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void Session::set_timeout(std::chrono::seconds timeout) {
    timeout_ = timeout;
}

void Session::reset_timeout() {
    if (timeout_suspended_) {
        return;
    }
    timeout_timer_.cancel();
    timeout_timer_.expires_after(timeout_);
    auto self = shared_from_this();
    timeout_timer_.async_wait(asio::bind_executor(strand_,
        [this, self](const boost::system::error_code& ec) {
            handle_timeout(ec);
        }));
}

void Session::suspend_timeout() {
    timeout_suspended_ = true;
    timeout_timer_.cancel();
}

void Session::resume_timeout() {
    timeout_suspended_ = false;
    reset_timeout();
}

void Session::handle_timeout(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted) {
        return;
    }
    // an expiry already queued when the timer was suspended or re-armed
    if (timeout_suspended_ || timeout_timer_.expiry() > std::chrono::steady_clock::now()) {
        return;
    }
    if (!stopped_) {
        LOG_DEBUG_FMT("Session timeout for {}", remote_address());
        stop();
    }
}

void Session::send(const std::string& data) {
    auto self = shared_from_this();
    asio::post(strand_, [this, self, data]() {
        if (stopped_) return;
        bool was_empty = write_queue_.empty();
        write_queue_.push_back(data);
        if (was_empty) {
            do_write();
        }
    });
}

void Session::send_line(const std::string& line) {
    send(line + "\r\n");
}

void Session::close_after_flush() {
    auto self = shared_from_this();
    asio::post(strand_, [this, self]() {
        closing_ = true;
        if (write_queue_.empty()) {
            stop();
        }
    });
}

void Session::do_read() {
    if (stopped_ || closing_ || pending_tls_) return;

    if (is_tls_) {
        do_read_impl(std::get<SSLSocket>(socket_));
    } else {
        do_read_impl(std::get<PlainSocket>(socket_));
    }
}

template<typename SocketType>
void Session::do_read_impl(SocketType& socket) {
    auto self = shared_from_this();
    asio::async_read_until(
        socket,
        read_buffer_,
        "\r\n",
        asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                handle_read(ec, bytes_transferred);
            }));
}

void Session::handle_read(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (!ec) {
        reset_timeout();

        std::istream is(&read_buffer_);
        std::string line;
        std::getline(is, line);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (discarding_) {
            discarding_ = false;  // tail of an overlong line
        } else {
            on_line(line);
        }

        do_read();
    } else if (ec == asio::error::not_found) {
        // streambuf hit its max_size before a CRLF arrived
        read_buffer_.consume(read_buffer_.size());
        if (!discarding_) {
            discarding_ = true;
            on_line_too_long();
        }
        do_read();
    } else {
        on_error(ec);
        stop();
    }
}

void Session::do_write() {
    if (stopped_ || write_queue_.empty()) return;

    if (is_tls_) {
        do_write_impl(std::get<SSLSocket>(socket_));
    } else {
        do_write_impl(std::get<PlainSocket>(socket_));
    }
}

template<typename SocketType>
void Session::do_write_impl(SocketType& socket) {
    auto self = shared_from_this();
    asio::async_write(
        socket,
        asio::buffer(write_queue_.front()),
        asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                handle_write(ec, bytes_transferred);
            }));
}

void Session::handle_write(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (!ec) {
        write_queue_.pop_front();
        if (!write_queue_.empty()) {
            do_write();
        } else if (closing_) {
            stop();
        } else if (pending_tls_) {
            do_handshake();
        }
    } else {
        on_error(ec);
        stop();
    }
}

void Session::on_connect() {
    LOG_DEBUG_FMT("New connection from {}:{}", remote_address(), remote_port());
}

void Session::on_line(const std::string& line) {
    on_data(line);
}

void Session::on_disconnect() {
    LOG_DEBUG_FMT("Connection closed from {}:{}", remote_address(), remote_port());
}

void Session::on_error(const boost::system::error_code& ec) {
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::operation_aborted) {
        return;
    }
    LOG_ERROR_FMT("Session error: {}", ec.message());
}

void Session::on_line_too_long() {
    LOG_WARNING_FMT("Line too long from {}, closing", remote_address());
    stop();
}

void Session::on_tls_handshake_complete() {
    LOG_DEBUG("TLS handshake completed");
}

void Session::start_tls(ssl::context& ssl_ctx) {
    if (is_tls_ || pending_tls_) return;

    pending_tls_ = &ssl_ctx;
    if (write_queue_.empty()) {
        auto self = shared_from_this();
        asio::post(strand_, [this, self]() {
            if (write_queue_.empty() && pending_tls_) {
                do_handshake();
            }
        });
    }
}

void Session::do_handshake() {
    ssl::context& ctx = *pending_tls_;

    // Anything pipelined before the handshake is discarded
    read_buffer_.consume(read_buffer_.size());

    PlainSocket plain = std::move(std::get<PlainSocket>(socket_));
    socket_.emplace<SSLSocket>(std::move(plain), ctx);
    is_tls_ = true;

    auto self = shared_from_this();
    std::get<SSLSocket>(socket_).async_handshake(
        ssl::stream_base::server,
        asio::bind_executor(strand_, [this, self](const boost::system::error_code& ec) {
            pending_tls_ = nullptr;
            if (!ec) {
                on_tls_handshake_complete();
                do_read();
            } else {
                on_error(ec);
                stop();
            }
        }));
}

}  // namespace mailfwd
