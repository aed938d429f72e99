#include "smtp_session.hpp"
#include "logger.hpp"
#include <sstream>
#include <chrono>
#include <iomanip>

namespace mailfwd::smtp {

namespace {

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S %z");
    return oss.str();
}

}  // namespace

SMTPSession::SMTPSession(asio::io_context& io_context, tcp::socket socket,
                         std::shared_ptr<MessageHandler> handler,
                         asio::thread_pool::executor_type workers,
                         const SMTPConfig& config,
                         ssl::context* ssl_ctx)
    : Session(io_context, std::move(socket), config.max_line_length)
    , handler_(std::move(handler))
    , workers_(workers)
    , hostname_(config.hostname)
    , max_message_size_(config.max_message_size)
    , max_recipients_(config.max_recipients)
    , max_line_length_(config.max_line_length)
    , starttls_enabled_(config.enable_starttls)
    , ssl_context_(ssl_ctx) {
}

void SMTPSession::on_connect() {
    Session::on_connect();
    LOG_INFO_FMT("SMTP connection from {}:{}", remote_address(), remote_port());

    send_line(reply::make(reply::SERVICE_READY, hostname_ + " ESMTP ready"));
}

void SMTPSession::on_data(const std::string& data) {
    if (processing_) {
        pending_lines_.push_back(data);
        return;
    }
    dispatch_line(data);
}

void SMTPSession::on_tls_handshake_complete() {
    Session::on_tls_handshake_complete();
    LOG_INFO_FMT("SMTP TLS handshake completed with {}", remote_address());
}

void SMTPSession::on_line_too_long() {
    LOG_WARNING_FMT("Line over {} bytes from {}", max_line_length_, remote_address());
    if (processing_) {
        pending_lines_.push_back(std::nullopt);
        return;
    }
    reject_overlong_line();
}

void SMTPSession::reject_overlong_line() {
    if (state_ == SessionState::DATA) {
        // Reported once the terminating dot arrives
        if (!data_rejection_) {
            data_rejection_ = reply::make(reply::SYNTAX_ERROR, "Line too long");
            envelope_.data.clear();
        }
        return;
    }
    send_line(reply::make(reply::SYNTAX_ERROR, "Line too long"));
}

void SMTPSession::dispatch_line(const std::string& line) {
    if (state_ == SessionState::DATA) {
        process_data_line(line);
    } else {
        process_command(line);
    }
}

void SMTPSession::process_command(const std::string& line) {
    LOG_DEBUG_FMT("SMTP command: {}", line);

    Command cmd = Command::parse(line);
    std::string response = execute(*this, cmd);

    if (!response.empty()) {
        send_line(response);
    }

    if (cmd.type == CommandType::QUIT) {
        close_after_flush();
    }
}

void SMTPSession::process_data_line(const std::string& line) {
    if (line == ".") {
        if (data_rejection_) {
            send_line(*data_rejection_);
            data_rejection_.reset();
            envelope_.clear();
            state_ = SessionState::GREETED;
            return;
        }
        finish_message();
        return;
    }

    if (data_rejection_) {
        return;
    }

    // Byte-stuffing: a leading dot was doubled by the client
    std::string content_line = line;
    if (!content_line.empty() && content_line[0] == '.') {
        content_line.erase(0, 1);
    }

    if (envelope_.data.size() + content_line.size() + 2 > max_message_size_) {
        LOG_WARNING_FMT("Message from {} exceeds {} bytes", envelope_.mail_from, max_message_size_);
        data_rejection_ = reply::make(reply::EXCEEDED_STORAGE, "Message too large");
        envelope_.data.clear();
        return;
    }

    envelope_.data += content_line + "\r\n";
}

std::string SMTPSession::received_header() const {
    std::ostringstream received;
    received << "Received: from " << client_hostname_
             << " (" << remote_address() << ")\r\n"
             << "\tby " << hostname_ << " with "
             << (is_tls() ? "ESMTPS" : "ESMTP") << ";\r\n"
             << "\t" << get_timestamp() << "\r\n";
    return received.str();
}

void SMTPSession::finish_message() {
    std::string mail_from = envelope_.mail_from;
    std::vector<std::string> rcpt_to = envelope_.rcpt_to;
    std::string message = received_header() + envelope_.data;

    envelope_.clear();
    state_ = SessionState::GREETED;
    processing_ = true;
    suspend_timeout();

    auto self = std::static_pointer_cast<SMTPSession>(shared_from_this());
    asio::post(workers_, [this, self, mail_from = std::move(mail_from),
                          rcpt_to = std::move(rcpt_to), message = std::move(message)]() {
        std::string response = handler_->handle_data(mail_from, rcpt_to, message);

        asio::post(strand_, [this, self, response]() {
            processing_ = false;
            if (stopped_) return;
            resume_timeout();
            send_line(response);
            replay_pending();
        });
    });
}

void SMTPSession::replay_pending() {
    while (!processing_ && !stopped_ && !pending_lines_.empty()) {
        auto line = std::move(pending_lines_.front());
        pending_lines_.pop_front();
        if (line) {
            dispatch_line(*line);
        } else {
            reject_overlong_line();
        }
    }
}

}  // namespace mailfwd::smtp
