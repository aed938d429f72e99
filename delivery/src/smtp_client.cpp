#include "smtp_client.hpp"
#include "delivery_errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <sstream>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

namespace mailfwd::delivery {

namespace {

std::string base64_encode(const std::string& data) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);

    BUF_MEM* buffer;
    BIO_get_mem_ptr(bio, &buffer);

    std::string result(buffer->data, buffer->length);
    BIO_free_all(bio);

    return result;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

bool is_positive(int code) {
    return code >= 200 && code < 400;
}

}  // namespace

std::string encode_data(std::string_view message) {
    std::string out;
    out.reserve(message.size() + message.size() / 64 + 8);

    size_t pos = 0;
    while (pos < message.size()) {
        size_t eol = message.find('\n', pos);
        std::string_view line = message.substr(pos, eol == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty() && line.front() == '.') {
            out += '.';
        }
        out += line;
        out += "\r\n";

        if (eol == std::string_view::npos) break;
        pos = eol + 1;
    }

    out += ".\r\n";
    return out;
}

AsioSmtpClient::AsioSmtpClient(std::shared_ptr<SSLContext> tls_context,
                               std::chrono::seconds timeout)
    : socket_(io_context_)
    , tls_context_(std::move(tls_context))
    , timeout_(timeout) {
}

AsioSmtpClient::~AsioSmtpClient() {
    close();
}

tcp::socket::lowest_layer_type& AsioSmtpClient::lowest_layer() {
    if (tls_) {
        return tls_->lowest_layer();
    }
    return socket_.lowest_layer();
}

bool AsioSmtpClient::run_pending(const std::function<void()>& cancel) {
    io_context_.restart();
    io_context_.run_for(timeout_);

    if (!io_context_.stopped()) {
        // Deadline passed: cancel the outstanding operation and let its
        // handler run with operation_aborted.
        if (cancel) {
            cancel();
        } else {
            boost::system::error_code ec;
            lowest_layer().close(ec);
        }
        io_context_.run();
        return false;
    }
    return true;
}

void AsioSmtpClient::fail_transport(const std::string& stage, const boost::system::error_code& ec) {
    connected_ = false;
    close();
    throw TemporarySmtpError(0, host_ + ": " + stage + " failed: " + ec.message());
}

void AsioSmtpClient::fail_reply(const std::string& stage, const Reply& reply, bool recipient_refused) {
    std::string message = host_ + ": " + stage + " rejected: " +
                          std::to_string(reply.code) + " " + reply.text;
    if (reply.code >= 500) {
        throw PermanentSmtpError(reply.code, message, recipient_refused);
    }
    throw TemporarySmtpError(reply.code, message);
}

void AsioSmtpClient::close() {
    boost::system::error_code ec;
    auto& sock = lowest_layer();
    if (sock.is_open()) {
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }
    connected_ = false;
}

void AsioSmtpClient::write(const std::string& data) {
    boost::system::error_code ec = asio::error::would_block;
    with_stream([&](auto& stream) {
        asio::async_write(stream, asio::buffer(data),
            [&](const boost::system::error_code& e, std::size_t) { ec = e; });
    });

    if (!run_pending()) {
        fail_transport("write", asio::error::timed_out);
    }
    if (ec) {
        fail_transport("write", ec);
    }
}

AsioSmtpClient::Reply AsioSmtpClient::read_reply() {
    Reply reply;

    while (true) {
        boost::system::error_code ec = asio::error::would_block;
        with_stream([&](auto& stream) {
            asio::async_read_until(stream, buffer_, "\r\n",
                [&](const boost::system::error_code& e, std::size_t) { ec = e; });
        });

        if (!run_pending()) {
            fail_transport("read", asio::error::timed_out);
        }
        if (ec) {
            fail_transport("read", ec);
        }

        std::istream is(&buffer_);
        std::string line;
        std::getline(is, line);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0])) ||
            !std::isdigit(static_cast<unsigned char>(line[1])) ||
            !std::isdigit(static_cast<unsigned char>(line[2]))) {
            connected_ = false;
            close();
            throw TemporarySmtpError(0, host_ + ": malformed reply '" + line + "'");
        }

        reply.code = std::stoi(line.substr(0, 3));
        if (!reply.text.empty()) {
            reply.text += "\n";
        }
        if (line.size() > 4) {
            reply.text += line.substr(4);
        }

        if (line.size() == 3 || line[3] != '-') {
            break;
        }
    }

    LOG_TRACE_FMT("{} <- {} {}", host_, reply.code, reply.text);
    return reply;
}

AsioSmtpClient::Reply AsioSmtpClient::command(const std::string& line, bool sensitive) {
    LOG_TRACE_FMT("{} -> {}", host_, sensitive ? "****" : line);
    write(line + "\r\n");
    return read_reply();
}

void AsioSmtpClient::connect(const std::string& host, uint16_t port) {
    close();
    tls_.reset();
    socket_ = tcp::socket(io_context_);
    buffer_.consume(buffer_.size());
    extensions_.clear();
    auth_mechanisms_.clear();
    host_ = host;

    tcp::resolver resolver(io_context_);
    boost::system::error_code ec = asio::error::would_block;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(host, std::to_string(port),
        [&](const boost::system::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
        });
    if (!run_pending([&resolver]() { resolver.cancel(); })) {
        fail_transport("resolve", asio::error::timed_out);
    }
    if (ec) {
        fail_transport("resolve", ec);
    }

    ec = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
        [&](const boost::system::error_code& e, const tcp::endpoint&) { ec = e; });
    if (!run_pending()) {
        fail_transport("connect", asio::error::timed_out);
    }
    if (ec) {
        fail_transport("connect", ec);
    }

    auto greeting = read_reply();
    if (greeting.code != 220) {
        fail_reply("greeting", greeting);
    }

    connected_ = true;
    LOG_DEBUG_FMT("Connected to {}:{}", host, port);
}

void AsioSmtpClient::ehlo(const std::string& hostname) {
    extensions_.clear();
    auth_mechanisms_.clear();

    auto reply = command("EHLO " + hostname);
    if (reply.code != 250) {
        auto helo = command("HELO " + hostname);
        if (helo.code != 250) {
            fail_reply("HELO", helo);
        }
        return;
    }

    // First line is the server greeting; the rest are extensions
    std::istringstream lines(reply.text);
    std::string line;
    std::getline(lines, line);
    while (std::getline(lines, line)) {
        std::istringstream words(line);
        std::string keyword;
        words >> keyword;
        keyword = to_upper(keyword);
        if (keyword.empty()) continue;
        extensions_.insert(keyword);

        if (keyword == "AUTH") {
            std::string mechanism;
            while (words >> mechanism) {
                auth_mechanisms_.insert(to_upper(mechanism));
            }
        }
    }
}

bool AsioSmtpClient::supports(std::string_view extension) const {
    return extensions_.count(to_upper(std::string(extension))) > 0;
}

void AsioSmtpClient::starttls() {
    if (tls_) return;
    if (!tls_context_) {
        throw TemporarySmtpError(0, host_ + ": no TLS context configured");
    }

    auto reply = command("STARTTLS");
    if (reply.code != 220) {
        fail_reply("STARTTLS", reply);
    }

    buffer_.consume(buffer_.size());
    tls_.emplace(std::move(socket_), tls_context_->native());
    socket_ = tcp::socket(io_context_);

    if (!SSL_set_tlsext_host_name(tls_->native_handle(), host_.c_str())) {
        LOG_DEBUG_FMT("Could not set SNI for {}", host_);
    }

    if (tls_context_->verifies_peer()) {
        tls_->set_verify_callback(asio::ssl::host_name_verification(host_));
    }

    boost::system::error_code ec = asio::error::would_block;
    tls_->async_handshake(asio::ssl::stream_base::client,
        [&](const boost::system::error_code& e) { ec = e; });
    if (!run_pending()) {
        fail_transport("TLS handshake", asio::error::timed_out);
    }
    if (ec) {
        fail_transport("TLS handshake", ec);
    }

    // Capabilities must be re-learned over the encrypted channel
    extensions_.clear();
    auth_mechanisms_.clear();
    LOG_DEBUG_FMT("TLS established with {}", host_);
}

void AsioSmtpClient::login(const std::string& username, const std::string& password) {
    if (auth_mechanisms_.count("PLAIN") || !auth_mechanisms_.count("LOGIN")) {
        std::string credentials;
        credentials += '\0';
        credentials += username;
        credentials += '\0';
        credentials += password;

        auto reply = command("AUTH PLAIN " + base64_encode(credentials), true);
        if (reply.code != 235) {
            fail_reply("AUTH PLAIN", reply);
        }
        return;
    }

    auto reply = command("AUTH LOGIN");
    if (reply.code != 334) {
        fail_reply("AUTH LOGIN", reply);
    }
    reply = command(base64_encode(username), true);
    if (reply.code != 334) {
        fail_reply("AUTH LOGIN username", reply);
    }
    reply = command(base64_encode(password), true);
    if (reply.code != 235) {
        fail_reply("AUTH LOGIN password", reply);
    }
}

std::vector<std::string> AsioSmtpClient::send_mail(const std::string& from,
                                                   const std::vector<std::string>& recipients,
                                                   const std::string& data) {
    auto reply = command("MAIL FROM:<" + from + ">");
    if (reply.code != 250) {
        fail_reply("MAIL FROM", reply);
    }

    std::vector<std::string> refused;
    std::optional<Reply> last_temporary;
    std::optional<Reply> last_permanent;
    size_t accepted = 0;

    for (const auto& rcpt : recipients) {
        reply = command("RCPT TO:<" + rcpt + ">");
        if (reply.code == 250 || reply.code == 251) {
            ++accepted;
            continue;
        }
        LOG_WARNING_FMT("{} refused recipient {}: {} {}", host_, rcpt, reply.code, reply.text);
        refused.push_back(rcpt);
        if (reply.code >= 500) {
            last_permanent = reply;
        } else {
            last_temporary = reply;
        }
    }

    if (accepted == 0) {
        command("RSET");
        if (last_temporary) {
            fail_reply("RCPT TO", *last_temporary);
        }
        fail_reply("RCPT TO", last_permanent.value_or(Reply{550, "all recipients refused"}), true);
    }

    reply = command("DATA");
    if (reply.code != 354) {
        fail_reply("DATA", reply);
    }

    write(encode_data(data));
    reply = read_reply();
    if (!is_positive(reply.code)) {
        fail_reply("message", reply);
    }

    return refused;
}

bool AsioSmtpClient::noop() {
    if (!connected_) return false;
    try {
        return command("NOOP").code == 250;
    } catch (const SmtpError& e) {
        LOG_DEBUG_FMT("NOOP to {} failed: {}", host_, e.what());
        connected_ = false;
        return false;
    }
}

void AsioSmtpClient::quit() {
    if (!connected_) return;
    try {
        command("QUIT");
    } catch (const SmtpError& e) {
        LOG_DEBUG_FMT("QUIT to {} failed: {}", host_, e.what());
    }
    close();
}

}  // namespace mailfwd::delivery
