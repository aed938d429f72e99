#include "smtp_server.hpp"
#include "logger.hpp"

namespace mailfwd::smtp {

SMTPServer::SMTPServer(const SMTPConfig& config, std::shared_ptr<MessageHandler> handler)
    : config_(config)
    , handler_(std::move(handler))
    , workers_(config.thread_pool_size == 0 ? 1 : config.thread_pool_size) {
}

SMTPServer::~SMTPServer() {
    stop();
    // Workers may still hold sessions bound to the listener's io_context
    workers_.join();
    smtp_server_.reset();
}

bool SMTPServer::configure_tls(const TLSConfig& tls_config) {
    ssl_context_ = SSLContext::for_inbound(tls_config);
    return ssl_context_.has_value();
}

void SMTPServer::start() {
    if (is_running()) return;

    smtp_server_ = std::make_unique<Server<SMTPSession>>(
        "SMTP",
        config_.bind_address,
        config_.port,
        config_.thread_pool_size
    );

    smtp_server_->set_session_factory(
        [this](asio::io_context& io_ctx, tcp::socket socket) {
            ssl::context* ssl_ctx = ssl_context_ ? &ssl_context_->native() : nullptr;
            return std::make_shared<SMTPSession>(
                io_ctx, std::move(socket), handler_, workers_.get_executor(), config_, ssl_ctx);
        }
    );

    smtp_server_->set_max_connections(config_.max_connections);
    smtp_server_->set_max_connections_per_address(config_.max_connections_per_client);
    smtp_server_->set_refusal_line(reply::make(reply::SERVICE_NOT_AVAILABLE,
        config_.hostname + " Too many connections, try again later"));
    smtp_server_->set_connection_timeout(config_.connection_timeout);

    if (!ssl_context_ && config_.enable_starttls) {
        LOG_WARNING("No TLS certificate configured, STARTTLS will not be offered");
    }

    LOG_INFO_FMT("Starting SMTP server on {}:{}", config_.bind_address, config_.port);
    smtp_server_->start();
}

void SMTPServer::stop() {
    if (!is_running()) return;

    smtp_server_->stop();

    LOG_INFO("SMTP server stopped");
}

bool SMTPServer::is_running() const {
    return smtp_server_ && smtp_server_->is_running();
}

uint16_t SMTPServer::port() const {
    return smtp_server_ ? smtp_server_->port() : 0;
}

}  // namespace mailfwd::smtp
