#pragma once

#include "net/server.hpp"
#include "ssl_context.hpp"
#include "config.hpp"
#include "smtp_session.hpp"
#include "inbound_handler.hpp"
#include <memory>
#include <optional>

namespace mailfwd::smtp {

// Inbound listener for hosted domains. Sessions share one worker pool that
// runs message handling off the I/O threads.
class SMTPServer {
public:
    SMTPServer(const SMTPConfig& config, std::shared_ptr<MessageHandler> handler);

    ~SMTPServer();

    void start();
    void stop();

    bool is_running() const;
    // Bound port, valid after start()
    uint16_t port() const;

    bool configure_tls(const TLSConfig& tls_config);

private:
    SMTPConfig config_;
    std::shared_ptr<MessageHandler> handler_;

    std::unique_ptr<Server<SMTPSession>> smtp_server_;
    asio::thread_pool workers_;

    std::optional<SSLContext> ssl_context_;
};

}  // namespace mailfwd::smtp
