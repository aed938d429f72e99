#include "smtp_server.hpp"
#include "inbound_handler.hpp"
#include "notifier.hpp"
#include "hybrid_delivery.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "ssl_context.hpp"
#include "storage/sqlite_store.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};
}

void signal_handler(int signal) {
    (void)signal;
    g_running = false;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file path\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "/etc/mailfwd/mailfwd.conf";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "mailfwd v1.0.0\n";
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    auto& config = mailfwd::Config::instance();
    bool loaded = config.load(config_file);

    const auto& log = config.log();
    mailfwd::Logger::instance().init(log.level, log.log_to_console, log.file,
                                     log.max_file_size, log.max_files);

    if (!loaded) {
        LOG_WARNING_FMT("Could not load config file: {}, using defaults", config_file);
    }

    LOG_INFO("mailfwd starting...");

    auto store = std::make_shared<mailfwd::SqliteStore>(config.database().path);
    if (!store->initialize()) {
        LOG_FATAL_FMT("Failed to open database {}: {}", config.database().path.string(),
                      store->last_error());
        return 1;
    }

    const auto& delivery_config = config.delivery();
    const auto& relay_config = config.relay();
    std::string sending_host = config.sending_hostname();

    // MX hosts are rarely verifiable; the smart host is checked when asked to
    auto mx_tls = std::make_shared<mailfwd::SSLContext>(mailfwd::SSLContext::for_mx_delivery());
    auto relay_tls = std::make_shared<mailfwd::SSLContext>(
        mailfwd::SSLContext::for_relay(config.tls(), relay_config.verify_certificate));

    auto connect_timeout = delivery_config.connect_timeout;
    mailfwd::delivery::SmtpClientFactory mx_clients = [mx_tls, connect_timeout]() {
        return std::make_unique<mailfwd::delivery::AsioSmtpClient>(mx_tls, connect_timeout);
    };
    mailfwd::delivery::SmtpClientFactory relay_clients = [relay_tls, connect_timeout]() {
        return std::make_unique<mailfwd::delivery::AsioSmtpClient>(relay_tls, connect_timeout);
    };

    auto resolver = std::make_shared<mailfwd::delivery::MxResolver>(
        std::make_shared<mailfwd::delivery::ResolvMxLookup>(), delivery_config.mx_cache_ttl);
    auto limiter = std::make_shared<mailfwd::delivery::RateLimiter>(
        delivery_config.rate_limit_per_domain);
    auto direct = std::make_shared<mailfwd::delivery::DirectDeliveryService>(
        resolver, limiter, mx_clients, sending_host, delivery_config.max_retries);

    std::shared_ptr<mailfwd::delivery::RelayService> relay;
    if (delivery_config.mode != mailfwd::DeliveryMode::Direct) {
        if (relay_config.configured()) {
            relay = std::make_shared<mailfwd::delivery::RelayService>(
                relay_config, sending_host, relay_clients);
        } else {
            LOG_WARNING_FMT("Delivery mode {} needs relay host and credentials, using direct",
                            mailfwd::delivery_mode_name(delivery_config.mode));
        }
    }

    std::shared_ptr<mailfwd::delivery::DkimSigner> signer;
    if (delivery_config.dkim_enabled) {
        signer = std::make_shared<mailfwd::delivery::DkimSigner>(store, delivery_config.dkim_selector);
    }

    auto coordinator = std::make_shared<mailfwd::delivery::HybridDelivery>(
        delivery_config.mode, relay_config, direct, relay, signer);

    auto handler = std::make_shared<mailfwd::smtp::InboundHandler>(
        store, coordinator, std::make_shared<mailfwd::smtp::LogNotifier>(),
        mailfwd::smtp::ForwardingOptions::from_config(config));

    mailfwd::smtp::SMTPServer server(config.smtp(), handler);

    if (!config.tls().certificate_file.empty() && !config.tls().private_key_file.empty()) {
        if (!server.configure_tls(config.tls())) {
            LOG_WARNING("TLS configuration failed, continuing without STARTTLS");
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        if (relay) {
            relay->start();
        }
        server.start();
        LOG_INFO_FMT("mailfwd accepting mail on port {} in {} mode", server.port(),
                     mailfwd::delivery_mode_name(coordinator->mode()));

        while (g_running && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    } catch (const std::exception& e) {
        LOG_FATAL_FMT("Server error: {}", e.what());
        server.stop();
        if (relay) {
            relay->stop();
        }
        return 1;
    }

    LOG_INFO("Shutting down...");
    server.stop();
    if (relay) {
        relay->stop();
    }

    auto stats = coordinator->stats();
    LOG_INFO_FMT("Forwarded {} direct ({} failed), {} relayed ({} failed)",
                 stats.direct_sent, stats.direct_failed, stats.relay_sent, stats.relay_failed);
    LOG_INFO("mailfwd shutdown complete");
    return 0;
}
