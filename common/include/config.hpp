#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <optional>
#include <unordered_map>
#include <vector>
#include <chrono>
#include <cstdint>

#include "logger.hpp"

namespace mailfwd {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 0;
    bool enable_starttls = true;
    size_t max_connections = 1000;
    size_t thread_pool_size = 4;
    std::chrono::seconds connection_timeout{300};
};

struct TLSConfig {
    std::filesystem::path certificate_file;
    std::filesystem::path private_key_file;
    std::filesystem::path ca_file;
    std::string ciphers = "HIGH:!aNULL:!MD5:!RC4";
};

struct DatabaseConfig {
    std::filesystem::path path = "/var/lib/mailfwd/mailfwd.db";
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::filesystem::path file;
    bool log_to_console = true;
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

// Inbound listener
struct SMTPConfig : ServerConfig {
    std::string hostname = "localhost";
    size_t max_message_size = 25 * 1024 * 1024;  // 25 MB
    size_t max_recipients = 100;
    size_t max_connections_per_client = 20;  // 0 = unlimited
    size_t max_line_length = 4096;           // CRLF included

    SMTPConfig() {
        port = 25;
    }
};

enum class DeliveryMode {
    Direct,
    Relay,
    Hybrid,
    Smart
};

std::optional<DeliveryMode> parse_delivery_mode(std::string_view name);
std::string_view delivery_mode_name(DeliveryMode mode);

struct RelayConfig {
    std::string host;
    uint16_t port = 587;
    std::string username;
    std::string password;
    bool use_tls = true;
    bool verify_certificate = true;
    size_t pool_size = 5;
    size_t workers = 3;
    size_t queue_capacity = 1000;
    size_t rate_limit = 100;  // sends per minute
    int max_retries = 3;
    std::chrono::seconds acquire_timeout{30};

    bool configured() const {
        return !host.empty() && !username.empty() && !password.empty();
    }
};

struct DeliveryConfig {
    DeliveryMode mode = DeliveryMode::Direct;
    std::string hostname;  // empty = SMTPConfig::hostname
    bool dkim_enabled = true;
    std::string dkim_selector = "mailfwd";
    int max_retries = 3;
    std::chrono::seconds connect_timeout{30};
    size_t rate_limit_per_domain = 10;  // connections per minute
    std::chrono::seconds mx_cache_ttl{3600};
    std::string envelope_sender;  // empty = noreply@<alias domain>
    std::string forwarded_by = "mailfwd";
};

class Config {
public:
    Config() = default;

    static Config& instance();

    bool load(const std::filesystem::path& config_file);
    bool load_from_string(const std::string& content);

    const TLSConfig& tls() const { return tls_; }
    const DatabaseConfig& database() const { return database_; }
    const LogConfig& log() const { return log_; }
    const SMTPConfig& smtp() const { return smtp_; }
    const DeliveryConfig& delivery() const { return delivery_; }
    const RelayConfig& relay() const { return relay_; }

    TLSConfig& tls() { return tls_; }
    DatabaseConfig& database() { return database_; }
    LogConfig& log() { return log_; }
    SMTPConfig& smtp() { return smtp_; }
    DeliveryConfig& delivery() { return delivery_; }
    RelayConfig& relay() { return relay_; }

    // Sending hostname used in EHLO and generated Message-IDs
    std::string sending_hostname() const {
        return delivery_.hostname.empty() ? smtp_.hostname : delivery_.hostname;
    }

    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);

private:
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void parse_section(const std::string& section, const std::string& key, const std::string& value);

    TLSConfig tls_;
    DatabaseConfig database_;
    LogConfig log_;
    SMTPConfig smtp_;
    DeliveryConfig delivery_;
    RelayConfig relay_;

    std::unordered_map<std::string, std::string> custom_values_;
};

}  // namespace mailfwd
