#include "config.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace mailfwd {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

bool to_bool(const std::string& v) {
    auto lower = to_lower(v);
    return lower == "true" || lower == "yes" || lower == "1" || lower == "on";
}

int64_t to_int(const std::string& v) {
    try {
        return std::stoll(v);
    } catch (const std::exception&) {
        LOG_WARNING_FMT("Invalid integer value in configuration: '{}'", v);
        return 0;
    }
}

constexpr int kMaxRetries = 20;

int to_retries(const std::string& v, const char* section) {
    auto retries = to_int(v);
    if (retries < 0 || retries > kMaxRetries) {
        auto clamped = std::clamp<int64_t>(retries, 0, kMaxRetries);
        LOG_WARNING_FMT("[{}] max_retries {} out of range, using {}", section, retries, clamped);
        return static_cast<int>(clamped);
    }
    return static_cast<int>(retries);
}

}  // namespace

std::optional<DeliveryMode> parse_delivery_mode(std::string_view name) {
    auto mode = to_lower(std::string(name));
    if (mode == "direct") return DeliveryMode::Direct;
    if (mode == "relay") return DeliveryMode::Relay;
    if (mode == "hybrid") return DeliveryMode::Hybrid;
    if (mode == "smart") return DeliveryMode::Smart;
    return std::nullopt;
}

std::string_view delivery_mode_name(DeliveryMode mode) {
    switch (mode) {
        case DeliveryMode::Direct: return "direct";
        case DeliveryMode::Relay:  return "relay";
        case DeliveryMode::Hybrid: return "hybrid";
        case DeliveryMode::Smart:  return "smart";
    }
    return "unknown";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::filesystem::path& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

bool Config::load_from_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string current_section;

    while (std::getline(stream, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            current_section = to_lower(trim(line.substr(1, line.length() - 2)));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = to_lower(trim(line.substr(0, eq_pos)));
        std::string value = trim(line.substr(eq_pos + 1));

        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        parse_section(current_section, key, value);
    }

    return true;
}

void Config::parse_section(const std::string& section, const std::string& key,
                           const std::string& value) {
    auto seconds = [](const std::string& v) {
        return std::chrono::seconds(to_int(v));
    };

    if (section == "tls" || section == "ssl") {
        if (key == "certificate" || key == "cert_file") {
            tls_.certificate_file = value;
        } else if (key == "private_key" || key == "key_file") {
            tls_.private_key_file = value;
        } else if (key == "ca_file") {
            tls_.ca_file = value;
        } else if (key == "ciphers") {
            tls_.ciphers = value;
        }
    } else if (section == "database") {
        if (key == "path") {
            database_.path = value;
        }
    } else if (section == "log" || section == "logging") {
        if (key == "level") {
            if (auto level = parse_log_level(value)) {
                log_.level = *level;
            }
        } else if (key == "file") {
            log_.file = value;
        } else if (key == "console") {
            log_.log_to_console = to_bool(value);
        } else if (key == "max_file_size") {
            log_.max_file_size = static_cast<size_t>(to_int(value));
        } else if (key == "max_files") {
            log_.max_files = static_cast<size_t>(to_int(value));
        }
    } else if (section == "smtp") {
        if (key == "bind_address" || key == "address") {
            smtp_.bind_address = value;
        } else if (key == "port") {
            smtp_.port = static_cast<uint16_t>(to_int(value));
        } else if (key == "hostname") {
            smtp_.hostname = value;
        } else if (key == "max_connections") {
            smtp_.max_connections = static_cast<size_t>(to_int(value));
        } else if (key == "thread_pool_size") {
            smtp_.thread_pool_size = static_cast<size_t>(to_int(value));
        } else if (key == "connection_timeout") {
            smtp_.connection_timeout = seconds(value);
        } else if (key == "max_message_size") {
            smtp_.max_message_size = static_cast<size_t>(to_int(value));
        } else if (key == "max_recipients") {
            smtp_.max_recipients = static_cast<size_t>(to_int(value));
        } else if (key == "max_connections_per_client" || key == "max_connections_per_ip") {
            smtp_.max_connections_per_client = static_cast<size_t>(to_int(value));
        } else if (key == "max_line_length") {
            smtp_.max_line_length = static_cast<size_t>(to_int(value));
        } else if (key == "enable_starttls") {
            smtp_.enable_starttls = to_bool(value);
        }
    } else if (section == "delivery") {
        if (key == "mode") {
            if (auto mode = parse_delivery_mode(value)) {
                delivery_.mode = *mode;
            } else {
                LOG_WARNING_FMT("Unknown delivery mode '{}', using direct", value);
                delivery_.mode = DeliveryMode::Direct;
            }
        } else if (key == "hostname") {
            delivery_.hostname = value;
        } else if (key == "dkim_enabled" || key == "enable_dkim") {
            delivery_.dkim_enabled = to_bool(value);
        } else if (key == "dkim_selector") {
            delivery_.dkim_selector = value;
        } else if (key == "max_retries") {
            delivery_.max_retries = to_retries(value, "delivery");
        } else if (key == "connect_timeout" || key == "timeout") {
            delivery_.connect_timeout = seconds(value);
        } else if (key == "rate_limit_per_domain") {
            delivery_.rate_limit_per_domain = static_cast<size_t>(to_int(value));
        } else if (key == "mx_cache_ttl") {
            delivery_.mx_cache_ttl = seconds(value);
        } else if (key == "envelope_sender") {
            delivery_.envelope_sender = value;
        } else if (key == "forwarded_by") {
            delivery_.forwarded_by = value;
        }
    } else if (section == "relay") {
        if (key == "host") {
            relay_.host = value;
        } else if (key == "port") {
            relay_.port = static_cast<uint16_t>(to_int(value));
        } else if (key == "username" || key == "user") {
            relay_.username = value;
        } else if (key == "password") {
            relay_.password = value;
        } else if (key == "use_tls") {
            relay_.use_tls = to_bool(value);
        } else if (key == "verify_certificate") {
            relay_.verify_certificate = to_bool(value);
        } else if (key == "pool_size") {
            relay_.pool_size = static_cast<size_t>(to_int(value));
        } else if (key == "workers") {
            relay_.workers = static_cast<size_t>(to_int(value));
        } else if (key == "queue_capacity" || key == "max_queue_size") {
            relay_.queue_capacity = static_cast<size_t>(to_int(value));
        } else if (key == "rate_limit") {
            relay_.rate_limit = static_cast<size_t>(to_int(value));
        } else if (key == "max_retries") {
            relay_.max_retries = to_retries(value, "relay");
        } else if (key == "acquire_timeout") {
            relay_.acquire_timeout = seconds(value);
        }
    } else {
        std::string full_key = section.empty() ? key : section + "." + key;
        custom_values_[full_key] = value;
    }
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = custom_values_.find(key);
    if (it != custom_values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void Config::set(const std::string& key, const std::string& value) {
    custom_values_[key] = value;
}

}  // namespace mailfwd
