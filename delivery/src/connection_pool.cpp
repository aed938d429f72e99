#include "connection_pool.hpp"
#include "delivery_errors.hpp"
#include "logger.hpp"

namespace mailfwd::delivery {

namespace {

void close_quietly(std::unique_ptr<SmtpClient>& client) {
    if (client && client->is_connected()) {
        client->quit();
    }
}

}  // namespace

PooledConnection::PooledConnection(ConnectionPool* pool, std::unique_ptr<SmtpClient> client,
                                   bool pooled)
    : pool_(pool)
    , client_(std::move(client))
    , pooled_(pooled) {
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_)
    , client_(std::move(other.client_))
    , pooled_(other.pooled_)
    , healthy_(other.healthy_) {
    other.pool_ = nullptr;
}

PooledConnection::~PooledConnection() {
    if (pool_ && client_) {
        pool_->release(std::move(client_), pooled_, healthy_);
    }
}

ConnectionPool::ConnectionPool(const RelayConfig& config, std::string hostname,
                               SmtpClientFactory factory)
    : config_(config)
    , hostname_(std::move(hostname))
    , factory_(std::move(factory)) {
}

ConnectionPool::~ConnectionPool() {
    close();
}

std::unique_ptr<SmtpClient> ConnectionPool::open() {
    auto client = factory_();
    client->connect(config_.host, config_.port);
    client->ehlo(hostname_);

    if (config_.use_tls) {
        client->starttls();
        client->ehlo(hostname_);
    }

    if (!config_.username.empty() && !config_.password.empty()) {
        client->login(config_.username, config_.password);
        LOG_DEBUG_FMT("Authenticated to relay {} as {}", config_.host, config_.username);
    }

    return client;
}

void ConnectionPool::warm_up() {
    LOG_INFO_FMT("Opening relay connection pool to {}:{} ({} connections)",
                 config_.host, config_.port, config_.pool_size);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    for (size_t i = 0; i < config_.pool_size; ++i) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || open_count_ >= config_.pool_size) break;
            ++open_count_;
        }

        try {
            auto client = open();
            std::lock_guard<std::mutex> lock(mutex_);
            idle_.push_back(std::move(client));
        } catch (const SmtpError& e) {
            LOG_ERROR_FMT("Relay connection {}/{} failed: {}", i + 1, config_.pool_size, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            --open_count_;
        }
    }
    available_.notify_all();
}

PooledConnection ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    bool ready = available_.wait_for(lock, config_.acquire_timeout, [this] {
        return closed_ || !idle_.empty() || open_count_ < config_.pool_size;
    });

    if (closed_) {
        throw TemporarySmtpError(0, "Relay connection pool is closed");
    }

    if (!ready) {
        lock.unlock();
        LOG_WARNING("Relay connection pool exhausted, opening a temporary connection");
        return PooledConnection(this, open(), false);
    }

    if (!idle_.empty()) {
        auto client = std::move(idle_.front());
        idle_.pop_front();
        lock.unlock();

        if (client->noop()) {
            return PooledConnection(this, std::move(client), true);
        }

        LOG_WARNING_FMT("Dead relay connection to {}, replacing it", config_.host);
        close_quietly(client);
        try {
            return PooledConnection(this, open(), true);
        } catch (const SmtpError&) {
            std::lock_guard<std::mutex> relock(mutex_);
            --open_count_;
            available_.notify_one();
            throw;
        }
    }

    ++open_count_;
    lock.unlock();
    try {
        return PooledConnection(this, open(), true);
    } catch (const SmtpError&) {
        std::lock_guard<std::mutex> relock(mutex_);
        --open_count_;
        available_.notify_one();
        throw;
    }
}

void ConnectionPool::release(std::unique_ptr<SmtpClient> client, bool pooled, bool healthy) {
    if (!pooled) {
        close_quietly(client);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_ && healthy && client->is_connected()) {
            idle_.push_back(std::move(client));
        } else {
            --open_count_;
        }
    }
    available_.notify_one();

    close_quietly(client);
}

void ConnectionPool::close() {
    std::deque<std::unique_ptr<SmtpClient>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        idle.swap(idle_);
        open_count_ -= idle.size();
    }
    available_.notify_all();

    for (auto& client : idle) {
        close_quietly(client);
    }
    LOG_INFO_FMT("Closed {} idle relay connection(s)", idle.size());
}

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_count_;
}

size_t ConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

}  // namespace mailfwd::delivery
